#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "evogate/applier.hpp"
#include "evogate/audit.hpp"
#include "evogate/code_generator.hpp"
#include "evogate/config.hpp"
#include "evogate/evolution_controller.hpp"
#include "evogate/evolution_sandbox.hpp"
#include "evogate/harness.hpp"
#include "evogate/jsonlite.hpp"
#include "evogate/log.hpp"
#include "evogate/sandbox_runtime.hpp"
#include "evogate/version.hpp"

namespace {

using evogate::jsonlite::Object;

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

// Value of "--name VALUE" anywhere after the command words.
std::optional<std::string> option(int argc, char** argv, const std::string& name) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (name == argv[i]) return std::string(argv[i + 1]);
  }
  return std::nullopt;
}

bool flag(int argc, char** argv, const std::string& name) {
  for (int i = 1; i < argc; ++i) {
    if (name == argv[i]) return true;
  }
  return false;
}

// Positional words, skipping options and their values.
std::vector<std::string> positionals(int argc, char** argv) {
  static const std::vector<std::string> kValueOptions = {
      "--config", "--code", "--fixtures", "--timeout", "--request", "--generator",
      "--limit", "--approver", "--module", "--log"};
  std::vector<std::string> out;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a.rfind("--", 0) == 0) {
      for (const auto& o : kValueOptions) {
        if (a == o) {
          ++i;
          break;
        }
      }
      continue;
    }
    out.push_back(a);
  }
  return out;
}

void print_json(const Object& o) { std::cout << evogate::jsonlite::to_json_pretty(o) << "\n"; }

int fail(const std::string& message, int code = 1) {
  Object o;
  o["ok"] = false;
  o["error"] = message;
  std::cerr << evogate::jsonlite::to_json(o) << "\n";
  return code;
}

bool parse_u32(const std::string& s, uint32_t* out) {
  if (s.empty() || s.size() > 9) return false;
  uint32_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<uint32_t>(c - '0');
  }
  *out = v;
  return true;
}

std::optional<Object> read_json_file(const std::string& path, std::string* error) {
  auto text = read_file(path);
  if (!text) {
    *error = "cannot read " + path;
    return std::nullopt;
  }
  std::optional<evogate::jsonlite::JsonError> err;
  Object o = evogate::jsonlite::parse(*text, &err);
  if (err) {
    *error = path + ": " + err->message;
    return std::nullopt;
  }
  return o;
}

Object capabilities_json(const evogate::EngineCapabilities& caps) {
  Object o;
  o["enforced"] = evogate::jsonlite::to_array(caps.enforced);
  o["unsupported"] = evogate::jsonlite::to_array(caps.unsupported);
  o["detail"] = caps.detail;
  return o;
}

// Stands in for the sandbox in commands that only inspect or decide on
// stored results; nothing is ever executed through it.
class StoredResultsOnly : public evogate::SandboxRunner {
 public:
  evogate::SandboxResult test_evolution(const std::string&, const Object&, std::optional<uint32_t>) override {
    evogate::SandboxResult r;
    r.status = evogate::SandboxStatus::failed;
    r.exit_code = -1;
    r.error_message = "sandbox is not started by this command";
    r.timestamp_unix_ms = evogate::now_unix_ms();
    return r;
  }
  Object stats_json() const override {
    Object o;
    o["engine"] = "none";
    return o;
  }
};

std::unique_ptr<evogate::EvolutionController> offline_controller(const evogate::EvogateConfig& cfg) {
  const auto profile = evogate::parse_harness_profile(cfg.profile).value_or(evogate::HarnessProfile::python);
  auto controller = std::make_unique<evogate::EvolutionController>(
      std::make_shared<evogate::CommandCodeGenerator>(cfg.generator, cfg.generator_timeout_s, cfg.temp_dir),
      std::make_shared<StoredResultsOnly>(),
      std::make_shared<evogate::ModuleApplier>(cfg.integration_root, evogate::source_extension(profile)),
      evogate::ControllerConfig::from(cfg));
  controller->restore_from_store();
  return controller;
}

void usage() {
  std::cerr << "usage: evogate [--config FILE] <command>\n"
               "  doctor\n"
               "  sandbox run --code FILE [--fixtures FILE] [--timeout S]\n"
               "  evolve --request FILE [--generator CMD]\n"
               "  validate --module FILE [--generator CMD]\n"
               "  pending\n"
               "  history [--limit N]\n"
               "  stats\n"
               "  approve ID [--reject] [--approver NAME]\n"
               "  audit verify [--log FILE]\n"
               "  config show | config check FILE\n"
               "  version\n";
}

}  // namespace

int main(int argc, char** argv) {
  evogate::configure_logging_from_env();

  const std::vector<std::string> words = positionals(argc, argv);
  if (words.empty()) {
    usage();
    return 1;
  }
  const std::string& cmd = words[0];
  const std::string sub = words.size() > 1 ? words[1] : "";

  // defaults < config file < EVOGATE_* environment
  evogate::EvogateConfig cfg = evogate::EvogateConfig::defaults();
  if (auto path = option(argc, argv, "--config")) {
    evogate::ConfigValidationResult vr;
    if (!evogate::load_config_file(*path, cfg, &vr)) {
      std::string joined;
      for (const auto& e : vr.errors) joined += (joined.empty() ? "" : "; ") + e;
      return fail(evogate::to_string(vr.code) + ": " + joined);
    }
    for (const auto& w : vr.warnings) evogate::log_warn("config", w, {{"path", *path}});
  }
  cfg.apply_env();
  if (auto gen = option(argc, argv, "--generator")) cfg.generator = *gen;

  if (cmd == "version") {
    std::cout << evogate::version::manifest_json() << "\n";
    return 0;
  }

  if (cmd == "config" && sub == "show") {
    print_json(evogate::config_to_json(cfg));
    return 0;
  }

  if (cmd == "config" && sub == "check") {
    if (words.size() < 3) return fail("config check needs a FILE");
    std::string error;
    auto doc = read_json_file(words[2], &error);
    if (!doc) return fail(error);
    const auto vr = evogate::validate_config(*doc);
    Object o;
    o["ok"] = vr.ok;
    if (!vr.ok) o["code"] = evogate::to_string(vr.code);
    o["errors"] = evogate::jsonlite::to_array(vr.errors);
    o["warnings"] = evogate::jsonlite::to_array(vr.warnings);
    print_json(o);
    return vr.ok ? 0 : 1;
  }

  if (cmd == "doctor") {
    std::vector<std::string> blockers;
    Object o;
    o["engine"] = cfg.engine;
    o["profile"] = cfg.profile;
    o["network_policy"] = cfg.network_policy;
    try {
      evogate::SandboxRuntime runtime(cfg);
      o["interpreter"] = runtime.interpreter();
      o["capabilities"] = capabilities_json(runtime.capabilities());
    } catch (const evogate::SandboxUnavailableError& e) {
      blockers.push_back(e.what());
    }
    if (!cfg.generator.empty()) {
      const evogate::CommandCodeGenerator gen(cfg.generator, cfg.generator_timeout_s, cfg.temp_dir);
      if (gen.argv().empty()) blockers.push_back("generator command is empty");
    }
    o["ok"] = blockers.empty();
    o["blockers"] = evogate::jsonlite::to_array(blockers);
    o["version"] = evogate::version::semver();
    print_json(o);
    return blockers.empty() ? 0 : 2;
  }

  if (cmd == "sandbox" && sub == "run") {
    auto code_path = option(argc, argv, "--code");
    if (!code_path) return fail("sandbox run needs --code FILE");
    auto code = read_file(*code_path);
    if (!code) return fail("cannot read " + *code_path);
    Object fixtures;
    if (auto fx = option(argc, argv, "--fixtures")) {
      std::string error;
      auto doc = read_json_file(*fx, &error);
      if (!doc) return fail(error);
      fixtures = std::move(*doc);
    }
    std::optional<uint32_t> timeout;
    if (auto t = option(argc, argv, "--timeout")) {
      uint32_t v = 0;
      if (!parse_u32(*t, &v) || v == 0) return fail("--timeout must be a positive integer");
      timeout = v;
    }
    try {
      evogate::EvolutionSandbox sandbox(std::make_shared<evogate::SandboxRuntime>(cfg));
      const auto result = sandbox.test_evolution(*code, fixtures, timeout);
      print_json(evogate::sandbox_result_to_json(result));
      return result.status == evogate::SandboxStatus::completed ? 0 : 1;
    } catch (const evogate::SandboxUnavailableError& e) {
      return fail(e.what(), 2);
    }
  }

  if (cmd == "evolve") {
    auto req_path = option(argc, argv, "--request");
    if (!req_path) return fail("evolve needs --request FILE");
    if (cfg.generator.empty()) return fail("no generator configured (EVOGATE_GENERATOR or --generator)");
    std::string error;
    auto doc = read_json_file(*req_path, &error);
    if (!doc) return fail(error);
    const evogate::EvolutionRequest request = evogate::request_from_json(*doc);

    try {
      auto runtime = std::make_shared<evogate::SandboxRuntime>(cfg);
      evogate::EvolutionController controller(
          std::make_shared<evogate::CommandCodeGenerator>(cfg.generator, cfg.generator_timeout_s, cfg.temp_dir),
          std::make_shared<evogate::EvolutionSandbox>(runtime),
          std::make_shared<evogate::ModuleApplier>(cfg.integration_root,
                                                   evogate::source_extension(runtime->profile())),
          evogate::ControllerConfig::from(cfg));
      const std::string id = controller.request_evolution(request);
      controller.wait_idle();
      auto result = controller.get_result(id);
      controller.shutdown();
      if (!result) return fail("no result recorded for " + id);
      print_json(evogate::evolution_result_to_json(*result));
      return result->success ? 0 : 1;
    } catch (const evogate::SandboxUnavailableError& e) {
      return fail(e.what(), 2);
    }
  }

  if (cmd == "validate") {
    auto module = option(argc, argv, "--module");
    if (!module) return fail("validate needs --module FILE");
    if (cfg.generator.empty()) return fail("no generator configured (EVOGATE_GENERATOR or --generator)");
    auto controller = offline_controller(cfg);
    const auto outcome = controller->validate_system_code(*module);
    if (!outcome.ok) return fail(outcome.error);
    print_json(evogate::analysis_to_json(outcome.analysis));
    return 0;
  }

  if (cmd == "pending" || cmd == "history" || cmd == "stats" || cmd == "approve") {
    if (cfg.store_root.empty()) return fail("no result store configured (EVOGATE_STORE)");
    auto controller = offline_controller(cfg);

    if (cmd == "pending") {
      evogate::jsonlite::Array items;
      for (const auto& p : controller->get_pending_approvals()) items.push_back(evogate::pending_approval_to_json(p));
      Object o;
      o["pending"] = std::move(items);
      print_json(o);
      return 0;
    }
    if (cmd == "history") {
      uint32_t limit = 50;
      if (auto l = option(argc, argv, "--limit")) {
        if (!parse_u32(*l, &limit)) return fail("--limit must be a non-negative integer");
      }
      evogate::jsonlite::Array items;
      for (const auto& r : controller->get_evolution_history(limit)) {
        items.push_back(evogate::evolution_summary_to_json(r));
      }
      Object o;
      o["history"] = std::move(items);
      print_json(o);
      return 0;
    }
    if (cmd == "stats") {
      print_json(controller->stats_json());
      return 0;
    }

    if (words.size() < 2) return fail("approve needs a request id");
    const bool approved = !flag(argc, argv, "--reject");
    const std::string approver = option(argc, argv, "--approver").value_or("human");
    const bool ok = controller->approve_evolution(words[1], approved, approver);
    Object o;
    o["ok"] = ok;
    o["request_id"] = words[1];
    o["decision"] = approved ? "approved" : "rejected";
    if (auto state = controller->request_state(words[1])) o["state"] = evogate::to_string(*state);
    print_json(o);
    return ok ? 0 : 1;
  }

  if (cmd == "audit" && sub == "verify") {
    const std::string path = option(argc, argv, "--log").value_or(cfg.audit_log);
    if (path.empty()) return fail("no audit log configured (EVOGATE_AUDIT_LOG or --log)");
    const auto v = evogate::verify_audit_chain(path);
    Object o;
    o["ok"] = v.ok;
    o["entries"] = v.entries;
    if (!v.ok) {
      o["first_bad_line"] = v.first_bad_line;
      o["error"] = v.error;
    }
    print_json(o);
    return v.ok ? 0 : 1;
  }

  usage();
  return 1;
}
