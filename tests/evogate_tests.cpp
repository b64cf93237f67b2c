#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "evogate/applier.hpp"
#include "evogate/approval.hpp"
#include "evogate/audit.hpp"
#include "evogate/code_generator.hpp"
#include "evogate/config.hpp"
#include "evogate/evolution_controller.hpp"
#include "evogate/evolution_sandbox.hpp"
#include "evogate/hash.hpp"
#include "evogate/isolation.hpp"
#include "evogate/jsonlite.hpp"
#include "evogate/log.hpp"
#include "evogate/result_store.hpp"
#include "evogate/sandbox_runtime.hpp"
#include "evogate/types.hpp"
#include "evogate/version.hpp"
#include "evogate/worker_pool.hpp"

namespace fs = std::filesystem;
using namespace evogate;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("evogate_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

std::string slurp(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  std::stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

std::vector<std::string> lines_of(const fs::path& p) {
  std::ifstream ifs(p);
  std::vector<std::string> out;
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

std::mutex g_log_mu;
std::vector<LogRecord> g_logged;

void capture_log(const LogRecord& r) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_logged.push_back(r);
}

// ----------------------------------------------------------------------------
// Test doubles
// ----------------------------------------------------------------------------

// Fails every request whose function_name is "broken".
class FakeGenerator : public CodeGenerator {
 public:
  std::string code{"print('evolved')"};
  RiskAssessment risk{RiskAssessment::safe};
  bool ethical{true};
  std::atomic<int> calls{0};

  GenerationOutcome generate_module(const jsonlite::Object& requirements) override {
    ++calls;
    GenerationOutcome out;
    if (jsonlite::get_string(requirements, "function_name") == "broken") {
      out.error_code = ErrorCode::generator_failed;
      out.error = "generator offline";
      return out;
    }
    out.ok = true;
    out.code = code;
    out.analysis.syntax_valid = true;
    out.analysis.security_score = 0.9;
    out.analysis.risk_assessment = risk;
    out.analysis.ethical_compliance = ethical;
    out.analysis.timestamp_unix_ms = now_unix_ms();
    return out;
  }

  GenerationOutcome validate_existing_code(const std::string& existing, const std::string&) override {
    GenerationOutcome out;
    out.ok = true;
    out.analysis.syntax_valid = !existing.empty();
    out.analysis.risk_assessment = RiskAssessment::caution;
    out.analysis.ethical_compliance = true;
    return out;
  }

  jsonlite::Object stats_json() const override {
    jsonlite::Object o;
    o["calls"] = calls.load();
    return o;
  }
};

class FakeSandbox : public SandboxRunner {
 public:
  SandboxStatus status{SandboxStatus::completed};
  std::atomic<int> calls{0};
  std::atomic<int> cleanups{0};

  SandboxResult test_evolution(const std::string&, const jsonlite::Object&, std::optional<uint32_t>) override {
    const int n = ++calls;
    SandboxResult r;
    r.status = status;
    r.exit_code = status == SandboxStatus::completed ? 0 : 124;
    r.environment_id = "fake-env-" + std::to_string(n);
    r.timestamp_unix_ms = now_unix_ms();
    return r;
  }

  jsonlite::Object stats_json() const override {
    jsonlite::Object o;
    o["runs"] = calls.load();
    return o;
  }

  void cleanup_all() override { ++cleanups; }
};

class FakeApplier : public EvolutionApplier {
 public:
  std::atomic<bool> succeed{true};
  std::atomic<int> applied{0};
  std::atomic<int> attempts{0};
  int delay_ms{0};

  bool apply(const std::string&, const EvolutionRequest&, const std::string&) override {
    ++attempts;
    if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    if (!succeed.load()) return false;
    ++applied;
    return true;
  }
};

struct Rig {
  std::shared_ptr<FakeGenerator> generator = std::make_shared<FakeGenerator>();
  std::shared_ptr<FakeSandbox> sandbox = std::make_shared<FakeSandbox>();
  std::shared_ptr<FakeApplier> applier = std::make_shared<FakeApplier>();
  std::unique_ptr<EvolutionController> controller;

  void start(ControllerConfig cfg = {}) {
    controller = std::make_unique<EvolutionController>(generator, sandbox, applier, cfg);
  }
};

EvolutionRequest make_request(EvolutionKind kind, const std::string& function_name = "adder") {
  EvolutionRequest r;
  r.kind = kind;
  r.description = "add two numbers";
  r.requirements.function_name = function_name;
  r.requirements.inputs = {"a", "b"};
  r.requirements.outputs = {"sum"};
  r.requester = "unit-test";
  return r;
}

std::string submit_and_wait(Rig& rig, const EvolutionRequest& req) {
  const std::string id = rig.controller->request_evolution(req);
  rig.controller->wait_idle();
  return id;
}

// ============================================================================
// Phase 1: Hashing, JSON and wire types
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "x = 1";
  const std::string c = code_digest(payload);
  const std::string r = record_digest(payload);
  const std::string a = audit_digest(payload);
  expect(is_hex_digest(c) && is_hex_digest(r) && is_hex_digest(a), "digests are 64 lowercase hex");
  expect(c != r && r != a && c != a, "domains produce distinct digests");
  expect(c != blake3_hex(payload), "domain digest differs from the raw hash");
  expect(code_digest(payload) == c, "digest is stable");
  expect(!is_hex_digest("ABC"), "short or uppercase digest rejected");
}

void test_json_strict_parse() {
  std::optional<jsonlite::JsonError> err;
  jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");

  err.reset();
  jsonlite::parse(R"({"a":1} x)", &err);
  expect(err && err->code == "json_parse_error", "trailing data rejected");

  err.reset();
  jsonlite::parse("[1,2]", &err);
  expect(err && err->code == "json_not_object", "top-level array rejected");

  err.reset();
  const auto obj = jsonlite::parse(R"({"s":"a\"b","n":-3,"d":0.5,"t":true})", &err);
  expect(!err, "valid object parses");
  expect(jsonlite::get_string(obj, "s") == "a\"b", "escaped string");
  expect(jsonlite::get_i64(obj, "n") == -3, "negative integer");
  expect(jsonlite::get_double(obj, "d") == 0.5, "double");
  expect(jsonlite::get_bool(obj, "t"), "bool");
}

void test_json_sorted_output() {
  jsonlite::Object o;
  o["zeta"] = 1;
  o["alpha"] = "x";
  o["mid"] = jsonlite::to_array({"p", "q"});
  expect(jsonlite::to_json(o) == R"({"alpha":"x","mid":["p","q"],"zeta":1})", "keys sorted, compact");
}

void test_enum_names() {
  expect(to_string(EvolutionKind::bug_fix) == "bug_fix", "kind name");
  expect(to_string(ApprovalLevel::review_required) == "review_required", "approval name");
  expect(to_string(RequestState::pending_approval) == "pending_approval", "state name");
  expect(parse_evolution_kind("feature_addition") == EvolutionKind::feature_addition, "kind parse");
  expect(!parse_evolution_kind("rewrite_everything"), "unknown kind");
  expect(parse_sandbox_status("timeout") == SandboxStatus::timeout, "status parse");
}

void test_unknown_levels_fail_closed() {
  jsonlite::Object analysis;
  analysis["risk_assessment"] = "harmless";
  analysis["ethical_compliance"] = true;
  expect(analysis_from_json(analysis).risk_assessment == RiskAssessment::blocked, "unknown risk -> blocked");

  jsonlite::Object result;
  result["request_id"] = "evo_x";
  result["approval_level"] = "whenever";
  result["success"] = true;
  expect(evolution_result_from_json(result).approval_level == ApprovalLevel::committee_approval,
         "unknown approval level -> committee");
}

void test_request_json() {
  EvolutionRequest req = make_request(EvolutionKind::module_enhancement);
  req.requirements.test_fixtures["case"] = 7;
  req.priority = 3;
  const jsonlite::Object o = request_to_json(req);
  expect(jsonlite::get_string(o, "evolution_type") == "module_enhancement", "evolution_type key");
  const EvolutionRequest back = request_from_json(o);
  expect(back.kind == EvolutionKind::module_enhancement, "kind restored");
  expect(back.requirements.function_name == "adder", "function name restored");
  expect(back.requirements.inputs.size() == 2, "inputs restored");
  expect(jsonlite::get_i64(back.requirements.test_fixtures, "case") == 7, "fixtures restored");
  expect(back.priority == 3, "priority restored");
}

void test_version_manifest() {
  std::optional<jsonlite::JsonError> err;
  const auto m = jsonlite::parse(version::manifest_json(), &err);
  expect(!err, "manifest is JSON");
  expect(jsonlite::get_string(m, "semver") == EVOGATE_VERSION, "semver");
  expect(jsonlite::get_string(m, "hash_primitive") == "blake3", "hash primitive");
  expect(jsonlite::get_string(m, "compression") == "zstd", "compression");
}

// ============================================================================
// Phase 2: Approval policy
// ============================================================================

void test_base_levels() {
  expect(base_approval_level(RiskAssessment::safe) == ApprovalLevel::automatic, "safe");
  expect(base_approval_level(RiskAssessment::caution) == ApprovalLevel::review_required, "caution");
  expect(base_approval_level(RiskAssessment::dangerous) == ApprovalLevel::human_approval, "dangerous");
  expect(base_approval_level(RiskAssessment::blocked) == ApprovalLevel::committee_approval, "blocked");
}

void test_escalation() {
  using R = RiskAssessment;
  using S = SandboxStatus;
  using A = ApprovalLevel;
  expect(determine_approval_level(R::safe, S::completed, true) == A::automatic, "safe+completed");
  expect(determine_approval_level(R::safe, S::timeout, true) == A::review_required, "safe+timeout");
  expect(determine_approval_level(R::caution, S::failed, true) == A::human_approval, "caution+failed");
  expect(determine_approval_level(R::dangerous, S::killed, true) == A::human_approval, "dangerous stays");
  expect(determine_approval_level(R::blocked, S::failed, true) == A::committee_approval, "blocked stays");
  expect(determine_approval_level(R::safe, S::completed, false) == A::human_approval, "unethical safe");
  expect(determine_approval_level(R::blocked, S::completed, false) == A::committee_approval,
         "unethical blocked stays committee");
}

void test_auto_apply_gate() {
  const RiskAssessment risks[] = {RiskAssessment::safe, RiskAssessment::caution, RiskAssessment::dangerous,
                                  RiskAssessment::blocked};
  const SandboxStatus statuses[] = {SandboxStatus::ready,     SandboxStatus::running, SandboxStatus::completed,
                                    SandboxStatus::failed,    SandboxStatus::timeout, SandboxStatus::killed};
  for (RiskAssessment r : risks) {
    for (SandboxStatus s : statuses) {
      for (bool ethical : {true, false}) {
        const ApprovalLevel level = determine_approval_level(r, s, ethical);
        const bool expected = r == RiskAssessment::safe && s == SandboxStatus::completed && ethical;
        expect(may_auto_apply(level, s) == expected, "auto-apply only for safe+completed+ethical");
        expect(level >= base_approval_level(r), "never below the base level");
      }
    }
  }
}

// ============================================================================
// Phase 3: Controller lifecycle
// ============================================================================

void test_auto_apply_bug_fix() {
  Rig rig;
  rig.start();
  const std::string id = submit_and_wait(rig, make_request(EvolutionKind::bug_fix));
  const auto r = rig.controller->get_result(id);
  expect(r.has_value(), "result recorded");
  expect(r->success, "success");
  expect(r->approval_level == ApprovalLevel::automatic, "automatic level");
  expect(r->applied, "applied");
  expect(r->code_digest == code_digest(rig.generator->code), "code digest recorded");
  expect(rig.applier->applied == 1, "applier called once");
  expect(rig.controller->request_state(id) == RequestState::applied, "state applied");
  expect(rig.controller->get_pending_approvals().empty(), "nothing pending");
  const EvolutionStats s = rig.controller->get_evolution_stats();
  expect(s.total_requests == 1 && s.successful_evolutions == 1 && s.automatic_approvals == 1, "counters");
  expect(s.pending_evolutions == 0, "queue drained");
}

void test_timeout_requires_review() {
  Rig rig;
  rig.sandbox->status = SandboxStatus::timeout;
  rig.start();
  const std::string id = submit_and_wait(rig, make_request(EvolutionKind::function_generation));
  const auto r = rig.controller->get_result(id);
  expect(r && r->success, "completed despite sandbox timeout");
  expect(r->approval_level == ApprovalLevel::review_required, "escalated to review");
  expect(!r->applied, "not applied");
  expect(rig.applier->attempts == 0, "applier untouched");
  const auto pending = rig.controller->get_pending_approvals();
  expect(pending.size() == 1 && pending[0].request_id == id, "listed as pending");
  expect(pending[0].sandbox_status == SandboxStatus::timeout, "pending carries sandbox status");
  expect(rig.controller->request_state(id) == RequestState::pending_approval, "state pending_approval");
}

void test_generator_failure() {
  Rig rig;
  rig.start();
  const std::string id = submit_and_wait(rig, make_request(EvolutionKind::function_generation, "broken"));
  const auto r = rig.controller->get_result(id);
  expect(r && !r->success, "failed result");
  expect(r->error_message && *r->error_message == "generator offline", "generator error kept");
  expect(r->approval_level == ApprovalLevel::committee_approval, "failed -> committee");
  expect(rig.sandbox->calls == 0, "sandbox never run");
  expect(rig.controller->request_state(id) == RequestState::failed, "state failed");
  expect(!rig.controller->approve_evolution(id, true), "failed result cannot be approved");
  const auto history = rig.controller->get_evolution_history();
  expect(history.size() == 1 && history[0].request_id == id, "failure in history");
  expect(rig.controller->get_evolution_stats().failed_evolutions == 1, "failed counter");
}

void test_approve_once() {
  Rig rig;
  rig.generator->risk = RiskAssessment::caution;
  rig.start();
  const std::string id = submit_and_wait(rig, make_request(EvolutionKind::function_generation));
  expect(rig.controller->approve_evolution(id, true, "alice"), "first approval applies");
  expect(!rig.controller->approve_evolution(id, true, "bob"), "second approval refused");
  expect(rig.applier->applied == 1, "applied exactly once");
  const auto r = rig.controller->get_result(id);
  expect(r->applied && r->decided_by == "alice", "decision recorded");
  expect(rig.controller->get_evolution_stats().manual_approvals == 1, "manual approval counted");
  expect(rig.controller->get_pending_approvals().empty(), "no longer pending");
}

void test_reject_is_terminal() {
  Rig rig;
  rig.generator->risk = RiskAssessment::dangerous;
  rig.start();
  const std::string id = submit_and_wait(rig, make_request(EvolutionKind::module_enhancement));
  expect(rig.controller->approve_evolution(id, false, "carol"), "rejection accepted");
  expect(!rig.controller->approve_evolution(id, true), "approve after reject refused");
  expect(!rig.controller->approve_evolution(id, false), "second reject refused");
  expect(rig.applier->attempts == 0, "rejected code never applied");
  expect(rig.controller->request_state(id) == RequestState::rejected, "state rejected");
  expect(rig.controller->get_evolution_stats().rejected_evolutions == 1, "rejection counted");
}

void test_unknown_id() {
  Rig rig;
  rig.start();
  expect(!rig.controller->approve_evolution("evo_does_not_exist", true), "unknown id refused");
  expect(!rig.controller->request_state("evo_does_not_exist"), "no state for unknown id");
}

void test_apply_failure_on_approve() {
  Rig rig;
  rig.generator->risk = RiskAssessment::caution;
  rig.start();
  const std::string id = submit_and_wait(rig, make_request(EvolutionKind::function_generation));
  rig.applier->succeed = false;
  expect(!rig.controller->approve_evolution(id, true), "failed apply reported");
  expect(rig.controller->get_evolution_stats().apply_failures == 1, "apply failure counted");
  expect(rig.controller->get_pending_approvals().size() == 1, "still pending");
  rig.applier->succeed = true;
  expect(rig.controller->approve_evolution(id, true), "retry succeeds");
}

void test_auto_apply_failure_held() {
  Rig rig;
  rig.applier->succeed = false;
  rig.start();
  const std::string id = submit_and_wait(rig, make_request(EvolutionKind::bug_fix));
  const auto r = rig.controller->get_result(id);
  expect(r && r->success && !r->applied, "completed but not applied");
  expect(rig.controller->request_state(id) == RequestState::pending_approval, "held for approval");
  expect(rig.controller->get_evolution_stats().apply_failures == 1, "apply failure counted");
  expect(rig.controller->get_evolution_stats().automatic_approvals == 0, "not counted as automatic");
  rig.applier->succeed = true;
  expect(rig.controller->approve_evolution(id, true, "ops"), "manual approval applies it");
}

void test_unethical_needs_human() {
  Rig rig;
  rig.generator->ethical = false;
  rig.start();
  const std::string id = submit_and_wait(rig, make_request(EvolutionKind::function_generation));
  const auto r = rig.controller->get_result(id);
  expect(r->approval_level == ApprovalLevel::human_approval, "human approval");
  expect(!r->applied, "not applied");
}

void test_history_order_and_limit() {
  Rig rig;
  rig.start();
  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    ids.push_back(submit_and_wait(rig, make_request(EvolutionKind::bug_fix, "f" + std::to_string(i))));
  }
  const auto all = rig.controller->get_evolution_history();
  expect(all.size() == 3, "three entries");
  expect(all[0].request_id == ids[2] && all[2].request_id == ids[0], "newest first");
  const auto two = rig.controller->get_evolution_history(2);
  expect(two.size() == 2 && two[0].request_id == ids[2], "limit respected");
  expect(rig.controller->get_evolution_history(0).empty(), "limit zero");
}

void test_concurrent_requests() {
  Rig rig;
  ControllerConfig cfg;
  cfg.workers = 4;
  rig.controller = std::make_unique<EvolutionController>(rig.generator, rig.sandbox, rig.applier, cfg);

  std::mutex mu;
  std::set<std::string> ids;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 10; ++i) {
        const std::string fn = (i % 3 == 0) ? "broken" : "f" + std::to_string(t) + "_" + std::to_string(i);
        const std::string id = rig.controller->request_evolution(make_request(EvolutionKind::bug_fix, fn));
        std::lock_guard<std::mutex> lk(mu);
        ids.insert(id);
      }
    });
  }
  for (auto& t : threads) t.join();
  rig.controller->wait_idle();

  expect(ids.size() == 40, "ids unique");
  const auto history = rig.controller->get_evolution_history(1000);
  expect(history.size() == 40, "every request in exactly one history");
  const EvolutionStats s = rig.controller->get_evolution_stats();
  expect(s.total_requests == 40, "total counted");
  expect(s.successful_evolutions == 24 && s.failed_evolutions == 16, "success/failure split");
  expect(s.pending_evolutions == 0, "no request left pending");
  expect(rig.applier->applied == 24, "each success applied once");
}

void test_request_after_shutdown() {
  Rig rig;
  rig.start();
  rig.controller->shutdown();
  expect(rig.sandbox->cleanups == 1, "sandbox released on shutdown");
  const std::string id = rig.controller->request_evolution(make_request(EvolutionKind::bug_fix));
  expect(!id.empty(), "id still returned");
  const auto r = rig.controller->get_result(id);
  expect(r && !r->success, "recorded as failed");
  expect(r->error_message && r->error_message->find("shutting down") != std::string::npos, "reason given");
  expect(r->error_message->rfind("shutting_down: ", 0) == 0, "reason carries its error code");
  expect(rig.generator->calls == 0, "generator not called");
  rig.controller->shutdown();
  expect(rig.sandbox->cleanups == 1, "shutdown idempotent");
}

void test_concurrent_approvals() {
  Rig rig;
  rig.generator->risk = RiskAssessment::caution;
  rig.applier->delay_ms = 20;
  rig.start();
  const std::string id = submit_and_wait(rig, make_request(EvolutionKind::function_generation));

  std::atomic<int> wins{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (rig.controller->approve_evolution(id, true)) ++wins;
    });
  }
  for (auto& t : threads) t.join();
  expect(wins == 1, "exactly one approval wins");
  expect(rig.applier->applied == 1, "applied once");
}

// Approvals race the worker's own finish(); the store and the audit log must
// both end with the approval.
void test_approve_races_finish() {
  const fs::path tmp = fresh_dir("approve_race");
  ControllerConfig cfg;
  cfg.workers = 2;
  cfg.store_root = (tmp / "store").string();
  cfg.audit_log_path = (tmp / "audit.ndjson").string();
  std::vector<std::string> ids;
  {
    Rig rig;
    rig.generator->risk = RiskAssessment::caution;
    rig.start(cfg);
    for (int i = 0; i < 20; ++i) {
      const std::string id = rig.controller->request_evolution(make_request(EvolutionKind::function_generation));
      const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
      bool approved = false;
      while (!approved && std::chrono::steady_clock::now() < deadline) {
        approved = rig.controller->approve_evolution(id, true, "racer");
      }
      expect(approved, "approval eventually accepted");
      ids.push_back(id);
    }
    rig.controller->wait_idle();
    expect(rig.controller->get_evolution_stats().store_failures == 0, "every record stored");
  }

  Rig rig;
  rig.start(cfg);
  expect(rig.controller->restore_from_store() == ids.size(), "all records restored intact");
  for (const auto& id : ids) {
    const auto r = rig.controller->get_result(id);
    expect(r && r->applied && r->decided_by == "racer", "stored record is the approved one");
  }
  expect(rig.controller->get_pending_approvals().empty(), "nothing pending after restore");

  std::map<std::string, std::vector<std::string>> states;
  for (const auto& line : lines_of(cfg.audit_log_path)) {
    std::optional<jsonlite::JsonError> err;
    const auto o = jsonlite::parse(line, &err);
    expect(!err, "audit line is JSON");
    states[jsonlite::get_string(o, "request_id")].push_back(jsonlite::get_string(o, "state"));
  }
  for (const auto& id : ids) {
    const auto& s = states[id];
    expect(s.size() >= 2 && s[s.size() - 2] == "pending_approval" && s.back() == "applied",
           "pending_approval recorded before applied");
  }
  fs::remove_all(tmp);
}

void test_pending_order_matches_history() {
  ControllerConfig cfg;
  cfg.workers = 1;
  Rig rig;
  rig.generator->risk = RiskAssessment::caution;
  rig.start(cfg);
  std::vector<std::string> ids;
  for (int i = 0; i < 30; ++i) {
    ids.push_back(rig.controller->request_evolution(make_request(EvolutionKind::function_generation)));
  }
  rig.controller->wait_idle();

  const auto pending = rig.controller->get_pending_approvals();
  const auto history = rig.controller->get_evolution_history(100);
  expect(pending.size() == 30 && history.size() == 30, "all pending");
  for (std::size_t i = 0; i < pending.size(); ++i) {
    expect(pending[i].request_id == history[i].request_id, "same newest-first order as history");
    expect(pending[i].request_id == ids[ids.size() - 1 - i], "one worker: reverse submission order");
  }
}

void test_apply_failure_logged_with_code() {
  Rig rig;
  rig.generator->risk = RiskAssessment::caution;
  rig.start();
  const std::string id = submit_and_wait(rig, make_request(EvolutionKind::function_generation));
  rig.applier->succeed = false;
  {
    std::lock_guard<std::mutex> lk(g_log_mu);
    g_logged.clear();
  }
  set_log_hook(capture_log);
  const bool ok = rig.controller->approve_evolution(id, true);
  set_log_hook(nullptr);
  expect(!ok, "failed apply reported");
  std::lock_guard<std::mutex> lk(g_log_mu);
  bool coded = false;
  for (const auto& rec : g_logged) {
    for (const auto& [k, v] : rec.fields) coded = coded || (k == "code" && v == "apply_failed");
  }
  expect(coded, "apply failure logged with its error code");
  g_logged.clear();
}

void test_validate_system_code() {
  const fs::path tmp = fresh_dir("validate");
  const fs::path mod = tmp / "module.py";
  std::ofstream(mod) << "def f():\n    return 1\n";
  Rig rig;
  rig.start();
  const GenerationOutcome ok = rig.controller->validate_system_code(mod.string());
  expect(ok.ok && ok.analysis.syntax_valid, "existing module analysed");
  const GenerationOutcome missing = rig.controller->validate_system_code((tmp / "nope.py").string());
  expect(!missing.ok && !missing.error.empty(), "unreadable module reported");
  fs::remove_all(tmp);
}

void test_stats_json() {
  Rig rig;
  rig.start();
  submit_and_wait(rig, make_request(EvolutionKind::bug_fix));
  const jsonlite::Object o = rig.controller->stats_json();
  expect(jsonlite::get_i64(o, "total_requests") == 1, "total_requests");
  expect(jsonlite::get_i64(jsonlite::get_object(o, "code_generator_stats"), "calls") == 1, "generator stats");
  expect(jsonlite::get_i64(jsonlite::get_object(o, "sandbox_stats"), "runs") == 1, "sandbox stats");
}

// ============================================================================
// Phase 4: Persistence and audit
// ============================================================================

void test_store_and_restore() {
  const fs::path tmp = fresh_dir("restore");
  ControllerConfig cfg;
  cfg.workers = 2;
  cfg.store_root = (tmp / "store").string();

  std::string applied_id;
  std::string pending_id;
  {
    Rig rig;
    rig.start(cfg);
    applied_id = submit_and_wait(rig, make_request(EvolutionKind::bug_fix));
    rig.generator->risk = RiskAssessment::caution;
    pending_id = submit_and_wait(rig, make_request(EvolutionKind::function_generation));
    expect(rig.controller->get_evolution_stats().store_failures == 0, "stored without failures");
  }

  Rig rig;
  rig.start(cfg);
  expect(rig.controller->restore_from_store() == 2, "two records restored");
  expect(rig.controller->restore_from_store() == 0, "restore is idempotent");
  expect(rig.controller->request_state(applied_id) == RequestState::applied, "applied restored");
  const auto pending = rig.controller->get_pending_approvals();
  expect(pending.size() == 1 && pending[0].request_id == pending_id, "pending restored");
  const EvolutionStats s = rig.controller->get_evolution_stats();
  expect(s.successful_evolutions == 2 && s.automatic_approvals == 1, "counters rebuilt");
  expect(rig.controller->approve_evolution(pending_id, true), "restored result can be approved");
  const std::string next = submit_and_wait(rig, make_request(EvolutionKind::bug_fix));
  expect(next != applied_id && next != pending_id, "new ids do not collide");
  fs::remove_all(tmp);
}

void test_controller_audit_chain() {
  const fs::path tmp = fresh_dir("ctl_audit");
  ControllerConfig cfg;
  cfg.workers = 1;
  cfg.audit_log_path = (tmp / "audit" / "transitions.ndjson").string();
  {
    Rig rig;
    rig.start(cfg);
    submit_and_wait(rig, make_request(EvolutionKind::bug_fix));
  }
  const auto lines = lines_of(cfg.audit_log_path);
  expect(lines.size() == 4, "four transitions");
  const char* states[] = {"submitted", "generating", "sandboxed", "applied"};
  for (std::size_t i = 0; i < 4; ++i) {
    std::optional<jsonlite::JsonError> err;
    const auto o = jsonlite::parse(lines[i], &err);
    expect(!err, "audit line is JSON");
    expect(jsonlite::get_string(o, "state") == states[i], "transition order");
    expect(jsonlite::get_i64(o, "seq") == static_cast<std::int64_t>(i + 1), "sequence numbers");
  }
  const AuditVerification v = verify_audit_chain(cfg.audit_log_path);
  expect(v.ok && v.entries == 4, "chain verifies");
  fs::remove_all(tmp);
}

void test_audit_append_and_resume() {
  const fs::path tmp = fresh_dir("audit");
  const std::string path = (tmp / "log.ndjson").string();
  {
    AuditLog log(path);
    TransitionRecord a;
    a.request_id = "evo_a";
    a.actor = "controller";
    a.detail = "a";
    expect(log.append(a), "append a");
    expect(a.sequence == 1 && a.previous_digest == std::string(64, '0'), "first record anchors on zeros");
    TransitionRecord b = a;
    b.detail = "b";
    expect(log.append(b), "append b");
    expect(b.sequence == 2 && b.previous_digest != a.previous_digest, "chained");
    expect(log.entry_count() == 2 && log.failure_count() == 0, "counts");
  }
  {
    AuditLog log(path);
    expect(log.last_sequence() == 2, "sequence resumed");
    TransitionRecord c;
    c.request_id = "evo_a";
    c.state = RequestState::applied;
    c.detail = "c";
    expect(log.append(c), "append c");
    expect(c.sequence == 3, "continues at 3");
  }
  const AuditVerification ok = verify_audit_chain(path);
  expect(ok.ok && ok.entries == 3, "resumed chain verifies");

  auto lines = lines_of(path);
  const std::string needle = "\"detail\":\"b\"";
  const auto pos = lines[1].find(needle);
  expect(pos != std::string::npos, "record b located");
  lines[1].replace(pos, needle.size(), "\"detail\":\"x\"");
  {
    std::ofstream ofs(path, std::ios::trunc);
    for (const auto& l : lines) ofs << l << "\n";
  }
  const AuditVerification bad = verify_audit_chain(path);
  expect(!bad.ok && bad.first_bad_line == 3, "tampering detected at the next link");

  AuditLog disabled;
  TransitionRecord d;
  expect(!disabled.enabled() && disabled.append(d), "disabled log accepts appends");
  fs::remove_all(tmp);
}

EvolutionResult sample_result(const std::string& id) {
  EvolutionResult r;
  r.request_id = id;
  r.request = make_request(EvolutionKind::function_generation);
  r.success = true;
  r.generated_code = "def adder(a, b):\n    return a + b\n";
  r.code_digest = code_digest(r.generated_code);
  r.approval_level = ApprovalLevel::review_required;
  r.timestamp_unix_ms = 1700000000000ull;
  r.completion_seq = 4;
  return r;
}

void test_result_store_roundtrip() {
  const fs::path tmp = fresh_dir("store");
  ResultStore store(tmp.string());
  StoreError err;
  expect(store.put(sample_result("evo_1"), &err), "put");
  const auto back = store.get("evo_1", &err);
  expect(back.has_value(), "get");
  expect(back->generated_code == sample_result("evo_1").generated_code, "code preserved");
  expect(back->approval_level == ApprovalLevel::review_required, "level preserved");
  expect(back->completion_seq == 4, "completion seq preserved");
  const auto info = store.info("evo_1");
  expect(info && info->encoding == "zstd" && is_hex_digest(info->stored_blob_hash), "meta sidecar");
  expect(store.contains("evo_1") && !store.contains("evo_2"), "contains");
  fs::remove_all(tmp);
}

void test_result_store_corruption() {
  const fs::path tmp = fresh_dir("store_corrupt");
  ResultStore store(tmp.string());
  expect(store.put(sample_result("evo_1")), "put 1");
  expect(store.put(sample_result("evo_2")), "put 2");

  fs::path blob;
  for (const auto& entry : fs::directory_iterator(tmp / "results")) {
    const std::string name = entry.path().filename().string();
    if (name.rfind("evo_1", 0) == 0 && name.size() > 4 && name.substr(name.size() - 4) == ".zst") blob = entry.path();
  }
  expect(!blob.empty(), "blob located");
  std::ofstream(blob, std::ios::binary | std::ios::trunc) << "garbage";

  StoreError err;
  expect(!store.get("evo_1", &err), "corrupt record refused");
  expect(err.code == ErrorCode::store_integrity_failed, "integrity failure reported");

  std::size_t skipped = 0;
  const auto all = store.load_all(&skipped);
  expect(all.size() == 1 && all[0].request_id == "evo_2", "healthy record still loads");
  expect(skipped == 1, "corrupt record counted");

  err = StoreError{};
  expect(!store.get("evo_9", &err) && err.code == ErrorCode::store_io_failed, "missing record");
  fs::remove_all(tmp);
}

void test_result_store_ids() {
  const fs::path tmp = fresh_dir("store_ids");
  ResultStore store(tmp.string());
  StoreError err;
  expect(!store.put(sample_result("../escape"), &err), "path-like id refused");
  expect(!valid_request_id("") && !valid_request_id("a/b") && valid_request_id("evo_20240101_000000_1"),
         "id validation");
  expect(store.put(sample_result("evo_b")) && store.put(sample_result("evo_a")), "puts");
  const auto ids = store.list_ids();
  expect(ids.size() == 2 && ids[0] == "evo_a" && ids[1] == "evo_b", "ids sorted");
  fs::remove_all(tmp);
}

// ============================================================================
// Phase 5: Integration of approved code
// ============================================================================

void test_module_applier_paths() {
  const fs::path tmp = fresh_dir("applier");
  ModuleApplier applier(tmp.string());
  expect(!applier.dry_run(), "root configured");

  EvolutionRequest fn = make_request(EvolutionKind::function_generation, "adder");
  expect(applier.apply("evo_1", fn, "def adder(): pass\n"), "function integrated");
  expect(fs::exists(tmp / "functions" / "adder.py"), "function file written");
  expect(slurp(tmp / "functions" / "adder.py") == "def adder(): pass\n", "content written");

  EvolutionRequest fix = make_request(EvolutionKind::bug_fix);
  expect(applier.apply("evo_2", fix, "patch\n"), "bug fix integrated");
  expect(fs::exists(tmp / "patches" / "evo_2.py"), "patch file written");

  expect(!applier.apply("evo_3", make_request(EvolutionKind::optimization), "x"), "optimization unsupported");
  expect(!applier.apply("evo_4", make_request(EvolutionKind::feature_addition), "x"),
         "feature addition unsupported");

  const auto journal = lines_of(tmp / "integration.ndjson");
  expect(journal.size() == 2, "journal has one line per integration");
  std::optional<jsonlite::JsonError> err;
  const auto first = jsonlite::parse(journal[0], &err);
  expect(!err && jsonlite::get_string(first, "request_id") == "evo_1", "journal entry");
  expect(jsonlite::get_string(first, "code_digest") == code_digest("def adder(): pass\n"), "journal digest");
  fs::remove_all(tmp);
}

void test_module_applier_dry_run() {
  ModuleApplier applier("");
  expect(applier.dry_run(), "dry run without root");
  expect(applier.apply("evo_1", make_request(EvolutionKind::module_enhancement), "x"), "dry run succeeds");
}

void test_module_applier_backup() {
  const fs::path tmp = fresh_dir("applier_backup");
  ModuleApplier applier(tmp.string());
  const EvolutionRequest fn = make_request(EvolutionKind::function_generation, "adder");
  expect(applier.apply("evo_1", fn, "v1\n"), "first version integrated");
  expect(applier.apply("evo_2", fn, "v2\n"), "second version integrated");

  expect(slurp(tmp / "functions" / "adder.py") == "v2\n", "unit replaced");
  const fs::path backup = tmp / "backups" / "evo_2" / "functions" / "adder.py";
  expect(fs::exists(backup) && slurp(backup) == "v1\n", "replaced content kept in backups/");
  expect(!fs::exists(tmp / "backups" / "evo_1"), "no backup for a new unit");

  const auto journal = lines_of(tmp / "integration.ndjson");
  expect(journal.size() == 2, "two journal lines");
  std::optional<jsonlite::JsonError> err;
  const auto first = jsonlite::parse(journal[0], &err);
  expect(!err && first.count("previous_digest") == 0, "new unit has no previous digest");
  const auto second = jsonlite::parse(journal[1], &err);
  expect(!err && jsonlite::get_string(second, "previous_digest") == code_digest("v1\n"), "previous digest");
  expect(jsonlite::get_string(second, "backup") == "backups/evo_2/functions/adder.py", "backup path");
  fs::remove_all(tmp);
}

void test_module_applier_restores_on_journal_failure() {
  const fs::path tmp = fresh_dir("applier_restore");
  ModuleApplier applier(tmp.string());
  const EvolutionRequest fn = make_request(EvolutionKind::function_generation, "adder");
  expect(applier.apply("evo_1", fn, "v1\n"), "first version integrated");

  // A directory in place of the journal makes every append fail.
  fs::remove(tmp / "integration.ndjson");
  fs::create_directories(tmp / "integration.ndjson");
  expect(!applier.apply("evo_2", fn, "v2\n"), "unjournaled replacement fails");
  expect(slurp(tmp / "functions" / "adder.py") == "v1\n", "previous unit restored");
  expect(!applier.apply("evo_3", make_request(EvolutionKind::module_enhancement, "fresh"), "x"),
         "unjournaled new unit fails");
  expect(!fs::exists(tmp / "modules" / "fresh.py"), "new unit removed");
  fs::remove_all(tmp);
}

void test_unit_name_sanitization() {
  expect(sanitize_unit_name("../evil") == "___evil", "separators replaced");
  expect(sanitize_unit_name("") == "evolved_function", "empty name defaulted");
  expect(sanitize_unit_name("ok_Name9") == "ok_Name9", "clean name untouched");
}

// ============================================================================
// Phase 6: Configuration and logging
// ============================================================================

void test_config_validation() {
  std::optional<jsonlite::JsonError> err;
  const auto doc = jsonlite::parse(
      R"({"engine":"local","timeout_s":0,"workers":"many","colour":"blue","profile":"posix_sh"})", &err);
  expect(!err, "config doc parses");
  const ConfigValidationResult r = validate_config(doc);
  expect(!r.ok, "invalid config");
  expect(r.errors.size() == 2, "two errors");
  expect(r.warnings.size() == 1 && r.warnings[0] == "unknown key: colour", "unknown key warned");

  expect(r.code == ErrorCode::config_invalid, "invalid config carries its error code");

  const auto bad_engine = jsonlite::parse(R"({"engine":"vm"})", &err);
  expect(!validate_config(bad_engine).ok, "unknown engine refused");

  const auto no_code = jsonlite::parse(R"({"max_code_bytes":0})", &err);
  expect(!validate_config(no_code).ok, "max_code_bytes must be positive");
  const auto fine = jsonlite::parse(R"({"engine":"local"})", &err);
  const ConfigValidationResult ok = validate_config(fine);
  expect(ok.ok && ok.code == ErrorCode::none, "valid config has no error code");
}

void test_config_file() {
  const fs::path tmp = fresh_dir("config");
  const fs::path file = tmp / "evogate.json";
  std::ofstream(file)
      << R"({"engine":"local","memory_mb":128,"workers":8,"network_policy":"best_effort","max_code_bytes":2048})";
  EvogateConfig cfg;
  ConfigValidationResult r;
  expect(load_config_file(file.string(), cfg, &r), "config loaded");
  expect(cfg.engine == "local" && cfg.workers == 8, "values applied");
  expect(cfg.limits.memory_bytes == 128ull * 1024 * 1024, "memory limit applied");
  expect(cfg.network_policy == "best_effort", "network policy applied");
  expect(cfg.max_code_bytes == 2048, "code size limit applied");
  expect(jsonlite::get_i64(config_to_json(cfg), "max_code_bytes") == 2048, "code size limit shown");

  EvogateConfig untouched;
  expect(!load_config_file((tmp / "missing.json").string(), untouched, &r), "missing file refused");
  expect(untouched.engine == "docker", "defaults kept on failure");
  expect(r.code == ErrorCode::config_invalid, "unreadable file is config_invalid");
  expect(untouched.max_code_bytes == 1024 * 1024, "1 MiB code size default");
  fs::remove_all(tmp);
}

void test_config_env() {
  ::setenv("EVOGATE_ENGINE", "local", 1);
  ::setenv("EVOGATE_TIMEOUT_S", "42", 1);
  ::setenv("EVOGATE_MEMORY_MB", "64", 1);
  ::setenv("EVOGATE_WORKERS", "abc", 1);
  ::setenv("EVOGATE_MAX_CODE_BYTES", "4096", 1);
  const EvogateConfig cfg = EvogateConfig::from_env();
  ::unsetenv("EVOGATE_MAX_CODE_BYTES");
  ::unsetenv("EVOGATE_ENGINE");
  ::unsetenv("EVOGATE_TIMEOUT_S");
  ::unsetenv("EVOGATE_MEMORY_MB");
  ::unsetenv("EVOGATE_WORKERS");
  expect(cfg.engine == "local", "engine from env");
  expect(cfg.timeout_s == 42, "timeout from env");
  expect(cfg.limits.memory_bytes == 64ull * 1024 * 1024, "memory from env");
  expect(cfg.workers == 4, "malformed number ignored");
  expect(cfg.max_code_bytes == 4096, "code size limit from env");
  const ControllerConfig cc = ControllerConfig::from(cfg);
  expect(cc.workers == 4, "controller config derived");
}

void test_log_hook() {
  configure_logging("off", LogLevel::info);
  set_log_hook(capture_log);
  log_debug("test", "below threshold");
  log_warn("test", "visible", {{"k", "v"}});
  set_log_hook(nullptr);

  std::lock_guard<std::mutex> lk(g_log_mu);
  expect(g_logged.size() == 1, "only records at or above the minimum");
  expect(g_logged[0].level == LogLevel::warn && g_logged[0].msg == "visible", "record fields");
  const std::string line = log_record_to_json(g_logged[0]);
  expect(line.find("\"component\":\"test\"") != std::string::npos, "component in JSON");
  expect(line.find("\"k\":\"v\"") != std::string::npos, "fields in JSON");
  expect(parse_log_level("warn") == LogLevel::warn && !parse_log_level("loud"), "level parsing");
  g_logged.clear();
}

// ============================================================================
// Phase 7: Code generator adapter
// ============================================================================

void test_parse_generator_output() {
  const auto ok = parse_generator_output(
      R"({"code":"x = 1","analysis":{"risk_assessment":"safe","ethical_compliance":true,"syntax_valid":true}})", true);
  expect(ok.ok && ok.code == "x = 1", "valid output");
  expect(ok.analysis.risk_assessment == RiskAssessment::safe, "risk parsed");

  const auto garbage = parse_generator_output("not json", true);
  expect(!garbage.ok && garbage.error_code == ErrorCode::generator_malformed_output, "non-JSON");

  const auto no_analysis = parse_generator_output(R"({"code":"x"})", true);
  expect(!no_analysis.ok && no_analysis.error_code == ErrorCode::generator_malformed_output, "no analysis");

  const auto empty = parse_generator_output(R"({"code":"","analysis":{}})", true);
  expect(!empty.ok && empty.error_code == ErrorCode::generator_failed, "empty code");

  const auto validate = parse_generator_output(R"({"analysis":{}})", false);
  expect(validate.ok && validate.analysis.risk_assessment == RiskAssessment::blocked,
         "analysis-only output, missing risk fails closed");
}

void test_flatten_requirements() {
  EvolutionRequest req;
  req.kind = EvolutionKind::optimization;
  req.description = "speed up parsing";
  const jsonlite::Object o = flatten_requirements(req);
  expect(jsonlite::get_string(o, "function_name") == "evolved_function", "default function name");
  expect(jsonlite::get_string(o, "logic_description") == "speed up parsing", "logic defaults to description");
  expect(jsonlite::get_string(o, "context").find("Evolution Type: optimization") == 0, "context prefix");
  expect(jsonlite::get_string(o, "mode") == "generate", "mode");
}

void test_command_generator() {
  const fs::path tmp = fresh_dir("generator");
  const fs::path good = tmp / "good.sh";
  std::ofstream(good) << "grep -q function_name \"$1\" || exit 9\n"
                         "printf '%s' '{\"code\":\"print(1)\",\"analysis\":{\"risk_assessment\":\"caution\","
                         "\"ethical_compliance\":true,\"syntax_valid\":true}}'\n";
  const fs::path bad = tmp / "bad.sh";
  std::ofstream(bad) << "echo 'model unavailable' >&2\nexit 3\n";
  const fs::path noisy = tmp / "noisy.sh";
  std::ofstream(noisy) << "echo 'here is your code'\n";

  EvolutionRequest req = make_request(EvolutionKind::function_generation);
  CommandCodeGenerator gen("/bin/sh " + good.string(), 10, tmp.string());
  expect(gen.argv().size() == 2, "command split");
  const GenerationOutcome out = gen.generate_module(flatten_requirements(req));
  expect(out.ok && out.code == "print(1)", "generator output parsed");
  expect(out.analysis.risk_assessment == RiskAssessment::caution, "analysis parsed");

  CommandCodeGenerator failing("/bin/sh " + bad.string(), 10, tmp.string());
  const GenerationOutcome f = failing.generate_module(flatten_requirements(req));
  expect(!f.ok && f.error_code == ErrorCode::generator_failed, "non-zero exit");
  expect(f.error.find("generator exited 3") == 0, "exit status in error");

  CommandCodeGenerator chatty("/bin/sh " + noisy.string(), 10, tmp.string());
  const GenerationOutcome m = chatty.generate_module(flatten_requirements(req));
  expect(!m.ok && m.error_code == ErrorCode::generator_malformed_output, "prose output refused");

  const jsonlite::Object stats = gen.stats_json();
  expect(jsonlite::get_i64(stats, "total_generations") == 1, "stats counted");
  expect(jsonlite::get_i64(failing.stats_json(), "failed_generations") == 1, "failure counted");

  std::size_t leftovers = 0;
  for (const auto& entry : fs::directory_iterator(tmp)) {
    if (entry.path().filename().string().rfind("evogate_requirements_", 0) == 0) ++leftovers;
  }
  expect(leftovers == 0, "requirements files removed");
  fs::remove_all(tmp);
}

// ============================================================================
// Phase 8: Worker pool
// ============================================================================

void test_worker_pool_runs_tasks() {
  WorkerPool pool(3);
  expect(pool.size() == 3, "three threads");
  std::atomic<int> n{0};
  for (int i = 0; i < 50; ++i) {
    expect(pool.submit([&n] { ++n; }), "submit accepted");
  }
  pool.wait_idle();
  expect(n == 50, "all tasks ran");
  expect(pool.in_flight() == 0, "nothing in flight");
}

void test_worker_pool_drains_on_shutdown() {
  std::atomic<int> n{0};
  WorkerPool pool(1);
  for (int i = 0; i < 10; ++i) {
    pool.submit([&n] {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      ++n;
    });
  }
  pool.shutdown();
  expect(n == 10, "queued tasks drained");
  expect(!pool.submit([&n] { ++n; }), "submit after shutdown refused");
  expect(n == 10, "refused task not run");
  pool.shutdown();
}

void test_worker_pool_survives_throw() {
  WorkerPool pool(1);
  std::atomic<int> n{0};
  pool.submit([] { throw std::runtime_error("boom"); });
  pool.submit([&n] { ++n; });
  pool.wait_idle();
  expect(n == 1, "worker kept running");
}

// ============================================================================
// Phase 9: Sandbox runtime with a scripted engine
// ============================================================================

// Pretends to run the harness: start() drops a result.json into out_dir.
class ScriptedEngine : public IsolationEngine {
 public:
  int exit_code{0};
  bool fail_create{false};
  bool hang{false};
  std::string result_json{R"({"success":true,"output":"ok"})"};
  std::function<void()> on_start;          // runs before the environment counts as started
  std::atomic<int> effective_kills{0};

  std::string name() const override { return "scripted"; }
  bool ping(std::string*) override { return true; }
  bool ensure_image(std::string*) override { return true; }
  EngineCapabilities capabilities() const override {
    EngineCapabilities c;
    c.enforced = {"memory", "network"};
    return c;
  }
  std::pair<std::string, std::string> guest_paths(const EnvironmentSpec& spec) const override {
    return {spec.app_dir, spec.out_dir};
  }
  bool create(const EnvironmentSpec& spec, std::string* error) override {
    if (fail_create) {
      if (error) *error = "no capacity";
      return false;
    }
    std::lock_guard<std::mutex> lk(mu_);
    envs_[spec.id] = spec;
    return true;
  }
  bool start(const std::string& id, std::string*) override {
    if (on_start) on_start();
    std::string out_dir;
    {
      std::lock_guard<std::mutex> lk(mu_);
      out_dir = envs_.at(id).out_dir;
      started_.insert(id);
    }
    std::ofstream(out_dir + "/result.json") << result_json;
    return true;
  }
  WaitOutcome wait(const std::string& id, uint64_t) override {
    WaitOutcome w;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (killed_.count(id)) {
        w.exited = true;
        w.exit_code = 137;
        return w;
      }
    }
    if (hang) {
      w.timed_out = true;
      return w;
    }
    w.exited = true;
    w.exit_code = exit_code;
    return w;
  }
  void logs(const std::string&, std::string* out, std::string* err) override {
    if (out) *out = "scripted stdout";
    if (err) err->clear();
  }
  ResourceUsage stats(const std::string&) override { return ResourceUsage{}; }
  // Like a real engine, a kill before start() finished has nothing to signal.
  void kill(const std::string& id) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (!started_.count(id)) return;
    killed_.insert(id);
    ++effective_kills;
  }
  bool remove(const std::string& id) override {
    std::lock_guard<std::mutex> lk(mu_);
    envs_.erase(id);
    started_.erase(id);
    killed_.erase(id);
    return true;
  }

 private:
  std::mutex mu_;
  std::map<std::string, EnvironmentSpec> envs_;
  std::set<std::string> started_;
  std::set<std::string> killed_;
};

EvogateConfig scripted_config(const fs::path& tmp) {
  EvogateConfig cfg;
  cfg.profile = "posix_sh";
  cfg.temp_dir = tmp.string();
  cfg.timeout_s = 5;
  return cfg;
}

std::size_t workspaces_left(const fs::path& tmp) {
  std::size_t n = 0;
  for (const auto& entry : fs::directory_iterator(tmp)) {
    if (entry.path().filename().string().rfind("evogate_", 0) == 0) ++n;
  }
  return n;
}

void test_runtime_completed() {
  const fs::path tmp = fresh_dir("rt_ok");
  auto engine = std::make_unique<ScriptedEngine>();
  auto runtime = std::make_shared<SandboxRuntime>(std::move(engine), scripted_config(tmp));
  EvolutionSandbox sandbox(runtime);
  const SandboxResult r = sandbox.test_evolution("echo hi", {});
  expect(r.status == SandboxStatus::completed, "completed");
  expect(r.exit_code == 0, "exit code 0");
  expect(jsonlite::get_bool(r.test_results, "success"), "result.json read back");
  expect(r.stdout_text == "scripted stdout", "stdout captured");
  expect(!r.environment_id.empty(), "environment id assigned");
  expect(runtime->active_environments().empty(), "no active environment");
  expect(runtime->environments_created() == runtime->environments_removed(), "created == removed");
  expect(workspaces_left(tmp) == 0, "workspace removed");
  fs::remove_all(tmp);
}

void test_runtime_fault_and_timeout() {
  const fs::path tmp = fresh_dir("rt_fault");
  auto engine = std::make_unique<ScriptedEngine>();
  ScriptedEngine* raw = engine.get();
  auto runtime = std::make_shared<SandboxRuntime>(std::move(engine), scripted_config(tmp));
  EvolutionSandbox sandbox(runtime);

  raw->exit_code = 1;
  raw->result_json = R"({"success":false,"error_type":"ExitStatus","exit_status":3})";
  const SandboxResult failed = sandbox.test_evolution("exit 3", {});
  expect(failed.status == SandboxStatus::failed, "fault -> failed");
  expect(jsonlite::get_string(failed.test_results, "error_type") == "ExitStatus", "error type kept");

  raw->hang = true;
  const SandboxResult timed = sandbox.test_evolution("sleep 100", {}, 1);
  expect(timed.status == SandboxStatus::timeout, "hang -> timeout");
  expect(timed.error_message.has_value(), "timeout explained");

  const jsonlite::Object stats = sandbox.stats_json();
  expect(jsonlite::get_i64(stats, "runs") == 2, "runs counted");
  expect(jsonlite::get_i64(stats, "failed") == 1 && jsonlite::get_i64(stats, "timeouts") == 1, "outcomes counted");
  expect(jsonlite::get_string(stats, "engine") == "scripted", "engine named");
  expect(runtime->environments_created() == runtime->environments_removed(), "created == removed");
  expect(workspaces_left(tmp) == 0, "workspaces removed");
  fs::remove_all(tmp);
}

void test_runtime_create_failure() {
  const fs::path tmp = fresh_dir("rt_create");
  auto engine = std::make_unique<ScriptedEngine>();
  engine->fail_create = true;
  auto runtime = std::make_shared<SandboxRuntime>(std::move(engine), scripted_config(tmp));
  const SandboxResult r = runtime->execute("echo hi", {});
  expect(r.status == SandboxStatus::failed, "create failure -> failed");
  expect(r.error_message && r.error_message->find("no capacity") != std::string::npos, "engine error kept");
  expect(r.error_message->rfind("environment_create_failed: ", 0) == 0, "error code prefixed");
  expect(runtime->active_environments().empty(), "nothing left active");
  expect(workspaces_left(tmp) == 0, "workspace removed");
  fs::remove_all(tmp);
}

void test_runtime_kill_during_start() {
  const fs::path tmp = fresh_dir("rt_kill_start");
  auto engine = std::make_unique<ScriptedEngine>();
  ScriptedEngine* raw = engine.get();
  auto runtime = std::make_shared<SandboxRuntime>(std::move(engine), scripted_config(tmp));
  SandboxRuntime* rt = runtime.get();
  raw->on_start = [rt] { rt->kill_all(); };
  const SandboxResult r = runtime->execute("sleep 30", {});
  expect(r.status == SandboxStatus::killed, "reported killed");
  expect(raw->effective_kills == 1, "kill delivered once the environment had started");
  expect(runtime->active_environments().empty(), "nothing left active");
  expect(workspaces_left(tmp) == 0, "workspace removed");
  fs::remove_all(tmp);
}

void test_runtime_code_size_limit() {
  const fs::path tmp = fresh_dir("rt_size");
  EvogateConfig cfg = scripted_config(tmp);
  cfg.max_code_bytes = 16;
  auto runtime = std::make_shared<SandboxRuntime>(std::make_unique<ScriptedEngine>(), cfg);
  const SandboxResult big = runtime->execute(std::string(17, 'x'), {});
  expect(big.status == SandboxStatus::failed, "oversized candidate fails");
  expect(big.error_message && big.error_message->find("max_code_bytes") != std::string::npos, "limit named");
  expect(runtime->environments_created() == 0, "no environment for an oversized candidate");
  const SandboxResult fits = runtime->execute(std::string(16, 'x'), {});
  expect(fits.status == SandboxStatus::completed, "candidate at the limit runs");
  expect(runtime->environments_created() == 1, "one environment");
  fs::remove_all(tmp);
}

void test_runtime_error_codes() {
  const fs::path tmp = fresh_dir("rt_codes");
  const fs::path not_a_dir = tmp / "plain_file";
  std::ofstream(not_a_dir) << "x";
  EvogateConfig cfg = scripted_config(tmp);
  cfg.temp_dir = not_a_dir.string();
  auto runtime = std::make_shared<SandboxRuntime>(std::make_unique<ScriptedEngine>(), cfg);
  const SandboxResult r = runtime->execute("true", {});
  expect(r.status == SandboxStatus::failed, "unusable temp dir -> failed");
  expect(r.error_message && r.error_message->rfind("workspace_failed: ", 0) == 0, "workspace error code");

  bool unavailable = false;
  try {
    SandboxRuntime none(nullptr, scripted_config(tmp));
  } catch (const SandboxUnavailableError& e) {
    unavailable = std::string(e.what()).rfind("sandbox_unavailable: ", 0) == 0;
  }
  expect(unavailable, "missing engine reported as sandbox_unavailable");
  fs::remove_all(tmp);
}

void test_status_mapping() {
  expect(status_from_exit_code(0) == SandboxStatus::completed, "0 -> completed");
  expect(status_from_exit_code(124) == SandboxStatus::timeout, "124 -> timeout");
  expect(status_from_exit_code(1) == SandboxStatus::failed, "1 -> failed");
  SandboxResult r;
  r.status = SandboxStatus::running;
  expect(normalize_sandbox_result(r).status == SandboxStatus::failed, "non-terminal status normalized");
}

}  // namespace

int main() {
  configure_logging("off", LogLevel::info);
  std::cout << "=== Evogate Test Suite ===\n";

  std::cout << "\n[Phase 1] Hashing, JSON and wire types\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("strict JSON parse", test_json_strict_parse);
  run_test("sorted JSON output", test_json_sorted_output);
  run_test("enum names", test_enum_names);
  run_test("unknown levels fail closed", test_unknown_levels_fail_closed);
  run_test("request JSON", test_request_json);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Phase 2] Approval policy\n";
  run_test("base levels", test_base_levels);
  run_test("escalation", test_escalation);
  run_test("auto-apply gate", test_auto_apply_gate);

  std::cout << "\n[Phase 3] Controller lifecycle\n";
  run_test("bug fix auto-applied", test_auto_apply_bug_fix);
  run_test("timeout requires review", test_timeout_requires_review);
  run_test("generator failure", test_generator_failure);
  run_test("approve once", test_approve_once);
  run_test("reject is terminal", test_reject_is_terminal);
  run_test("unknown id", test_unknown_id);
  run_test("apply failure on approve", test_apply_failure_on_approve);
  run_test("automatic apply failure held", test_auto_apply_failure_held);
  run_test("unethical code needs a human", test_unethical_needs_human);
  run_test("history order and limit", test_history_order_and_limit);
  run_test("concurrent requests (40)", test_concurrent_requests);
  run_test("request after shutdown", test_request_after_shutdown);
  run_test("concurrent approvals", test_concurrent_approvals);
  run_test("approval racing finish", test_approve_races_finish);
  run_test("pending order matches history", test_pending_order_matches_history);
  run_test("apply failure logged with code", test_apply_failure_logged_with_code);
  run_test("validate system code", test_validate_system_code);
  run_test("stats JSON", test_stats_json);

  std::cout << "\n[Phase 4] Persistence and audit\n";
  run_test("store and restore", test_store_and_restore);
  run_test("controller audit chain", test_controller_audit_chain);
  run_test("audit append + resume + tamper", test_audit_append_and_resume);
  run_test("result store put/get", test_result_store_roundtrip);
  run_test("result store corruption", test_result_store_corruption);
  run_test("result store ids", test_result_store_ids);

  std::cout << "\n[Phase 5] Integration of approved code\n";
  run_test("module applier paths", test_module_applier_paths);
  run_test("module applier dry run", test_module_applier_dry_run);
  run_test("module applier backup", test_module_applier_backup);
  run_test("module applier restore on journal failure", test_module_applier_restores_on_journal_failure);
  run_test("unit name sanitization", test_unit_name_sanitization);

  std::cout << "\n[Phase 6] Configuration and logging\n";
  run_test("config validation", test_config_validation);
  run_test("config file", test_config_file);
  run_test("config from env", test_config_env);
  run_test("log hook", test_log_hook);

  std::cout << "\n[Phase 7] Code generator adapter\n";
  run_test("parse generator output", test_parse_generator_output);
  run_test("flatten requirements", test_flatten_requirements);
  run_test("command generator", test_command_generator);

  std::cout << "\n[Phase 8] Worker pool\n";
  run_test("tasks run", test_worker_pool_runs_tasks);
  run_test("drain on shutdown", test_worker_pool_drains_on_shutdown);
  run_test("survives throwing task", test_worker_pool_survives_throw);

  std::cout << "\n[Phase 9] Sandbox runtime (scripted engine)\n";
  run_test("completed run", test_runtime_completed);
  run_test("fault and timeout", test_runtime_fault_and_timeout);
  run_test("create failure", test_runtime_create_failure);
  run_test("kill during start", test_runtime_kill_during_start);
  run_test("code size limit", test_runtime_code_size_limit);
  run_test("error codes", test_runtime_error_codes);
  run_test("status mapping", test_status_mapping);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
