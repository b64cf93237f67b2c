#include "evogate/sandbox_runtime.hpp"

#include <unistd.h>

#include <chrono>

#include "evogate/log.hpp"
#include "evogate/process.hpp"
#include "evogate/workspace.hpp"

namespace evogate {

// Owns the per-call resources of one execution. Destruction removes the
// isolated environment, then the workspace, then unregisters the id.
class EnvironmentLease {
 public:
  EnvironmentLease(SandboxRuntime& rt, std::string id) : rt_(rt), id_(std::move(id)) {
    rt_.register_environment(id_);
  }

  ~EnvironmentLease() {
    if (engine_created && !rt_.engine_->remove(id_)) {
      log_error("sandbox", "environment removal failed", {{"env", id_}});
    }
    if (workspace && !workspace->remove()) {
      log_error("sandbox", "workspace removal failed", {{"env", id_}, {"path", workspace->root()}});
    }
    workspace.reset();
    rt_.release_environment(id_);
  }

  EnvironmentLease(const EnvironmentLease&) = delete;
  EnvironmentLease& operator=(const EnvironmentLease&) = delete;

  std::unique_ptr<Workspace> workspace;
  bool engine_created{false};

 private:
  SandboxRuntime& rt_;
  std::string id_;
};

namespace {

jsonlite::Object read_result_file(const Workspace& ws) {
  jsonlite::Object out;
  const auto text = ws.read_out_file(RESULT_FILE_NAME);
  if (!text) {
    out["error"] = "result file not found";
    return out;
  }
  std::optional<jsonlite::JsonError> err;
  jsonlite::Object parsed = jsonlite::parse(*text, &err);
  if (err) {
    out["error"] = "malformed result file: " + err->message;
    return out;
  }
  return parsed;
}

std::string resolve_interpreter(const EvogateConfig& cfg, HarnessProfile profile, bool container) {
  if (!cfg.interpreter.empty()) return cfg.interpreter;
  return container ? container_interpreter(profile) : default_interpreter(profile);
}

std::string coded(ErrorCode code, const std::string& detail) { return to_string(code) + ": " + detail; }

HarnessProfile require_profile(const std::string& name) {
  const auto p = parse_harness_profile(name);
  if (!p) throw SandboxUnavailableError(coded(ErrorCode::sandbox_unavailable, "unknown harness profile: " + name));
  return *p;
}

}  // namespace

SandboxStatus status_from_exit_code(int exit_code) {
  if (exit_code == 0) return SandboxStatus::completed;
  if (exit_code == TIMEOUT_EXIT_CODE) return SandboxStatus::timeout;
  return SandboxStatus::failed;
}

SandboxRuntime::SandboxRuntime(const EvogateConfig& cfg) : cfg_(cfg) {
  profile_ = require_profile(cfg_.profile);
  interpreter_ = resolve_interpreter(cfg_, profile_, cfg_.engine == "docker");
  std::string err;
  engine_ = make_engine(cfg_, interpreter_, &err);
  if (!engine_) throw SandboxUnavailableError(coded(ErrorCode::sandbox_unavailable, err));
  init();
}

SandboxRuntime::SandboxRuntime(std::unique_ptr<IsolationEngine> engine, const EvogateConfig& cfg)
    : engine_(std::move(engine)), cfg_(cfg) {
  if (!engine_) throw SandboxUnavailableError(coded(ErrorCode::sandbox_unavailable, "no isolation engine"));
  profile_ = require_profile(cfg_.profile);
  interpreter_ = resolve_interpreter(cfg_, profile_, engine_->name() == "docker");
  init();
}

SandboxRuntime::~SandboxRuntime() {
  const auto active = active_environments();
  if (!active.empty()) {
    log_warn("sandbox", "runtime destroyed with active environments",
             {{"count", std::to_string(active.size())}});
    kill_all();
  }
}

void SandboxRuntime::init() {
  std::string err;
  if (!engine_->ping(&err))
    throw SandboxUnavailableError(coded(ErrorCode::sandbox_unavailable, engine_->name() + ": " + err));
  if (!engine_->ensure_image(&err))
    throw SandboxUnavailableError(coded(ErrorCode::sandbox_unavailable, engine_->name() + ": " + err));
  log_info("sandbox", "isolation engine ready",
           {{"engine", engine_->name()},
            {"profile", to_string(profile_)},
            {"interpreter", interpreter_},
            {"timeout_s", std::to_string(cfg_.timeout_s)}});
}

std::string SandboxRuntime::next_environment_id() {
  std::lock_guard<std::mutex> lk(mu_);
  return "env-" + std::to_string(static_cast<long>(::getpid())) + "-" + std::to_string(++seq_);
}

void SandboxRuntime::register_environment(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  active_.insert(id);
  ++created_;
}

void SandboxRuntime::release_environment(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  active_.erase(id);
  ++removed_;
}

bool SandboxRuntime::was_killed(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return killed_.count(id) > 0;
}

std::vector<std::string> SandboxRuntime::active_environments() const {
  std::lock_guard<std::mutex> lk(mu_);
  return {active_.begin(), active_.end()};
}

void SandboxRuntime::kill_all() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& id : active_) {
      killed_.insert(id);
      ids.push_back(id);
    }
  }
  for (const auto& id : ids) {
    log_warn("sandbox", "killing environment", {{"env", id}});
    engine_->kill(id);
  }
}

SandboxResult SandboxRuntime::execute(const std::string& code, const jsonlite::Object& fixtures,
                                      std::optional<uint32_t> timeout_s) {
  const uint32_t limit = (timeout_s && *timeout_s > 0) ? *timeout_s : cfg_.timeout_s;
  const uint64_t watchdog_ms = (static_cast<uint64_t>(limit) + cfg_.watchdog_grace_s) * 1000;
  const auto started = std::chrono::steady_clock::now();

  SandboxResult result;
  result.timestamp_unix_ms = now_unix_ms();
  result.status = SandboxStatus::running;
  const std::string id = next_environment_id();
  result.environment_id = id;

  if (code.size() > cfg_.max_code_bytes) {
    result.status = SandboxStatus::failed;
    result.exit_code = -1;
    result.error_message = "candidate code is " + std::to_string(code.size()) +
                           " bytes, max_code_bytes is " + std::to_string(cfg_.max_code_bytes);
    result.stderr_text = *result.error_message;
    log_warn("sandbox", "candidate refused before execution",
             {{"env", id}, {"code_bytes", std::to_string(code.size())}});
    return result;
  }

  try {
    EnvironmentLease lease(*this, id);
    std::string err;
    lease.workspace = Workspace::create(cfg_.temp_dir, id, &err);
    if (!lease.workspace) throw std::runtime_error(coded(ErrorCode::workspace_failed, err));
    for (const auto& f : harness_files(profile_, code, fixtures)) {
      if (!lease.workspace->write_app_file(f.name, f.content, &err))
        throw std::runtime_error(coded(ErrorCode::workspace_failed, err));
    }

    EnvironmentSpec spec;
    spec.id = id;
    spec.app_dir = lease.workspace->app_dir();
    spec.out_dir = lease.workspace->out_dir();
    spec.limits = cfg_.limits;
    spec.timeout_s = limit;
    const auto [app_path, out_path] = engine_->guest_paths(spec);
    spec.command = harness_command(profile_, interpreter_, app_path);
    spec.env = harness_env(app_path, out_path, !fixtures.empty(), limit);

    if (!engine_->create(spec, &err)) throw std::runtime_error(coded(ErrorCode::environment_create_failed, err));
    lease.engine_created = true;
    if (was_killed(id)) throw std::runtime_error("environment killed before start");
    if (!engine_->start(id, &err)) throw std::runtime_error("environment start failed: " + err);
    // A kill_all() racing start() may have found nothing to signal yet.
    if (was_killed(id)) engine_->kill(id);
    log_debug("sandbox", "environment started", {{"env", id}, {"timeout_s", std::to_string(limit)}});

    const WaitOutcome w = engine_->wait(id, watchdog_ms);
    if (w.timed_out) {
      // Outer watchdog: the harness did not stop itself.
      engine_->kill(id);
      engine_->wait(id, 10000);
      result.exit_code = TIMEOUT_EXIT_CODE;
      result.error_message = "sandbox watchdog expired after " + std::to_string(watchdog_ms / 1000) + "s";
    } else if (!w.exited) {
      throw std::runtime_error(w.error.empty() ? "environment wait failed" : w.error);
    } else {
      result.exit_code = w.exit_code;
    }

    engine_->logs(id, &result.stdout_text, &result.stderr_text);
    result.resource_usage = engine_->stats(id);
    if (result.resource_usage.memory_limit_bytes == 0)
      result.resource_usage.memory_limit_bytes = cfg_.limits.memory_bytes;
    result.test_results = read_result_file(*lease.workspace);
    result.status = was_killed(id) ? SandboxStatus::killed : status_from_exit_code(*result.exit_code);
  } catch (const std::exception& e) {
    result.status = was_killed(id) ? SandboxStatus::killed : SandboxStatus::failed;
    result.exit_code = -1;
    result.error_message = e.what();
    if (!result.stderr_text.empty()) result.stderr_text += "\n";
    result.stderr_text += e.what();
    log_error("sandbox", "execution infrastructure failure", {{"env", id}, {"error", e.what()}});
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    killed_.erase(id);
  }
  result.execution_time_s =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  log_info("sandbox", "execution finished",
           {{"env", id},
            {"status", to_string(result.status)},
            {"exit_code", result.exit_code ? std::to_string(*result.exit_code) : "none"}});
  return result;
}

}  // namespace evogate
