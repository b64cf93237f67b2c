#include "evogate/evolution_sandbox.hpp"

#include "evogate/log.hpp"
#include "evogate/sandbox_runtime.hpp"

namespace evogate {

SandboxResult normalize_sandbox_result(SandboxResult r) {
  if (r.timestamp_unix_ms == 0) r.timestamp_unix_ms = now_unix_ms();
  if (!r.exit_code) r.exit_code = -1;
  // A run that never reached a terminal state is a failure.
  if (r.status == SandboxStatus::ready || r.status == SandboxStatus::running) {
    r.status = SandboxStatus::failed;
    if (!r.error_message) r.error_message = "sandbox run did not reach a terminal state";
  }
  if (r.status != SandboxStatus::completed && r.test_results.empty()) {
    r.test_results["error"] = r.error_message ? *r.error_message : "result file not found";
  }
  return r;
}

EvolutionSandbox::EvolutionSandbox(std::shared_ptr<SandboxRuntime> runtime)
    : runtime_(std::move(runtime)) {}

void EvolutionSandbox::count(SandboxStatus status) {
  ++runs_;
  switch (status) {
    case SandboxStatus::completed: ++completed_; break;
    case SandboxStatus::timeout: ++timeouts_; break;
    case SandboxStatus::killed: ++killed_; break;
    case SandboxStatus::failed:
    case SandboxStatus::ready:
    case SandboxStatus::running: ++failed_; break;
  }
}

SandboxResult EvolutionSandbox::test_evolution(const std::string& code, const jsonlite::Object& fixtures,
                                               std::optional<uint32_t> timeout_s) {
  SandboxResult result;
  try {
    result = runtime_->execute(code, fixtures, timeout_s);
  } catch (const std::exception& e) {
    result = SandboxResult{};
    result.status = SandboxStatus::failed;
    result.exit_code = -1;
    result.stderr_text = e.what();
    result.error_message = e.what();
    log_error("sandbox", "runtime raised during test_evolution", {{"error", e.what()}});
  }
  result = normalize_sandbox_result(std::move(result));
  count(result.status);
  return result;
}

jsonlite::Object EvolutionSandbox::stats_json() const {
  const EvogateConfig& cfg = runtime_->config();
  jsonlite::Object limits;
  limits["memory_bytes"] = cfg.limits.memory_bytes;
  limits["cpu_period_us"] = cfg.limits.cpu_period_us;
  limits["cpu_quota_us"] = cfg.limits.cpu_quota_us;
  limits["max_processes"] = cfg.limits.max_processes;
  limits["max_file_descriptors"] = cfg.limits.max_file_descriptors;

  jsonlite::Object o;
  o["engine"] = runtime_->engine().name();
  o["image"] = cfg.image;
  o["interpreter"] = runtime_->interpreter();
  o["profile"] = to_string(runtime_->profile());
  o["active_environments"] = runtime_->active_environments().size();
  o["environments_created"] = runtime_->environments_created();
  o["environments_removed"] = runtime_->environments_removed();
  o["runs"] = runs_.load();
  o["completed"] = completed_.load();
  o["failed"] = failed_.load();
  o["timeouts"] = timeouts_.load();
  o["killed"] = killed_.load();
  o["limits"] = std::move(limits);
  o["timeout"] = cfg.timeout_s;
  return o;
}

void EvolutionSandbox::cleanup_all() { runtime_->kill_all(); }

}  // namespace evogate
