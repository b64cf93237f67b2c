#include "evogate/evolution_controller.hpp"

#include <time.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <fstream>
#include <iterator>

#include "evogate/approval.hpp"
#include "evogate/config.hpp"
#include "evogate/hash.hpp"
#include "evogate/log.hpp"

namespace evogate {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

RequestState state_of(const EvolutionResult& r) {
  if (!r.success) return RequestState::failed;
  if (r.rejected) return RequestState::rejected;
  if (r.applied) return RequestState::applied;
  return RequestState::pending_approval;
}

bool newer_first(const EvolutionResult& a, const EvolutionResult& b) {
  if (a.timestamp_unix_ms != b.timestamp_unix_ms) return a.timestamp_unix_ms > b.timestamp_unix_ms;
  return a.completion_seq > b.completion_seq;
}

}  // namespace

ControllerConfig ControllerConfig::from(const EvogateConfig& cfg) {
  ControllerConfig c;
  c.workers = cfg.workers;
  c.store_root = cfg.store_root;
  c.audit_log_path = cfg.audit_log;
  return c;
}

jsonlite::Object pending_approval_to_json(const PendingApproval& p) {
  jsonlite::Object o;
  o["request_id"] = p.request_id;
  o["evolution_type"] = to_string(p.kind);
  o["approval_level"] = to_string(p.approval_level);
  o["risk_assessment"] = p.risk_assessment ? to_string(*p.risk_assessment) : std::string("unknown");
  o["sandbox_status"] = p.sandbox_status ? to_string(*p.sandbox_status) : std::string("none");
  o["timestamp"] = iso8601_utc(p.timestamp_unix_ms);
  o["timestamp_unix_ms"] = p.timestamp_unix_ms;
  o["description"] = p.description;
  return o;
}

// ---------------------------------------------------------------------------
// EvolutionController
// ---------------------------------------------------------------------------

EvolutionController::EvolutionController(std::shared_ptr<CodeGenerator> generator,
                                         std::shared_ptr<SandboxRunner> sandbox,
                                         std::shared_ptr<EvolutionApplier> applier, ControllerConfig config)
    : generator_(std::move(generator)),
      sandbox_(std::move(sandbox)),
      applier_(std::move(applier)),
      config_(std::move(config)),
      audit_(config_.audit_log_path),
      store_(config_.store_root.empty() ? nullptr : std::make_unique<ResultStore>(config_.store_root)),
      pool_(config_.workers) {
  log_info("controller", "evolution controller started",
           {{"workers", std::to_string(pool_.size())},
            {"store", config_.store_root.empty() ? "memory" : config_.store_root}});
}

EvolutionController::~EvolutionController() { shutdown(); }

std::string EvolutionController::next_request_id_locked() {
  const uint64_t now_ms = now_unix_ms();
  const time_t secs = static_cast<time_t>(now_ms / 1000);
  struct tm tm_utc {};
  gmtime_r(&secs, &tm_utc);
  char stamp[32];
  std::snprintf(stamp, sizeof(stamp), "%04d%02d%02d_%02d%02d%02d", tm_utc.tm_year + 1900, tm_utc.tm_mon + 1,
                tm_utc.tm_mday, tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec);
  std::string id;
  do {
    id = "evo_" + std::string(stamp) + "_" + std::to_string(++id_seq_);
  } while (pending_.count(id) || completed_.count(id) || failed_.count(id));
  return id;
}

std::string EvolutionController::request_evolution(EvolutionRequest request) {
  if (request.created_at_unix_ms == 0) request.created_at_unix_ms = now_unix_ms();

  std::string id;
  bool accepting = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    id = next_request_id_locked();
    ++stats_.total_requests;
    accepting = !shutting_down_;
    if (accepting) {
      pending_.emplace(id, request);
      states_[id] = RequestState::submitted;
    }
  }

  if (accepting) {
    transition(id, RequestState::submitted, request.requester, to_string(request.kind));
    const bool queued = pool_.submit([this, id, request] { process_evolution(id, request); });
    if (queued) {
      log_info("controller", "evolution requested", {{"request_id", id}, {"kind", to_string(request.kind)}});
      return id;
    }
    std::lock_guard<std::mutex> lk(mu_);
    pending_.erase(id);
  }

  log_warn("controller", "request refused during shutdown", {{"request_id", id}});
  finish(failed_result(id, request, to_string(ErrorCode::shutting_down) + ": controller is shutting down", 0.0),
         false);
  return id;
}

EvolutionResult EvolutionController::failed_result(const std::string& request_id, const EvolutionRequest& request,
                                                   const std::string& error, double execution_time_s) {
  EvolutionResult failed;
  failed.request_id = request_id;
  failed.request = request;
  failed.success = false;
  failed.approval_level = ApprovalLevel::committee_approval;
  failed.error_message = error;
  failed.execution_time_s = execution_time_s;
  return failed;
}

void EvolutionController::process_evolution(const std::string& request_id, const EvolutionRequest& request) {
  const auto start = std::chrono::steady_clock::now();
  EvolutionResult result;
  bool completed = false;
  try {
    transition(request_id, RequestState::generating, "controller");
    GenerationOutcome generated = generator_->generate_module(flatten_requirements(request));
    if (!generated.ok) {
      const std::string error = generated.error.empty() ? "code generation failed" : generated.error;
      log_error("controller", "code generation failed", {{"request_id", request_id}, {"error", error}});
      result = failed_result(request_id, request, error, seconds_since(start));
    } else {
      result.request_id = request_id;
      result.request = request;
      result.generated_code = std::move(generated.code);
      result.code_digest = code_digest(result.generated_code);
      result.code_analysis = generated.analysis;

      SandboxResult sandboxed =
          sandbox_->test_evolution(result.generated_code, request.requirements.test_fixtures);
      transition(request_id, RequestState::sandboxed, "controller", to_string(sandboxed.status),
                 result.code_digest);

      const CodeAnalysis& analysis = *result.code_analysis;
      result.approval_level =
          determine_approval_level(analysis.risk_assessment, sandboxed.status, analysis.ethical_compliance);

      if (may_auto_apply(result.approval_level, sandboxed.status)) {
        result.applied = applier_->apply(request_id, request, result.generated_code);
        if (!result.applied) {
          log_warn("controller", "automatic apply failed; held for approval",
                   {{"request_id", request_id}, {"code", to_string(ErrorCode::apply_failed)}});
        }
      }
      result.sandbox_result = std::move(sandboxed);
      result.success = true;
      result.execution_time_s = seconds_since(start);
      completed = true;
    }
  } catch (const std::exception& e) {
    log_error("controller", "evolution failed", {{"request_id", request_id}, {"error", e.what()}});
    result = failed_result(request_id, request, e.what(), seconds_since(start));
    completed = false;
  }
  finish(std::move(result), completed);
}

void EvolutionController::finish(EvolutionResult result, bool completed) {
  const bool auto_applied = completed && result.applied;
  const bool tried_apply =
      completed && result.sandbox_result && may_auto_apply(result.approval_level, result.sandbox_result->status);
  const RequestState state = state_of(result);
  const std::string id = result.request_id;
  const std::string digest = result.code_digest;
  const std::string detail = result.error_message ? *result.error_message : to_string(result.approval_level);
  const ApprovalLevel level = result.approval_level;

  std::lock_guard<std::mutex> order(persist_mu_);
  {
    std::lock_guard<std::mutex> lk(mu_);
    result.timestamp_unix_ms = now_unix_ms();
    result.completion_seq = ++completion_seq_;
    if (completed) {
      ++stats_.successful_evolutions;
      if (auto_applied) ++stats_.automatic_approvals;
      if (tried_apply && !auto_applied) ++stats_.apply_failures;
      completed_[id] = std::move(result);
    } else {
      ++stats_.failed_evolutions;
      failed_[id] = std::move(result);
    }
    states_[id] = state;
    pending_.erase(id);
  }

  transition(id, state, "controller", detail, digest);
  persist(id);
  if (auto_applied) {
    log_info("controller", "evolution applied automatically", {{"request_id", id}});
  } else if (completed) {
    log_info("controller", "evolution awaits approval",
             {{"request_id", id}, {"approval_level", to_string(level)}});
  }
}

bool EvolutionController::approve_evolution(const std::string& request_id, bool approved,
                                            const std::string& approver) {
  EvolutionRequest request;
  std::string code;
  std::optional<EvolutionResult> rejected;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = completed_.find(request_id);
    if (it == completed_.end() || it->second.applied || it->second.rejected) {
      log_warn("controller", "evolution not found or already decided", {{"request_id", request_id}});
      return false;
    }
    if (approving_.count(request_id)) {
      log_warn("controller", "approval already in progress", {{"request_id", request_id}});
      return false;
    }

    if (!approved) {
      it->second.rejected = true;
      it->second.decided_by = approver;
      ++stats_.rejected_evolutions;
      states_[request_id] = RequestState::rejected;
      rejected = it->second;
    } else if (it->second.generated_code.empty()) {
      log_error("controller", "no generated code to apply", {{"request_id", request_id}});
      return false;
    } else {
      approving_.insert(request_id);
      request = it->second.request;
      code = it->second.generated_code;
    }
  }

  if (rejected) {
    std::lock_guard<std::mutex> order(persist_mu_);
    transition(request_id, RequestState::rejected, approver, "rejected", rejected->code_digest);
    persist(request_id);
    log_info("controller", "evolution rejected", {{"request_id", request_id}, {"approver", approver}});
    return true;
  }

  bool applied = false;
  try {
    applied = applier_->apply(request_id, request, code);
  } catch (const std::exception& e) {
    log_error("controller", "apply threw",
              {{"request_id", request_id}, {"code", to_string(ErrorCode::apply_failed)}, {"error", e.what()}});
  }

  std::lock_guard<std::mutex> order(persist_mu_);
  EvolutionResult snapshot;
  {
    std::lock_guard<std::mutex> lk(mu_);
    approving_.erase(request_id);
    if (!applied) {
      ++stats_.apply_failures;
      log_error("controller", "failed to apply approved evolution",
                {{"request_id", request_id}, {"code", to_string(ErrorCode::apply_failed)}});
      return false;
    }
    EvolutionResult& r = completed_.at(request_id);
    r.applied = true;
    r.decided_by = approver;
    ++stats_.manual_approvals;
    states_[request_id] = RequestState::applied;
    snapshot = r;
  }
  transition(request_id, RequestState::applied, approver, "approved", snapshot.code_digest);
  persist(request_id);
  log_info("controller", "evolution approved and applied", {{"request_id", request_id}, {"approver", approver}});
  return true;
}

std::vector<PendingApproval> EvolutionController::get_pending_approvals() const {
  std::vector<std::pair<uint64_t, PendingApproval>> ranked;
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& [id, r] : completed_) {
    if (r.applied || r.rejected || r.approval_level == ApprovalLevel::automatic) continue;
    PendingApproval p;
    p.request_id = id;
    p.kind = r.request.kind;
    p.approval_level = r.approval_level;
    if (r.code_analysis) p.risk_assessment = r.code_analysis->risk_assessment;
    if (r.sandbox_result) p.sandbox_status = r.sandbox_result->status;
    p.timestamp_unix_ms = r.timestamp_unix_ms;
    p.description = r.request.description;
    ranked.emplace_back(r.completion_seq, std::move(p));
  }
  // Newest first; completion order breaks ties within one millisecond.
  std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
    if (a.second.timestamp_unix_ms != b.second.timestamp_unix_ms)
      return a.second.timestamp_unix_ms > b.second.timestamp_unix_ms;
    return a.first > b.first;
  });
  std::vector<PendingApproval> out;
  out.reserve(ranked.size());
  for (auto& [seq, p] : ranked) out.push_back(std::move(p));
  return out;
}

std::size_t EvolutionController::pending_approvals_locked() const {
  std::size_t n = 0;
  for (const auto& [id, r] : completed_) {
    if (!r.applied && !r.rejected && r.approval_level != ApprovalLevel::automatic) ++n;
  }
  return n;
}

std::vector<EvolutionResult> EvolutionController::get_evolution_history(std::size_t limit) const {
  std::vector<EvolutionResult> all;
  {
    std::lock_guard<std::mutex> lk(mu_);
    all.reserve(completed_.size() + failed_.size());
    for (const auto& [id, r] : completed_) all.push_back(r);
    for (const auto& [id, r] : failed_) all.push_back(r);
  }
  std::sort(all.begin(), all.end(), newer_first);
  if (all.size() > limit) all.resize(limit);
  return all;
}

EvolutionStats EvolutionController::get_evolution_stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  EvolutionStats s = stats_;
  s.pending_evolutions = pending_.size();
  s.pending_approvals = pending_approvals_locked();
  return s;
}

jsonlite::Object EvolutionController::stats_json() const {
  const EvolutionStats s = get_evolution_stats();
  jsonlite::Object o;
  o["total_requests"] = s.total_requests;
  o["successful_evolutions"] = s.successful_evolutions;
  o["failed_evolutions"] = s.failed_evolutions;
  o["automatic_approvals"] = s.automatic_approvals;
  o["manual_approvals"] = s.manual_approvals;
  o["rejected_evolutions"] = s.rejected_evolutions;
  o["apply_failures"] = s.apply_failures;
  o["store_failures"] = s.store_failures;
  o["pending_evolutions"] = s.pending_evolutions;
  o["pending_approvals"] = s.pending_approvals;
  o["audit_entries"] = audit_.entry_count();
  o["audit_failures"] = audit_.failure_count();
  o["code_generator_stats"] = generator_->stats_json();
  o["sandbox_stats"] = sandbox_->stats_json();
  return o;
}

std::optional<RequestState> EvolutionController::request_state(const std::string& request_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = states_.find(request_id);
  if (it == states_.end()) return std::nullopt;
  return it->second;
}

std::optional<EvolutionResult> EvolutionController::get_result(const std::string& request_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (auto it = completed_.find(request_id); it != completed_.end()) return it->second;
  if (auto it = failed_.find(request_id); it != failed_.end()) return it->second;
  return std::nullopt;
}

std::size_t EvolutionController::restore_from_store() {
  if (!store_) return 0;
  std::size_t skipped = 0;
  std::vector<EvolutionResult> loaded = store_->load_all(&skipped);

  std::size_t added = 0;
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& r : loaded) {
    const std::string id = r.request_id;
    if (pending_.count(id) || completed_.count(id) || failed_.count(id)) continue;
    ++stats_.total_requests;
    if (r.success) {
      ++stats_.successful_evolutions;
      if (r.applied && r.decided_by.empty()) ++stats_.automatic_approvals;
      if (r.applied && !r.decided_by.empty()) ++stats_.manual_approvals;
      if (r.rejected) ++stats_.rejected_evolutions;
    } else {
      ++stats_.failed_evolutions;
    }
    completion_seq_ = std::max(completion_seq_, r.completion_seq);
    states_[id] = state_of(r);
    if (r.success) {
      completed_.emplace(id, std::move(r));
    } else {
      failed_.emplace(id, std::move(r));
    }
    ++added;
  }
  log_info("controller", "history restored",
           {{"records", std::to_string(added)}, {"skipped", std::to_string(skipped)}});
  return added;
}

GenerationOutcome EvolutionController::validate_system_code(const std::string& module_path) {
  std::ifstream ifs(module_path, std::ios::binary);
  if (!ifs) {
    GenerationOutcome out;
    out.error_code = ErrorCode::generator_failed;
    out.error = "cannot read " + module_path;
    return out;
  }
  const std::string code((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return generator_->validate_existing_code(code, "Existing module: " + module_path);
}

void EvolutionController::wait_idle() { pool_.wait_idle(); }

void EvolutionController::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (shutting_down_) return;
    shutting_down_ = true;
  }
  pool_.shutdown();
  sandbox_->cleanup_all();
  log_info("controller", "evolution controller stopped");
}

void EvolutionController::transition(const std::string& request_id, RequestState state, const std::string& actor,
                                     const std::string& detail, const std::string& digest) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = states_.find(request_id);
    // Terminal states are set by finish()/approve; only advance in-flight ones here.
    if (it != states_.end() && (state == RequestState::generating || state == RequestState::sandboxed)) {
      it->second = state;
    }
  }
  TransitionRecord rec;
  rec.request_id = request_id;
  rec.state = state;
  rec.actor = actor;
  rec.detail = detail;
  rec.code_digest = digest;
  if (!audit_.append(rec)) {
    log_debug("audit", "transition not recorded", {{"request_id", request_id}, {"state", to_string(state)}});
  }
}

void EvolutionController::persist(const std::string& request_id) {
  if (!store_) return;
  EvolutionResult result;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = completed_.find(request_id);
    if (it != completed_.end()) {
      result = it->second;
    } else if (auto f = failed_.find(request_id); f != failed_.end()) {
      result = f->second;
    } else {
      return;
    }
  }
  StoreError err;
  if (!store_->put(result, &err)) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      ++stats_.store_failures;
    }
    log_warn("store", "result not persisted", {{"request_id", result.request_id}, {"error", err.message}});
  }
}

}  // namespace evogate
