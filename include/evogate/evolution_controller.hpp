#pragma once

// evogate/evolution_controller.hpp — Approval state machine and book-keeping
// for evolution requests.
//
// PER-REQUEST LIFECYCLE:
//   submitted -> generating -> sandboxed -> applied            (auto-apply)
//                                        -> pending_approval -> applied | rejected
//   generating | sandboxed -> failed                          (unrecoverable error)
//
// PROCESSING (one worker task per request, steps strictly in order):
//   1. generator->generate_module(flatten_requirements(request))
//      failure -> failed history, no sandbox run
//   2. sandbox->test_evolution(code, fixtures); failures are a SandboxResult
//   3. determine_approval_level(risk, sandbox status, ethical compliance)
//   4. may_auto_apply() -> applier->apply()
//   5. result into the completed (or, on exception, failed) history
//   6. request leaves the pending queue
//
// THREAD SAFETY:
//   Every public method may be called from any thread. Pending queue,
//   histories, states and counters are guarded by one mutex; the generator,
//   the sandbox and the applier are always called without holding it.
//   persist_mu_ orders each terminal update together with its audit record
//   and store write, so the stored record is always the latest one. Lock
//   order: persist_mu_ before mu_.
//
// INVARIANTS:
//   - A request id names at most one pending entry, and ends up in exactly
//     one of the completed/failed histories.
//   - applied == true only via may_auto_apply() or approve_evolution().
//   - A rejected result is terminal. Of concurrent approvals for one id at
//     most one runs the apply step.

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "evogate/applier.hpp"
#include "evogate/audit.hpp"
#include "evogate/code_generator.hpp"
#include "evogate/evolution_sandbox.hpp"
#include "evogate/result_store.hpp"
#include "evogate/types.hpp"
#include "evogate/worker_pool.hpp"

namespace evogate {

struct EvogateConfig;

struct ControllerConfig {
  uint32_t workers{4};
  std::string store_root;          // "" -> in-memory history only
  std::string audit_log_path;      // "" -> no transition log

  static ControllerConfig from(const EvogateConfig& cfg);
};

struct PendingApproval {
  std::string request_id;
  EvolutionKind kind{EvolutionKind::function_generation};
  ApprovalLevel approval_level{ApprovalLevel::committee_approval};
  std::optional<RiskAssessment> risk_assessment;
  std::optional<SandboxStatus> sandbox_status;
  uint64_t timestamp_unix_ms{0};
  std::string description;
};

jsonlite::Object pending_approval_to_json(const PendingApproval& p);

struct EvolutionStats {
  uint64_t total_requests{0};
  uint64_t successful_evolutions{0};
  uint64_t failed_evolutions{0};
  uint64_t automatic_approvals{0};
  uint64_t manual_approvals{0};
  uint64_t rejected_evolutions{0};
  uint64_t apply_failures{0};
  uint64_t store_failures{0};
  std::size_t pending_evolutions{0};
  std::size_t pending_approvals{0};
};

class EvolutionController {
 public:
  EvolutionController(std::shared_ptr<CodeGenerator> generator, std::shared_ptr<SandboxRunner> sandbox,
                      std::shared_ptr<EvolutionApplier> applier, ControllerConfig config = {});
  ~EvolutionController();

  EvolutionController(const EvolutionController&) = delete;
  EvolutionController& operator=(const EvolutionController&) = delete;

  // Non-blocking. Returns the new request id. After shutdown() the request
  // is recorded as failed immediately and its id is still returned.
  std::string request_evolution(EvolutionRequest request);

  // false: unknown id, already applied, rejected, another approval of the
  // same id in progress, or the apply step failed.
  bool approve_evolution(const std::string& request_id, bool approved, const std::string& approver = "human");

  // Completed results with approval_level != automatic that are neither
  // applied nor rejected.
  std::vector<PendingApproval> get_pending_approvals() const;

  // Completed and failed results, newest first, at most limit entries.
  std::vector<EvolutionResult> get_evolution_history(std::size_t limit = 50) const;

  EvolutionStats get_evolution_stats() const;

  // Counters plus generator and sandbox statistics.
  jsonlite::Object stats_json() const;

  std::optional<RequestState> request_state(const std::string& request_id) const;
  std::optional<EvolutionResult> get_result(const std::string& request_id) const;

  // Loads persisted results not yet known to this controller. Returns how
  // many were added.
  std::size_t restore_from_store();

  // Asks the generator to analyse a module already part of the system.
  GenerationOutcome validate_system_code(const std::string& module_path);

  void wait_idle();

  // Stops intake, drains in-flight requests, then releases the sandbox.
  void shutdown();

 private:
  std::string next_request_id_locked();
  void process_evolution(const std::string& request_id, const EvolutionRequest& request);
  static EvolutionResult failed_result(const std::string& request_id, const EvolutionRequest& request,
                                       const std::string& error, double execution_time_s);
  void finish(EvolutionResult result, bool completed);
  void transition(const std::string& request_id, RequestState state, const std::string& actor,
                  const std::string& detail = "", const std::string& digest = "");
  // Stores the current snapshot of request_id. Caller holds persist_mu_.
  void persist(const std::string& request_id);
  std::size_t pending_approvals_locked() const;

  std::shared_ptr<CodeGenerator> generator_;
  std::shared_ptr<SandboxRunner> sandbox_;
  std::shared_ptr<EvolutionApplier> applier_;
  ControllerConfig config_;
  AuditLog audit_;
  std::unique_ptr<ResultStore> store_;

  std::mutex persist_mu_;
  mutable std::mutex mu_;
  std::map<std::string, EvolutionRequest> pending_;
  std::map<std::string, EvolutionResult> completed_;
  std::map<std::string, EvolutionResult> failed_;
  std::map<std::string, RequestState> states_;
  std::set<std::string> approving_;
  EvolutionStats stats_;
  uint64_t id_seq_{0};
  uint64_t completion_seq_{0};
  bool shutting_down_{false};

  // Last member: destroyed first, so no task outlives the state above.
  WorkerPool pool_;
};

}  // namespace evogate
