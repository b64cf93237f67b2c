#pragma once

// evogate/types.hpp — Core data model of the controlled self-modification pipeline.
//
// OWNERSHIP:
//   - EvolutionRequest is an immutable value created by the caller. The
//     controller copies it into its pending queue and into the final result.
//   - SandboxResult is produced once per sandbox run and never mutated after
//     it is handed back to the controller.
//   - EvolutionResult is created at the end of processing; the only later
//     mutation is through EvolutionController::approve_evolution().
//   - All members are value-owned. No borrowed references cross an API.
//
// CLOSED ENUMS:
//   Every enum below is matched with an exhaustive switch (no default) at its
//   dispatch sites. The build enables -Werror=switch, so adding an enumerator
//   without handling it everywhere is a compile error.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "evogate/jsonlite.hpp"

namespace evogate {

enum class ErrorCode {
  none,
  spawn_failed,
  timeout,
  sandbox_unavailable,
  environment_create_failed,
  workspace_failed,
  generator_failed,
  generator_malformed_output,
  apply_failed,
  store_io_failed,
  store_integrity_failed,
  config_invalid,
  shutting_down,
};

std::string to_string(ErrorCode code);

enum class EvolutionKind {
  function_generation,
  module_enhancement,
  bug_fix,
  optimization,
  feature_addition,
};

enum class RiskAssessment {
  safe,
  caution,
  dangerous,
  blocked,
};

enum class SandboxStatus {
  ready,
  running,
  completed,
  failed,
  timeout,
  killed,
};

// Ordered: automatic < review_required < human_approval < committee_approval.
enum class ApprovalLevel {
  automatic = 0,
  review_required = 1,
  human_approval = 2,
  committee_approval = 3,
};

// Per-request lifecycle. submitted is the only initial state; applied,
// rejected and failed are terminal.
enum class RequestState {
  submitted,
  generating,
  sandboxed,
  pending_approval,
  applied,
  rejected,
  failed,
};

std::string to_string(EvolutionKind k);
std::string to_string(RiskAssessment r);
std::string to_string(SandboxStatus s);
std::string to_string(ApprovalLevel a);
std::string to_string(RequestState s);

std::optional<EvolutionKind> parse_evolution_kind(const std::string& s);
std::optional<RiskAssessment> parse_risk_assessment(const std::string& s);
std::optional<SandboxStatus> parse_sandbox_status(const std::string& s);
std::optional<ApprovalLevel> parse_approval_level(const std::string& s);

uint64_t now_unix_ms();
std::string iso8601_utc(uint64_t unix_ms);

// ---------------------------------------------------------------------------
// EvolutionRequest
// ---------------------------------------------------------------------------
struct EvolutionRequirements {
  std::string function_name;                 // "" -> "evolved_function"
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
  std::string logic_description;             // "" -> request description
  jsonlite::Object test_fixtures;            // empty -> no fixture file
};

struct EvolutionRequest {
  EvolutionKind kind{EvolutionKind::function_generation};
  std::string description;
  EvolutionRequirements requirements;
  int priority{1};
  std::string safety_level{"medium"};
  std::string context;
  std::string requester{"system"};
  uint64_t created_at_unix_ms{0};            // 0 -> stamped on submission
};

// ---------------------------------------------------------------------------
// CodeAnalysis: opaque output of the external analyzer.
// ---------------------------------------------------------------------------
struct CodeAnalysis {
  bool syntax_valid{false};
  double security_score{0.0};                // 0.0 .. 1.0
  RiskAssessment risk_assessment{RiskAssessment::blocked};
  bool ethical_compliance{false};
  double complexity_score{0.0};
  std::vector<std::string> recommendations;
  std::vector<std::string> warnings;
  uint64_t timestamp_unix_ms{0};
};

// ---------------------------------------------------------------------------
// SandboxResult
// ---------------------------------------------------------------------------
struct ResourceUsage {
  uint64_t memory_peak_bytes{0};
  uint64_t memory_limit_bytes{0};
  uint64_t cpu_time_ms{0};
  uint64_t io_read_bytes{0};
  uint64_t io_write_bytes{0};
  bool oom_killed{false};
};

struct SandboxResult {
  SandboxStatus status{SandboxStatus::ready};
  std::optional<int> exit_code;
  std::string stdout_text;
  std::string stderr_text;
  double execution_time_s{0.0};
  ResourceUsage resource_usage;
  jsonlite::Object test_results;             // contents of result.json
  uint64_t timestamp_unix_ms{0};
  std::string environment_id;
  std::optional<std::string> error_message;
};

// ---------------------------------------------------------------------------
// EvolutionResult
// ---------------------------------------------------------------------------
struct EvolutionResult {
  std::string request_id;
  EvolutionRequest request;
  bool success{false};
  std::string generated_code;
  std::string code_digest;
  std::optional<CodeAnalysis> code_analysis;
  std::optional<SandboxResult> sandbox_result;
  ApprovalLevel approval_level{ApprovalLevel::committee_approval};
  bool applied{false};
  bool rejected{false};
  std::string decided_by;                    // approver of the manual decision
  std::optional<std::string> error_message;
  uint64_t timestamp_unix_ms{0};
  double execution_time_s{0.0};
  uint64_t completion_seq{0};                // tie-break for equal timestamps
};

// JSON mapping. *_from_json never throws; unknown enum strings fall back to
// the most restrictive value of that enum.
jsonlite::Object request_to_json(const EvolutionRequest& r);
EvolutionRequest request_from_json(const jsonlite::Object& o);

jsonlite::Object analysis_to_json(const CodeAnalysis& a);
CodeAnalysis analysis_from_json(const jsonlite::Object& o);

jsonlite::Object usage_to_json(const ResourceUsage& u);
ResourceUsage usage_from_json(const jsonlite::Object& o);

jsonlite::Object sandbox_result_to_json(const SandboxResult& r);
SandboxResult sandbox_result_from_json(const jsonlite::Object& o);

jsonlite::Object evolution_result_to_json(const EvolutionResult& r);
EvolutionResult evolution_result_from_json(const jsonlite::Object& o);

// Compact summary used by history views (no code, no captured output).
jsonlite::Object evolution_summary_to_json(const EvolutionResult& r);

}  // namespace evogate
