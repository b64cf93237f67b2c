#include "evogate/types.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

#include "evogate/version.hpp"

namespace evogate {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::sandbox_unavailable: return "sandbox_unavailable";
    case ErrorCode::environment_create_failed: return "environment_create_failed";
    case ErrorCode::workspace_failed: return "workspace_failed";
    case ErrorCode::generator_failed: return "generator_failed";
    case ErrorCode::generator_malformed_output: return "generator_malformed_output";
    case ErrorCode::apply_failed: return "apply_failed";
    case ErrorCode::store_io_failed: return "store_io_failed";
    case ErrorCode::store_integrity_failed: return "store_integrity_failed";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::shutting_down: return "shutting_down";
  }
  return "";
}

std::string to_string(EvolutionKind k) {
  switch (k) {
    case EvolutionKind::function_generation: return "function_generation";
    case EvolutionKind::module_enhancement: return "module_enhancement";
    case EvolutionKind::bug_fix: return "bug_fix";
    case EvolutionKind::optimization: return "optimization";
    case EvolutionKind::feature_addition: return "feature_addition";
  }
  return "";
}

std::string to_string(RiskAssessment r) {
  switch (r) {
    case RiskAssessment::safe: return "safe";
    case RiskAssessment::caution: return "caution";
    case RiskAssessment::dangerous: return "dangerous";
    case RiskAssessment::blocked: return "blocked";
  }
  return "";
}

std::string to_string(SandboxStatus s) {
  switch (s) {
    case SandboxStatus::ready: return "ready";
    case SandboxStatus::running: return "running";
    case SandboxStatus::completed: return "completed";
    case SandboxStatus::failed: return "failed";
    case SandboxStatus::timeout: return "timeout";
    case SandboxStatus::killed: return "killed";
  }
  return "";
}

std::string to_string(ApprovalLevel a) {
  switch (a) {
    case ApprovalLevel::automatic: return "automatic";
    case ApprovalLevel::review_required: return "review_required";
    case ApprovalLevel::human_approval: return "human_approval";
    case ApprovalLevel::committee_approval: return "committee_approval";
  }
  return "";
}

std::string to_string(RequestState s) {
  switch (s) {
    case RequestState::submitted: return "submitted";
    case RequestState::generating: return "generating";
    case RequestState::sandboxed: return "sandboxed";
    case RequestState::pending_approval: return "pending_approval";
    case RequestState::applied: return "applied";
    case RequestState::rejected: return "rejected";
    case RequestState::failed: return "failed";
  }
  return "";
}

std::optional<EvolutionKind> parse_evolution_kind(const std::string& s) {
  if (s == "function_generation") return EvolutionKind::function_generation;
  if (s == "module_enhancement") return EvolutionKind::module_enhancement;
  if (s == "bug_fix") return EvolutionKind::bug_fix;
  if (s == "optimization") return EvolutionKind::optimization;
  if (s == "feature_addition") return EvolutionKind::feature_addition;
  return std::nullopt;
}

std::optional<RiskAssessment> parse_risk_assessment(const std::string& s) {
  if (s == "safe") return RiskAssessment::safe;
  if (s == "caution") return RiskAssessment::caution;
  if (s == "dangerous") return RiskAssessment::dangerous;
  if (s == "blocked") return RiskAssessment::blocked;
  return std::nullopt;
}

std::optional<SandboxStatus> parse_sandbox_status(const std::string& s) {
  if (s == "ready") return SandboxStatus::ready;
  if (s == "running") return SandboxStatus::running;
  if (s == "completed") return SandboxStatus::completed;
  if (s == "failed") return SandboxStatus::failed;
  if (s == "timeout") return SandboxStatus::timeout;
  if (s == "killed") return SandboxStatus::killed;
  return std::nullopt;
}

std::optional<ApprovalLevel> parse_approval_level(const std::string& s) {
  if (s == "automatic") return ApprovalLevel::automatic;
  if (s == "review_required") return ApprovalLevel::review_required;
  if (s == "human_approval") return ApprovalLevel::human_approval;
  if (s == "committee_approval") return ApprovalLevel::committee_approval;
  return std::nullopt;
}

uint64_t now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

std::string iso8601_utc(uint64_t unix_ms) {
  const std::time_t secs = static_cast<std::time_t>(unix_ms / 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<unsigned>(unix_ms % 1000));
  return buf;
}

// ---------------------------------------------------------------------------
// JSON mapping
// ---------------------------------------------------------------------------

using jsonlite::Object;
using jsonlite::Value;

Object request_to_json(const EvolutionRequest& r) {
  Object req;
  req["function_name"] = r.requirements.function_name;
  req["inputs"] = jsonlite::to_array(r.requirements.inputs);
  req["outputs"] = jsonlite::to_array(r.requirements.outputs);
  req["logic_description"] = r.requirements.logic_description;
  req["test_data"] = r.requirements.test_fixtures;

  Object o;
  o["evolution_type"] = to_string(r.kind);
  o["description"] = r.description;
  o["requirements"] = std::move(req);
  o["priority"] = r.priority;
  o["safety_level"] = r.safety_level;
  o["context"] = r.context;
  o["requester"] = r.requester;
  o["created_at_unix_ms"] = r.created_at_unix_ms;
  return o;
}

EvolutionRequest request_from_json(const Object& o) {
  EvolutionRequest r;
  r.kind = parse_evolution_kind(jsonlite::get_string(o, "evolution_type"))
               .value_or(EvolutionKind::feature_addition);
  r.description = jsonlite::get_string(o, "description");
  const Object req = jsonlite::get_object(o, "requirements");
  r.requirements.function_name = jsonlite::get_string(req, "function_name");
  r.requirements.inputs = jsonlite::get_string_array(req, "inputs");
  r.requirements.outputs = jsonlite::get_string_array(req, "outputs");
  r.requirements.logic_description = jsonlite::get_string(req, "logic_description");
  r.requirements.test_fixtures = jsonlite::get_object(req, "test_data");
  r.priority = static_cast<int>(jsonlite::get_i64(o, "priority", 1));
  r.safety_level = jsonlite::get_string(o, "safety_level", "medium");
  r.context = jsonlite::get_string(o, "context");
  r.requester = jsonlite::get_string(o, "requester", "system");
  r.created_at_unix_ms = static_cast<uint64_t>(jsonlite::get_i64(o, "created_at_unix_ms", 0));
  return r;
}

Object analysis_to_json(const CodeAnalysis& a) {
  Object o;
  o["syntax_valid"] = a.syntax_valid;
  o["security_score"] = a.security_score;
  o["risk_assessment"] = to_string(a.risk_assessment);
  o["ethical_compliance"] = a.ethical_compliance;
  o["complexity_score"] = a.complexity_score;
  o["recommendations"] = jsonlite::to_array(a.recommendations);
  o["warnings"] = jsonlite::to_array(a.warnings);
  o["timestamp_unix_ms"] = a.timestamp_unix_ms;
  return o;
}

CodeAnalysis analysis_from_json(const Object& o) {
  CodeAnalysis a;
  a.syntax_valid = jsonlite::get_bool(o, "syntax_valid", false);
  a.security_score = jsonlite::get_double(o, "security_score", 0.0);
  a.risk_assessment = parse_risk_assessment(jsonlite::get_string(o, "risk_assessment"))
                          .value_or(RiskAssessment::blocked);
  a.ethical_compliance = jsonlite::get_bool(o, "ethical_compliance", false);
  a.complexity_score = jsonlite::get_double(o, "complexity_score", 0.0);
  a.recommendations = jsonlite::get_string_array(o, "recommendations");
  a.warnings = jsonlite::get_string_array(o, "warnings");
  a.timestamp_unix_ms = static_cast<uint64_t>(jsonlite::get_i64(o, "timestamp_unix_ms", 0));
  return a;
}

Object usage_to_json(const ResourceUsage& u) {
  Object mem;
  mem["max_usage"] = u.memory_peak_bytes;
  mem["limit"] = u.memory_limit_bytes;
  mem["oom_killed"] = u.oom_killed;
  Object cpu;
  cpu["total_usage_ms"] = u.cpu_time_ms;
  Object io;
  io["read_bytes"] = u.io_read_bytes;
  io["write_bytes"] = u.io_write_bytes;

  Object o;
  o["memory"] = std::move(mem);
  o["cpu"] = std::move(cpu);
  o["io"] = std::move(io);
  return o;
}

ResourceUsage usage_from_json(const Object& o) {
  ResourceUsage u;
  const Object mem = jsonlite::get_object(o, "memory");
  const Object cpu = jsonlite::get_object(o, "cpu");
  const Object io = jsonlite::get_object(o, "io");
  u.memory_peak_bytes = static_cast<uint64_t>(jsonlite::get_i64(mem, "max_usage", 0));
  u.memory_limit_bytes = static_cast<uint64_t>(jsonlite::get_i64(mem, "limit", 0));
  u.oom_killed = jsonlite::get_bool(mem, "oom_killed", false);
  u.cpu_time_ms = static_cast<uint64_t>(jsonlite::get_i64(cpu, "total_usage_ms", 0));
  u.io_read_bytes = static_cast<uint64_t>(jsonlite::get_i64(io, "read_bytes", 0));
  u.io_write_bytes = static_cast<uint64_t>(jsonlite::get_i64(io, "write_bytes", 0));
  return u;
}

Object sandbox_result_to_json(const SandboxResult& r) {
  Object o;
  o["status"] = to_string(r.status);
  o["exit_code"] = r.exit_code ? Value{*r.exit_code} : Value{nullptr};
  o["stdout"] = r.stdout_text;
  o["stderr"] = r.stderr_text;
  o["execution_time"] = r.execution_time_s;
  o["resource_usage"] = usage_to_json(r.resource_usage);
  o["test_results"] = r.test_results;
  o["timestamp"] = iso8601_utc(r.timestamp_unix_ms);
  o["timestamp_unix_ms"] = r.timestamp_unix_ms;
  o["environment_id"] = r.environment_id;
  o["error_message"] = r.error_message ? Value{*r.error_message} : Value{nullptr};
  return o;
}

SandboxResult sandbox_result_from_json(const Object& o) {
  SandboxResult r;
  r.status = parse_sandbox_status(jsonlite::get_string(o, "status")).value_or(SandboxStatus::failed);
  const Value* ec = jsonlite::find(o, "exit_code");
  if (ec && !ec->is_null()) r.exit_code = static_cast<int>(jsonlite::get_i64(o, "exit_code", -1));
  r.stdout_text = jsonlite::get_string(o, "stdout");
  r.stderr_text = jsonlite::get_string(o, "stderr");
  r.execution_time_s = jsonlite::get_double(o, "execution_time", 0.0);
  r.resource_usage = usage_from_json(jsonlite::get_object(o, "resource_usage"));
  r.test_results = jsonlite::get_object(o, "test_results");
  r.timestamp_unix_ms = static_cast<uint64_t>(jsonlite::get_i64(o, "timestamp_unix_ms", 0));
  r.environment_id = jsonlite::get_string(o, "environment_id");
  const Value* em = jsonlite::find(o, "error_message");
  if (em && em->is_string()) r.error_message = std::get<std::string>(em->v);
  return r;
}

Object evolution_result_to_json(const EvolutionResult& r) {
  Object o;
  o["record_version"] = version::RESULT_RECORD_VERSION;
  o["request_id"] = r.request_id;
  o["request"] = request_to_json(r.request);
  o["success"] = r.success;
  o["generated_code"] = r.generated_code;
  o["code_digest"] = r.code_digest;
  o["code_analysis"] = r.code_analysis ? Value{analysis_to_json(*r.code_analysis)} : Value{nullptr};
  o["sandbox_result"] =
      r.sandbox_result ? Value{sandbox_result_to_json(*r.sandbox_result)} : Value{nullptr};
  o["approval_level"] = to_string(r.approval_level);
  o["applied"] = r.applied;
  o["rejected"] = r.rejected;
  o["decided_by"] = r.decided_by;
  o["error_message"] = r.error_message ? Value{*r.error_message} : Value{nullptr};
  o["timestamp"] = iso8601_utc(r.timestamp_unix_ms);
  o["timestamp_unix_ms"] = r.timestamp_unix_ms;
  o["execution_time"] = r.execution_time_s;
  o["completion_seq"] = r.completion_seq;
  return o;
}

EvolutionResult evolution_result_from_json(const Object& o) {
  EvolutionResult r;
  r.request_id = jsonlite::get_string(o, "request_id");
  r.request = request_from_json(jsonlite::get_object(o, "request"));
  r.success = jsonlite::get_bool(o, "success", false);
  r.generated_code = jsonlite::get_string(o, "generated_code");
  r.code_digest = jsonlite::get_string(o, "code_digest");
  const Value* ca = jsonlite::find(o, "code_analysis");
  if (ca && ca->is_object()) r.code_analysis = analysis_from_json(std::get<Object>(ca->v));
  const Value* sr = jsonlite::find(o, "sandbox_result");
  if (sr && sr->is_object()) r.sandbox_result = sandbox_result_from_json(std::get<Object>(sr->v));
  r.approval_level = parse_approval_level(jsonlite::get_string(o, "approval_level"))
                         .value_or(ApprovalLevel::committee_approval);
  r.applied = jsonlite::get_bool(o, "applied", false);
  r.rejected = jsonlite::get_bool(o, "rejected", false);
  r.decided_by = jsonlite::get_string(o, "decided_by");
  const Value* em = jsonlite::find(o, "error_message");
  if (em && em->is_string()) r.error_message = std::get<std::string>(em->v);
  r.timestamp_unix_ms = static_cast<uint64_t>(jsonlite::get_i64(o, "timestamp_unix_ms", 0));
  r.execution_time_s = jsonlite::get_double(o, "execution_time", 0.0);
  r.completion_seq = static_cast<uint64_t>(jsonlite::get_i64(o, "completion_seq", 0));
  return r;
}

Object evolution_summary_to_json(const EvolutionResult& r) {
  Object o;
  o["request_id"] = r.request_id;
  o["evolution_type"] = to_string(r.request.kind);
  o["success"] = r.success;
  o["applied"] = r.applied;
  o["rejected"] = r.rejected;
  o["approval_level"] = to_string(r.approval_level);
  o["risk_assessment"] = r.code_analysis ? to_string(r.code_analysis->risk_assessment) : "unknown";
  o["sandbox_status"] = r.sandbox_result ? to_string(r.sandbox_result->status) : "none";
  o["execution_time"] = r.execution_time_s;
  o["timestamp"] = iso8601_utc(r.timestamp_unix_ms);
  o["error_message"] = r.error_message ? Value{*r.error_message} : Value{nullptr};
  return o;
}

}  // namespace evogate
