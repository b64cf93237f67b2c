#include "evogate/code_generator.hpp"

#include <stdlib.h>
#include <unistd.h>

#include <cstdio>
#include <sstream>

#include "evogate/log.hpp"
#include "evogate/process.hpp"
#include "evogate/workspace.hpp"

namespace evogate {

jsonlite::Object flatten_requirements(const EvolutionRequest& request) {
  const EvolutionRequirements& req = request.requirements;
  jsonlite::Object o;
  o["mode"] = "generate";
  o["function_name"] = req.function_name.empty() ? std::string("evolved_function") : req.function_name;
  o["description"] = request.description;
  o["inputs"] = jsonlite::to_array(req.inputs);
  o["outputs"] = jsonlite::to_array(req.outputs);
  o["logic_description"] = req.logic_description.empty() ? request.description : req.logic_description;
  o["safety_level"] = request.safety_level;
  o["context"] = "Evolution Type: " + to_string(request.kind) + "\n" + request.context;
  return o;
}

GenerationOutcome parse_generator_output(const std::string& text, bool require_code) {
  GenerationOutcome out;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object doc = jsonlite::parse(text, &err);
  if (err) {
    out.error_code = ErrorCode::generator_malformed_output;
    out.error = "generator output is not a JSON object: " + err->message;
    return out;
  }
  const jsonlite::Value* analysis = jsonlite::find(doc, "analysis");
  if (!analysis || !analysis->is_object()) {
    out.error_code = ErrorCode::generator_malformed_output;
    out.error = "generator output has no analysis object";
    return out;
  }
  out.code = jsonlite::get_string(doc, "code");
  if (require_code && out.code.empty()) {
    out.error_code = ErrorCode::generator_failed;
    out.error = "generator returned empty code";
    return out;
  }
  out.analysis = analysis_from_json(std::get<jsonlite::Object>(analysis->v));
  if (out.analysis.timestamp_unix_ms == 0) out.analysis.timestamp_unix_ms = now_unix_ms();
  out.ok = true;
  return out;
}

// ---------------------------------------------------------------------------
// GenerationStats
// ---------------------------------------------------------------------------

void GenerationStats::record(const GenerationOutcome& outcome) {
  std::lock_guard<std::mutex> lk(mu_);
  ++total_;
  if (outcome.ok) {
    ++succeeded_;
    ++by_risk_[to_string(outcome.analysis.risk_assessment)];
  } else {
    ++failed_;
  }
}

jsonlite::Object GenerationStats::to_json() const {
  std::lock_guard<std::mutex> lk(mu_);
  jsonlite::Object risk;
  for (const auto& [k, v] : by_risk_) risk[k] = v;
  jsonlite::Object o;
  o["total_generations"] = total_;
  o["successful_generations"] = succeeded_;
  o["failed_generations"] = failed_;
  o["by_risk"] = std::move(risk);
  return o;
}

// ---------------------------------------------------------------------------
// CommandCodeGenerator
// ---------------------------------------------------------------------------

CommandCodeGenerator::CommandCodeGenerator(const std::string& command_line, uint32_t timeout_s,
                                           std::string temp_dir)
    : timeout_s_(timeout_s), temp_dir_(temp_dir.empty() ? default_temp_root() : std::move(temp_dir)) {
  std::istringstream iss(command_line);
  std::string word;
  while (iss >> word) argv_.push_back(word);
}

GenerationOutcome CommandCodeGenerator::invoke(const jsonlite::Object& input, bool require_code) {
  GenerationOutcome out;
  if (argv_.empty()) {
    out.error_code = ErrorCode::generator_failed;
    out.error = "no generator command configured";
    return out;
  }

  std::string path = temp_dir_ + "/evogate_requirements_XXXXXX";
  std::vector<char> buf(path.begin(), path.end());
  buf.push_back('\0');
  const int fd = ::mkstemp(buf.data());
  if (fd < 0) {
    out.error_code = ErrorCode::generator_failed;
    out.error = "cannot create requirements file under " + temp_dir_;
    return out;
  }
  path.assign(buf.data());
  const std::string payload = jsonlite::to_json(input);
  const bool written = ::write(fd, payload.data(), payload.size()) == static_cast<ssize_t>(payload.size());
  ::close(fd);

  ProcessResult r;
  if (written) {
    ProcessSpec spec;
    spec.command = argv_.front();
    spec.argv.assign(argv_.begin() + 1, argv_.end());
    spec.argv.push_back(path);
    spec.inherit_env = true;
    spec.timeout_ms = static_cast<uint64_t>(timeout_s_) * 1000;
    spec.max_output_bytes = 8 * 1024 * 1024;
    r = run_process(spec);
  }
  std::remove(path.c_str());

  if (!written) {
    out.error_code = ErrorCode::generator_failed;
    out.error = "cannot write requirements file";
  } else if (!r.error_message.empty()) {
    out.error_code = ErrorCode::spawn_failed;
    out.error = "generator: " + r.error_message;
  } else if (r.timed_out) {
    out.error_code = ErrorCode::timeout;
    out.error = "generator timed out after " + std::to_string(timeout_s_) + "s";
  } else if (r.exit_code != 0) {
    out.error_code = ErrorCode::generator_failed;
    out.error = "generator exited " + std::to_string(r.exit_code) +
                (r.stderr_text.empty() ? "" : ": " + r.stderr_text.substr(0, 512));
  } else if (r.stdout_truncated) {
    out.error_code = ErrorCode::generator_malformed_output;
    out.error = "generator output exceeds the capture limit";
  } else {
    out = parse_generator_output(r.stdout_text, require_code);
  }

  if (!out.ok) log_warn("generator", "generation failed", {{"error", out.error}});
  return out;
}

GenerationOutcome CommandCodeGenerator::generate_module(const jsonlite::Object& requirements) {
  GenerationOutcome out = invoke(requirements, true);
  stats_.record(out);
  return out;
}

GenerationOutcome CommandCodeGenerator::validate_existing_code(const std::string& code,
                                                               const std::string& context) {
  jsonlite::Object input;
  input["mode"] = "validate";
  input["code"] = code;
  input["context"] = context;
  return invoke(input, false);
}

jsonlite::Object CommandCodeGenerator::stats_json() const {
  jsonlite::Object o = stats_.to_json();
  o["command"] = argv_.empty() ? std::string() : argv_.front();
  return o;
}

}  // namespace evogate
