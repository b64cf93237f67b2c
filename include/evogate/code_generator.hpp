#pragma once

// evogate/code_generator.hpp — Boundary to the external code generator.
//
// The generator is a black box: it receives flattened requirements and
// returns candidate source text plus a CodeAnalysis. Failures are values
// (GenerationOutcome::ok == false), never exceptions.
//
// COMMAND PROTOCOL (CommandCodeGenerator):
//   argv:   <command> [args...] <requirements.json>
//   input:  requirements.json, one JSON object
//             generation: {"mode":"generate","function_name",...,"context"}
//             validation: {"mode":"validate","code","context"}
//   stdout: {"code": "<source>", "analysis": {CodeAnalysis JSON}}
//           ("code" is ignored for validation)
//   A timeout, a non-zero exit, unparsable stdout, a missing analysis or an
//   empty "code" on generation is a failure.

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "evogate/jsonlite.hpp"
#include "evogate/types.hpp"

namespace evogate {

struct GenerationOutcome {
  bool ok{false};
  std::string code;
  CodeAnalysis analysis;
  ErrorCode error_code{ErrorCode::none};
  std::string error;
};

// Flat requirements handed to the generator for a request.
jsonlite::Object flatten_requirements(const EvolutionRequest& request);

// Parses generator stdout. require_code=false for validation.
GenerationOutcome parse_generator_output(const std::string& text, bool require_code);

class CodeGenerator {
 public:
  virtual ~CodeGenerator() = default;

  virtual GenerationOutcome generate_module(const jsonlite::Object& requirements) = 0;

  // Analysis of code that is already part of the system.
  virtual GenerationOutcome validate_existing_code(const std::string& code, const std::string& context) = 0;

  virtual jsonlite::Object stats_json() const = 0;
};

// Counters shared by generator implementations.
class GenerationStats {
 public:
  void record(const GenerationOutcome& outcome);
  jsonlite::Object to_json() const;

 private:
  mutable std::mutex mu_;
  uint64_t total_{0};
  uint64_t succeeded_{0};
  uint64_t failed_{0};
  std::map<std::string, uint64_t> by_risk_;
};

class CommandCodeGenerator : public CodeGenerator {
 public:
  // command_line is split on whitespace; the first word is the executable.
  CommandCodeGenerator(const std::string& command_line, uint32_t timeout_s, std::string temp_dir = "");

  GenerationOutcome generate_module(const jsonlite::Object& requirements) override;
  GenerationOutcome validate_existing_code(const std::string& code, const std::string& context) override;
  jsonlite::Object stats_json() const override;

  const std::vector<std::string>& argv() const { return argv_; }

 private:
  GenerationOutcome invoke(const jsonlite::Object& input, bool require_code);

  std::vector<std::string> argv_;
  uint32_t timeout_s_{120};
  std::string temp_dir_;
  GenerationStats stats_;
};

}  // namespace evogate
