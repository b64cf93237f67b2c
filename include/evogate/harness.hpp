#pragma once

// evogate/harness.hpp — Generated runner programs that wrap one candidate.
//
// WORKSPACE LAYOUT (app dir, read-only inside the environment):
//   python    candidate.py   the generated code, verbatim
//             main.py        loads fixtures, exec()s candidate.py in a guarded
//                            block, writes result.json
//             runner.py      entry point; runs main.py in its own session and
//                            kills that session when EVOGATE_TIMEOUT_S expires
//   posix_sh  candidate.sh   the generated code, verbatim
//             runner.sh      entry point; runs candidate.sh with a background
//                            watchdog, writes result.json
//   both      test_data.json fixtures, present only when non-empty
//
// RESULT CONTRACT (out dir, result.json):
//   {"success": bool, "output": ..., "error": null | {"type","message"[,"traceback"]},
//    "execution_time": seconds, "exit_status": int, "fixtures_loaded": bool,
//    "harness_version": N}
//
// EXIT CODES:
//   0 candidate completed, 1 candidate fault, 124 harness watchdog expired.
//
// INVARIANT: the candidate text is stored in its own file and never spliced
// into harness source.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "evogate/jsonlite.hpp"

namespace evogate {

enum class HarnessProfile {
  python,
  posix_sh,
};

std::string to_string(HarnessProfile p);
std::optional<HarnessProfile> parse_harness_profile(const std::string& s);

constexpr const char* RESULT_FILE_NAME = "result.json";
constexpr const char* FIXTURES_FILE_NAME = "test_data.json";

struct HarnessFile {
  std::string name;
  std::string content;
};

// Candidate + harness sources, plus the fixture file when fixtures is non-empty.
std::vector<HarnessFile> harness_files(HarnessProfile profile, const std::string& code,
                                       const jsonlite::Object& fixtures);

// Interpreter used when the configuration does not name one.
std::string default_interpreter(HarnessProfile profile);

// Interpreter name inside a container image.
std::string container_interpreter(HarnessProfile profile);

// argv of the entry point, app_path as seen inside the environment.
std::vector<std::string> harness_command(HarnessProfile profile, const std::string& interpreter,
                                         const std::string& app_path);

std::map<std::string, std::string> harness_env(const std::string& app_path, const std::string& out_path,
                                               bool has_fixtures, uint32_t timeout_s);

// Candidate file name for a profile ("candidate.py" / "candidate.sh").
std::string candidate_file_name(HarnessProfile profile);

// Source extension used when a candidate is integrated ("py" / "sh").
std::string source_extension(HarnessProfile profile);

}  // namespace evogate
