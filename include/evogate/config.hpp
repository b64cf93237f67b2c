#pragma once

// evogate/config.hpp — Runtime configuration.
//
// PRECEDENCE (lowest to highest):
//   1. Compiled defaults below.
//   2. JSON config file (evogate --config FILE), checked by validate_config().
//   3. EVOGATE_* environment variables.
//
// ENVIRONMENT:
//   EVOGATE_ENGINE            docker | local
//   EVOGATE_DOCKER_BIN        docker CLI binary (default: "docker" on PATH)
//   EVOGATE_IMAGE             container image for the docker engine
//   EVOGATE_INTERPRETER       interpreter for the local engine
//   EVOGATE_PROFILE           python | posix_sh
//   EVOGATE_TIMEOUT_S         default sandbox wall-clock timeout
//   EVOGATE_MEMORY_MB         memory ceiling per sandbox
//   EVOGATE_MAX_CODE_BYTES    largest candidate accepted for execution
//   EVOGATE_WORKERS           controller worker threads
//   EVOGATE_STORE             ResultStore root ("" = no persistence)
//   EVOGATE_AUDIT_LOG         transition audit log path ("" = disabled)
//   EVOGATE_INTEGRATION_ROOT  apply target root ("" = dry run)
//   EVOGATE_GENERATOR         external generator command
//   EVOGATE_NETWORK_POLICY    required | best_effort

#include <cstdint>
#include <string>
#include <vector>

#include "evogate/jsonlite.hpp"
#include "evogate/types.hpp"

namespace evogate {

struct SandboxLimits {
  uint64_t memory_bytes{256ull * 1024 * 1024};
  uint64_t cpu_period_us{100000};
  uint64_t cpu_quota_us{50000};            // 50% of one core
  uint32_t max_processes{50};              // pids-limit
  uint32_t max_file_descriptors{64};
  uint32_t nproc_ulimit{32};
};

struct EvogateConfig {
  std::string engine{"docker"};
  std::string docker_bin{"docker"};
  std::string image{"python:3.11-alpine"};
  std::string interpreter;                 // "" -> harness profile default
  std::string profile{"python"};
  std::string network_policy{"required"};
  std::string temp_dir;                    // "" -> TMPDIR or /tmp
  uint32_t timeout_s{300};
  uint32_t watchdog_grace_s{5};
  SandboxLimits limits;
  uint64_t max_code_bytes{1024 * 1024};    // larger candidates are never run

  uint32_t workers{4};
  std::string store_root;
  std::string audit_log;
  std::string integration_root;
  std::string generator;
  uint32_t generator_timeout_s{120};

  static EvogateConfig defaults() { return EvogateConfig{}; }

  // defaults() with EVOGATE_* environment overrides applied.
  static EvogateConfig from_env();

  // Applies EVOGATE_* overrides on top of this configuration.
  void apply_env();
};

struct ConfigValidationResult {
  bool ok{true};
  ErrorCode code{ErrorCode::none};         // config_invalid when !ok
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Checks a parsed config document. Wrong types, unknown engine/profile/policy
// names and non-positive limits are errors; unknown keys are warnings.
ConfigValidationResult validate_config(const jsonlite::Object& doc);

// Applies an already validated config document onto cfg.
void apply_config(EvogateConfig& cfg, const jsonlite::Object& doc);

// Reads, validates and applies a JSON config file. Returns false and fills
// result->errors when the file is unreadable or invalid; cfg is untouched then.
bool load_config_file(const std::string& path, EvogateConfig& cfg, ConfigValidationResult* result);

jsonlite::Object config_to_json(const EvogateConfig& cfg);

}  // namespace evogate
