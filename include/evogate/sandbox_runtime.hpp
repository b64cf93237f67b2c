#pragma once

// evogate/sandbox_runtime.hpp — Executes one untrusted candidate per call.
//
// CONTRACT:
//   execute(code, fixtures, timeout) -> SandboxResult
//     - creates one workspace and one isolated environment
//     - runs the harness entry point under the harness watchdog (timeout) and
//       an outer watchdog (timeout + grace) that kills the environment
//     - status: exit 0 -> completed, 124 -> timeout, other -> failed,
//       stopped by kill_all() -> killed
//     - per-call errors are returned as a failed result, never thrown
//     - the environment and the workspace are removed before return, on every
//       path (EnvironmentLease)
//
// STARTUP:
//   The constructor validates the engine (ping + ensure_image) and throws
//   SandboxUnavailableError when the isolation runtime cannot be used. This
//   is the only exception this class throws.

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "evogate/config.hpp"
#include "evogate/harness.hpp"
#include "evogate/isolation.hpp"
#include "evogate/types.hpp"

namespace evogate {

class SandboxUnavailableError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class SandboxRuntime {
 public:
  // Builds the engine named by cfg.engine.
  explicit SandboxRuntime(const EvogateConfig& cfg);

  // Injected engine (tests, alternative runtimes).
  SandboxRuntime(std::unique_ptr<IsolationEngine> engine, const EvogateConfig& cfg);

  ~SandboxRuntime();

  SandboxRuntime(const SandboxRuntime&) = delete;
  SandboxRuntime& operator=(const SandboxRuntime&) = delete;

  SandboxResult execute(const std::string& code, const jsonlite::Object& fixtures,
                        std::optional<uint32_t> timeout_s = std::nullopt);

  // Kills every running environment; their results report status killed.
  void kill_all();

  std::vector<std::string> active_environments() const;
  uint64_t environments_created() const { return created_.load(); }
  uint64_t environments_removed() const { return removed_.load(); }

  const IsolationEngine& engine() const { return *engine_; }
  EngineCapabilities capabilities() const { return engine_->capabilities(); }
  HarnessProfile profile() const { return profile_; }
  const std::string& interpreter() const { return interpreter_; }
  const EvogateConfig& config() const { return cfg_; }

 private:
  friend class EnvironmentLease;

  void init();
  std::string next_environment_id();
  void register_environment(const std::string& id);
  void release_environment(const std::string& id);
  bool was_killed(const std::string& id) const;

  std::unique_ptr<IsolationEngine> engine_;
  EvogateConfig cfg_;
  HarnessProfile profile_{HarnessProfile::python};
  std::string interpreter_;

  mutable std::mutex mu_;
  std::set<std::string> active_;
  std::set<std::string> killed_;
  uint64_t seq_{0};
  std::atomic<uint64_t> created_{0};
  std::atomic<uint64_t> removed_{0};
};

// Maps a harness/engine exit code to a sandbox status.
SandboxStatus status_from_exit_code(int exit_code);

}  // namespace evogate
