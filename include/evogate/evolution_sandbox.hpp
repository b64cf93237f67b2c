#pragma once

// evogate/evolution_sandbox.hpp — Orchestrator between the controller and the
// sandbox runtime.
//
// SandboxRunner is the seam the controller depends on; EvolutionSandbox is
// the production implementation over a SandboxRuntime. test_evolution()
// never throws: anything escaping the runtime becomes a failed result.

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "evogate/jsonlite.hpp"
#include "evogate/types.hpp"

namespace evogate {

class SandboxRuntime;

class SandboxRunner {
 public:
  virtual ~SandboxRunner() = default;

  virtual SandboxResult test_evolution(const std::string& code, const jsonlite::Object& fixtures,
                                       std::optional<uint32_t> timeout_s = std::nullopt) = 0;
  virtual jsonlite::Object stats_json() const = 0;

  // Stops every in-flight execution (shutdown path).
  virtual void cleanup_all() {}
};

class EvolutionSandbox : public SandboxRunner {
 public:
  explicit EvolutionSandbox(std::shared_ptr<SandboxRuntime> runtime);

  SandboxResult test_evolution(const std::string& code, const jsonlite::Object& fixtures,
                               std::optional<uint32_t> timeout_s = std::nullopt) override;
  jsonlite::Object stats_json() const override;
  void cleanup_all() override;

  SandboxRuntime& runtime() { return *runtime_; }

 private:
  void count(SandboxStatus status);

  std::shared_ptr<SandboxRuntime> runtime_;
  std::atomic<uint64_t> runs_{0};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> timeouts_{0};
  std::atomic<uint64_t> killed_{0};
};

// Fills the fields every SandboxResult must carry: a terminal status,
// exit_code, a timestamp, and non-empty test_results on a non-completed run.
SandboxResult normalize_sandbox_result(SandboxResult r);

}  // namespace evogate
