#pragma once

// evogate/isolation.hpp — OS-level isolation engines for candidate execution.
//
// An engine owns disposable environments keyed by an environment id chosen
// by the caller (SandboxRuntime). The lifecycle of one environment is
//
//   create -> start -> wait(timeout) -> logs/stats -> [kill] -> remove
//
// and remove() is always called, whatever happened before it.
//
// ENGINES:
//   DockerEngine  Docker-compatible CLI. Every limit is enforced by the
//                 container runtime (cgroups, network=none, read-only rootfs).
//   LocalEngine   fork/exec under setsid + setrlimit + PR_SET_NO_NEW_PRIVS +
//                 a private network namespace. The app dir is a read-only
//                 bind mount in a private mount namespace where the kernel
//                 allows one. No cgroups: cpu_share is reported as
//                 unsupported. Capabilities follow the configured limits.
//
// THREAD SAFETY:
//   Distinct environments may be driven from different threads. kill() may be
//   called from any thread while another thread is inside wait() for the same
//   id; it only signals, the waiting thread observes the exit.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "evogate/config.hpp"
#include "evogate/types.hpp"

namespace evogate {

class ChildProcess;

struct EnvironmentSpec {
  std::string id;
  std::string app_dir;                       // host path, mounted read-only
  std::string out_dir;                       // host path, writable result dir
  std::vector<std::string> command;          // argv inside the environment
  std::map<std::string, std::string> env;
  SandboxLimits limits;
  uint32_t timeout_s{300};
};

struct WaitOutcome {
  bool exited{false};
  bool timed_out{false};
  int exit_code{-1};
  std::string error;
};

struct EngineCapabilities {
  std::vector<std::string> enforced;
  std::vector<std::string> unsupported;
  std::string detail;
};

class IsolationEngine {
 public:
  virtual ~IsolationEngine() = default;

  virtual std::string name() const = 0;

  // Startup checks. false + *error means the engine must not be used.
  virtual bool ping(std::string* error) = 0;
  virtual bool ensure_image(std::string* error) = 0;
  virtual EngineCapabilities capabilities() const = 0;

  // Paths under which the app and out directories are visible inside an
  // environment built from spec.
  virtual std::pair<std::string, std::string> guest_paths(const EnvironmentSpec& spec) const = 0;

  virtual bool create(const EnvironmentSpec& spec, std::string* error) = 0;
  virtual bool start(const std::string& id, std::string* error) = 0;
  virtual WaitOutcome wait(const std::string& id, uint64_t timeout_ms) = 0;
  virtual void logs(const std::string& id, std::string* out, std::string* err) = 0;
  virtual ResourceUsage stats(const std::string& id) = 0;
  virtual void kill(const std::string& id) = 0;
  virtual bool remove(const std::string& id) = 0;
};

// ---------------------------------------------------------------------------
// DockerEngine
// ---------------------------------------------------------------------------
class DockerEngine : public IsolationEngine {
 public:
  DockerEngine(std::string docker_bin, std::string image);

  std::string name() const override { return "docker"; }
  bool ping(std::string* error) override;
  bool ensure_image(std::string* error) override;
  EngineCapabilities capabilities() const override;
  std::pair<std::string, std::string> guest_paths(const EnvironmentSpec& spec) const override;

  bool create(const EnvironmentSpec& spec, std::string* error) override;
  bool start(const std::string& id, std::string* error) override;
  WaitOutcome wait(const std::string& id, uint64_t timeout_ms) override;
  void logs(const std::string& id, std::string* out, std::string* err) override;
  ResourceUsage stats(const std::string& id) override;
  void kill(const std::string& id) override;
  bool remove(const std::string& id) override;

  const std::string& image() const { return image_; }

  // Arguments of the `docker create` call for spec. Exposed for inspection.
  std::vector<std::string> create_args(const EnvironmentSpec& spec) const;

  static std::string container_name(const std::string& env_id) { return "evogate_" + env_id; }

 private:
  struct ContainerInfo {
    uint64_t memory_limit_bytes{0};
  };

  std::string bin_;
  std::string image_;
  mutable std::mutex mu_;
  std::map<std::string, ContainerInfo> containers_;
};

// ---------------------------------------------------------------------------
// LocalEngine
// ---------------------------------------------------------------------------
class LocalEngine : public IsolationEngine {
 public:
  // network_required: refuse to run (ping fails, start fails) when a private
  // network namespace cannot be created. false = best effort.
  // scratch_dir is where ping() checks read-only bind mounts ("" = TMPDIR).
  LocalEngine(std::string interpreter, bool network_required, SandboxLimits limits = {},
              std::string scratch_dir = "");
  ~LocalEngine() override;

  std::string name() const override { return "local"; }
  bool ping(std::string* error) override;
  bool ensure_image(std::string* error) override;
  EngineCapabilities capabilities() const override;
  std::pair<std::string, std::string> guest_paths(const EnvironmentSpec& spec) const override;

  bool create(const EnvironmentSpec& spec, std::string* error) override;
  bool start(const std::string& id, std::string* error) override;
  WaitOutcome wait(const std::string& id, uint64_t timeout_ms) override;
  void logs(const std::string& id, std::string* out, std::string* err) override;
  ResourceUsage stats(const std::string& id) override;
  void kill(const std::string& id) override;
  bool remove(const std::string& id) override;

 private:
  struct Environment {
    EnvironmentSpec spec;
    std::unique_ptr<ChildProcess> child;
  };

  Environment* find(const std::string& id);

  std::string interpreter_;
  bool network_required_{true};
  SandboxLimits limits_;
  std::string scratch_dir_;
  bool network_available_{false};
  std::string network_detail_;
  bool readonly_available_{false};
  std::string readonly_detail_;
  mutable std::mutex mu_;
  std::map<std::string, std::unique_ptr<Environment>> envs_;
};

// Builds the engine named by cfg.engine; nullptr + *error for an unknown name.
std::unique_ptr<IsolationEngine> make_engine(const EvogateConfig& cfg, const std::string& interpreter,
                                             std::string* error);

}  // namespace evogate
