#include "evogate/isolation.hpp"

#include <signal.h>

#include <filesystem>

#include "evogate/log.hpp"
#include "evogate/process.hpp"
#include "evogate/workspace.hpp"

namespace fs = std::filesystem;

namespace evogate {

LocalEngine::LocalEngine(std::string interpreter, bool network_required, SandboxLimits limits,
                         std::string scratch_dir)
    : interpreter_(std::move(interpreter)),
      network_required_(network_required),
      limits_(limits),
      scratch_dir_(std::move(scratch_dir)) {}

LocalEngine::~LocalEngine() = default;

bool LocalEngine::ping(std::string* error) {
  if (find_executable(interpreter_).empty()) {
    if (error) *error = "interpreter not found: " + interpreter_;
    return false;
  }
  network_available_ = probe_network_isolation(&network_detail_);
  if (!network_available_) {
    if (network_required_) {
      if (error) *error = "network isolation unavailable: " + network_detail_;
      return false;
    }
    log_warn("local", "network isolation unavailable, continuing (best_effort)",
             {{"detail", network_detail_}});
  }
  const std::string scratch = scratch_dir_.empty() ? default_temp_root() : scratch_dir_;
  std::error_code ec;
  fs::create_directories(scratch, ec);
  readonly_available_ = readonly_mount_available(scratch, &readonly_detail_);
  if (!readonly_available_) {
    log_warn("local", "read-only workspace mount unavailable, app dir is only chmod-sealed",
             {{"detail", readonly_detail_}});
  }
  return true;
}

bool LocalEngine::ensure_image(std::string*) { return true; }

EngineCapabilities LocalEngine::capabilities() const {
  EngineCapabilities caps;
  auto claim = [&caps](bool enforced, const char* name) {
    (enforced ? caps.enforced : caps.unsupported).push_back(name);
  };
  claim(limits_.memory_bytes > 0, "rlimits_mem");
  claim(limits_.max_file_descriptors > 0, "rlimits_fds");
  claim(limits_.max_processes > 0, "rlimits_nproc");
  claim(readonly_available_, "readonly_workspace");
  caps.enforced.push_back("no_new_privileges");
  claim(network_available_, "network_isolation");
  caps.unsupported.push_back("cpu_share");
  caps.detail = "fork/exec " + interpreter_ + (network_detail_.empty() ? "" : ", " + network_detail_) +
                (readonly_detail_.empty() ? "" : ", " + readonly_detail_);
  return caps;
}

std::pair<std::string, std::string> LocalEngine::guest_paths(const EnvironmentSpec& spec) const {
  return {spec.app_dir, spec.out_dir};
}

LocalEngine::Environment* LocalEngine::find(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = envs_.find(id);
  return it == envs_.end() ? nullptr : it->second.get();
}

bool LocalEngine::create(const EnvironmentSpec& spec, std::string* error) {
  if (spec.command.empty()) {
    if (error) *error = "empty command";
    return false;
  }
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(spec.app_dir, ec)) {
    fs::permissions(entry.path(), fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read,
                    ec);
  }
  fs::permissions(spec.app_dir,
                  fs::perms::owner_read | fs::perms::owner_exec | fs::perms::group_read |
                      fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                  ec);
  if (ec) {
    if (error) *error = "cannot seal app dir: " + ec.message();
    return false;
  }

  auto env = std::make_unique<Environment>();
  env->spec = spec;
  std::lock_guard<std::mutex> lk(mu_);
  if (envs_.count(spec.id)) {
    if (error) *error = "environment id already in use: " + spec.id;
    return false;
  }
  envs_[spec.id] = std::move(env);
  return true;
}

bool LocalEngine::start(const std::string& id, std::string* error) {
  Environment* env = find(id);
  if (!env) {
    if (error) *error = "unknown environment: " + id;
    return false;
  }
  const EnvironmentSpec& es = env->spec;

  ProcessSpec ps;
  ps.command = es.command.front();
  ps.argv.assign(es.command.begin() + 1, es.command.end());
  ps.env = es.env;
  ps.env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
  ps.env["HOME"] = es.out_dir;
  ps.env["TMPDIR"] = es.out_dir;
  ps.cwd = es.app_dir;
  ps.timeout_ms = 0;  // the runtime's watchdog drives wait()
  ps.max_output_bytes = 1 << 20;
  ps.max_memory_bytes = es.limits.memory_bytes;
  ps.max_file_descriptors = es.limits.max_file_descriptors;
  ps.max_processes = es.limits.max_processes;
  ps.cpu_seconds = es.timeout_s + 1;
  ps.isolate_network = true;
  ps.network_required = network_required_;
  if (readonly_available_) ps.readonly_paths = {es.app_dir};
  ps.no_new_privileges = true;

  auto child = std::make_unique<ChildProcess>(std::move(ps));
  std::string err;
  const bool ok = child->start(&err);
  {
    std::lock_guard<std::mutex> lk(mu_);
    env->child = std::move(child);
  }
  if (!ok) {
    if (error) *error = err;
    return false;
  }
  return true;
}

WaitOutcome LocalEngine::wait(const std::string& id, uint64_t timeout_ms) {
  WaitOutcome w;
  Environment* env = find(id);
  if (!env || !env->child) {
    w.error = "environment not started: " + id;
    return w;
  }
  if (!env->child->wait_for(timeout_ms)) {
    w.timed_out = true;
    return w;
  }
  w.exited = true;
  w.exit_code = env->child->result().exit_code;
  return w;
}

void LocalEngine::logs(const std::string& id, std::string* out, std::string* err) {
  Environment* env = find(id);
  if (!env || !env->child) return;
  if (out) *out = env->child->result().stdout_text;
  if (err) *err = env->child->result().stderr_text;
}

ResourceUsage LocalEngine::stats(const std::string& id) {
  Environment* env = find(id);
  if (!env || !env->child) return {};
  return env->child->result().usage;
}

void LocalEngine::kill(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = envs_.find(id);
  if (it == envs_.end() || !it->second->child) return;
  // Signal only; the thread inside wait() reaps.
  it->second->child->signal_group(SIGKILL);
}

bool LocalEngine::remove(const std::string& id) {
  std::unique_ptr<Environment> env;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = envs_.find(id);
    if (it == envs_.end()) return true;
    env = std::move(it->second);
    envs_.erase(it);
  }
  std::error_code ec;
  fs::permissions(env->spec.app_dir, fs::perms::owner_all, fs::perm_options::add, ec);
  // ~ChildProcess kills the process group and reaps if still running.
  env.reset();
  return true;
}

std::unique_ptr<IsolationEngine> make_engine(const EvogateConfig& cfg, const std::string& interpreter,
                                             std::string* error) {
  if (cfg.engine == "docker") return std::make_unique<DockerEngine>(cfg.docker_bin, cfg.image);
  if (cfg.engine == "local")
    return std::make_unique<LocalEngine>(interpreter, cfg.network_policy != "best_effort", cfg.limits,
                                         cfg.temp_dir);
  if (error) *error = "unknown isolation engine: " + cfg.engine;
  return nullptr;
}

}  // namespace evogate
