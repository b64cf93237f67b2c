#include "evogate/isolation.hpp"

#include <cstdlib>

#include "evogate/jsonlite.hpp"
#include "evogate/log.hpp"
#include "evogate/process.hpp"

namespace evogate {

namespace {

constexpr uint64_t kCliTimeoutMs = 30000;
constexpr uint64_t kPullTimeoutMs = 600000;

ProcessResult docker_cli(const std::string& bin, std::vector<std::string> args, uint64_t timeout_ms) {
  ProcessSpec spec;
  spec.command = bin;
  spec.argv = std::move(args);
  spec.inherit_env = true;  // DOCKER_HOST, DOCKER_CONFIG, HOME
  spec.timeout_ms = timeout_ms;
  spec.max_output_bytes = 4 * 1024 * 1024;
  return run_process(spec);
}

std::string cli_error(const ProcessResult& r) {
  if (!r.error_message.empty()) return r.error_message;
  if (r.timed_out) return "docker cli timed out";
  std::string msg = r.stderr_text.empty() ? r.stdout_text : r.stderr_text;
  while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();
  return "exit " + std::to_string(r.exit_code) + ": " + msg;
}

bool cli_ok(const ProcessResult& r) { return r.started && !r.timed_out && r.exit_code == 0; }

}  // namespace

DockerEngine::DockerEngine(std::string docker_bin, std::string image)
    : bin_(docker_bin.empty() ? "docker" : std::move(docker_bin)), image_(std::move(image)) {}

bool DockerEngine::ping(std::string* error) {
  const ProcessResult r = docker_cli(bin_, {"version", "--format", "{{.Server.Version}}"}, kCliTimeoutMs);
  if (!cli_ok(r)) {
    if (error) *error = "docker daemon unreachable: " + cli_error(r);
    return false;
  }
  log_info("docker", "daemon reachable", {{"server_version", r.stdout_text.substr(0, r.stdout_text.find('\n'))}});
  return true;
}

bool DockerEngine::ensure_image(std::string* error) {
  if (cli_ok(docker_cli(bin_, {"image", "inspect", image_}, kCliTimeoutMs))) return true;
  log_info("docker", "pulling image", {{"image", image_}});
  const ProcessResult pull = docker_cli(bin_, {"pull", image_}, kPullTimeoutMs);
  if (!cli_ok(pull)) {
    if (error) *error = "image " + image_ + " missing and pull failed: " + cli_error(pull);
    return false;
  }
  return true;
}

EngineCapabilities DockerEngine::capabilities() const {
  EngineCapabilities caps;
  caps.enforced = {"network_isolation", "rlimits_mem",        "rlimits_fds",      "rlimits_nproc",
                   "cpu_share",         "readonly_workspace", "no_new_privileges"};
  caps.detail = "docker cli " + bin_ + ", image " + image_;
  return caps;
}

std::pair<std::string, std::string> DockerEngine::guest_paths(const EnvironmentSpec&) const {
  return {"/app", "/out"};
}

std::vector<std::string> DockerEngine::create_args(const EnvironmentSpec& spec) const {
  const SandboxLimits& l = spec.limits;
  std::vector<std::string> args = {
      "create",
      "--name", container_name(spec.id),
      "--label", "evogate.environment=" + spec.id,
      "--memory=" + std::to_string(l.memory_bytes),
      "--memory-swap=" + std::to_string(l.memory_bytes),
      "--cpu-period=" + std::to_string(l.cpu_period_us),
      "--cpu-quota=" + std::to_string(l.cpu_quota_us),
      "--pids-limit=" + std::to_string(l.max_processes),
      "--ulimit", "nofile=" + std::to_string(l.max_file_descriptors) + ":" +
                      std::to_string(l.max_file_descriptors),
      "--ulimit", "nproc=" + std::to_string(l.nproc_ulimit) + ":" + std::to_string(l.nproc_ulimit),
      "--network=none",
      "--read-only",
      "--security-opt", "no-new-privileges:true",
      "--tmpfs", "/tmp:rw,noexec,nosuid,size=16m",
      "-v", spec.app_dir + ":/app:ro",
      "-v", spec.out_dir + ":/out:rw",
      "-w", "/app",
  };
  for (const auto& [k, v] : spec.env) {
    args.push_back("-e");
    args.push_back(k + "=" + v);
  }
  args.push_back(image_);
  args.insert(args.end(), spec.command.begin(), spec.command.end());
  return args;
}

bool DockerEngine::create(const EnvironmentSpec& spec, std::string* error) {
  const ProcessResult r = docker_cli(bin_, create_args(spec), kCliTimeoutMs);
  if (!cli_ok(r)) {
    if (error) *error = "docker create: " + cli_error(r);
    return false;
  }
  std::lock_guard<std::mutex> lk(mu_);
  containers_[spec.id].memory_limit_bytes = spec.limits.memory_bytes;
  return true;
}

bool DockerEngine::start(const std::string& id, std::string* error) {
  const ProcessResult r = docker_cli(bin_, {"start", container_name(id)}, kCliTimeoutMs);
  if (!cli_ok(r)) {
    if (error) *error = "docker start: " + cli_error(r);
    return false;
  }
  return true;
}

WaitOutcome DockerEngine::wait(const std::string& id, uint64_t timeout_ms) {
  WaitOutcome w;
  const ProcessResult r = docker_cli(bin_, {"wait", container_name(id)}, timeout_ms);
  if (r.timed_out) {
    w.timed_out = true;
    return w;
  }
  if (!cli_ok(r)) {
    w.error = "docker wait: " + cli_error(r);
    return w;
  }
  char* end = nullptr;
  const long code = std::strtol(r.stdout_text.c_str(), &end, 10);
  if (end == r.stdout_text.c_str()) {
    w.error = "docker wait: unparsable exit code '" + r.stdout_text + "'";
    return w;
  }
  w.exited = true;
  w.exit_code = static_cast<int>(code);
  return w;
}

void DockerEngine::logs(const std::string& id, std::string* out, std::string* err) {
  const ProcessResult r = docker_cli(bin_, {"logs", container_name(id)}, kCliTimeoutMs);
  if (out) *out = r.stdout_text;
  if (err) *err = r.stderr_text;
}

ResourceUsage DockerEngine::stats(const std::string& id) {
  ResourceUsage u;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = containers_.find(id);
    if (it != containers_.end()) u.memory_limit_bytes = it->second.memory_limit_bytes;
  }
  const ProcessResult r =
      docker_cli(bin_, {"inspect", "--format", "{{json .State}}", container_name(id)}, kCliTimeoutMs);
  if (!cli_ok(r)) {
    log_warn("docker", "inspect failed", {{"env", id}, {"error", cli_error(r)}});
    return u;
  }
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object state = jsonlite::parse(r.stdout_text, &err);
  if (!err) u.oom_killed = jsonlite::get_bool(state, "OOMKilled", false);
  return u;
}

void DockerEngine::kill(const std::string& id) {
  const ProcessResult r = docker_cli(bin_, {"kill", container_name(id)}, kCliTimeoutMs);
  if (!cli_ok(r)) log_debug("docker", "kill failed", {{"env", id}, {"error", cli_error(r)}});
}

bool DockerEngine::remove(const std::string& id) {
  const ProcessResult r = docker_cli(bin_, {"rm", "-f", container_name(id)}, kCliTimeoutMs);
  {
    std::lock_guard<std::mutex> lk(mu_);
    containers_.erase(id);
  }
  if (!cli_ok(r)) {
    log_error("docker", "container removal failed", {{"env", id}, {"error", cli_error(r)}});
    return false;
  }
  return true;
}

}  // namespace evogate
