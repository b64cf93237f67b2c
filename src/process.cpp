#include "evogate/process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>

extern char** environ;

namespace evogate {

namespace {

enum ChildStage : int32_t {
  stage_network = 1,
  stage_no_new_privs = 2,
  stage_rlimit = 3,
  stage_stdio = 4,
  stage_chdir = 5,
  stage_exec = 6,
};

const char* stage_name(int32_t stage) {
  switch (stage) {
    case stage_network: return "network_isolation";
    case stage_no_new_privs: return "no_new_privileges";
    case stage_rlimit: return "setrlimit";
    case stage_stdio: return "stdio";
    case stage_chdir: return "chdir";
    case stage_exec: return "execve";
    default: return "unknown";
  }
}

// First record on the status pipe, always written by the child.
struct NsReport {
  int32_t requested{0};
  int32_t isolated{0};
  int32_t via_userns{0};
  int32_t readonly{0};
};

// Second record, written only when setup fails.
struct FailReport {
  int32_t stage{0};
  int32_t err{0};
};

uint64_t steady_ms() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now().time_since_epoch())
                                   .count());
}

void write_all(int fd, const void* data, size_t n) {
  const char* p = static_cast<const char*>(data);
  while (n > 0) {
    const ssize_t w = ::write(fd, p, n);
    if (w < 0) {
      if (errno == EINTR) continue;
      return;
    }
    p += w;
    n -= static_cast<size_t>(w);
  }
}

[[noreturn]] void child_fail(int status_fd, int32_t stage, int err) {
  FailReport r;
  r.stage = stage;
  r.err = err;
  write_all(status_fd, &r, sizeof(r));
  _exit(127);
}

bool write_proc_file(const char* path, const char* data, size_t n) {
  const int fd = ::open(path, O_WRONLY | O_CLOEXEC);
  if (fd < 0) return false;
  const ssize_t w = ::write(fd, data, n);
  ::close(fd);
  return w == static_cast<ssize_t>(n);
}

// Bind mounts each path onto itself and remounts it read-only. The
// nosuid/nodev/noexec/atime flags of the source mount are locked inside an
// unprivileged user namespace, so they are carried into the remount.
bool child_remount_readonly(const std::vector<std::string>& paths) {
  if (mount("none", "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) return false;
  for (const auto& p : paths) {
    struct statvfs sv;
    if (statvfs(p.c_str(), &sv) != 0) return false;
    unsigned long flags = MS_BIND | MS_REMOUNT | MS_RDONLY;
    if (sv.f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (sv.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (sv.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (sv.f_flag & ST_NOATIME) flags |= MS_NOATIME;
    if (sv.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (sv.f_flag & ST_RELATIME) flags |= MS_RELATIME;
    if (mount(p.c_str(), p.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0) return false;
    if (mount(nullptr, p.c_str(), nullptr, flags, nullptr) != 0) return false;
  }
  return true;
}

// Soft and hard limit set to value (hard = value + hard_extra), clamped to the
// inherited hard limit so an unprivileged child never needs to raise it.
void child_rlimit(int resource, uint64_t value, uint64_t hard_extra, int status_fd) {
  struct rlimit cur;
  if (getrlimit(resource, &cur) != 0) child_fail(status_fd, stage_rlimit, errno);
  struct rlimit rl;
  rl.rlim_cur = static_cast<rlim_t>(value);
  rl.rlim_max = static_cast<rlim_t>(value + hard_extra);
  if (cur.rlim_max != RLIM_INFINITY) {
    rl.rlim_max = std::min(rl.rlim_max, cur.rlim_max);
    rl.rlim_cur = std::min(rl.rlim_cur, rl.rlim_max);
  }
  if (setrlimit(resource, &rl) != 0) child_fail(status_fd, stage_rlimit, errno);
}

void append_limited(std::string& dst, const char* src, ssize_t n, std::size_t limit,
                    bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) truncated = true;
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

}  // namespace

ChildProcess::ChildProcess(ProcessSpec spec) : spec_(std::move(spec)) {}

ChildProcess::~ChildProcess() {
  if (running()) kill_group();
  close_fd(out_fd_);
  close_fd(err_fd_);
}

bool ChildProcess::start(std::string* error) {
  auto fail = [&](const std::string& msg) {
    result_.error_message = msg;
    if (error) *error = msg;
    return false;
  };

  const std::string exe = find_executable(spec_.command);
  if (exe.empty()) return fail("spawn_failed: executable not found: " + spec_.command);

  // Everything the child needs is materialized before fork; the child only
  // issues syscalls.
  std::vector<std::string> args;
  args.push_back(spec_.command);
  args.insert(args.end(), spec_.argv.begin(), spec_.argv.end());
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& a : args) argv.push_back(a.data());
  argv.push_back(nullptr);

  std::map<std::string, std::string> env_map;
  if (spec_.inherit_env) {
    for (char** e = environ; e && *e; ++e) {
      const std::string kv(*e);
      const auto eq = kv.find('=');
      if (eq != std::string::npos) env_map[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
  }
  for (const auto& [k, v] : spec_.env) env_map[k] = v;
  std::vector<std::string> envs;
  envs.reserve(env_map.size());
  for (const auto& [k, v] : env_map) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  const std::string uid_map = std::to_string(getuid()) + " " + std::to_string(getuid()) + " 1\n";
  const std::string gid_map = std::to_string(getgid()) + " " + std::to_string(getgid()) + " 1\n";
  long max_fd = sysconf(_SC_OPEN_MAX);
  if (max_fd < 0 || max_fd > 4096) max_fd = 4096;

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int* p : {out_pipe, err_pipe, status_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  };
  if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
      pipe2(status_pipe, O_CLOEXEC) != 0) {
    const int e = errno;
    close_all();
    return fail(std::string("spawn_failed: pipe: ") + std::strerror(e));
  }
  int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (devnull < 0) {
    const int e = errno;
    close_all();
    return fail(std::string("spawn_failed: /dev/null: ") + std::strerror(e));
  }

  started_at_ms_ = steady_ms();
  const pid_t pid = fork();
  if (pid < 0) {
    const int e = errno;
    close_all();
    close_fd(devnull);
    return fail(std::string("spawn_failed: fork: ") + std::strerror(e));
  }

  if (pid == 0) {
    const int sfd = status_pipe[1];
    setsid();

    NsReport net;
    net.requested = spec_.isolate_network ? 1 : 0;
    auto enter_namespaces = [&](int flags) -> bool {
      if (unshare(flags) == 0) return true;
      if (unshare(CLONE_NEWUSER | flags) != 0) return false;
      net.via_userns = 1;
      // setgroups may be absent on old kernels; the maps are what matter.
      write_proc_file("/proc/self/setgroups", "deny", 4);
      if (!write_proc_file("/proc/self/gid_map", gid_map.data(), gid_map.size()) ||
          !write_proc_file("/proc/self/uid_map", uid_map.data(), uid_map.size())) {
        const int e = errno;
        write_all(sfd, &net, sizeof(net));
        child_fail(sfd, stage_network, e);
      }
      return true;
    };
    const bool want_readonly = !spec_.readonly_paths.empty();
    int ns_flags = (spec_.isolate_network ? CLONE_NEWNET : 0) | (want_readonly ? CLONE_NEWNS : 0);
    bool in_ns = ns_flags != 0 && enter_namespaces(ns_flags);
    if (!in_ns && want_readonly && spec_.isolate_network) {
      // A mount namespace is optional; the network one may still be available alone.
      ns_flags = CLONE_NEWNET;
      in_ns = enter_namespaces(ns_flags);
    }
    const int net_errno = errno;
    if (in_ns && (ns_flags & CLONE_NEWNET)) net.isolated = 1;
    if (in_ns && (ns_flags & CLONE_NEWNS))
      net.readonly = child_remount_readonly(spec_.readonly_paths) ? 1 : 0;
    write_all(sfd, &net, sizeof(net));
    if (net.requested && !net.isolated && spec_.network_required)
      child_fail(sfd, stage_network, net_errno);

    if (spec_.no_new_privileges && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0)
      child_fail(sfd, stage_no_new_privs, errno);

    if (spec_.max_memory_bytes > 0) child_rlimit(RLIMIT_AS, spec_.max_memory_bytes, 0, sfd);
    if (spec_.max_processes > 0) child_rlimit(RLIMIT_NPROC, spec_.max_processes, 0, sfd);
    if (spec_.cpu_seconds > 0) child_rlimit(RLIMIT_CPU, spec_.cpu_seconds, 1, sfd);

    if (dup2(devnull, STDIN_FILENO) < 0 || dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
        dup2(err_pipe[1], STDERR_FILENO) < 0)
      child_fail(sfd, stage_stdio, errno);
    for (int fd = 3; fd < max_fd; ++fd) {
      if (fd != sfd) ::close(fd);
    }
    // After the close loop so the limit cannot reject the dup2 targets.
    if (spec_.max_file_descriptors > 0)
      child_rlimit(RLIMIT_NOFILE, spec_.max_file_descriptors, 0, sfd);

    if (!spec_.cwd.empty() && chdir(spec_.cwd.c_str()) != 0) child_fail(sfd, stage_chdir, errno);

    execve(exe.c_str(), argv.data(), envp.data());
    child_fail(sfd, stage_exec, errno);
  }

  pid_ = pid;
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);
  close_fd(devnull);
  out_fd_ = out_pipe[0];
  err_fd_ = err_pipe[0];
  out_pipe[0] = -1;
  err_pipe[0] = -1;
  fcntl(out_fd_, F_SETFL, O_NONBLOCK);
  fcntl(err_fd_, F_SETFL, O_NONBLOCK);

  // EOF arrives when execve closes the CLOEXEC write end or the child exits.
  char report[sizeof(NsReport) + sizeof(FailReport)];
  std::size_t got = 0;
  while (got < sizeof(report)) {
    const ssize_t n = ::read(status_pipe[0], report + got, sizeof(report) - got);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    got += static_cast<std::size_t>(n);
  }
  close_fd(status_pipe[0]);

  NsReport net;
  if (got >= sizeof(NsReport)) std::memcpy(&net, report, sizeof(net));
  if (spec_.isolate_network) {
    if (net.isolated) {
      result_.enforced_capabilities.push_back(net.via_userns ? "network_isolation_userns"
                                                             : "network_isolation");
    } else {
      result_.failed_capabilities.push_back("network_isolation");
    }
  }
  if (!spec_.readonly_paths.empty()) {
    if (net.readonly) {
      result_.enforced_capabilities.push_back("readonly_mount");
    } else {
      result_.failed_capabilities.push_back("readonly_mount");
    }
  }

  if (got != sizeof(NsReport)) {
    FailReport fr;
    fr.stage = stage_exec;
    if (got == sizeof(report)) std::memcpy(&fr, report + sizeof(NsReport), sizeof(fr));
    try_reap(true);
    finish();
    return fail(std::string("spawn_failed: ") + stage_name(fr.stage) + ": " +
                std::strerror(fr.err));
  }

  result_.started = true;
  if (spec_.no_new_privileges) result_.enforced_capabilities.push_back("no_new_privileges");
  if (spec_.max_memory_bytes > 0) result_.enforced_capabilities.push_back("rlimits_mem");
  if (spec_.max_file_descriptors > 0) result_.enforced_capabilities.push_back("rlimits_fds");
  if (spec_.max_processes > 0) result_.enforced_capabilities.push_back("rlimits_nproc");
  if (spec_.cpu_seconds > 0) result_.enforced_capabilities.push_back("rlimits_cpu");
  return true;
}

void ChildProcess::pump(int timeout_ms) {
  struct pollfd fds[2];
  nfds_t n = 0;
  if (out_fd_ >= 0) fds[n++] = {out_fd_, POLLIN, 0};
  if (err_fd_ >= 0) fds[n++] = {err_fd_, POLLIN, 0};
  // With no open pipes poll() degenerates into a sleep.
  if (::poll(fds, n, timeout_ms) > 0) drain();
}

void ChildProcess::drain() {
  char buf[4096];
  auto read_fd = [&](int& fd, std::string& dst, bool& truncated) {
    while (fd >= 0) {
      const ssize_t n = ::read(fd, buf, sizeof(buf));
      if (n > 0) {
        append_limited(dst, buf, n, spec_.max_output_bytes, truncated);
        continue;
      }
      if (n < 0 && errno == EINTR) continue;
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
      close_fd(fd);
    }
  };
  read_fd(out_fd_, result_.stdout_text, result_.stdout_truncated);
  read_fd(err_fd_, result_.stderr_text, result_.stderr_truncated);
}

bool ChildProcess::running() const {
  std::lock_guard<std::mutex> lk(reap_mu_);
  return pid_ > 0 && !reaped_;
}

bool ChildProcess::signal_group(int sig) {
  std::lock_guard<std::mutex> lk(reap_mu_);
  // After the reap the pid may already belong to an unrelated process.
  if (pid_ <= 0 || reaped_) return false;
  ::kill(-pid_, sig);
  ::kill(pid_, sig);
  return true;
}

// Blocking reaps only follow a SIGKILL, so reap_mu_ is never held for long.
bool ChildProcess::try_reap(bool block) {
  std::lock_guard<std::mutex> lk(reap_mu_);
  if (reaped_ || pid_ <= 0) return true;
  int status = 0;
  struct rusage ru;
  std::memset(&ru, 0, sizeof(ru));
  pid_t w;
  do {
    w = wait4(pid_, &status, block ? 0 : WNOHANG, &ru);
  } while (w < 0 && errno == EINTR);
  if (w == 0) return false;
  reaped_ = true;
  if (w < 0) return true;

  // Descendants never outlive the supervised child.
  ::kill(-pid_, SIGKILL);

  if (result_.timed_out) {
    result_.exit_code = TIMEOUT_EXIT_CODE;
  } else if (WIFEXITED(status)) {
    result_.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result_.term_signal = WTERMSIG(status);
    result_.exit_code = 128 + result_.term_signal;
  }
  result_.usage.memory_peak_bytes = static_cast<uint64_t>(ru.ru_maxrss) * 1024;
  result_.usage.memory_limit_bytes = spec_.max_memory_bytes;
  result_.usage.cpu_time_ms =
      static_cast<uint64_t>(ru.ru_utime.tv_sec + ru.ru_stime.tv_sec) * 1000 +
      static_cast<uint64_t>(ru.ru_utime.tv_usec + ru.ru_stime.tv_usec) / 1000;
  result_.usage.io_read_bytes = static_cast<uint64_t>(ru.ru_inblock) * 512;
  result_.usage.io_write_bytes = static_cast<uint64_t>(ru.ru_oublock) * 512;
  result_.wall_time_s = static_cast<double>(steady_ms() - started_at_ms_) / 1000.0;
  return true;
}

void ChildProcess::finish() {
  if (finished_) return;
  finished_ = true;
  drain();
  close_fd(out_fd_);
  close_fd(err_fd_);
  if (result_.stdout_truncated) result_.stdout_text += "(truncated)";
  if (result_.stderr_truncated) result_.stderr_text += "(truncated)";
}

bool ChildProcess::wait_for(uint64_t ms) {
  if (pid_ <= 0) return true;
  const uint64_t until = steady_ms() + ms;
  while (!try_reap(false)) {
    const uint64_t now = steady_ms();
    if (now >= until) return false;
    pump(static_cast<int>(std::min<uint64_t>(until - now, 10)));
  }
  finish();
  return true;
}

void ChildProcess::wait() {
  if (pid_ <= 0) return;
  if (spec_.timeout_ms == 0) {
    while (!wait_for(1000)) {
    }
    return;
  }
  const uint64_t deadline = started_at_ms_ + spec_.timeout_ms;
  const uint64_t now = steady_ms();
  if (wait_for(deadline > now ? deadline - now : 0)) return;
  result_.timed_out = true;
  kill_group();
}

void ChildProcess::kill_group() {
  if (!signal_group(SIGKILL)) return;
  try_reap(true);
  finish();
}

ProcessResult run_process(const ProcessSpec& spec) {
  ChildProcess child(spec);
  std::string error;
  if (!child.start(&error)) return child.result();
  child.wait();
  return child.result();
}

std::string find_executable(const std::string& name) {
  if (name.empty()) return {};
  auto is_exec = [](const std::string& p) {
    struct stat st;
    return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
  };
  if (name.find('/') != std::string::npos) return is_exec(name) ? name : std::string();

  const char* env_path = std::getenv("PATH");
  const std::string path = (env_path && env_path[0]) ? env_path : "/usr/local/bin:/usr/bin:/bin";
  std::size_t begin = 0;
  while (begin <= path.size()) {
    const std::size_t end = std::min(path.find(':', begin), path.size());
    const std::string dir = path.substr(begin, end - begin);
    if (!dir.empty()) {
      const std::string candidate = dir + "/" + name;
      if (is_exec(candidate)) return candidate;
    }
    begin = end + 1;
  }
  return {};
}

bool probe_network_isolation(std::string* detail) {
  ProcessSpec spec;
  spec.command = find_executable("true");
  spec.timeout_ms = 5000;
  spec.isolate_network = true;
  spec.network_required = true;
  if (spec.command.empty()) {
    if (detail) *detail = "probe binary 'true' not found on PATH";
    return false;
  }
  const ProcessResult r = run_process(spec);
  if (r.started && r.exit_code == 0) {
    if (detail) {
      *detail = r.enforced_capabilities.empty() ? "network_isolation"
                                                : r.enforced_capabilities.front();
    }
    return true;
  }
  if (detail) {
    *detail = r.error_message.empty() ? "probe exited " + std::to_string(r.exit_code)
                                      : r.error_message;
  }
  return false;
}

bool readonly_mount_available(const std::string& dir, std::string* detail) {
  ProcessSpec spec;
  spec.command = find_executable("true");
  spec.timeout_ms = 5000;
  spec.isolate_network = true;
  spec.readonly_paths = {dir};
  if (spec.command.empty()) {
    if (detail) *detail = "helper binary 'true' not found on PATH";
    return false;
  }
  const ProcessResult r = run_process(spec);
  const bool ok = r.started && r.exit_code == 0 &&
                  std::find(r.enforced_capabilities.begin(), r.enforced_capabilities.end(),
                            "readonly_mount") != r.enforced_capabilities.end();
  if (detail) {
    if (ok) {
      *detail = "readonly bind mount";
    } else if (!r.error_message.empty()) {
      *detail = r.error_message;
    } else {
      *detail = "read-only bind mount unavailable";
    }
  }
  return ok;
}

}  // namespace evogate
