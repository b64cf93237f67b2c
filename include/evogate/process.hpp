#pragma once

// evogate/process.hpp — Supervised child processes with a hard safety envelope.
//
// Every external program evogate runs (the docker CLI, the local sandbox
// harness, the external code generator) goes through ChildProcess.
//
// CHILD SETUP ORDER (between fork and execve, async-signal-safe calls only):
//   1. setsid()                      new session + process group
//   2. namespaces                    unshare(CLONE_NEWNET), falling back to
//                                    CLONE_NEWUSER|CLONE_NEWNET with an
//                                    identity uid/gid map; CLONE_NEWNS is
//                                    added when readonly_paths is non-empty
//   2b. read-only binds              each readonly_path is bind mounted onto
//                                    itself and remounted MS_RDONLY
//   3. PR_SET_NO_NEW_PRIVS
//   4. setrlimit                     AS, NOFILE, NPROC, CPU
//   5. stdio                         stdin=/dev/null, stdout/stderr=pipes
//   6. chdir(cwd)
//   7. execve
//   A failure at any stage is reported to the parent through a CLOEXEC
//   status pipe and the child exits 127. The parent turns that into
//   ProcessResult::error_message ("spawn_failed: <stage>: <strerror>").
//
// TERMINATION:
//   On deadline expiry the whole process group is killed with SIGKILL and
//   exit_code is forced to 124. After a normal exit the group is killed as
//   well, so no descendant outlives its supervisor.
//
// OWNERSHIP:
//   ChildProcess owns the pid and all pipe fds. The destructor kills the
//   group and reaps the child if the caller did not.
//
// THREADING:
//   One thread drives start/wait. signal_group() and running() may be
//   called from any thread; they share reap_mu_ with the reap so a signal
//   never reaches a pid that has already been recycled.

#include <sys/types.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "evogate/types.hpp"

namespace evogate {

// Exit code reported for a run terminated by its deadline.
constexpr int TIMEOUT_EXIT_CODE = 124;

struct ProcessSpec {
  std::string command;                       // path, or a name looked up on PATH
  std::vector<std::string> argv;             // arguments after argv[0]
  std::map<std::string, std::string> env;
  bool inherit_env{false};                   // start from the parent's environ
  std::string cwd;
  uint64_t timeout_ms{5000};                 // 0 = no deadline
  std::size_t max_output_bytes{1 << 20};     // per stream
  uint64_t max_memory_bytes{0};              // RLIMIT_AS, 0 = unlimited
  uint64_t max_file_descriptors{0};          // RLIMIT_NOFILE
  uint64_t max_processes{0};                 // RLIMIT_NPROC (per user!)
  uint64_t cpu_seconds{0};                   // RLIMIT_CPU
  bool isolate_network{false};
  bool network_required{false};              // fail the spawn when isolation fails
  std::vector<std::string> readonly_paths;   // bind-remounted read-only, best effort
  bool no_new_privileges{false};
};

struct ProcessResult {
  bool started{false};
  int exit_code{-1};
  bool timed_out{false};
  int term_signal{0};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;                 // empty when the spawn succeeded
  ResourceUsage usage;
  double wall_time_s{0.0};
  std::vector<std::string> enforced_capabilities;
  std::vector<std::string> failed_capabilities;
};

class ChildProcess {
 public:
  explicit ChildProcess(ProcessSpec spec);
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  // Forks and execs. Returns false and sets *error when the child could not
  // be started; result().error_message carries the same text.
  bool start(std::string* error);

  // Pumps output until the child exits or ms elapse. Returns true once the
  // child has been reaped.
  bool wait_for(uint64_t ms);

  // Waits until exit or the timeout_ms deadline, killing the group on expiry.
  void wait();

  // SIGKILL to the whole process group, then reap.
  void kill_group();

  // Sends sig to the group and the child unless it has been reaped.
  // Returns false when there was nothing left to signal.
  bool signal_group(int sig);

  bool running() const;
  pid_t pid() const { return pid_; }
  const ProcessResult& result() const { return result_; }

 private:
  void pump(int timeout_ms);
  void drain();
  bool try_reap(bool block);
  void finish();

  ProcessSpec spec_;
  ProcessResult result_;
  pid_t pid_{-1};
  int out_fd_{-1};
  int err_fd_{-1};
  mutable std::mutex reap_mu_;               // guards reaped_ against signal_group
  bool reaped_{false};
  bool finished_{false};
  uint64_t started_at_ms_{0};
};

// Blocking convenience wrapper: start + wait.
ProcessResult run_process(const ProcessSpec& spec);

// Resolves name against PATH (or checks it directly when it contains '/').
// Returns "" when no executable is found.
std::string find_executable(const std::string& name);

// True when this process can give a child a private network namespace.
bool probe_network_isolation(std::string* detail);

// True when a child can see dir through a read-only bind mount.
bool readonly_mount_available(const std::string& dir, std::string* detail);

}  // namespace evogate
