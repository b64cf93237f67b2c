// Sandbox tests against the local isolation engine. These fork real
// processes; tests needing namespaces, a read-only bind mount or python3 are
// skipped where the host cannot provide them.

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "evogate/config.hpp"
#include "evogate/evolution_sandbox.hpp"
#include "evogate/jsonlite.hpp"
#include "evogate/log.hpp"
#include "evogate/process.hpp"
#include "evogate/sandbox_runtime.hpp"
#include "evogate/types.hpp"

namespace fs = std::filesystem;
using namespace evogate;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
int g_tests_skipped = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

void skip(const std::string& why) {
  std::cout << " SKIPPED (" << why << ")";
  g_tests_skipped++;
}

fs::path g_temp;

EvogateConfig local_config(const std::string& network_policy = "best_effort") {
  EvogateConfig cfg;
  cfg.engine = "local";
  cfg.profile = "posix_sh";
  cfg.network_policy = network_policy;
  cfg.temp_dir = g_temp.string();
  cfg.timeout_s = 20;
  cfg.watchdog_grace_s = 5;
  // RLIMIT_NPROC counts every process of the user, not just the sandbox.
  cfg.limits.max_processes = 0;
  cfg.limits.memory_bytes = 128ull * 1024 * 1024;
  return cfg;
}

std::shared_ptr<SandboxRuntime> local_runtime() {
  return std::make_shared<SandboxRuntime>(local_config());
}

bool has(const std::vector<std::string>& names, const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

std::size_t workspaces_left() {
  std::size_t n = 0;
  for (const auto& entry : fs::directory_iterator(g_temp)) {
    if (entry.path().filename().string().rfind("evogate_", 0) == 0) ++n;
  }
  return n;
}

// ============================================================================
// Execution outcomes
// ============================================================================

void test_completed_run() {
  auto rt = local_runtime();
  const SandboxResult r = rt->execute("echo hello", {});
  expect(r.status == SandboxStatus::completed, "echo completes");
  expect(r.exit_code == 0, "exit 0");
  expect(r.stdout_text.find("hello") != std::string::npos, "stdout captured");
  expect(jsonlite::get_bool(r.test_results, "success"), "result.json success");
  expect(!jsonlite::get_bool(r.test_results, "fixtures_loaded", true), "no fixtures");
  expect(r.resource_usage.memory_limit_bytes == 128ull * 1024 * 1024, "memory limit reported");
}

void test_fixtures_visible() {
  auto rt = local_runtime();
  jsonlite::Object fixtures;
  fixtures["input"] = 21;
  const SandboxResult r = rt->execute("test -r \"$EVOGATE_FIXTURES\"", fixtures);
  expect(r.status == SandboxStatus::completed, "fixture file readable by the candidate");
  expect(jsonlite::get_bool(r.test_results, "fixtures_loaded"), "fixtures_loaded reported");
}

void test_candidate_fault() {
  auto rt = local_runtime();
  const SandboxResult r = rt->execute("echo broken >&2\nexit 3", {});
  expect(r.status == SandboxStatus::failed, "non-zero exit -> failed");
  const jsonlite::Object error = jsonlite::get_object(r.test_results, "error");
  expect(jsonlite::get_string(error, "type") == "ExitStatus", "error type");
  expect(jsonlite::get_i64(r.test_results, "exit_status") == 3, "candidate status");
  expect(r.stderr_text.find("broken") != std::string::npos, "stderr captured");
}

void test_timeout() {
  auto rt = local_runtime();
  const auto start = std::chrono::steady_clock::now();
  const SandboxResult r = rt->execute("sleep 30", {}, 1);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(r.status == SandboxStatus::timeout, "sleep past the limit -> timeout");
  expect(r.exit_code == 124, "timeout exit code");
  expect(jsonlite::get_string(jsonlite::get_object(r.test_results, "error"), "type") == "Timeout",
         "timeout recorded by the harness");
  expect(elapsed < std::chrono::seconds(10), "timeout enforced promptly");
}

void test_memory_limit() {
  auto rt = local_runtime();
  const SandboxResult r =
      rt->execute("x=$(dd if=/dev/zero bs=1048576 count=400 2>/dev/null | tr '\\0' a)\necho ${#x}", {});
  expect(r.status != SandboxStatus::completed, "allocation past the limit does not complete");
}

void test_network_isolation() {
  std::shared_ptr<SandboxRuntime> rt;
  try {
    rt = std::make_shared<SandboxRuntime>(local_config("required"));
  } catch (const SandboxUnavailableError& e) {
    skip(e.what());
    return;
  }
  const SandboxResult r = rt->execute("grep -c ':' /proc/self/net/dev", {});
  expect(r.status == SandboxStatus::completed, "candidate runs");
  expect(r.stdout_text.rfind("1", 0) == 0, "only the loopback interface is visible");
}

// ============================================================================
// Lifecycle
// ============================================================================

void test_no_leaks() {
  auto rt = local_runtime();
  rt->execute("true", {});
  rt->execute("exit 1", {});
  rt->execute("sleep 30", {}, 1);
  expect(rt->active_environments().empty(), "no active environments");
  expect(rt->environments_created() == 3, "three environments");
  expect(rt->environments_created() == rt->environments_removed(), "created == removed");
  expect(workspaces_left() == 0, "workspaces removed");
}

void test_kill_all() {
  auto rt = local_runtime();
  SandboxResult result;
  std::thread runner([&] { result = rt->execute("sleep 30", {}); });

  for (int i = 0; i < 500 && rt->active_environments().empty(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  expect(!rt->active_environments().empty(), "environment became active");
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  const auto start = std::chrono::steady_clock::now();
  rt->kill_all();
  runner.join();
  expect(result.status == SandboxStatus::killed, "killed status");
  expect(std::chrono::steady_clock::now() - start < std::chrono::seconds(10), "kill is prompt");
  expect(rt->active_environments().empty(), "nothing left active");
  expect(workspaces_left() == 0, "workspace removed after kill");
}

void test_kill_all_races_short_runs() {
  auto rt = local_runtime();
  std::atomic<bool> done{false};
  std::thread killer([&] {
    while (!done) {
      rt->kill_all();
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });
  for (int i = 0; i < 20; ++i) {
    const SandboxResult r = rt->execute("true", {});
    expect(r.status == SandboxStatus::completed || r.status == SandboxStatus::killed,
           "every run ends completed or killed");
  }
  done = true;
  killer.join();
  expect(rt->active_environments().empty(), "nothing left active");
  expect(rt->environments_created() == rt->environments_removed(), "created == removed");
  expect(workspaces_left() == 0, "workspaces removed");
}

void test_evolution_sandbox_stats() {
  EvolutionSandbox sandbox(local_runtime());
  expect(sandbox.test_evolution("true", {}).status == SandboxStatus::completed, "completed run");
  expect(sandbox.test_evolution("exit 2", {}).status == SandboxStatus::failed, "failed run");
  const jsonlite::Object stats = sandbox.stats_json();
  expect(jsonlite::get_string(stats, "engine") == "local", "engine");
  expect(jsonlite::get_string(stats, "profile") == "posix_sh", "profile");
  expect(jsonlite::get_i64(stats, "runs") == 2, "runs");
  expect(jsonlite::get_i64(stats, "completed") == 1 && jsonlite::get_i64(stats, "failed") == 1, "outcomes");
  expect(jsonlite::get_i64(stats, "active_environments") == 0, "no active environments");
}

void test_capabilities() {
  auto rt = local_runtime();
  const EngineCapabilities caps = rt->capabilities();
  expect(has(caps.unsupported, "cpu_share"), "cpu share reported as unsupported");
  expect(has(caps.enforced, "rlimits_mem") && has(caps.enforced, "rlimits_fds"), "configured rlimits enforced");
  expect(has(caps.unsupported, "rlimits_nproc") && !has(caps.enforced, "rlimits_nproc"),
         "no process limit configured, none claimed");
  expect(has(caps.enforced, "readonly_workspace") != has(caps.unsupported, "readonly_workspace"),
         "read-only workspace either enforced or unsupported");

  EvogateConfig cfg = local_config();
  cfg.limits.max_processes = 64;
  const EngineCapabilities with_nproc = SandboxRuntime(cfg).capabilities();
  expect(has(with_nproc.enforced, "rlimits_nproc"), "process limit claimed once configured");
}

// ============================================================================
// Workspace sealing
// ============================================================================

void test_readonly_workspace() {
  auto rt = local_runtime();
  if (!has(rt->capabilities().enforced, "readonly_workspace")) {
    skip("read-only bind mount unavailable");
    return;
  }
  const SandboxResult r = rt->execute(
      "chmod -R u+w \"$EVOGATE_APP_DIR\" 2>/dev/null\n"
      "if echo pwned > \"$EVOGATE_APP_DIR/evil\" 2>/dev/null; then echo WRITABLE; else echo SEALED; fi\n"
      "if echo pwned >> \"$EVOGATE_APP_DIR/candidate.sh\" 2>/dev/null; then echo WRITABLE; fi",
      {});
  expect(r.status == SandboxStatus::completed, "candidate runs");
  expect(r.stdout_text.find("SEALED") != std::string::npos, "new file refused after chmod");
  expect(r.stdout_text.find("WRITABLE") == std::string::npos, "app dir stays read-only");
}

// ============================================================================
// Python profile
// ============================================================================

bool python_available() {
  if (find_executable("python3").empty()) {
    skip("python3 not installed");
    return false;
  }
  return true;
}

std::shared_ptr<SandboxRuntime> python_runtime(const std::string& network_policy = "best_effort") {
  EvogateConfig cfg = local_config(network_policy);
  cfg.profile = "python";
  return std::make_shared<SandboxRuntime>(cfg);
}

void test_python_completed() {
  if (!python_available()) return;
  auto rt = python_runtime();
  const SandboxResult r = rt->execute("print('hello')\nresult = 'done'\n", {});
  expect(r.status == SandboxStatus::completed, "python candidate completes");
  expect(r.exit_code == 0, "exit 0");
  expect(r.stdout_text.find("hello") != std::string::npos, "stdout captured");
  expect(jsonlite::get_bool(r.test_results, "success"), "result.json success");
  expect(jsonlite::get_string(r.test_results, "output") == "done", "candidate result reported");
}

void test_python_exception() {
  if (!python_available()) return;
  auto rt = python_runtime();
  const SandboxResult r = rt->execute("raise ValueError('bad input')\n", {});
  expect(r.status == SandboxStatus::failed, "exception -> failed");
  expect(r.exit_code == 1, "harness exits 1");
  const jsonlite::Object error = jsonlite::get_object(r.test_results, "error");
  expect(jsonlite::get_string(error, "type") == "ValueError", "exception type recorded");
  expect(jsonlite::get_string(error, "message") == "bad input", "exception message recorded");
}

void test_python_fixtures() {
  if (!python_available()) return;
  auto rt = python_runtime();
  jsonlite::Object fixtures;
  fixtures["input"] = 21;
  const SandboxResult r = rt->execute("result = test_data['input'] * 2\n", fixtures);
  expect(r.status == SandboxStatus::completed, "fixture run completes");
  expect(jsonlite::get_bool(r.test_results, "fixtures_loaded"), "fixtures_loaded reported");
  expect(jsonlite::get_i64(r.test_results, "output") == 42, "fixture value reached the candidate");
}

void test_python_timeout() {
  if (!python_available()) return;
  auto rt = python_runtime();
  const auto start = std::chrono::steady_clock::now();
  const SandboxResult r = rt->execute("import time\ntime.sleep(30)\n", {}, 1);
  expect(r.status == SandboxStatus::timeout, "sleep past the limit -> timeout");
  expect(r.exit_code == 124, "timeout exit code");
  expect(jsonlite::get_string(jsonlite::get_object(r.test_results, "error"), "type") == "Timeout",
         "timeout recorded by the runner");
  expect(std::chrono::steady_clock::now() - start < std::chrono::seconds(10), "timeout enforced promptly");
}

void test_python_memory_limit() {
  if (!python_available()) return;
  auto rt = python_runtime();
  const SandboxResult r = rt->execute("block = bytearray(400 * 1024 * 1024)\nresult = len(block)\n", {});
  expect(r.status != SandboxStatus::completed, "allocation past the limit does not complete");
}

void test_python_network_denied() {
  if (!python_available()) return;
  std::shared_ptr<SandboxRuntime> rt;
  try {
    rt = python_runtime("required");
  } catch (const SandboxUnavailableError& e) {
    skip(e.what());
    return;
  }
  const SandboxResult r = rt->execute(
      "import socket\n"
      "socket.create_connection(('192.0.2.1', 80), timeout=2)\n"
      "result = 'connected'\n",
      {});
  expect(r.status == SandboxStatus::failed, "outbound connect fails");
  const jsonlite::Object error = jsonlite::get_object(r.test_results, "error");
  expect(!jsonlite::get_string(error, "type").empty(), "connect error recorded");
  expect(jsonlite::get_string(r.test_results, "output") != "connected", "no connection made");
}

}  // namespace

int main() {
  configure_logging("off", LogLevel::info);
  g_temp = fs::temp_directory_path() / ("evogate_sandbox_tests_" + std::to_string(::getpid()));
  fs::remove_all(g_temp);
  fs::create_directories(g_temp);

  std::cout << "=== Evogate Sandbox Test Suite ===\n";

  std::cout << "\n[Sandbox] Execution outcomes\n";
  run_test("completed run", test_completed_run);
  run_test("fixtures visible", test_fixtures_visible);
  run_test("candidate fault", test_candidate_fault);
  run_test("timeout", test_timeout);
  run_test("memory limit", test_memory_limit);
  run_test("network isolation", test_network_isolation);

  std::cout << "\n[Sandbox] Workspace sealing\n";
  run_test("read-only workspace", test_readonly_workspace);

  std::cout << "\n[Sandbox] Python profile\n";
  run_test("python completed", test_python_completed);
  run_test("python exception", test_python_exception);
  run_test("python fixtures", test_python_fixtures);
  run_test("python timeout", test_python_timeout);
  run_test("python memory limit", test_python_memory_limit);
  run_test("python network denied", test_python_network_denied);

  std::cout << "\n[Sandbox] Lifecycle\n";
  run_test("no leaked environments", test_no_leaks);
  run_test("kill_all", test_kill_all);
  run_test("kill_all racing short runs", test_kill_all_races_short_runs);
  run_test("evolution sandbox stats", test_evolution_sandbox_stats);
  run_test("engine capabilities", test_capabilities);

  fs::remove_all(g_temp);
  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed";
  if (g_tests_skipped > 0) std::cout << " (" << g_tests_skipped << " skipped)";
  std::cout << " ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
