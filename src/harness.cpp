#include "evogate/harness.hpp"

#include "evogate/version.hpp"

namespace evogate {

namespace {

// Guarded execution of candidate.py. Exit 0 on success, 1 on any fault.
const char* kPythonMain = R"PY(# evogate harness (python): guarded execution of candidate.py
import json
import os
import sys
import time
import traceback

sys.tracebacklimit = 10

APP = os.environ.get("EVOGATE_APP_DIR", "/app")
OUT = os.environ.get("EVOGATE_OUT_DIR", "/out")
FIXTURES = os.environ.get("EVOGATE_FIXTURES", "")


def main():
    start = time.time()
    result = {
        "success": False,
        "output": None,
        "error": None,
        "execution_time": 0,
        "exit_status": 1,
        "fixtures_loaded": False,
        "harness_version": HARNESS_VERSION,
    }
    try:
        test_data = None
        if FIXTURES:
            with open(FIXTURES, "r") as f:
                test_data = json.load(f)
            result["fixtures_loaded"] = True
        with open(os.path.join(APP, "candidate.py"), "r") as f:
            source = f.read()
        scope = {"__name__": "__evogate_candidate__", "test_data": test_data}
        try:
            exec(compile(source, "candidate.py", "exec"), scope)
        except SystemExit as e:
            if e.code not in (None, 0):
                raise
        output = scope.get("result")
        try:
            json.dumps(output)
        except (TypeError, ValueError):
            output = repr(output)
        result["success"] = True
        result["output"] = output if output is not None else "candidate executed successfully"
        result["exit_status"] = 0
    except BaseException as e:
        result["error"] = {
            "type": type(e).__name__,
            "message": str(e),
            "traceback": traceback.format_exc(),
        }
    finally:
        result["execution_time"] = time.time() - start

    with open(os.path.join(OUT, "result.json"), "w") as f:
        json.dump(result, f, indent=2)
    print(json.dumps(result))
    return result["exit_status"]


if __name__ == "__main__":
    sys.exit(main())
)PY";

// Watchdog entry point. The candidate stays in the runner's process group so
// the supervisor's group kill reaches every descendant.
const char* kPythonRunner = R"PY(# evogate harness (python): watchdog entry point
import json
import os
import subprocess
import sys
import time

APP = os.environ.get("EVOGATE_APP_DIR", "/app")
OUT = os.environ.get("EVOGATE_OUT_DIR", "/out")
LIMIT = float(os.environ.get("EVOGATE_TIMEOUT_S", "300"))
TIMEOUT_EXIT = 124


def write_timeout(elapsed):
    result = {
        "success": False,
        "output": None,
        "error": {"type": "Timeout", "message": "candidate exceeded the harness time limit"},
        "execution_time": elapsed,
        "exit_status": TIMEOUT_EXIT,
        "fixtures_loaded": bool(os.environ.get("EVOGATE_FIXTURES")),
        "harness_version": HARNESS_VERSION,
    }
    try:
        with open(os.path.join(OUT, "result.json"), "w") as f:
            json.dump(result, f, indent=2)
    except OSError:
        pass


def main():
    start = time.time()
    proc = subprocess.Popen([sys.executable, os.path.join(APP, "main.py")], cwd=APP)
    try:
        rc = proc.wait(timeout=LIMIT)
    except subprocess.TimeoutExpired:
        proc.kill()
        proc.wait()
        write_timeout(time.time() - start)
        print("TIMEOUT: candidate exceeded the harness time limit", file=sys.stderr)
        return TIMEOUT_EXIT
    if rc < 0:
        return 128 - rc
    return rc


if __name__ == "__main__":
    sys.exit(main())
)PY";

const char* kShellRunner = R"SH(#!/bin/sh
# evogate harness (posix_sh): watchdog entry point
APP="${EVOGATE_APP_DIR:-/app}"
OUT="${EVOGATE_OUT_DIR:-/out}"
LIMIT="${EVOGATE_TIMEOUT_S:-300}"
MARK="$OUT/.timed_out"

loaded=false
if [ -n "${EVOGATE_FIXTURES:-}" ] && [ -r "$EVOGATE_FIXTURES" ]; then
  loaded=true
fi

# Only literals and integers reach result.json.
write_result() {
  printf '{\n  "success": %s,\n  "output": %s,\n  "error": %s,\n  "execution_time": %s,\n  "exit_status": %s,\n  "fixtures_loaded": %s,\n  "harness_version": HARNESS_VERSION\n}\n' \
    "$1" "$2" "$3" "$elapsed" "$4" "$loaded" > "$OUT/result.json"
}

start=$(date +%s)
sh "$APP/candidate.sh" &
child=$!
( sleep "$LIMIT"; : > "$MARK"; kill -KILL "$child" 2>/dev/null ) &
watchdog=$!
wait "$child"
status=$?
kill -KILL "$watchdog" 2>/dev/null
elapsed=$(( $(date +%s) - start ))

if [ -f "$MARK" ] && [ "$status" -ne 0 ]; then
  write_result false null '{"type": "Timeout", "message": "candidate exceeded the harness time limit"}' 124
  echo "TIMEOUT: candidate exceeded the harness time limit" >&2
  exit 124
fi
if [ "$status" -eq 0 ]; then
  write_result true '"candidate executed successfully"' null 0
  exit 0
fi
write_result false null "{\"type\": \"ExitStatus\", \"message\": \"candidate exited with status $status\"}" "$status"
exit 1
)SH";

std::string with_version(const char* source) {
  std::string s(source);
  const std::string token = "HARNESS_VERSION";
  const std::string value = std::to_string(version::HARNESS_VERSION);
  for (std::size_t pos = s.find(token); pos != std::string::npos; pos = s.find(token, pos + value.size())) {
    s.replace(pos, token.size(), value);
  }
  return s;
}

}  // namespace

std::string to_string(HarnessProfile p) {
  switch (p) {
    case HarnessProfile::python: return "python";
    case HarnessProfile::posix_sh: return "posix_sh";
  }
  return "python";
}

std::optional<HarnessProfile> parse_harness_profile(const std::string& s) {
  if (s == "python") return HarnessProfile::python;
  if (s == "posix_sh") return HarnessProfile::posix_sh;
  return std::nullopt;
}

std::string candidate_file_name(HarnessProfile profile) {
  switch (profile) {
    case HarnessProfile::python: return "candidate.py";
    case HarnessProfile::posix_sh: return "candidate.sh";
  }
  return "candidate.py";
}

std::string source_extension(HarnessProfile profile) {
  switch (profile) {
    case HarnessProfile::python: return "py";
    case HarnessProfile::posix_sh: return "sh";
  }
  return "py";
}

std::vector<HarnessFile> harness_files(HarnessProfile profile, const std::string& code,
                                       const jsonlite::Object& fixtures) {
  std::vector<HarnessFile> files;
  files.push_back({candidate_file_name(profile), code});
  switch (profile) {
    case HarnessProfile::python:
      files.push_back({"main.py", with_version(kPythonMain)});
      files.push_back({"runner.py", with_version(kPythonRunner)});
      break;
    case HarnessProfile::posix_sh:
      files.push_back({"runner.sh", with_version(kShellRunner)});
      break;
  }
  if (!fixtures.empty()) {
    files.push_back({FIXTURES_FILE_NAME, jsonlite::to_json_pretty(jsonlite::Value{fixtures})});
  }
  return files;
}

std::string default_interpreter(HarnessProfile profile) {
  switch (profile) {
    case HarnessProfile::python: return "python3";
    case HarnessProfile::posix_sh: return "/bin/sh";
  }
  return "python3";
}

std::string container_interpreter(HarnessProfile profile) {
  switch (profile) {
    case HarnessProfile::python: return "python";
    case HarnessProfile::posix_sh: return "/bin/sh";
  }
  return "python";
}

std::vector<std::string> harness_command(HarnessProfile profile, const std::string& interpreter,
                                         const std::string& app_path) {
  switch (profile) {
    case HarnessProfile::python: return {interpreter, app_path + "/runner.py"};
    case HarnessProfile::posix_sh: return {interpreter, app_path + "/runner.sh"};
  }
  return {interpreter};
}

std::map<std::string, std::string> harness_env(const std::string& app_path, const std::string& out_path,
                                               bool has_fixtures, uint32_t timeout_s) {
  std::map<std::string, std::string> env;
  env["EVOGATE_APP_DIR"] = app_path;
  env["EVOGATE_OUT_DIR"] = out_path;
  env["EVOGATE_FIXTURES"] = has_fixtures ? app_path + "/" + FIXTURES_FILE_NAME : "";
  env["EVOGATE_TIMEOUT_S"] = std::to_string(timeout_s);
  env["PYTHONDONTWRITEBYTECODE"] = "1";
  return env;
}

}  // namespace evogate
