#pragma once

// evogate/log.hpp — Structured JSONL logging.
//
// Every record is one compact JSON object on its own line:
//   {"ts":"2026-01-01T00:00:00.000Z","level":"info","component":"sandbox",
//    "msg":"environment created","env":"evo-env-3"}
//
// SINK (resolved once, on first use, unless configure_logging() ran before):
//   EVOGATE_LOG unset or empty -> stderr
//   EVOGATE_LOG=off            -> disabled
//   EVOGATE_LOG=/path/x.jsonl  -> appended to that file
//   EVOGATE_LOG_LEVEL          -> debug | info | warn | error (default info)
//
// HOOK:
//   set_log_hook() installs a process-wide callback. When a hook is set it
//   receives every record at or above the minimum level and the sink is
//   bypassed. Tests use it to capture records.

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace evogate {

enum class LogLevel {
  debug = 0,
  info = 1,
  warn = 2,
  error = 3,
};

std::string to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& s);

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogRecord {
  uint64_t ts_unix_ms{0};
  LogLevel level{LogLevel::info};
  std::string component;
  std::string msg;
  LogFields fields;
};

std::string log_record_to_json(const LogRecord& r);

using LogHook = void (*)(const LogRecord&);
void set_log_hook(LogHook hook);

// sink: "" = stderr, "off" = disabled, anything else = file path.
void configure_logging(const std::string& sink, LogLevel min_level);
void configure_logging_from_env();
LogLevel log_min_level();

void log_event(LogLevel level, const std::string& component, const std::string& msg,
               LogFields fields = {});

inline void log_debug(const std::string& component, const std::string& msg, LogFields fields = {}) {
  log_event(LogLevel::debug, component, msg, std::move(fields));
}
inline void log_info(const std::string& component, const std::string& msg, LogFields fields = {}) {
  log_event(LogLevel::info, component, msg, std::move(fields));
}
inline void log_warn(const std::string& component, const std::string& msg, LogFields fields = {}) {
  log_event(LogLevel::warn, component, msg, std::move(fields));
}
inline void log_error(const std::string& component, const std::string& msg, LogFields fields = {}) {
  log_event(LogLevel::error, component, msg, std::move(fields));
}

}  // namespace evogate
