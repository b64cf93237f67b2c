#include "evogate/log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "evogate/jsonlite.hpp"
#include "evogate/types.hpp"

namespace evogate {

namespace {

struct LogSink {
  std::mutex mu;
  bool configured{false};
  bool disabled{false};
  std::string path;  // empty -> stderr
  std::atomic<int> min_level{static_cast<int>(LogLevel::info)};
};

LogSink& sink() {
  static LogSink s;
  return s;
}

std::atomic<LogHook> g_log_hook{nullptr};

void configure_locked(LogSink& s, const std::string& target, LogLevel min_level) {
  s.configured = true;
  s.disabled = (target == "off");
  s.path = s.disabled ? std::string() : target;
  s.min_level.store(static_cast<int>(min_level), std::memory_order_relaxed);
}

void ensure_configured(LogSink& s) {
  if (s.configured) return;
  const char* target = std::getenv("EVOGATE_LOG");
  const char* level = std::getenv("EVOGATE_LOG_LEVEL");
  LogLevel min = LogLevel::info;
  if (level && level[0]) min = parse_log_level(level).value_or(LogLevel::info);
  configure_locked(s, target ? target : "", min);
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "info";
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
  if (s == "debug") return LogLevel::debug;
  if (s == "info") return LogLevel::info;
  if (s == "warn" || s == "warning") return LogLevel::warn;
  if (s == "error") return LogLevel::error;
  return std::nullopt;
}

std::string log_record_to_json(const LogRecord& r) {
  // Fixed keys first, then extra fields in call order.
  std::string line;
  line.reserve(160);
  line += "{\"ts\":\"";
  line += iso8601_utc(r.ts_unix_ms);
  line += "\",\"level\":\"";
  line += to_string(r.level);
  line += "\",\"component\":\"";
  line += jsonlite::escape(r.component);
  line += "\",\"msg\":\"";
  line += jsonlite::escape(r.msg);
  line += "\"";
  for (const auto& [k, v] : r.fields) {
    line += ",\"";
    line += jsonlite::escape(k);
    line += "\":\"";
    line += jsonlite::escape(v);
    line += "\"";
  }
  line += "}";
  return line;
}

void set_log_hook(LogHook hook) { g_log_hook.store(hook, std::memory_order_release); }

void configure_logging(const std::string& target, LogLevel min_level) {
  LogSink& s = sink();
  std::lock_guard<std::mutex> lk(s.mu);
  configure_locked(s, target, min_level);
}

void configure_logging_from_env() {
  LogSink& s = sink();
  std::lock_guard<std::mutex> lk(s.mu);
  s.configured = false;
  ensure_configured(s);
}

LogLevel log_min_level() {
  LogSink& s = sink();
  {
    std::lock_guard<std::mutex> lk(s.mu);
    ensure_configured(s);
  }
  return static_cast<LogLevel>(s.min_level.load(std::memory_order_relaxed));
}

void log_event(LogLevel level, const std::string& component, const std::string& msg,
               LogFields fields) {
  LogSink& s = sink();
  std::unique_lock<std::mutex> lk(s.mu);
  ensure_configured(s);
  if (static_cast<int>(level) < s.min_level.load(std::memory_order_relaxed)) return;

  LogRecord rec;
  rec.ts_unix_ms = now_unix_ms();
  rec.level = level;
  rec.component = component;
  rec.msg = msg;
  rec.fields = std::move(fields);

  LogHook hook = g_log_hook.load(std::memory_order_acquire);
  if (hook) {
    lk.unlock();
    hook(rec);
    return;
  }
  if (s.disabled) return;

  const std::string line = log_record_to_json(rec) + "\n";
  if (s.path.empty()) {
    std::fwrite(line.data(), 1, line.size(), stderr);
    return;
  }
  if (FILE* f = std::fopen(s.path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace evogate
