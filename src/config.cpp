#include "evogate/config.hpp"

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace evogate {

namespace {

const char* env_or_null(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? v : nullptr;
}

void env_string(const char* name, std::string& out) {
  if (const char* v = env_or_null(name)) out = v;
}

// Accepts only positive integers; anything else keeps the current value.
template <typename T>
void env_positive(const char* name, T& out) {
  const char* v = env_or_null(name);
  if (!v) return;
  char* end = nullptr;
  const long long n = std::strtoll(v, &end, 10);
  if (end && *end == '\0' && n > 0) out = static_cast<T>(n);
}

bool is_int(const jsonlite::Value& v) { return std::holds_alternative<std::int64_t>(v.v); }

const std::set<std::string>& string_keys() {
  static const std::set<std::string> keys = {
      "engine", "docker_bin", "image", "interpreter", "profile", "network_policy",
      "temp_dir", "store_root", "audit_log", "integration_root", "generator"};
  return keys;
}

const std::set<std::string>& positive_keys() {
  static const std::set<std::string> keys = {
      "timeout_s", "watchdog_grace_s", "memory_mb", "cpu_period_us", "cpu_quota_us",
      "max_processes", "max_file_descriptors", "nproc_ulimit", "workers",
      "generator_timeout_s", "max_code_bytes"};
  return keys;
}

}  // namespace

void EvogateConfig::apply_env() {
  env_string("EVOGATE_ENGINE", engine);
  env_string("EVOGATE_DOCKER_BIN", docker_bin);
  env_string("EVOGATE_IMAGE", image);
  env_string("EVOGATE_INTERPRETER", interpreter);
  env_string("EVOGATE_PROFILE", profile);
  env_string("EVOGATE_NETWORK_POLICY", network_policy);
  env_string("EVOGATE_STORE", store_root);
  env_string("EVOGATE_AUDIT_LOG", audit_log);
  env_string("EVOGATE_INTEGRATION_ROOT", integration_root);
  env_string("EVOGATE_GENERATOR", generator);
  env_positive("EVOGATE_TIMEOUT_S", timeout_s);
  env_positive("EVOGATE_WORKERS", workers);
  env_positive("EVOGATE_MAX_CODE_BYTES", max_code_bytes);
  uint64_t memory_mb = 0;
  env_positive("EVOGATE_MEMORY_MB", memory_mb);
  if (memory_mb > 0) limits.memory_bytes = memory_mb * 1024 * 1024;
  if (temp_dir.empty()) {
    if (const char* t = env_or_null("TMPDIR")) temp_dir = t;
  }
}

EvogateConfig EvogateConfig::from_env() {
  EvogateConfig cfg;
  cfg.apply_env();
  return cfg;
}

ConfigValidationResult validate_config(const jsonlite::Object& doc) {
  ConfigValidationResult r;
  auto error = [&](std::string msg) {
    r.ok = false;
    r.code = ErrorCode::config_invalid;
    r.errors.push_back(std::move(msg));
  };

  for (const auto& [key, value] : doc) {
    if (string_keys().count(key)) {
      if (!value.is_string()) error(key + ": expected string");
      continue;
    }
    if (positive_keys().count(key)) {
      if (!is_int(value)) {
        error(key + ": expected integer");
      } else if (std::get<std::int64_t>(value.v) <= 0) {
        error(key + ": must be positive");
      }
      continue;
    }
    r.warnings.push_back("unknown key: " + key);
  }

  const std::string engine = jsonlite::get_string(doc, "engine", "docker");
  if (engine != "docker" && engine != "local") error("engine: unknown engine '" + engine + "'");
  const std::string profile = jsonlite::get_string(doc, "profile", "python");
  if (profile != "python" && profile != "posix_sh")
    error("profile: unknown profile '" + profile + "'");
  const std::string policy = jsonlite::get_string(doc, "network_policy", "required");
  if (policy != "required" && policy != "best_effort")
    error("network_policy: unknown policy '" + policy + "'");

  const std::int64_t period = jsonlite::get_i64(doc, "cpu_period_us", 100000);
  const std::int64_t quota = jsonlite::get_i64(doc, "cpu_quota_us", 50000);
  if (period > 0 && quota > 0 && quota > period * 64) error("cpu_quota_us: exceeds 64 cores");
  return r;
}

void apply_config(EvogateConfig& cfg, const jsonlite::Object& doc) {
  cfg.engine = jsonlite::get_string(doc, "engine", cfg.engine);
  cfg.docker_bin = jsonlite::get_string(doc, "docker_bin", cfg.docker_bin);
  cfg.image = jsonlite::get_string(doc, "image", cfg.image);
  cfg.interpreter = jsonlite::get_string(doc, "interpreter", cfg.interpreter);
  cfg.profile = jsonlite::get_string(doc, "profile", cfg.profile);
  cfg.network_policy = jsonlite::get_string(doc, "network_policy", cfg.network_policy);
  cfg.temp_dir = jsonlite::get_string(doc, "temp_dir", cfg.temp_dir);
  cfg.store_root = jsonlite::get_string(doc, "store_root", cfg.store_root);
  cfg.audit_log = jsonlite::get_string(doc, "audit_log", cfg.audit_log);
  cfg.integration_root = jsonlite::get_string(doc, "integration_root", cfg.integration_root);
  cfg.generator = jsonlite::get_string(doc, "generator", cfg.generator);

  cfg.timeout_s = static_cast<uint32_t>(jsonlite::get_i64(doc, "timeout_s", cfg.timeout_s));
  cfg.watchdog_grace_s =
      static_cast<uint32_t>(jsonlite::get_i64(doc, "watchdog_grace_s", cfg.watchdog_grace_s));
  cfg.workers = static_cast<uint32_t>(jsonlite::get_i64(doc, "workers", cfg.workers));
  cfg.generator_timeout_s = static_cast<uint32_t>(
      jsonlite::get_i64(doc, "generator_timeout_s", cfg.generator_timeout_s));
  cfg.max_code_bytes = static_cast<uint64_t>(
      jsonlite::get_i64(doc, "max_code_bytes", static_cast<std::int64_t>(cfg.max_code_bytes)));

  const std::int64_t mb = jsonlite::get_i64(doc, "memory_mb", 0);
  if (mb > 0) cfg.limits.memory_bytes = static_cast<uint64_t>(mb) * 1024 * 1024;
  cfg.limits.cpu_period_us = static_cast<uint64_t>(
      jsonlite::get_i64(doc, "cpu_period_us", static_cast<std::int64_t>(cfg.limits.cpu_period_us)));
  cfg.limits.cpu_quota_us = static_cast<uint64_t>(
      jsonlite::get_i64(doc, "cpu_quota_us", static_cast<std::int64_t>(cfg.limits.cpu_quota_us)));
  cfg.limits.max_processes =
      static_cast<uint32_t>(jsonlite::get_i64(doc, "max_processes", cfg.limits.max_processes));
  cfg.limits.max_file_descriptors = static_cast<uint32_t>(
      jsonlite::get_i64(doc, "max_file_descriptors", cfg.limits.max_file_descriptors));
  cfg.limits.nproc_ulimit =
      static_cast<uint32_t>(jsonlite::get_i64(doc, "nproc_ulimit", cfg.limits.nproc_ulimit));
}

bool load_config_file(const std::string& path, EvogateConfig& cfg, ConfigValidationResult* result) {
  ConfigValidationResult local;
  ConfigValidationResult& r = result ? *result : local;

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    r.ok = false;
    r.code = ErrorCode::config_invalid;
    r.errors.push_back("cannot read config file: " + path);
    return false;
  }
  std::stringstream ss;
  ss << ifs.rdbuf();

  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object doc = jsonlite::parse(ss.str(), &err);
  if (err) {
    r.ok = false;
    r.code = ErrorCode::config_invalid;
    r.errors.push_back(err->code + ": " + err->message);
    return false;
  }
  r = validate_config(doc);
  if (!r.ok) return false;
  apply_config(cfg, doc);
  return true;
}

jsonlite::Object config_to_json(const EvogateConfig& cfg) {
  jsonlite::Object limits;
  limits["memory_bytes"] = cfg.limits.memory_bytes;
  limits["cpu_period_us"] = cfg.limits.cpu_period_us;
  limits["cpu_quota_us"] = cfg.limits.cpu_quota_us;
  limits["max_processes"] = cfg.limits.max_processes;
  limits["max_file_descriptors"] = cfg.limits.max_file_descriptors;
  limits["nproc_ulimit"] = cfg.limits.nproc_ulimit;

  jsonlite::Object o;
  o["engine"] = cfg.engine;
  o["docker_bin"] = cfg.docker_bin;
  o["image"] = cfg.image;
  o["interpreter"] = cfg.interpreter;
  o["profile"] = cfg.profile;
  o["network_policy"] = cfg.network_policy;
  o["temp_dir"] = cfg.temp_dir;
  o["timeout_s"] = cfg.timeout_s;
  o["watchdog_grace_s"] = cfg.watchdog_grace_s;
  o["limits"] = std::move(limits);
  o["max_code_bytes"] = cfg.max_code_bytes;
  o["workers"] = cfg.workers;
  o["store_root"] = cfg.store_root;
  o["audit_log"] = cfg.audit_log;
  o["integration_root"] = cfg.integration_root;
  o["generator"] = cfg.generator;
  o["generator_timeout_s"] = cfg.generator_timeout_s;
  return o;
}

}  // namespace evogate
