#include "evogate/applier.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

#include "evogate/hash.hpp"
#include "evogate/log.hpp"
#include "evogate/workspace.hpp"

namespace fs = std::filesystem;

namespace evogate {

namespace {

std::optional<std::string> read_unit(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

}  // namespace

std::string sanitize_unit_name(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    const unsigned char u = static_cast<unsigned char>(c);
    out.push_back((std::isalnum(u) || c == '_') ? c : '_');
  }
  if (out.empty()) out = "evolved_function";
  return out;
}

ModuleApplier::ModuleApplier(std::string integration_root, std::string extension)
    : root_(std::move(integration_root)), extension_(std::move(extension)) {}

bool ModuleApplier::apply(const std::string& request_id, const EvolutionRequest& request,
                          const std::string& code) {
  switch (request.kind) {
    case EvolutionKind::function_generation: return integrate_function(request_id, request, code);
    case EvolutionKind::module_enhancement: return enhance_module(request_id, request, code);
    case EvolutionKind::bug_fix: return apply_bug_fix(request_id, request, code);
    case EvolutionKind::optimization:
    case EvolutionKind::feature_addition:
      log_warn("applier", "no integration routine for evolution kind",
               {{"request_id", request_id}, {"kind", to_string(request.kind)}});
      return false;
  }
  return false;
}

bool ModuleApplier::integrate_function(const std::string& request_id, const EvolutionRequest& request,
                                       const std::string& code) {
  const std::string name = sanitize_unit_name(request.requirements.function_name);
  return write_unit("functions/" + name + "." + extension_, request_id, request.kind, code);
}

bool ModuleApplier::enhance_module(const std::string& request_id, const EvolutionRequest& request,
                                   const std::string& code) {
  const std::string name = sanitize_unit_name(request.requirements.function_name);
  return write_unit("modules/" + name + "." + extension_, request_id, request.kind, code);
}

bool ModuleApplier::apply_bug_fix(const std::string& request_id, const EvolutionRequest& request,
                                  const std::string& code) {
  return write_unit("patches/" + sanitize_unit_name(request_id) + "." + extension_, request_id,
                    request.kind, code);
}

bool ModuleApplier::write_unit(const std::string& rel_path, const std::string& request_id,
                               EvolutionKind kind, const std::string& code) {
  if (dry_run()) {
    log_info("applier", "dry run apply", {{"request_id", request_id}, {"target", rel_path}});
    return true;
  }
  const std::string target = root_ + "/" + rel_path;
  const LogFields failure = {{"request_id", request_id}, {"target", rel_path},
                             {"code", to_string(ErrorCode::apply_failed)}};
  std::lock_guard<std::mutex> lk(write_mu_);

  jsonlite::Object entry;
  std::error_code ec;
  const std::optional<std::string> previous =
      fs::is_regular_file(target, ec) ? read_unit(target) : std::nullopt;
  if (previous) {
    const std::string backup_rel = "backups/" + sanitize_unit_name(request_id) + "/" + rel_path;
    if (!atomic_write(root_ + "/" + backup_rel, *previous)) {
      log_error("applier", "backup of the replaced unit failed", failure);
      return false;
    }
    entry["backup"] = backup_rel;
    entry["previous_digest"] = code_digest(*previous);
  }

  if (!atomic_write(target, code)) {
    log_error("applier", "integration write failed", failure);
    return false;
  }

  entry["request_id"] = request_id;
  entry["evolution_type"] = to_string(kind);
  entry["path"] = rel_path;
  entry["code_digest"] = code_digest(code);
  entry["timestamp_unix_ms"] = now_unix_ms();
  const std::string line = jsonlite::to_json(entry) + "\n";
  std::ofstream ofs(root_ + "/integration.ndjson", std::ios::binary | std::ios::app);
  ofs.write(line.data(), static_cast<std::streamsize>(line.size()));
  ofs.flush();
  if (!ofs) {
    log_error("applier", "integration journal write failed", failure);
    // An unjournaled unit must not stay live.
    const bool restored = previous ? atomic_write(target, *previous) : fs::remove(target, ec);
    if (!restored) log_error("applier", "replaced unit could not be restored", failure);
    return false;
  }
  log_info("applier", "evolution integrated",
           {{"request_id", request_id}, {"target", rel_path}, {"replaced", previous ? "true" : "false"}});
  return true;
}

}  // namespace evogate
