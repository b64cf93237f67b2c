#pragma once

// evogate/applier.hpp — Kind-specific integration of an approved candidate.
//
// ModuleApplier layout under the integration root:
//   functions/<function_name>.<ext>     function_generation
//   modules/<function_name>.<ext>       module_enhancement
//   patches/<request_id>.<ext>          bug_fix
//   backups/<request_id>/<unit path>    prior content of a replaced unit
//   integration.ndjson                  one line per successful apply
// Files are written atomically (temp + rename). A unit that already exists
// is copied to backups/ first and its digest is journaled as
// previous_digest. When the journal cannot be written the unit is restored
// (or removed, if it is new) and the apply fails. With an empty root nothing
// is written and every supported kind succeeds (dry run).
// optimization and feature_addition have no integration routine and fail.

#include <mutex>
#include <string>

#include "evogate/types.hpp"

namespace evogate {

class EvolutionApplier {
 public:
  virtual ~EvolutionApplier() = default;
  virtual bool apply(const std::string& request_id, const EvolutionRequest& request,
                     const std::string& code) = 0;
};

class ModuleApplier : public EvolutionApplier {
 public:
  explicit ModuleApplier(std::string integration_root, std::string extension = "py");

  bool apply(const std::string& request_id, const EvolutionRequest& request,
             const std::string& code) override;

  bool dry_run() const { return root_.empty(); }
  const std::string& root() const { return root_; }

 private:
  bool integrate_function(const std::string& request_id, const EvolutionRequest& request,
                          const std::string& code);
  bool enhance_module(const std::string& request_id, const EvolutionRequest& request,
                      const std::string& code);
  bool apply_bug_fix(const std::string& request_id, const EvolutionRequest& request,
                     const std::string& code);
  bool write_unit(const std::string& rel_path, const std::string& request_id, EvolutionKind kind,
                  const std::string& code);

  std::string root_;
  std::string extension_;
  std::mutex write_mu_;                    // backup + unit + journal line
};

// [A-Za-z0-9_] only; anything else becomes '_'. Empty -> "evolved_function".
std::string sanitize_unit_name(const std::string& name);

}  // namespace evogate
