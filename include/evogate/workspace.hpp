#pragma once

// evogate/workspace.hpp — Per-execution temporary filesystem.
//
// LAYOUT:
//   <temp>/evogate_<env-id>_XXXXXX/      mode 0700, created with mkdtemp
//     app/                               candidate + harness (sealed 0555 by the engine)
//     out/                               result.json is written here
//
// A Workspace is never reused. The destructor removes the whole tree,
// restoring write permission on sealed directories first.

#include <memory>
#include <optional>
#include <string>

namespace evogate {

class Workspace {
 public:
  static std::unique_ptr<Workspace> create(const std::string& temp_root, const std::string& env_id,
                                           std::string* error);
  ~Workspace();

  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  const std::string& root() const { return root_; }
  const std::string& app_dir() const { return app_dir_; }
  const std::string& out_dir() const { return out_dir_; }

  bool write_app_file(const std::string& name, const std::string& content, std::string* error);

  // Contents of out/<name>, nullopt when absent or unreadable.
  std::optional<std::string> read_out_file(const std::string& name) const;

  // Idempotent; true when nothing is left on disk.
  bool remove();

 private:
  explicit Workspace(std::string root);

  std::string root_;
  std::string app_dir_;
  std::string out_dir_;
  bool removed_{false};
};

// Write to a temporary sibling, then rename into place.
bool atomic_write(const std::string& target, const std::string& data);

// Recursive removal that first makes every directory owner-writable.
bool remove_tree(const std::string& path);

// TMPDIR, or /tmp when unset.
std::string default_temp_root();

}  // namespace evogate
