#include "evogate/workspace.hpp"

#include <fcntl.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

namespace fs = std::filesystem;

namespace evogate {

namespace {

constexpr off_t kMaxOutFileBytes = 4 * 1024 * 1024;

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

}  // namespace

std::string default_temp_root() {
  const char* t = std::getenv("TMPDIR");
  return (t && t[0]) ? std::string(t) : std::string("/tmp");
}

bool atomic_write(const std::string& target, const std::string& data) {
  const fs::path tp(target);
  std::error_code ec;
  fs::create_directories(tp.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(tp.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, tp, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

bool remove_tree(const std::string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return true;
  if (fs::is_directory(path, ec)) {
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, ec);
    for (auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) break;
      if (it->is_directory(ec) && !it->is_symlink(ec)) {
        fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
      }
    }
  }
  ec.clear();
  fs::remove_all(path, ec);
  return !ec && !fs::exists(path, ec);
}

Workspace::Workspace(std::string root)
    : root_(std::move(root)), app_dir_(root_ + "/app"), out_dir_(root_ + "/out") {}

Workspace::~Workspace() { remove(); }

std::unique_ptr<Workspace> Workspace::create(const std::string& temp_root, const std::string& env_id,
                                             std::string* error) {
  const std::string base = temp_root.empty() ? default_temp_root() : temp_root;
  std::string tmpl = base + "/evogate_" + env_id + "_XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (!::mkdtemp(buf.data())) {
    if (error) *error = "mkdtemp failed under " + base;
    return nullptr;
  }
  std::unique_ptr<Workspace> ws(new Workspace(std::string(buf.data())));

  std::error_code ec;
  fs::create_directory(ws->app_dir_, ec);
  if (!ec) fs::create_directory(ws->out_dir_, ec);
  // The environment may write as a different uid (container root).
  if (!ec) fs::permissions(ws->out_dir_, fs::perms::all, ec);
  if (ec) {
    if (error) *error = "workspace layout: " + ec.message();
    return nullptr;  // ~Workspace removes the partial tree
  }
  return ws;
}

bool Workspace::write_app_file(const std::string& name, const std::string& content, std::string* error) {
  if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
    if (error) *error = "invalid workspace file name: " + name;
    return false;
  }
  std::ofstream ofs(app_dir_ + "/" + name, std::ios::binary | std::ios::trunc);
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  ofs.flush();
  if (!ofs) {
    if (error) *error = "cannot write workspace file: " + name;
    return false;
  }
  return true;
}

std::optional<std::string> Workspace::read_out_file(const std::string& name) const {
  // The out dir is writable by the candidate: refuse symlinks, fifos and
  // oversized files.
  const int fd = ::open((out_dir_ + "/" + name).c_str(), O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) return std::nullopt;
  struct stat st;
  if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode) || st.st_size > kMaxOutFileBytes) {
    ::close(fd);
    return std::nullopt;
  }
  std::string data;
  char buf[8192];
  ssize_t n;
  while ((n = ::read(fd, buf, sizeof(buf))) > 0) {
    data.append(buf, static_cast<std::size_t>(n));
    if (data.size() > static_cast<std::size_t>(kMaxOutFileBytes)) break;
  }
  ::close(fd);
  if (n < 0) return std::nullopt;
  return data;
}

bool Workspace::remove() {
  if (removed_) return true;
  removed_ = remove_tree(root_);
  return removed_;
}

}  // namespace evogate
