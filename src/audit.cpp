#include "evogate/audit.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>

#include "evogate/hash.hpp"
#include "evogate/jsonlite.hpp"
#include "evogate/log.hpp"
#include "evogate/version.hpp"

namespace fs = std::filesystem;

namespace evogate {

namespace {

const std::string kGenesisDigest(64, '0');

}  // namespace

std::string transition_to_json(const TransitionRecord& r) {
  jsonlite::Object o;
  o["v"] = version::AUDIT_LOG_VERSION;
  o["seq"] = r.sequence;
  o["prev"] = r.previous_digest;
  o["request_id"] = r.request_id;
  o["state"] = to_string(r.state);
  o["actor"] = r.actor;
  o["detail"] = r.detail;
  o["code_digest"] = r.code_digest;
  o["timestamp_unix_ms"] = r.timestamp_unix_ms;
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// AuditLog
// ---------------------------------------------------------------------------

struct AuditLogImpl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t entry_count{0};
  uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};
};

AuditLog::AuditLog(const std::string& path) : path_(path), impl_(std::make_unique<AuditLogImpl>()) {
  if (path_.empty()) return;

  std::error_code ec;
  const fs::path parent = fs::path(path_).parent_path();
  if (!parent.empty()) fs::create_directories(parent, ec);

  // Resume the chain from the last line already on disk.
  {
    std::ifstream ifs(path_, std::ios::binary);
    std::string line;
    std::string last;
    while (std::getline(ifs, line)) {
      if (!line.empty()) last = line;
    }
    if (!last.empty()) {
      std::optional<jsonlite::JsonError> err;
      const jsonlite::Object o = jsonlite::parse(last, &err);
      if (err) {
        log_warn("audit", "last audit line unreadable; chain continues from it",
                 {{"path", path_}, {"error", err->message}});
      }
      impl_->seq = static_cast<uint64_t>(jsonlite::get_i64(o, "seq", 0));
      impl_->last_digest = audit_digest(last);
    }
  }

  impl_->file = std::fopen(path_.c_str(), "a");
  if (!impl_->file) {
    log_error("audit", "cannot open audit log", {{"path", path_}});
  }
}

AuditLog::~AuditLog() {
  if (impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

bool AuditLog::append(TransitionRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (path_.empty()) return true;
  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  record.sequence = impl_->seq + 1;
  record.previous_digest = impl_->last_digest;
  if (record.timestamp_unix_ms == 0) record.timestamp_unix_ms = now_unix_ms();

  const std::string line = transition_to_json(record);
  const std::string final_line = line + "\n";
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size();
  const bool flushed = std::fflush(impl_->file) == 0;

  if (!written || !flushed) {
    ++impl_->failure_count;
    log_warn("audit", "audit append failed", {{"request_id", record.request_id}});
    return false;
  }
  const long post_write_pos = std::ftell(impl_->file);
  if (post_write_pos >= 0 && post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
    ++impl_->failure_count;
    return false;
  }

  impl_->seq = record.sequence;
  impl_->last_digest = audit_digest(line);
  ++impl_->entry_count;
  return true;
}

uint64_t AuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t AuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

uint64_t AuditLog::last_sequence() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->seq;
}

bool AuditLog::enabled() const { return !path_.empty(); }

// ---------------------------------------------------------------------------
// Verification
// ---------------------------------------------------------------------------

AuditVerification verify_audit_chain(const std::string& path) {
  AuditVerification v;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    v.error = "cannot open " + path;
    return v;
  }

  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 1;
  uint64_t line_no = 0;
  std::string line;
  while (std::getline(ifs, line)) {
    ++line_no;
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const jsonlite::Object o = jsonlite::parse(line, &err);
    if (err) {
      v.first_bad_line = line_no;
      v.error = "line " + std::to_string(line_no) + ": " + err->message;
      return v;
    }
    const uint64_t seq = static_cast<uint64_t>(jsonlite::get_i64(o, "seq", 0));
    if (seq != expected_seq) {
      v.first_bad_line = line_no;
      v.error = "line " + std::to_string(line_no) + ": seq " + std::to_string(seq) + " != expected " +
                std::to_string(expected_seq);
      return v;
    }
    if (jsonlite::get_string(o, "prev") != expected_prev) {
      v.first_bad_line = line_no;
      v.error = "line " + std::to_string(line_no) + ": chain digest mismatch";
      return v;
    }
    expected_prev = audit_digest(line);
    ++expected_seq;
    ++v.entries;
  }
  v.ok = true;
  return v;
}

}  // namespace evogate
