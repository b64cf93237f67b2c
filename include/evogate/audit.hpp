#pragma once

// evogate/audit.hpp — Append-only, hash-chained log of request state transitions.
//
// DESIGN INVARIANTS:
//   1. APPEND-ONLY: lines are never modified or deleted.
//   2. SEQUENTIAL: each line carries seq = previous seq + 1, starting at 1,
//      continued across process restarts from the last line on disk.
//   3. CHAINED: "prev" is audit_digest() of the previous line's exact bytes
//      (64 zeros for the first line), so any edit breaks verification.
//   4. FAIL-SAFE: a write failure never affects the request; it is counted
//      in failure_count() and the chain digest is not advanced.
//
// LINE FORMAT (AUDIT_LOG_VERSION = 1), one compact JSON object per line:
//   {"actor","code_digest","detail","prev","request_id","seq","state",
//    "timestamp_unix_ms","v"}

#include <cstdint>
#include <memory>
#include <string>

#include "evogate/types.hpp"

namespace evogate {

struct TransitionRecord {
  uint64_t sequence{0};           // assigned by append()
  std::string previous_digest;    // assigned by append()
  std::string request_id;
  RequestState state{RequestState::submitted};
  std::string actor;              // "controller", approver name, ...
  std::string detail;             // error text or decision note
  std::string code_digest;        // empty before generation
  uint64_t timestamp_unix_ms{0};  // 0 -> stamped by append()
};

std::string transition_to_json(const TransitionRecord& r);

struct AuditLogImpl;

class AuditLog {
 public:
  // Empty path disables the log; append() then succeeds without writing.
  // The parent directory is created when missing.
  explicit AuditLog(const std::string& path = "");
  ~AuditLog();

  AuditLog(const AuditLog&) = delete;
  AuditLog& operator=(const AuditLog&) = delete;

  // Thread-safe. Assigns sequence and previous_digest in place.
  bool append(TransitionRecord& record);

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  uint64_t last_sequence() const;
  bool enabled() const;
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::unique_ptr<AuditLogImpl> impl_;
};

struct AuditVerification {
  bool ok{false};
  uint64_t entries{0};
  uint64_t first_bad_line{0};     // 1-based, 0 when ok
  std::string error;
};

// Re-reads the file and checks seq continuity and the prev chain.
AuditVerification verify_audit_chain(const std::string& path);

}  // namespace evogate
