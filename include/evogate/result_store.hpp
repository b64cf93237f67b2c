#pragma once

// evogate/result_store.hpp — Durable EvolutionResult records keyed by request id.
//
// LAYOUT:
//   <root>/results/<request_id>.json.zst        zstd (level 3) of the record JSON
//   <root>/results/<request_id>.json.zst.meta   {"digest","encoding","original_size",
//                                                "stored_size","stored_blob_hash",
//                                                "record_version","created_at"}
//
// INVARIANTS:
//   - Blob and sidecar are each written atomically (temp + rename); the blob
//     first. A crash between the two leaves a blob whose sidecar is stale or
//     missing, which get() reports as an integrity failure.
//   - get() checks stored_blob_hash over the compressed bytes, then
//     record_digest() over the decompressed JSON. Any mismatch is rejected.
//   - put() overwrites: the latest state of a result wins (approval updates).

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "evogate/types.hpp"

namespace evogate {

struct StoredRecordInfo {
  std::string digest;             // record_digest() of the JSON
  std::string encoding;           // "zstd"
  uint64_t original_size{0};
  uint64_t stored_size{0};
  std::string stored_blob_hash;   // blake3_hex() of the compressed bytes
  uint32_t record_version{0};
  uint64_t created_at_unix_ms{0};
};

struct StoreError {
  ErrorCode code{ErrorCode::none};
  std::string message;
};

class ResultStore {
 public:
  explicit ResultStore(std::string root);

  const std::string& root() const { return root_; }

  bool put(const EvolutionResult& result, StoreError* error = nullptr);

  std::optional<EvolutionResult> get(const std::string& request_id, StoreError* error = nullptr) const;

  std::optional<StoredRecordInfo> info(const std::string& request_id) const;

  bool contains(const std::string& request_id) const;

  // Ids with a blob on disk, sorted.
  std::vector<std::string> list_ids() const;

  // Every readable record. Corrupt ones are skipped and counted in *skipped.
  std::vector<EvolutionResult> load_all(std::size_t* skipped = nullptr) const;

 private:
  std::string blob_path(const std::string& request_id) const;
  std::string meta_path(const std::string& request_id) const;

  std::string root_;
};

// [A-Za-z0-9_-], 1..128 chars. Guards every path built from an id.
bool valid_request_id(const std::string& id);

}  // namespace evogate
