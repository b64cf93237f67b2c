#include "evogate/result_store.hpp"

#include <zstd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "evogate/hash.hpp"
#include "evogate/log.hpp"
#include "evogate/version.hpp"
#include "evogate/workspace.hpp"

namespace fs = std::filesystem;

namespace evogate {

namespace {

constexpr int kZstdLevel = 3;
constexpr const char* kBlobSuffix = ".json.zst";

// Records are small; anything past this is not one of ours.
constexpr uint64_t kMaxRecordBytes = 64ull * 1024 * 1024;

std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), kZstdLevel);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return std::nullopt;
  return out;
}

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return data;
}

void set_error(StoreError* error, ErrorCode code, std::string message) {
  if (!error) return;
  error->code = code;
  error->message = std::move(message);
}

std::string meta_to_json(const StoredRecordInfo& m) {
  jsonlite::Object o;
  o["digest"] = m.digest;
  o["encoding"] = m.encoding;
  o["original_size"] = m.original_size;
  o["stored_size"] = m.stored_size;
  o["stored_blob_hash"] = m.stored_blob_hash;
  o["record_version"] = m.record_version;
  o["created_at"] = m.created_at_unix_ms;
  return jsonlite::to_json(o);
}

std::optional<StoredRecordInfo> meta_from_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(text, &err);
  if (err) return std::nullopt;
  StoredRecordInfo m;
  m.digest = jsonlite::get_string(o, "digest");
  m.encoding = jsonlite::get_string(o, "encoding");
  const int64_t original = jsonlite::get_i64(o, "original_size", -1);
  const int64_t stored = jsonlite::get_i64(o, "stored_size", -1);
  if (original < 0 || stored < 0) return std::nullopt;
  m.original_size = static_cast<uint64_t>(original);
  m.stored_size = static_cast<uint64_t>(stored);
  m.stored_blob_hash = jsonlite::get_string(o, "stored_blob_hash");
  m.record_version = static_cast<uint32_t>(jsonlite::get_i64(o, "record_version", 0));
  m.created_at_unix_ms = static_cast<uint64_t>(jsonlite::get_i64(o, "created_at", 0));
  if (!is_hex_digest(m.digest) || !is_hex_digest(m.stored_blob_hash)) return std::nullopt;
  return m;
}

}  // namespace

bool valid_request_id(const std::string& id) {
  if (id.empty() || id.size() > 128) return false;
  for (char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '_' || c == '-';
    if (!ok) return false;
  }
  return true;
}

ResultStore::ResultStore(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "results", ec);
  if (ec) log_warn("store", "cannot create results directory", {{"root", root_}, {"error", ec.message()}});
}

std::string ResultStore::blob_path(const std::string& request_id) const {
  return (fs::path(root_) / "results" / (request_id + kBlobSuffix)).string();
}

std::string ResultStore::meta_path(const std::string& request_id) const {
  return blob_path(request_id) + ".meta";
}

bool ResultStore::put(const EvolutionResult& result, StoreError* error) {
  if (!valid_request_id(result.request_id)) {
    set_error(error, ErrorCode::store_io_failed, "invalid request id: " + result.request_id);
    return false;
  }
  const std::string json = jsonlite::to_json(evolution_result_to_json(result));
  const std::string stored = compress_zstd(json);
  if (stored.empty()) {
    set_error(error, ErrorCode::store_io_failed, "zstd compression failed");
    return false;
  }

  StoredRecordInfo meta;
  meta.digest = record_digest(json);
  meta.encoding = "zstd";
  meta.original_size = json.size();
  meta.stored_size = stored.size();
  meta.stored_blob_hash = blake3_hex(stored);
  meta.record_version = version::RESULT_RECORD_VERSION;
  meta.created_at_unix_ms = now_unix_ms();

  if (!atomic_write(blob_path(result.request_id), stored)) {
    set_error(error, ErrorCode::store_io_failed, "cannot write " + blob_path(result.request_id));
    return false;
  }
  if (!atomic_write(meta_path(result.request_id), meta_to_json(meta))) {
    set_error(error, ErrorCode::store_io_failed, "cannot write " + meta_path(result.request_id));
    return false;
  }
  return true;
}

std::optional<StoredRecordInfo> ResultStore::info(const std::string& request_id) const {
  if (!valid_request_id(request_id)) return std::nullopt;
  auto text = read_file(meta_path(request_id));
  if (!text) return std::nullopt;
  return meta_from_json(*text);
}

std::optional<EvolutionResult> ResultStore::get(const std::string& request_id, StoreError* error) const {
  if (!valid_request_id(request_id)) {
    set_error(error, ErrorCode::store_io_failed, "invalid request id: " + request_id);
    return std::nullopt;
  }
  auto stored = read_file(blob_path(request_id));
  if (!stored) {
    set_error(error, ErrorCode::store_io_failed, "no record for " + request_id);
    return std::nullopt;
  }
  auto meta = info(request_id);
  if (!meta) {
    set_error(error, ErrorCode::store_integrity_failed, "missing or unreadable sidecar for " + request_id);
    return std::nullopt;
  }
  if (meta->record_version > version::RESULT_RECORD_VERSION) {
    set_error(error, ErrorCode::store_integrity_failed,
              "record version " + std::to_string(meta->record_version) + " is newer than supported");
    return std::nullopt;
  }
  if (meta->encoding != "zstd" || meta->original_size > kMaxRecordBytes) {
    set_error(error, ErrorCode::store_integrity_failed, "unsupported record encoding for " + request_id);
    return std::nullopt;
  }
  if (blake3_hex(*stored) != meta->stored_blob_hash) {
    set_error(error, ErrorCode::store_integrity_failed, "stored blob hash mismatch for " + request_id);
    return std::nullopt;
  }
  auto json = decompress_zstd(*stored, static_cast<std::size_t>(meta->original_size));
  if (!json) {
    set_error(error, ErrorCode::store_integrity_failed, "zstd decompression failed for " + request_id);
    return std::nullopt;
  }
  if (record_digest(*json) != meta->digest) {
    set_error(error, ErrorCode::store_integrity_failed, "record digest mismatch for " + request_id);
    return std::nullopt;
  }

  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object doc = jsonlite::parse(*json, &err);
  if (err) {
    set_error(error, ErrorCode::store_integrity_failed, "record is not JSON: " + err->message);
    return std::nullopt;
  }
  EvolutionResult r = evolution_result_from_json(doc);
  if (r.request_id != request_id) {
    set_error(error, ErrorCode::store_integrity_failed, "record id does not match its key " + request_id);
    return std::nullopt;
  }
  return r;
}

bool ResultStore::contains(const std::string& request_id) const {
  if (!valid_request_id(request_id)) return false;
  std::error_code ec;
  return fs::exists(blob_path(request_id), ec);
}

std::vector<std::string> ResultStore::list_ids() const {
  std::vector<std::string> out;
  const fs::path dir = fs::path(root_) / "results";
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return out;
  const std::string suffix = kBlobSuffix;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file()) continue;
    const std::string name = entry.path().filename().string();
    if (name.size() <= suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)
      continue;
    const std::string id = name.substr(0, name.size() - suffix.size());
    if (valid_request_id(id)) out.push_back(id);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<EvolutionResult> ResultStore::load_all(std::size_t* skipped) const {
  std::vector<EvolutionResult> out;
  std::size_t bad = 0;
  for (const auto& id : list_ids()) {
    StoreError err;
    auto r = get(id, &err);
    if (!r) {
      ++bad;
      log_warn("store", "skipping unreadable record", {{"request_id", id}, {"error", err.message}});
      continue;
    }
    out.push_back(std::move(*r));
  }
  if (skipped) *skipped = bad;
  return out;
}

}  // namespace evogate
