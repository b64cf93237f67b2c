#pragma once

// evogate/hash.hpp — BLAKE3 digests for generated code, stored records and
// audit-log chaining.
//
// Domain separation: every caller hashes under a short prefix ("code:",
// "rec:", "audit:") so a digest from one context can never be replayed as a
// digest from another.

#include <string>
#include <string_view>

namespace evogate {

// 64-char lowercase hex BLAKE3-256 of the payload.
std::string blake3_hex(std::string_view payload);

// blake3_hex(domain + payload).
std::string hash_domain(std::string_view domain, std::string_view payload);

// Digest of a generated candidate, stored on EvolutionResult.
std::string code_digest(std::string_view code);

// Digest of a serialized EvolutionResult record (ResultStore sidecar).
std::string record_digest(std::string_view record_json);

// Chain digest for one audit-log line.
std::string audit_digest(std::string_view line);

bool is_hex_digest(const std::string& d);

}  // namespace evogate
