#pragma once

// evogate/version.hpp — Version manifest for every persisted or generated format.
//
// INVARIANT:
//   Any structural change to a persisted record, the audit log line layout or
//   the generated harness must bump the matching constant below. Readers
//   reject records written with a newer version than they were compiled with.

#include <cstdint>
#include <string>

#ifndef EVOGATE_VERSION
#define EVOGATE_VERSION "0.1.0"
#endif

namespace evogate {
namespace version {

// Layout of EvolutionResult JSON records in the ResultStore.
constexpr uint32_t RESULT_RECORD_VERSION = 1;

// Layout of one NDJSON line in the transition audit log.
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// Generated runner/wrapper sources. Bump when the result.json contract changes.
constexpr uint32_t HARNESS_VERSION = 1;

// Hash primitive for code digests and audit chaining (1 = BLAKE3-256).
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

inline std::string semver() { return EVOGATE_VERSION; }

// Compact JSON manifest, printed by `evogate version`.
std::string manifest_json();

}  // namespace version
}  // namespace evogate
