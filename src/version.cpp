#include "evogate/version.hpp"

#include <sstream>

namespace evogate {
namespace version {

std::string manifest_json() {
  std::ostringstream o;
  o << "{"
    << "\"semver\":\"" << semver() << "\""
    << ",\"result_record\":" << RESULT_RECORD_VERSION
    << ",\"audit_log\":" << AUDIT_LOG_VERSION
    << ",\"harness\":" << HARNESS_VERSION
    << ",\"hash_algorithm\":" << HASH_ALGORITHM_VERSION
    << ",\"hash_primitive\":\"blake3\""
    << ",\"compression\":\"zstd\""
    // Deterministic within a single build.
    << ",\"build_timestamp\":\"" << __DATE__ << "T" << __TIME__ << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace evogate
