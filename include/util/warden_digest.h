#ifndef WARDEN_DIGEST_H_
#define WARDEN_DIGEST_H_

#include <string>

namespace warden {

// Lowercase hex SHA-256 of data. Returns an empty string (and logs) if the
// digest could not be computed.
std::string Sha256Hex(const std::string& data);

// Random RFC 4122 UUID in lowercase text form
std::string GenerateCorrelationId();

}  // namespace warden

#endif  // WARDEN_DIGEST_H_
