#include "util/warden_digest.h"
#include "util/logger.h"
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <uuid/uuid.h>

namespace warden {

std::string Sha256Hex(const std::string& data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
    LOG_ERROR("Digest", "EVP_Digest(sha256) failed");
    return "";
  }

  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::setw(2) << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string GenerateCorrelationId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return std::string(uuid_str);
}

}  // namespace warden
