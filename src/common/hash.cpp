#include "clausekit/common/hash.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace clausekit::common {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_Digest(text.data(), text.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
    return "";
  }
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < length; ++i) {
    out << std::setw(2) << static_cast<int>(digest[i]);
  }
  return out.str();
}

} // namespace clausekit::common
