#include "mbt/auth/authorizer.h"
#include <openssl/crypto.h>

namespace mbt::auth {

bool StaticTokenAuthorizer::authorize(const std::string& token, const std::string& client_id) {
  (void)client_id;
  if (expected_.empty()) return true;
  if (token.size() != expected_.size()) return false;
  // constant-time compare
  return CRYPTO_memcmp(token.data(), expected_.data(), token.size()) == 0;
}

} // namespace mbt::auth
