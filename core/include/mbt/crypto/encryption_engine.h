#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <stop_token>
#include <string>
#include "mbt/common/error.h"
#include "mbt/crypto/encryption_metadata.h"

namespace mbt::crypto {

struct EncryptionConfig {
  int key_size_bits = 256;  // 128, 192 or 256
  int iterations = 100000;
  size_t buffer_size = 64 * 1024;

  Status validate() const;
};

// Password-based AES-CBC (PKCS#7) with PBKDF2-HMAC-SHA256 key derivation.
// Data is streamed through a fixed buffer; inputs never fully reside in memory.
class EncryptionEngine {
public:
  static constexpr size_t kSaltSize = 32;
  static constexpr size_t kIvSize = 16;
  static constexpr int kFormatVersion = 1;

  explicit EncryptionEngine(EncryptionConfig cfg = {});

  Result<EncryptionMetadata> encrypt(std::istream& in, std::ostream& out,
                                     const std::string& password,
                                     std::stop_token stop = {}) const;

  // Decryption error on bad padding or malformed input; integrity error when
  // the plaintext does not hash to meta.original_checksum.
  Status decrypt(std::istream& in, std::ostream& out,
                 const std::string& password,
                 const EncryptionMetadata& meta,
                 std::stop_token stop = {}) const;

  // File variants write to "<out>.part" and rename on success; partial output
  // is removed on failure. encrypt_file also writes the metadata sidecar.
  Result<EncryptionMetadata> encrypt_file(const std::string& in_path,
                                          const std::string& out_path,
                                          const std::string& password,
                                          std::stop_token stop = {}) const;
  Status decrypt_file(const std::string& in_path,
                      const std::string& out_path,
                      const std::string& password,
                      const EncryptionMetadata& meta,
                      std::stop_token stop = {}) const;

  // Full trial decryption into a hashing sink. Never throws for a wrong password.
  bool validate_password(std::istream& in, const std::string& password,
                         const EncryptionMetadata& meta) const;
  bool validate_password(const std::string& encrypted_path, const std::string& password,
                         const EncryptionMetadata& meta) const;

  // Throws std::invalid_argument when length < 8.
  static std::string generate_password(size_t length = 32);

  static std::string metadata_path(const std::string& ciphertext_path);

  const EncryptionConfig& config() const { return cfg_; }

private:
  EncryptionConfig cfg_;
};

} // namespace mbt::crypto
