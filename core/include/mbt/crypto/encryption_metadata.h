#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mbt::crypto {

// Everything needed to decrypt a ciphertext except the password.
// Stored next to the ciphertext as "<ciphertext>.meta", never inside it.
struct EncryptionMetadata {
  std::string algorithm = "AES-256-CBC";
  std::string key_derivation = "PBKDF2";
  int iterations = 100000;
  std::string salt;  // base64
  std::string iv;    // base64
  std::chrono::system_clock::time_point encrypted_at{};
  uint64_t original_size = 0;
  std::string original_checksum;  // SHA-256 hex of the plaintext
  int version = 1;

  // key=value lines
  std::string to_text() const;
  static EncryptionMetadata from_text(const std::string& text);

  void save(const std::string& path) const;
  static EncryptionMetadata load(const std::string& path);
};

} // namespace mbt::crypto
