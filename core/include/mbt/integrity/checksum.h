#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include "mbt/common/error.h"

namespace mbt::integrity {

enum class HashAlgorithm { MD5, SHA1, SHA256, SHA512 };

const char* to_string(HashAlgorithm algo);
std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name);

// Incremental digest over an EVP_MD_CTX.
class Hasher {
public:
  explicit Hasher(HashAlgorithm algo);
  ~Hasher();

  Hasher(const Hasher&) = delete;
  Hasher& operator=(const Hasher&) = delete;

  void update(const void* data, size_t len);
  // Lowercase hex. The hasher cannot be updated afterwards.
  std::string final_hex();

private:
  EVP_MD_CTX* ctx_ = nullptr;
};

struct FileDigests {
  uint64_t size = 0;
  std::string md5;
  std::string sha256;
};

class ChecksumValidator {
public:
  static constexpr size_t kBufferSize = 64 * 1024;

  static std::string compute(const void* data, size_t len, HashAlgorithm algo);
  static Result<std::string> compute(std::istream& in, HashAlgorithm algo, std::stop_token stop = {});
  static Result<std::string> compute_file(const std::string& path, HashAlgorithm algo, std::stop_token stop = {});

  // MD5 and SHA-256 in a single read of the file.
  static Result<FileDigests> digest_file(const std::string& path, std::stop_token stop = {});

  // Per-chunk checksum (MD5) used on the wire.
  static std::string chunk_checksum(const std::vector<uint8_t>& data);
  static bool verify_chunk(const std::vector<uint8_t>& data, const std::string& expected);

  // Empty expectations are skipped. Mismatch is an integrity error.
  static Status verify_file(const std::string& path,
                            const std::string& expected_md5,
                            const std::string& expected_sha256,
                            std::stop_token stop = {});

  static bool matches(const std::string& a, const std::string& b);
};

} // namespace mbt::integrity
