#include "mbt/crypto/encryption_engine.h"
#include "mbt/common/ids.h"
#include "mbt/integrity/checksum.h"
#include "mbt/log/logger.h"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace mbt::crypto {

namespace {

using Sink = std::function<bool(const unsigned char*, size_t)>;

class CipherCtx {
public:
  CipherCtx() : ctx_(EVP_CIPHER_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
  }
  ~CipherCtx() { EVP_CIPHER_CTX_free(ctx_); }
  CipherCtx(const CipherCtx&) = delete;
  CipherCtx& operator=(const CipherCtx&) = delete;
  EVP_CIPHER_CTX* get() { return ctx_; }

private:
  EVP_CIPHER_CTX* ctx_;
};

// Derived key material, wiped on scope exit.
struct SecretBytes {
  explicit SecretBytes(size_t n) : bytes(n) {}
  ~SecretBytes() { if (!bytes.empty()) OPENSSL_cleanse(bytes.data(), bytes.size()); }
  SecretBytes(const SecretBytes&) = delete;
  SecretBytes& operator=(const SecretBytes&) = delete;
  std::vector<unsigned char> bytes;
};

const EVP_CIPHER* cipher_for(const std::string& algorithm) {
  if (algorithm == "AES-128-CBC") return EVP_aes_128_cbc();
  if (algorithm == "AES-192-CBC") return EVP_aes_192_cbc();
  if (algorithm == "AES-256-CBC") return EVP_aes_256_cbc();
  return nullptr;
}

std::string algorithm_name(int key_size_bits) {
  return "AES-" + std::to_string(key_size_bits) + "-CBC";
}

std::string base64_encode(const unsigned char* data, size_t len) {
  std::string out(4 * ((len + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(len));
  out.resize(static_cast<size_t>(n));
  return out;
}

std::optional<std::vector<unsigned char>> base64_decode(const std::string& in) {
  if (in.empty() || in.size() % 4 != 0) return std::nullopt;
  std::vector<unsigned char> out(3 * in.size() / 4);
  int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(in.data()), static_cast<int>(in.size()));
  if (n < 0) return std::nullopt;
  size_t pad = 0;
  if (in[in.size() - 1] == '=') pad++;
  if (in[in.size() - 2] == '=') pad++;
  out.resize(static_cast<size_t>(n) - pad);
  return out;
}

void derive_key(const std::string& password, const std::vector<unsigned char>& salt,
                int iterations, SecretBytes& key) {
  if (PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        iterations, EVP_sha256(),
                        static_cast<int>(key.bytes.size()), key.bytes.data()) != 1) {
    throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
  }
}

Status run_decrypt(std::istream& in, const std::string& password, const EncryptionMetadata& meta,
                   size_t buffer_size, std::stop_token stop, const Sink& sink) {
  if (meta.version != EncryptionEngine::kFormatVersion) {
    return Error::decryption("unsupported encryption format version " + std::to_string(meta.version));
  }
  if (meta.key_derivation != "PBKDF2") {
    return Error::decryption("unsupported key derivation " + meta.key_derivation);
  }
  const EVP_CIPHER* cipher = cipher_for(meta.algorithm);
  if (!cipher) return Error::decryption("unsupported algorithm " + meta.algorithm);
  if (meta.iterations <= 0) return Error::decryption("invalid iteration count");

  auto salt = base64_decode(meta.salt);
  auto iv = base64_decode(meta.iv);
  if (!salt || salt->empty()) return Error::decryption("malformed salt");
  if (!iv || iv->size() != EncryptionEngine::kIvSize) return Error::decryption("malformed IV");

  SecretBytes key(static_cast<size_t>(EVP_CIPHER_key_length(cipher)));
  derive_key(password, *salt, meta.iterations, key);

  CipherCtx ctx;
  if (EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, key.bytes.data(), iv->data()) != 1) {
    return Error::decryption("EVP_DecryptInit_ex failed");
  }

  integrity::Hasher sha(integrity::HashAlgorithm::SHA256);
  uint64_t total = 0;
  std::vector<char> inbuf(buffer_size);
  std::vector<unsigned char> outbuf(buffer_size + EVP_MAX_BLOCK_LENGTH);
  int outlen = 0;

  while (in) {
    if (stop.stop_requested()) return Error::cancelled("decryption cancelled");
    in.read(inbuf.data(), static_cast<std::streamsize>(inbuf.size()));
    auto n = in.gcount();
    if (n <= 0) break;
    if (EVP_DecryptUpdate(ctx.get(), outbuf.data(), &outlen,
                          reinterpret_cast<const unsigned char*>(inbuf.data()), static_cast<int>(n)) != 1) {
      return Error::decryption("malformed ciphertext");
    }
    sha.update(outbuf.data(), static_cast<size_t>(outlen));
    total += static_cast<uint64_t>(outlen);
    if (!sink(outbuf.data(), static_cast<size_t>(outlen))) return Error::fatal("write failed during decryption");
  }
  if (in.bad()) return Error::fatal("read error during decryption");

  if (EVP_DecryptFinal_ex(ctx.get(), outbuf.data(), &outlen) != 1) {
    return Error::decryption("bad padding: wrong password or corrupted ciphertext");
  }
  sha.update(outbuf.data(), static_cast<size_t>(outlen));
  total += static_cast<uint64_t>(outlen);
  if (!sink(outbuf.data(), static_cast<size_t>(outlen))) return Error::fatal("write failed during decryption");

  std::string checksum = sha.final_hex();
  if (!hex_equal(checksum, meta.original_checksum)) {
    return Error::integrity("decrypted checksum " + checksum + " does not match original " + meta.original_checksum);
  }
  if (total != meta.original_size) {
    return Error::integrity("decrypted size " + std::to_string(total) +
                            " does not match original " + std::to_string(meta.original_size));
  }
  return {};
}

bool commit_part(const std::string& part, const std::string& path) {
  if (std::rename(part.c_str(), path.c_str()) != 0) {
    std::remove(part.c_str());
    return false;
  }
  return true;
}

} // namespace

Status EncryptionConfig::validate() const {
  if (key_size_bits != 128 && key_size_bits != 192 && key_size_bits != 256) {
    return Error::configuration("key size must be 128, 192 or 256 bits");
  }
  if (iterations < 1) return Error::configuration("iteration count must be positive");
  if (buffer_size < 1024) return Error::configuration("encryption buffer must be at least 1024 bytes");
  return {};
}

EncryptionEngine::EncryptionEngine(EncryptionConfig cfg) : cfg_(cfg) {}

std::string EncryptionEngine::metadata_path(const std::string& ciphertext_path) {
  return ciphertext_path + ".meta";
}

Result<EncryptionMetadata> EncryptionEngine::encrypt(std::istream& in, std::ostream& out,
                                                     const std::string& password,
                                                     std::stop_token stop) const {
  if (password.empty()) return Error::configuration("encryption password is empty");
  if (auto st = cfg_.validate(); !st) return st.error();

  const std::string algo = algorithm_name(cfg_.key_size_bits);
  const EVP_CIPHER* cipher = cipher_for(algo);

  std::vector<unsigned char> salt(kSaltSize);
  std::vector<unsigned char> iv(kIvSize);
  if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1 ||
      RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    return Error::fatal("RAND_bytes failed");
  }

  SecretBytes key(static_cast<size_t>(cfg_.key_size_bits / 8));
  derive_key(password, salt, cfg_.iterations, key);

  CipherCtx ctx;
  if (EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, key.bytes.data(), iv.data()) != 1) {
    return Error::fatal("EVP_EncryptInit_ex failed");
  }

  integrity::Hasher sha(integrity::HashAlgorithm::SHA256);
  uint64_t total = 0;
  std::vector<char> inbuf(cfg_.buffer_size);
  std::vector<unsigned char> outbuf(cfg_.buffer_size + EVP_MAX_BLOCK_LENGTH);
  int outlen = 0;

  while (in) {
    if (stop.stop_requested()) return Error::cancelled("encryption cancelled");
    in.read(inbuf.data(), static_cast<std::streamsize>(inbuf.size()));
    auto n = in.gcount();
    if (n <= 0) break;
    sha.update(inbuf.data(), static_cast<size_t>(n));
    total += static_cast<uint64_t>(n);
    if (EVP_EncryptUpdate(ctx.get(), outbuf.data(), &outlen,
                          reinterpret_cast<const unsigned char*>(inbuf.data()), static_cast<int>(n)) != 1) {
      return Error::fatal("EVP_EncryptUpdate failed");
    }
    out.write(reinterpret_cast<const char*>(outbuf.data()), outlen);
  }
  if (in.bad()) return Error::fatal("read error during encryption");

  if (EVP_EncryptFinal_ex(ctx.get(), outbuf.data(), &outlen) != 1) {
    return Error::fatal("EVP_EncryptFinal_ex failed");
  }
  out.write(reinterpret_cast<const char*>(outbuf.data()), outlen);
  out.flush();
  if (!out) return Error::fatal("write failed during encryption");

  EncryptionMetadata meta;
  meta.algorithm = algo;
  meta.key_derivation = "PBKDF2";
  meta.iterations = cfg_.iterations;
  meta.salt = base64_encode(salt.data(), salt.size());
  meta.iv = base64_encode(iv.data(), iv.size());
  meta.encrypted_at = std::chrono::system_clock::now();
  meta.original_size = total;
  meta.original_checksum = sha.final_hex();
  meta.version = kFormatVersion;
  return meta;
}

Status EncryptionEngine::decrypt(std::istream& in, std::ostream& out,
                                 const std::string& password,
                                 const EncryptionMetadata& meta,
                                 std::stop_token stop) const {
  auto st = run_decrypt(in, password, meta, cfg_.buffer_size, stop,
                        [&out](const unsigned char* p, size_t n) {
                          out.write(reinterpret_cast<const char*>(p), static_cast<std::streamsize>(n));
                          return static_cast<bool>(out);
                        });
  if (st) out.flush();
  return st;
}

Result<EncryptionMetadata> EncryptionEngine::encrypt_file(const std::string& in_path,
                                                          const std::string& out_path,
                                                          const std::string& password,
                                                          std::stop_token stop) const {
  std::ifstream in(in_path, std::ios::binary);
  if (!in) return Error::fatal("cannot open " + in_path);

  const std::string part = out_path + ".part";
  Result<EncryptionMetadata> meta = Error::fatal("not started");
  {
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out) return Error::fatal("cannot create " + part);
    meta = encrypt(in, out, password, stop);
  }
  if (!meta) {
    std::remove(part.c_str());
    Logger::instance().warn("encryption of " + in_path + " failed: " + meta.error().describe());
    return meta;
  }
  if (!commit_part(part, out_path)) return Error::fatal("rename failed: " + out_path);

  try {
    meta->save(metadata_path(out_path));
  } catch (const std::exception& e) {
    std::remove(out_path.c_str());
    return Error::fatal(std::string("cannot write encryption metadata: ") + e.what());
  }
  Logger::instance().info("encrypted " + in_path + " -> " + out_path +
                          " (" + std::to_string(meta->original_size) + " bytes, " + meta->algorithm + ")");
  return meta;
}

Status EncryptionEngine::decrypt_file(const std::string& in_path,
                                      const std::string& out_path,
                                      const std::string& password,
                                      const EncryptionMetadata& meta,
                                      std::stop_token stop) const {
  std::ifstream in(in_path, std::ios::binary);
  if (!in) return Error::fatal("cannot open " + in_path);

  const std::string part = out_path + ".part";
  Status st;
  {
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out) return Error::fatal("cannot create " + part);
    st = decrypt(in, out, password, meta, stop);
  }
  if (!st) {
    std::remove(part.c_str());
    Logger::instance().warn("decryption of " + in_path + " failed: " + st.error().describe());
    return st;
  }
  if (!commit_part(part, out_path)) return Error::fatal("rename failed: " + out_path);
  Logger::instance().info("decrypted " + in_path + " -> " + out_path);
  return {};
}

bool EncryptionEngine::validate_password(std::istream& in, const std::string& password,
                                         const EncryptionMetadata& meta) const {
  if (password.empty()) return false;
  try {
    auto st = run_decrypt(in, password, meta, cfg_.buffer_size, {},
                          [](const unsigned char*, size_t) { return true; });
    if (!st) Logger::instance().debug("password validation failed: " + st.error().describe());
    return st.ok();
  } catch (const std::exception& e) {
    Logger::instance().warn(std::string("password validation error: ") + e.what());
    return false;
  }
}

bool EncryptionEngine::validate_password(const std::string& encrypted_path, const std::string& password,
                                         const EncryptionMetadata& meta) const {
  std::ifstream in(encrypted_path, std::ios::binary);
  if (!in) {
    Logger::instance().warn("password validation: cannot open " + encrypted_path);
    return false;
  }
  return validate_password(in, password, meta);
}

std::string EncryptionEngine::generate_password(size_t length) {
  if (length < 8) throw std::invalid_argument("password length must be at least 8");

  static const std::string groups[] = {
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ",
    "abcdefghijklmnopqrstuvwxyz",
    "0123456789",
    "!@#$%^&*()-_=+[]{}"
  };
  const std::string all = groups[0] + groups[1] + groups[2] + groups[3];

  auto random_below = [](size_t n) {
    uint32_t limit = UINT32_MAX - (UINT32_MAX % static_cast<uint32_t>(n));
    uint32_t v = 0;
    do {
      if (RAND_bytes(reinterpret_cast<unsigned char*>(&v), sizeof(v)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
      }
    } while (v >= limit);
    return static_cast<size_t>(v % n);
  };

  std::string out;
  out.reserve(length);
  for (const auto& g : groups) out.push_back(g[random_below(g.size())]);
  while (out.size() < length) out.push_back(all[random_below(all.size())]);

  for (size_t i = out.size() - 1; i > 0; i--) {
    std::swap(out[i], out[random_below(i + 1)]);
  }
  return out;
}

} // namespace mbt::crypto
