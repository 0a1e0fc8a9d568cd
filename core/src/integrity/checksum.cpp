#include "mbt/integrity/checksum.h"
#include "mbt/common/ids.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace mbt::integrity {

static const EVP_MD* md_for(HashAlgorithm algo) {
  switch (algo) {
    case HashAlgorithm::MD5:    return EVP_md5();
    case HashAlgorithm::SHA1:   return EVP_sha1();
    case HashAlgorithm::SHA256: return EVP_sha256();
    case HashAlgorithm::SHA512: return EVP_sha512();
  }
  return EVP_sha256();
}

const char* to_string(HashAlgorithm algo) {
  switch (algo) {
    case HashAlgorithm::MD5:    return "MD5";
    case HashAlgorithm::SHA1:   return "SHA1";
    case HashAlgorithm::SHA256: return "SHA256";
    case HashAlgorithm::SHA512: return "SHA512";
  }
  return "SHA256";
}

std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name) {
  std::string n;
  for (char c : name) {
    if (c != '-') n.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  if (n == "MD5") return HashAlgorithm::MD5;
  if (n == "SHA1") return HashAlgorithm::SHA1;
  if (n == "SHA256") return HashAlgorithm::SHA256;
  if (n == "SHA512") return HashAlgorithm::SHA512;
  return std::nullopt;
}

Hasher::Hasher(HashAlgorithm algo) : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx_, md_for(algo), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

Hasher::~Hasher() {
  if (ctx_) EVP_MD_CTX_free(ctx_);
}

void Hasher::update(const void* data, size_t len) {
  if (len == 0) return;
  if (EVP_DigestUpdate(ctx_, data, len) != 1) throw std::runtime_error("EVP_DigestUpdate failed");
}

std::string Hasher::final_hex() {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int n = 0;
  if (EVP_DigestFinal_ex(ctx_, md, &n) != 1) throw std::runtime_error("EVP_DigestFinal_ex failed");
  return to_hex(md, n);
}

std::string ChecksumValidator::compute(const void* data, size_t len, HashAlgorithm algo) {
  Hasher h(algo);
  h.update(data, len);
  return h.final_hex();
}

Result<std::string> ChecksumValidator::compute(std::istream& in, HashAlgorithm algo, std::stop_token stop) {
  Hasher h(algo);
  std::vector<char> buf(kBufferSize);
  while (in) {
    if (stop.stop_requested()) return Error::cancelled("checksum cancelled");
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    auto n = in.gcount();
    if (n > 0) h.update(buf.data(), static_cast<size_t>(n));
  }
  if (in.bad()) return Error::fatal("read error while computing checksum");
  return h.final_hex();
}

Result<std::string> ChecksumValidator::compute_file(const std::string& path, HashAlgorithm algo, std::stop_token stop) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return Error::fatal("cannot open " + path);
  return compute(f, algo, stop);
}

Result<FileDigests> ChecksumValidator::digest_file(const std::string& path, std::stop_token stop) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return Error::fatal("cannot open " + path);

  Hasher md5(HashAlgorithm::MD5);
  Hasher sha(HashAlgorithm::SHA256);
  FileDigests d;
  std::vector<char> buf(kBufferSize);
  while (f) {
    if (stop.stop_requested()) return Error::cancelled("checksum cancelled");
    f.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    auto n = static_cast<size_t>(f.gcount());
    if (n == 0) break;
    md5.update(buf.data(), n);
    sha.update(buf.data(), n);
    d.size += n;
  }
  if (f.bad()) return Error::fatal("read error: " + path);
  d.md5 = md5.final_hex();
  d.sha256 = sha.final_hex();
  return d;
}

std::string ChecksumValidator::chunk_checksum(const std::vector<uint8_t>& data) {
  return compute(data.data(), data.size(), HashAlgorithm::MD5);
}

bool ChecksumValidator::verify_chunk(const std::vector<uint8_t>& data, const std::string& expected) {
  return matches(chunk_checksum(data), expected);
}

Status ChecksumValidator::verify_file(const std::string& path,
                                      const std::string& expected_md5,
                                      const std::string& expected_sha256,
                                      std::stop_token stop) {
  if (expected_md5.empty() && expected_sha256.empty()) return {};
  auto d = digest_file(path, stop);
  if (!d) return d.error();
  if (!expected_md5.empty() && !matches(d->md5, expected_md5)) {
    return Error::integrity("MD5 mismatch for " + path + ": expected " + expected_md5 + ", got " + d->md5);
  }
  if (!expected_sha256.empty() && !matches(d->sha256, expected_sha256)) {
    return Error::integrity("SHA-256 mismatch for " + path + ": expected " + expected_sha256 + ", got " + d->sha256);
  }
  return {};
}

bool ChecksumValidator::matches(const std::string& a, const std::string& b) {
  return !a.empty() && hex_equal(a, b);
}

} // namespace mbt::integrity
