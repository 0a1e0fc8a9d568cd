#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <arpa/inet.h>

namespace mbt::protocol {

inline uint64_t htobe64_portable(uint64_t x) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
  return __builtin_bswap64(x);
#else
  return x;
#endif
}

inline uint64_t be64toh_portable(uint64_t x) {
  return htobe64_portable(x);  // Same operation
}

// Big-endian payload builder. Strings: u16 length + bytes. Blobs: u32 length + bytes.
class PayloadWriter {
public:
  void u8(uint8_t v) { out_.push_back(v); }
  void boolean(bool v) { out_.push_back(v ? 1 : 0); }

  void u16(uint16_t v) {
    uint16_t be = htons(v);
    append(&be, 2);
  }
  void u32(uint32_t v) {
    uint32_t be = htonl(v);
    append(&be, 4);
  }
  void u64(uint64_t v) {
    uint64_t be = htobe64_portable(v);
    append(&be, 8);
  }
  void i64(int64_t v) { u64(static_cast<uint64_t>(v)); }

  void str(const std::string& s) {
    if (s.size() > 0xFFFF) throw std::runtime_error("string field too long");
    u16(static_cast<uint16_t>(s.size()));
    append(s.data(), s.size());
  }
  void blob(const std::vector<uint8_t>& b) {
    u32(static_cast<uint32_t>(b.size()));
    append(b.data(), b.size());
  }

  std::vector<uint8_t> take() { return std::move(out_); }

private:
  void append(const void* p, size_t n) {
    auto* b = static_cast<const uint8_t*>(p);
    out_.insert(out_.end(), b, b + n);
  }

  std::vector<uint8_t> out_;
};

// Bounds-checked reader. Every read throws std::runtime_error naming the
// message and field on truncated input.
class PayloadReader {
public:
  PayloadReader(const std::vector<uint8_t>& payload, const char* msg) : p_(payload), msg_(msg) {}

  uint8_t u8(const char* field) {
    need(1, field);
    return p_[pos_++];
  }
  bool boolean(const char* field) { return u8(field) != 0; }

  uint16_t u16(const char* field) {
    uint16_t be;
    copy(&be, 2, field);
    return ntohs(be);
  }
  uint32_t u32(const char* field) {
    uint32_t be;
    copy(&be, 4, field);
    return ntohl(be);
  }
  uint64_t u64(const char* field) {
    uint64_t be;
    copy(&be, 8, field);
    return be64toh_portable(be);
  }
  int64_t i64(const char* field) { return static_cast<int64_t>(u64(field)); }

  std::string str(const char* field) {
    uint16_t n = u16(field);
    need(n, field);
    std::string s(reinterpret_cast<const char*>(p_.data() + pos_), n);
    pos_ += n;
    return s;
  }
  std::vector<uint8_t> blob(const char* field) {
    uint32_t n = u32(field);
    need(n, field);
    std::vector<uint8_t> b(p_.begin() + static_cast<std::ptrdiff_t>(pos_),
                           p_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
    pos_ += n;
    return b;
  }

  bool at_end() const { return pos_ == p_.size(); }

private:
  void need(size_t n, const char* field) const {
    if (p_.size() - pos_ < n) {
      throw std::runtime_error(std::string(msg_) + ": missing " + field);
    }
  }
  void copy(void* dst, size_t n, const char* field) {
    need(n, field);
    std::memcpy(dst, p_.data() + pos_, n);
    pos_ += n;
  }

  const std::vector<uint8_t>& p_;
  const char* msg_;
  size_t pos_ = 0;
};

} // namespace mbt::protocol
