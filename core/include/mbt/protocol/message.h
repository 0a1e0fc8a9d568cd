#pragma once
#include <cstdint>
#include <cstring>
#include <vector>
#include <string>
#include <stdexcept>
#include <arpa/inet.h>

namespace mbt::protocol {

static constexpr uint32_t MAGIC = 0x4D425431; // "MBT1"
static constexpr uint8_t  VERSION = 1;
static constexpr size_t   HEADER_SIZE = 12;

enum class MsgType : uint8_t {
  PING  = 1,
  PONG  = 2,
  // Handshake, first frame on every connection
  TRANSFER_REQ  = 10,
  TRANSFER_RESP = 11,
  // Chunks
  CHUNK_DATA   = 20,
  CHUNK_RESULT = 21,
  // Completion
  FINALIZE_REQ   = 30,
  RECEIVE_RESULT = 31
};

const char* to_string(MsgType t);

#pragma pack(push, 1)
struct MessageHeaderWire {
  uint32_t magic_be;   // network order
  uint8_t  version;
  uint8_t  type;
  uint32_t len_be;     // network order
  uint16_t reserved_be; // network order (0 for now)
};
#pragma pack(pop)

static_assert(sizeof(MessageHeaderWire) == HEADER_SIZE, "header must be 12 bytes");

struct Message {
  MsgType type;
  std::vector<uint8_t> payload;
};

inline MessageHeaderWire make_header(MsgType type, uint32_t len) {
  MessageHeaderWire h{};
  h.magic_be = htonl(MAGIC);
  h.version  = VERSION;
  h.type     = static_cast<uint8_t>(type);
  h.len_be   = htonl(len);
  h.reserved_be = htons(0);
  return h;
}

inline void validate_header(const MessageHeaderWire& h) {
  if (ntohl(h.magic_be) != MAGIC) throw std::runtime_error("bad magic");
  if (h.version != VERSION) throw std::runtime_error("bad version");
}

inline uint32_t payload_len(const MessageHeaderWire& h) {
  return ntohl(h.len_be);
}

// frame = header(12) + payload
inline std::vector<uint8_t> make_frame(MsgType type, const std::vector<uint8_t>& payload) {
  MessageHeaderWire h = make_header(type, static_cast<uint32_t>(payload.size()));
  std::vector<uint8_t> out(sizeof(h) + payload.size());
  std::memcpy(out.data(), &h, sizeof(h));
  if (!payload.empty()) std::memcpy(out.data() + sizeof(h), payload.data(), payload.size());
  return out;
}

} // namespace mbt::protocol
