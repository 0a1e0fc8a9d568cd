#include "mbt/protocol/message.h"

namespace mbt::protocol {

const char* to_string(MsgType t) {
  switch (t) {
    case MsgType::PING:           return "PING";
    case MsgType::PONG:           return "PONG";
    case MsgType::TRANSFER_REQ:   return "TRANSFER_REQ";
    case MsgType::TRANSFER_RESP:  return "TRANSFER_RESP";
    case MsgType::CHUNK_DATA:     return "CHUNK_DATA";
    case MsgType::CHUNK_RESULT:   return "CHUNK_RESULT";
    case MsgType::FINALIZE_REQ:   return "FINALIZE_REQ";
    case MsgType::RECEIVE_RESULT: return "RECEIVE_RESULT";
  }
  return "UNKNOWN";
}

} // namespace mbt::protocol
