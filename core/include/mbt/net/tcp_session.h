#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "mbt/protocol/message.h"
#include "mbt/transfer/chunk_receiver.h"

namespace mbt::net {

// One sender connection. The first frame must be TRANSFER_REQ; the session
// is then bound to that transfer id until the connection closes.
class TcpSession : public std::enable_shared_from_this<TcpSession> {
public:
  TcpSession(boost::asio::ip::tcp::socket socket, transfer::ChunkReceiver& receiver,
             uint64_t max_frame_bytes, boost::asio::any_io_executor disk);
  void start();

  bool has_transfer() const { return !transfer_id_.empty(); }
  const std::string& transfer_id() const { return transfer_id_; }

private:
  void log(const std::string& s);

  void do_read_header();
  void do_read_body();

  void send(protocol::MsgType type, const std::vector<uint8_t>& payload);
  void do_write();

  enum class Next { Read, Wait, Drop };

  // Wait: the reply comes from the disk executor, which resumes reading.
  Next handle_message(protocol::MsgType type, const std::vector<uint8_t>& payload);
  void handle_transfer_request(const std::vector<uint8_t>& payload);
  Next handle_chunk(const std::vector<uint8_t>& payload);
  Next handle_finalize(const std::vector<uint8_t>& payload);

  // Runs work() on disk_, then send(type, reply) and the next read on the socket's strand.
  template <typename Work>
  void offload(protocol::MsgType reply_type, Work work);

  boost::asio::ip::tcp::socket socket_;
  transfer::ChunkReceiver& receiver_;
  uint64_t max_frame_bytes_;
  boost::asio::any_io_executor disk_;
  std::string peer_;

  std::string transfer_id_;

  protocol::MessageHeaderWire header_{};
  std::vector<uint8_t> body_;

  struct OutFrame {
    std::vector<uint8_t> bytes;
  };
  std::deque<OutFrame> outq_;
};

} // namespace mbt::net
