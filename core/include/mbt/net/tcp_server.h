#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <cstdint>
#include "mbt/transfer/chunk_receiver.h"

namespace mbt::net {

class TcpServer {
public:
  // max_frame_bytes bounds a single message payload. Chunk writes and
  // reassembly run on `disk`, never on the io_context threads.
  TcpServer(boost::asio::io_context& io, uint16_t port, transfer::ChunkReceiver& receiver,
            uint64_t max_frame_bytes, boost::asio::any_io_executor disk);
  void start();
  void stop();

  uint16_t local_port() const;

private:
  void do_accept();

  boost::asio::io_context& io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  transfer::ChunkReceiver& receiver_;
  uint64_t max_frame_bytes_;
  boost::asio::any_io_executor disk_;
};

} // namespace mbt::net
