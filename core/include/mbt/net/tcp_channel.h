#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "mbt/protocol/message.h"
#include "mbt/transfer/chunk_channel.h"

namespace mbt::net {

// Blocking request/response channel to a TcpServer. Each call drives a
// private io_context for at most `timeout`; a stop request aborts it.
class TcpChunkChannel : public transfer::ChunkChannel {
public:
  TcpChunkChannel(std::string host, uint16_t port);
  ~TcpChunkChannel() override;

  Result<transfer::TransferResponse> open(const transfer::TransferRequest& req,
                                          std::chrono::milliseconds timeout,
                                          std::stop_token stop) override;
  Result<transfer::ChunkResult> send_chunk(const transfer::ChunkData& chunk,
                                           std::chrono::milliseconds timeout,
                                           std::stop_token stop) override;
  Result<transfer::ReceiveResult> finalize(const transfer::FinalizeRequest& req,
                                           std::chrono::milliseconds timeout,
                                           std::stop_token stop) override;
  void close() override;

private:
  using Deadline = std::chrono::steady_clock::time_point;

  Status connect(Deadline deadline, std::stop_token stop);
  Result<transfer::TransferResponse> handshake(Deadline deadline, std::stop_token stop);
  // Reconnects and re-sends the cached request when the connection was lost.
  Status ensure_ready(Deadline deadline, std::stop_token stop);
  Result<std::vector<uint8_t>> roundtrip(protocol::MsgType type, const std::vector<uint8_t>& payload,
                                         protocol::MsgType expect, Deadline deadline, std::stop_token stop);
  void drop();
  std::function<void()> close_socket();

  std::string host_;
  uint16_t port_;
  boost::asio::io_context io_;
  boost::asio::ip::tcp::socket socket_;
  std::optional<transfer::TransferRequest> request_;
  bool connected_ = false;
  bool handshaken_ = false;
};

class TcpChannelFactory : public transfer::ChannelFactory {
public:
  TcpChannelFactory(std::string host, uint16_t port) : host_(std::move(host)), port_(port) {}
  std::unique_ptr<transfer::ChunkChannel> create() override;

private:
  std::string host_;
  uint16_t port_;
};

} // namespace mbt::net
