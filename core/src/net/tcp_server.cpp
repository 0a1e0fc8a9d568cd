#include "mbt/net/tcp_server.h"
#include "mbt/net/tcp_session.h"
#include "mbt/log/logger.h"

namespace mbt::net {

TcpServer::TcpServer(boost::asio::io_context& io, uint16_t port, transfer::ChunkReceiver& receiver,
                     uint64_t max_frame_bytes, boost::asio::any_io_executor disk)
  : io_(io),
    acceptor_(boost::asio::make_strand(io), boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v4(), port)),
    receiver_(receiver),
    max_frame_bytes_(max_frame_bytes),
    disk_(std::move(disk)) {}

void TcpServer::start() {
  Logger::instance().info("[core] listening on 0.0.0.0:" + std::to_string(local_port()));
  do_accept();
}

void TcpServer::stop() {
  boost::system::error_code ec;
  acceptor_.close(ec);
}

uint16_t TcpServer::local_port() const {
  return acceptor_.local_endpoint().port();
}

void TcpServer::do_accept() {
  acceptor_.async_accept(boost::asio::make_strand(io_),
    [this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
      if (ec == boost::asio::error::operation_aborted) return;
      if (!ec) {
        auto s = std::make_shared<TcpSession>(std::move(socket), receiver_, max_frame_bytes_, disk_);
        s->start();
      } else {
        Logger::instance().warn("[core] accept error: " + ec.message());
      }
      if (acceptor_.is_open()) do_accept();
    });
}

} // namespace mbt::net
