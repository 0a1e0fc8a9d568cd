#include "mbt/net/tcp_channel.h"
#include "mbt/log/logger.h"
#include "mbt/protocol/transfer_messages.h"

namespace mbt::net {

using std::chrono::steady_clock;

namespace {

// Runs one async operation until it completes, the deadline passes or stop is
// requested. On timeout or stop cancel() aborts it and the handler is drained.
template <typename Cancel, typename Start>
Status await(boost::asio::io_context& io, const std::string& what, steady_clock::time_point deadline,
             std::stop_token stop, Cancel&& cancel, Start&& start) {
  bool done = false;
  boost::system::error_code result;
  start([&](boost::system::error_code ec, auto&&...) {
    result = ec;
    done = true;
  });

  io.restart();
  {
    std::stop_callback cb(stop, [&io] { io.stop(); });
    auto now = steady_clock::now();
    if (deadline > now) io.run_for(deadline - now);
  }

  if (!done) {
    cancel();
    io.restart();
    io.run();
    if (stop.stop_requested()) return Error::cancelled(what + " cancelled");
    return Error::transient(what + " timed out");
  }
  if (result) return Error::transient(what + ": " + result.message());
  return {};
}

} // namespace

TcpChunkChannel::TcpChunkChannel(std::string host, uint16_t port)
  : host_(std::move(host)), port_(port), socket_(io_) {}

TcpChunkChannel::~TcpChunkChannel() {
  close();
}

std::function<void()> TcpChunkChannel::close_socket() {
  return [this] {
    boost::system::error_code ec;
    socket_.close(ec);
  };
}

void TcpChunkChannel::drop() {
  boost::system::error_code ec;
  socket_.close(ec);
  connected_ = false;
  handshaken_ = false;
}

void TcpChunkChannel::close() {
  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }
  drop();
}

Status TcpChunkChannel::connect(Deadline deadline, std::stop_token stop) {
  boost::asio::ip::tcp::resolver resolver(io_);
  boost::asio::ip::tcp::resolver::results_type endpoints;
  auto st = await(io_, "resolve " + host_, deadline, stop, [&resolver] { resolver.cancel(); },
                  [&](auto handler) {
                    resolver.async_resolve(host_, std::to_string(port_),
                      [&endpoints, handler](boost::system::error_code ec,
                                            boost::asio::ip::tcp::resolver::results_type results) mutable {
                        endpoints = std::move(results);
                        handler(ec);
                      });
                  });
  if (!st) return st;

  st = await(io_, "connect to " + host_ + ":" + std::to_string(port_), deadline, stop, close_socket(),
             [&](auto handler) { boost::asio::async_connect(socket_, endpoints, handler); });
  if (!st) {
    drop();
    return st;
  }
  boost::system::error_code ec;
  socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
  connected_ = true;
  Logger::instance().debug("[chan] connected to " + host_ + ":" + std::to_string(port_));
  return {};
}

Result<std::vector<uint8_t>> TcpChunkChannel::roundtrip(protocol::MsgType type, const std::vector<uint8_t>& payload,
                                                        protocol::MsgType expect, Deadline deadline,
                                                        std::stop_token stop) {
  const std::string what = protocol::to_string(type);
  auto frame = protocol::make_frame(type, payload);
  auto st = await(io_, "send " + what, deadline, stop, close_socket(),
                  [&](auto handler) { boost::asio::async_write(socket_, boost::asio::buffer(frame), handler); });
  if (!st) {
    drop();
    return st.error();
  }

  protocol::MessageHeaderWire h{};
  st = await(io_, "read reply to " + what, deadline, stop, close_socket(),
             [&](auto handler) { boost::asio::async_read(socket_, boost::asio::buffer(&h, sizeof(h)), handler); });
  if (!st) {
    drop();
    return st.error();
  }
  try {
    protocol::validate_header(h);
  } catch (const std::exception& e) {
    drop();
    return Error::fatal("reply to " + what + ": " + e.what());
  }
  if (static_cast<protocol::MsgType>(h.type) != expect) {
    drop();
    return Error::fatal("reply to " + what + ": unexpected " +
                        protocol::to_string(static_cast<protocol::MsgType>(h.type)));
  }

  std::vector<uint8_t> body(protocol::payload_len(h));
  if (!body.empty()) {
    st = await(io_, "read reply to " + what, deadline, stop, close_socket(),
               [&](auto handler) { boost::asio::async_read(socket_, boost::asio::buffer(body), handler); });
    if (!st) {
      drop();
      return st.error();
    }
  }
  return body;
}

Result<transfer::TransferResponse> TcpChunkChannel::handshake(Deadline deadline, std::stop_token stop) {
  if (!connected_) {
    if (auto st = connect(deadline, stop); !st) return st.error();
  }
  auto body = roundtrip(protocol::MsgType::TRANSFER_REQ, protocol::serialize(*request_),
                        protocol::MsgType::TRANSFER_RESP, deadline, stop);
  if (!body) return body.error();
  try {
    auto resp = protocol::deserialize_transfer_response(*body);
    handshaken_ = resp.success;
    return resp;
  } catch (const std::exception& e) {
    drop();
    return Error::fatal(e.what());
  }
}

Status TcpChunkChannel::ensure_ready(Deadline deadline, std::stop_token stop) {
  if (!request_) return Error::fatal("channel used before open()");
  if (connected_ && handshaken_) return {};
  auto resp = handshake(deadline, stop);
  if (!resp) return resp.error();
  if (!resp->success) {
    Error e;
    e.kind = resp->error_kind.value_or(ErrorKind::Fatal);
    e.message = "transfer rejected on reconnect: " + resp->error_message.value_or("no reason given");
    return e;
  }
  return {};
}

Result<transfer::TransferResponse> TcpChunkChannel::open(const transfer::TransferRequest& req,
                                                         std::chrono::milliseconds timeout,
                                                         std::stop_token stop) {
  request_ = req;
  handshaken_ = false;
  return handshake(steady_clock::now() + timeout, stop);
}

Result<transfer::ChunkResult> TcpChunkChannel::send_chunk(const transfer::ChunkData& chunk,
                                                          std::chrono::milliseconds timeout,
                                                          std::stop_token stop) {
  const auto deadline = steady_clock::now() + timeout;
  if (auto st = ensure_ready(deadline, stop); !st) return st.error();

  auto body = roundtrip(protocol::MsgType::CHUNK_DATA, protocol::serialize(chunk),
                        protocol::MsgType::CHUNK_RESULT, deadline, stop);
  if (!body) return body.error();
  try {
    return protocol::deserialize_chunk_result(*body);
  } catch (const std::exception& e) {
    drop();
    return Error::fatal(e.what());
  }
}

Result<transfer::ReceiveResult> TcpChunkChannel::finalize(const transfer::FinalizeRequest& req,
                                                          std::chrono::milliseconds timeout,
                                                          std::stop_token stop) {
  const auto deadline = steady_clock::now() + timeout;
  if (auto st = ensure_ready(deadline, stop); !st) return st.error();

  auto body = roundtrip(protocol::MsgType::FINALIZE_REQ, protocol::serialize(req),
                        protocol::MsgType::RECEIVE_RESULT, deadline, stop);
  if (!body) return body.error();
  try {
    return protocol::deserialize_receive_result(*body);
  } catch (const std::exception& e) {
    drop();
    return Error::fatal(e.what());
  }
}

std::unique_ptr<transfer::ChunkChannel> TcpChannelFactory::create() {
  return std::make_unique<TcpChunkChannel>(host_, port_);
}

} // namespace mbt::net
