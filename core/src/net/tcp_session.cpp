#include "mbt/net/tcp_session.h"
#include "mbt/log/logger.h"
#include "mbt/protocol/transfer_messages.h"
#include <cstring>
#include <optional>

namespace mbt::net {

namespace {
// headroom over the chunk limit for the CHUNK_DATA fields around the blob
constexpr uint64_t kFrameOverhead = 4096;
}

TcpSession::TcpSession(boost::asio::ip::tcp::socket socket, transfer::ChunkReceiver& receiver,
                       uint64_t max_frame_bytes, boost::asio::any_io_executor disk)
  : socket_(std::move(socket)), receiver_(receiver), max_frame_bytes_(max_frame_bytes + kFrameOverhead),
    disk_(std::move(disk)) {}

void TcpSession::log(const std::string& s) {
  Logger::instance().debug("[sess " + peer_ + "] " + s);
}

void TcpSession::start() {
  boost::system::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  peer_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
  Logger::instance().info("[sess " + peer_ + "] CONNECTED");
  do_read_header();
}

void TcpSession::do_read_header() {
  auto self = shared_from_this();
  boost::asio::async_read(socket_,
    boost::asio::buffer(&header_, sizeof(header_)),
    [this, self](boost::system::error_code ec, std::size_t n) {
      if (ec) {
        log(std::string("DISCONNECTED (read header): ") + ec.message());
        return;
      }
      if (n != sizeof(header_)) {
        log("DISCONNECTED (header size mismatch)");
        return;
      }

      try {
        protocol::validate_header(header_);
      } catch (const std::exception& e) {
        Logger::instance().warn("[sess " + peer_ + "] DISCONNECTED (bad header): " + e.what());
        return;
      }

      auto len = protocol::payload_len(header_);
      if (len > max_frame_bytes_) {
        Logger::instance().warn("[sess " + peer_ + "] DISCONNECTED (payload too large: " +
                                std::to_string(len) + ")");
        return;
      }

      body_.assign(len, 0);
      do_read_body();
    }
  );
}

void TcpSession::do_read_body() {
  auto self = shared_from_this();
  if (body_.empty()) {
    if (handle_message(static_cast<protocol::MsgType>(header_.type), body_) == Next::Read) do_read_header();
    return;
  }

  boost::asio::async_read(socket_,
    boost::asio::buffer(body_.data(), body_.size()),
    [this, self](boost::system::error_code ec, std::size_t n) {
      if (ec) {
        log(std::string("DISCONNECTED (read body): ") + ec.message());
        return;
      }
      if (n != body_.size()) {
        log("DISCONNECTED (body size mismatch)");
        return;
      }

      if (handle_message(static_cast<protocol::MsgType>(header_.type), body_) == Next::Read) do_read_header();
    }
  );
}

TcpSession::Next TcpSession::handle_message(protocol::MsgType type, const std::vector<uint8_t>& payload) {
  try {
    switch (type) {
      case protocol::MsgType::PING:
        log("RECV PING -> SEND PONG");
        send(protocol::MsgType::PONG, {});
        return Next::Read;
      case protocol::MsgType::TRANSFER_REQ:
        handle_transfer_request(payload);
        return Next::Read;
      case protocol::MsgType::CHUNK_DATA:
        if (!has_transfer()) {
          Logger::instance().warn("[sess " + peer_ + "] CHUNK_DATA before TRANSFER_REQ, dropping connection");
          return Next::Drop;
        }
        return handle_chunk(payload);
      case protocol::MsgType::FINALIZE_REQ:
        return handle_finalize(payload);
      default:
        break;
    }
  } catch (const std::exception& e) {
    // malformed payload; the stream can no longer be trusted
    Logger::instance().warn("[sess " + peer_ + "] " + protocol::to_string(type) + " error: " + e.what());
    return Next::Drop;
  }
  Logger::instance().warn("[sess " + peer_ + "] RECV UNKNOWN type=" + std::to_string(static_cast<int>(type)));
  return Next::Drop;
}

template <typename Work>
void TcpSession::offload(protocol::MsgType reply_type, Work work) {
  auto self = shared_from_this();
  boost::asio::post(disk_, [this, self, reply_type, work = std::move(work)]() mutable {
    std::optional<std::vector<uint8_t>> reply;
    try {
      reply = work();
    } catch (const std::exception& e) {
      Logger::instance().error("[sess " + peer_ + "] " + protocol::to_string(reply_type) +
                               " not produced, dropping connection: " + e.what());
    }
    boost::asio::post(socket_.get_executor(), [this, self, reply_type, reply = std::move(reply)] {
      if (!reply) return;
      send(reply_type, *reply);
      do_read_header();
    });
  });
}

void TcpSession::handle_transfer_request(const std::vector<uint8_t>& payload) {
  auto req = protocol::deserialize_transfer_request(payload);
  log("RECV TRANSFER_REQ transfer_id=" + req.transfer_id + " resume=" + (req.resume_transfer ? "1" : "0"));

  auto resp = receiver_.begin(req);
  if (resp.success) {
    auto prepared = receiver_.receive(transfer::ReceiveRequest{req.transfer_id, req.metadata, req.target_path,
                                                               req.authentication_token, req.client_id});
    if (!prepared.success) {
      resp.success = false;
      resp.error_kind = prepared.error_kind;
      resp.error_message = prepared.error_message;
      resp.received_chunks.clear();
    }
  }
  if (resp.success) transfer_id_ = req.transfer_id;
  send(protocol::MsgType::TRANSFER_RESP, protocol::serialize(resp));
  log("SENT TRANSFER_RESP ok=" + std::string(resp.success ? "true" : "false") +
      " received=" + std::to_string(resp.received_chunks.size()));
}

TcpSession::Next TcpSession::handle_chunk(const std::vector<uint8_t>& payload) {
  auto chunk = protocol::deserialize_chunk_data(payload);
  if (chunk.transfer_id != transfer_id_) {
    transfer::ChunkResult res;
    res.chunk_index = chunk.chunk_index;
    res.error_kind = ErrorKind::Fatal;
    res.error_message = "chunk for transfer " + chunk.transfer_id + " on a connection bound to " + transfer_id_;
    send(protocol::MsgType::CHUNK_RESULT, protocol::serialize(res));
    return Next::Read;
  }

  offload(protocol::MsgType::CHUNK_RESULT, [this, chunk = std::move(chunk)] {
    auto res = receiver_.receive_chunk(chunk);
    log("SENT CHUNK_RESULT index=" + std::to_string(res.chunk_index) +
        " ok=" + (res.success ? "true" : "false") + (res.is_complete ? " complete" : ""));
    return protocol::serialize(res);
  });
  return Next::Wait;
}

TcpSession::Next TcpSession::handle_finalize(const std::vector<uint8_t>& payload) {
  auto req = protocol::deserialize_finalize_request(payload);
  log("RECV FINALIZE_REQ transfer_id=" + req.transfer_id);
  offload(protocol::MsgType::RECEIVE_RESULT, [this, req = std::move(req)] {
    return protocol::serialize(receiver_.finalize(req));
  });
  return Next::Wait;
}

void TcpSession::send(protocol::MsgType type, const std::vector<uint8_t>& payload) {
  OutFrame f;
  f.bytes = protocol::make_frame(type, payload);

  bool writing = !outq_.empty();
  outq_.push_back(std::move(f));
  if (!writing) do_write();
}

void TcpSession::do_write() {
  auto self = shared_from_this();
  boost::asio::async_write(socket_,
    boost::asio::buffer(outq_.front().bytes),
    [this, self](boost::system::error_code ec, std::size_t) {
      if (ec) {
        log(std::string("DISCONNECTED (write): ") + ec.message());
        return;
      }
      outq_.pop_front();
      if (!outq_.empty()) do_write();
    }
  );
}

} // namespace mbt::net
