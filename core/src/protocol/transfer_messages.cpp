#include "mbt/protocol/transfer_messages.h"
#include "mbt/protocol/wire.h"
#include <chrono>

namespace mbt::protocol {

using namespace mbt::transfer;
using std::chrono::milliseconds;
using std::chrono::seconds;
using std::chrono::duration_cast;

static constexpr uint8_t STATUS_OK = 0;
static constexpr uint8_t STATUS_FAIL = 1;

static void put_kind(PayloadWriter& w, const std::optional<ErrorKind>& k) {
  w.u8(k ? static_cast<uint8_t>(*k) : 0);
}

static std::optional<ErrorKind> get_kind(PayloadReader& r) {
  uint8_t v = r.u8("error_kind");
  if (v == 0) return std::nullopt;
  if (v > static_cast<uint8_t>(ErrorKind::Fatal)) return ErrorKind::Fatal;
  return static_cast<ErrorKind>(v);
}

static std::optional<std::string> opt_text(std::string s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::vector<uint8_t> serialize(const TransferRequest& m) {
  PayloadWriter w;
  w.str(m.transfer_id);

  w.str(m.metadata.file_name);
  w.u64(m.metadata.file_size);
  w.str(m.metadata.checksum_md5);
  w.str(m.metadata.checksum_sha256);
  w.i64(duration_cast<milliseconds>(m.metadata.created_at.time_since_epoch()).count());

  w.u32(m.strategy.chunk_size);
  w.u8(static_cast<uint8_t>(m.strategy.max_concurrent_chunks));
  w.boolean(m.strategy.enable_compression);

  w.boolean(m.resume_transfer);
  w.boolean(m.resume_token.has_value());
  if (m.resume_token) w.str(*m.resume_token);

  w.str(m.authentication_token);
  w.str(m.client_id);
  w.str(m.target_path);

  w.boolean(m.encryption.has_value());
  if (m.encryption) {
    const auto& e = *m.encryption;
    w.str(e.algorithm);
    w.str(e.key_derivation);
    w.u32(static_cast<uint32_t>(e.iterations));
    w.str(e.salt);
    w.str(e.iv);
    w.i64(duration_cast<seconds>(e.encrypted_at.time_since_epoch()).count());
    w.u64(e.original_size);
    w.str(e.original_checksum);
    w.u32(static_cast<uint32_t>(e.version));
  }
  return w.take();
}

TransferRequest deserialize_transfer_request(const std::vector<uint8_t>& payload) {
  PayloadReader r(payload, "TRANSFER_REQ");
  TransferRequest m;
  m.transfer_id = r.str("transfer_id");

  m.metadata.file_name = r.str("file_name");
  m.metadata.file_size = r.u64("file_size");
  m.metadata.checksum_md5 = r.str("checksum_md5");
  m.metadata.checksum_sha256 = r.str("checksum_sha256");
  m.metadata.created_at = Clock::time_point(milliseconds(r.i64("created_at")));

  m.strategy.chunk_size = r.u32("chunk_size");
  m.strategy.max_concurrent_chunks = r.u8("max_concurrent_chunks");
  m.strategy.enable_compression = r.boolean("enable_compression");

  m.resume_transfer = r.boolean("resume_transfer");
  if (r.boolean("has_resume_token")) m.resume_token = r.str("resume_token");

  m.authentication_token = r.str("authentication_token");
  m.client_id = r.str("client_id");
  m.target_path = r.str("target_path");

  if (r.boolean("has_encryption")) {
    crypto::EncryptionMetadata e;
    e.algorithm = r.str("algorithm");
    e.key_derivation = r.str("key_derivation");
    e.iterations = static_cast<int>(r.u32("iterations"));
    e.salt = r.str("salt");
    e.iv = r.str("iv");
    e.encrypted_at = std::chrono::system_clock::time_point(seconds(r.i64("encrypted_at")));
    e.original_size = r.u64("original_size");
    e.original_checksum = r.str("original_checksum");
    e.version = static_cast<int>(r.u32("version"));
    m.encryption = std::move(e);
  }
  return m;
}

std::vector<uint8_t> serialize(const TransferResponse& m) {
  PayloadWriter w;
  w.u8(m.success ? STATUS_OK : STATUS_FAIL);
  put_kind(w, m.error_kind);
  w.str(m.error_message.value_or(""));
  w.u32(static_cast<uint32_t>(m.received_chunks.size()));
  for (uint32_t i : m.received_chunks) w.u32(i);
  return w.take();
}

TransferResponse deserialize_transfer_response(const std::vector<uint8_t>& payload) {
  PayloadReader r(payload, "TRANSFER_RESP");
  TransferResponse m;
  m.success = r.u8("status") == STATUS_OK;
  m.error_kind = get_kind(r);
  m.error_message = opt_text(r.str("error_message"));
  uint32_t n = r.u32("received_count");
  if (n > payload.size() / 4) throw std::runtime_error("TRANSFER_RESP: invalid received_count");
  m.received_chunks.reserve(n);
  for (uint32_t i = 0; i < n; i++) m.received_chunks.push_back(r.u32("received_chunk"));
  return m;
}

std::vector<uint8_t> serialize(const ChunkData& m) {
  PayloadWriter w;
  w.str(m.transfer_id);
  w.u32(m.chunk_index);
  w.str(m.chunk_checksum);
  w.boolean(m.is_last_chunk);
  w.blob(m.data);
  return w.take();
}

ChunkData deserialize_chunk_data(const std::vector<uint8_t>& payload) {
  PayloadReader r(payload, "CHUNK_DATA");
  ChunkData m;
  m.transfer_id = r.str("transfer_id");
  m.chunk_index = r.u32("chunk_index");
  m.chunk_checksum = r.str("chunk_checksum");
  m.is_last_chunk = r.boolean("is_last_chunk");
  m.data = r.blob("data");
  return m;
}

std::vector<uint8_t> serialize(const ChunkResult& m) {
  PayloadWriter w;
  w.u8(m.success ? STATUS_OK : STATUS_FAIL);
  put_kind(w, m.error_kind);
  w.u32(m.chunk_index);
  w.boolean(m.is_complete);
  w.str(m.error_message.value_or(""));
  return w.take();
}

ChunkResult deserialize_chunk_result(const std::vector<uint8_t>& payload) {
  PayloadReader r(payload, "CHUNK_RESULT");
  ChunkResult m;
  m.success = r.u8("status") == STATUS_OK;
  m.error_kind = get_kind(r);
  m.chunk_index = r.u32("chunk_index");
  m.is_complete = r.boolean("is_complete");
  m.error_message = opt_text(r.str("error_message"));
  return m;
}

std::vector<uint8_t> serialize(const FinalizeRequest& m) {
  PayloadWriter w;
  w.str(m.transfer_id);
  w.str(m.authentication_token);
  w.str(m.client_id);
  return w.take();
}

FinalizeRequest deserialize_finalize_request(const std::vector<uint8_t>& payload) {
  PayloadReader r(payload, "FINALIZE_REQ");
  FinalizeRequest m;
  m.transfer_id = r.str("transfer_id");
  m.authentication_token = r.str("authentication_token");
  m.client_id = r.str("client_id");
  return m;
}

std::vector<uint8_t> serialize(const ReceiveResult& m) {
  PayloadWriter w;
  w.u8(m.success ? STATUS_OK : STATUS_FAIL);
  put_kind(w, m.error_kind);
  w.str(m.error_message.value_or(""));
  w.boolean(m.file_path.has_value());
  if (m.file_path) w.str(*m.file_path);
  w.u64(m.bytes_received);
  w.u64(static_cast<uint64_t>(m.duration.count()));
  return w.take();
}

ReceiveResult deserialize_receive_result(const std::vector<uint8_t>& payload) {
  PayloadReader r(payload, "RECEIVE_RESULT");
  ReceiveResult m;
  m.success = r.u8("status") == STATUS_OK;
  m.error_kind = get_kind(r);
  m.error_message = opt_text(r.str("error_message"));
  if (r.boolean("has_path")) m.file_path = r.str("file_path");
  m.bytes_received = r.u64("bytes_received");
  m.duration = milliseconds(static_cast<int64_t>(r.u64("duration_ms")));
  return m;
}

} // namespace mbt::protocol
