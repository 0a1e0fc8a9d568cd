#include <gtest/gtest.h>
#include "mbt/protocol/message.h"
#include "mbt/protocol/transfer_messages.h"

using namespace mbt;
using namespace mbt::protocol;
using namespace mbt::transfer;

TEST(TransferMessages, TransferRequestCarriesResumeAndEncryptionFields) {
  TransferRequest req;
  req.transfer_id = "abc123";
  req.metadata.file_name = "db.sql.enc";
  req.metadata.file_size = 5ull * 1024 * 1024 * 1024;
  req.metadata.checksum_md5 = "md5hex";
  req.metadata.checksum_sha256 = "shahex";
  req.metadata.created_at = Clock::time_point(std::chrono::milliseconds(1700000000123));
  req.strategy.chunk_size = 25 * 1024 * 1024;
  req.strategy.max_concurrent_chunks = 8;
  req.resume_transfer = true;
  req.resume_token = "tok";
  req.authentication_token = "auth";
  req.client_id = "host-1";
  req.target_path = "nightly/db.sql.enc";
  crypto::EncryptionMetadata enc;
  enc.salt = "c2FsdA==";
  enc.iv = "aXY=";
  enc.original_size = 99;
  enc.original_checksum = "plainsha";
  req.encryption = enc;

  auto back = deserialize_transfer_request(serialize(req));
  EXPECT_EQ(back.transfer_id, "abc123");
  EXPECT_TRUE(back.metadata.same_file(req.metadata));
  EXPECT_EQ(back.metadata.created_at, req.metadata.created_at);
  EXPECT_EQ(back.strategy.chunk_size, req.strategy.chunk_size);
  EXPECT_EQ(back.strategy.max_concurrent_chunks, 8);
  EXPECT_TRUE(back.resume_transfer);
  EXPECT_EQ(back.resume_token, std::optional<std::string>("tok"));
  EXPECT_EQ(back.client_id, "host-1");
  EXPECT_EQ(back.target_path, "nightly/db.sql.enc");
  ASSERT_TRUE(back.encryption.has_value());
  EXPECT_EQ(back.encryption->original_checksum, "plainsha");
  EXPECT_EQ(back.encryption->algorithm, "AES-256-CBC");
}

TEST(TransferMessages, FailedChunkResultKeepsErrorKind) {
  ChunkResult r;
  r.success = false;
  r.chunk_index = 17;
  r.error_kind = ErrorKind::Integrity;
  r.error_message = "checksum mismatch";

  auto back = deserialize_chunk_result(serialize(r));
  EXPECT_FALSE(back.success);
  EXPECT_EQ(back.chunk_index, 17u);
  EXPECT_EQ(back.error_kind, std::optional<ErrorKind>(ErrorKind::Integrity));
  EXPECT_EQ(back.error_message, std::optional<std::string>("checksum mismatch"));
  EXPECT_FALSE(back.is_complete);
}

TEST(TransferMessages, ChunkDataPreservesBinaryPayload) {
  ChunkData c;
  c.transfer_id = "t";
  c.chunk_index = 3;
  c.data = {0, 1, 2, 0xFF, 0, 0x80};
  c.chunk_checksum = "sum";
  c.is_last_chunk = true;
  auto back = deserialize_chunk_data(serialize(c));
  EXPECT_EQ(back.data, c.data);
  EXPECT_TRUE(back.is_last_chunk);
}

TEST(TransferMessages, ResponseListsReceivedChunks) {
  TransferResponse r;
  r.success = true;
  r.received_chunks = {0, 4, 9};
  auto back = deserialize_transfer_response(serialize(r));
  EXPECT_TRUE(back.success);
  EXPECT_EQ(back.received_chunks, r.received_chunks);
  EXPECT_FALSE(back.error_kind.has_value());
}

TEST(TransferMessages, TruncatedPayloadThrows) {
  ChunkData c;
  c.transfer_id = "transfer";
  c.data = std::vector<uint8_t>(100, 7);
  auto bytes = serialize(c);
  bytes.resize(bytes.size() - 10);
  EXPECT_THROW(deserialize_chunk_data(bytes), std::runtime_error);
  EXPECT_THROW(deserialize_finalize_request({}), std::runtime_error);
}

TEST(MessageHeader, FrameRoundTrip) {
  auto frame = make_frame(MsgType::CHUNK_RESULT, {1, 2, 3});
  ASSERT_EQ(frame.size(), HEADER_SIZE + 3);
  MessageHeaderWire h{};
  std::memcpy(&h, frame.data(), sizeof(h));
  EXPECT_NO_THROW(validate_header(h));
  EXPECT_EQ(payload_len(h), 3u);
  EXPECT_EQ(static_cast<MsgType>(h.type), MsgType::CHUNK_RESULT);

  h.magic_be = 0;
  EXPECT_THROW(validate_header(h), std::runtime_error);
}
