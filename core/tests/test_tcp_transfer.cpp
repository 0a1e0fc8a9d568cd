#include <gtest/gtest.h>
#include <utility>
#include <boost/asio.hpp>
#include <filesystem>
#include <thread>
#include "mbt/integrity/checksum.h"
#include "mbt/net/tcp_channel.h"
#include "mbt/net/tcp_server.h"
#include "mbt/protocol/transfer_messages.h"
#include "mbt/transfer/transfer_coordinator.h"
#include "support/memory_resume_store.h"
#include "support/temp_dir.h"

using namespace mbt;
using namespace mbt::transfer;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

using boost::asio::ip::tcp;

void write_frame(tcp::socket& s, protocol::MsgType type, const std::vector<uint8_t>& payload) {
  auto frame = protocol::make_frame(type, payload);
  boost::asio::write(s, boost::asio::buffer(frame));
}

std::pair<protocol::MsgType, std::vector<uint8_t>> read_frame(tcp::socket& s) {
  protocol::MessageHeaderWire h{};
  boost::asio::read(s, boost::asio::buffer(&h, sizeof(h)));
  protocol::validate_header(h);
  std::vector<uint8_t> body(protocol::payload_len(h));
  if (!body.empty()) boost::asio::read(s, boost::asio::buffer(body));
  return {static_cast<protocol::MsgType>(h.type), std::move(body)};
}

class TcpTransferTest : public ::testing::Test {
protected:
  TcpTransferTest() : authorizer_("secret") {
    rcfg_.storage_dir = dir_.sub("backups");
    rcfg_.temp_dir = dir_.sub("incoming");
    rcfg_.max_chunk_bytes = 1024 * 1024;
    receiver_ = std::make_unique<ChunkReceiver>(rcfg_, authorizer_);
    EXPECT_TRUE(receiver_->initialize());

    server_ = std::make_unique<net::TcpServer>(io_, 0, *receiver_, rcfg_.max_chunk_bytes, disk_.get_executor());
    server_->start();
    for (int i = 0; i < 2; i++) threads_.emplace_back([this] { io_.run(); });

    ccfg_.retry.max_retries = 2;
    ccfg_.retry.base_delay = 5ms;
    ccfg_.retry.max_delay = 10ms;
    ccfg_.retry.jitter = false;
    ccfg_.chunk_timeout = 10s;
    ccfg_.work_dir = dir_.sub("outgoing");
  }

  ~TcpTransferTest() override {
    server_->stop();
    io_.stop();
    for (auto& t : threads_) t.join();
  }

  TransferOptions options(int concurrency) {
    TransferOptions o;
    o.chunk_size = 4096;
    o.max_concurrent_chunks = concurrency;
    o.authentication_token = "secret";
    o.client_id = "tcp-test";
    return o;
  }

  static uint16_t unused_port() {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor a(io, boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v4(), 0));
    return a.local_endpoint().port();
  }

  test::TempDir dir_;
  ReceiverConfig rcfg_;
  auth::StaticTokenAuthorizer authorizer_;
  std::unique_ptr<ChunkReceiver> receiver_;
  boost::asio::io_context io_;
  boost::asio::thread_pool disk_{2};
  std::unique_ptr<net::TcpServer> server_;
  std::vector<std::thread> threads_;
  CoordinatorConfig ccfg_;
  test::MemoryResumeStore store_;
};

} // namespace

TEST_F(TcpTransferTest, ConcurrentTransferOverSockets) {
  auto data = test::make_bytes(37 * 4096 + 1234, 21);
  test::write_file(dir_.sub("src/dump.sql"), data);

  net::TcpChannelFactory channels("127.0.0.1", server_->local_port());
  TransferCoordinator coordinator(ccfg_, store_, channels);
  auto opts = options(4);
  opts.target_path = "nightly/dump.sql";

  auto r = coordinator.transfer(dir_.sub("src/dump.sql"), opts);
  ASSERT_TRUE(r.success) << r.error_message.value_or("");
  EXPECT_EQ(r.bytes_transferred, data.size());
  EXPECT_EQ(test::read_file((fs::path(rcfg_.storage_dir) / "nightly/dump.sql").string()), data);
  EXPECT_EQ(store_.token_count(), 0u);
}

TEST_F(TcpTransferTest, WrongTokenIsRejectedWithoutRetry) {
  test::write_file(dir_.sub("src/a.sql"), test::make_bytes(100));
  net::TcpChannelFactory channels("127.0.0.1", server_->local_port());
  TransferCoordinator coordinator(ccfg_, store_, channels);
  auto opts = options(1);
  opts.authentication_token = "guess";

  auto r = coordinator.transfer(dir_.sub("src/a.sql"), opts);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->kind, ErrorKind::Fatal);
}

TEST_F(TcpTransferTest, UnreachableReceiverExhaustsRetries) {
  test::write_file(dir_.sub("src/a.sql"), test::make_bytes(5000));
  net::TcpChannelFactory channels("127.0.0.1", unused_port());
  TransferCoordinator coordinator(ccfg_, store_, channels);

  auto r = coordinator.transfer(dir_.sub("src/a.sql"), options(1));
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->kind, ErrorKind::RetriesExhausted);
  EXPECT_EQ(r.error->exhausted->attempts, 3);
  EXPECT_TRUE(r.resume_token.has_value());
}

TEST_F(TcpTransferTest, ChannelRequiresOpenBeforeSending) {
  net::TcpChunkChannel channel("127.0.0.1", server_->local_port());
  ChunkData c;
  c.transfer_id = "x";
  auto r = channel.send_chunk(c, 1s, {});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, ErrorKind::Fatal);
}

TEST_F(TcpTransferTest, SilentReceiverTimesOutAndStaysResumable) {
  // connections land in the listen backlog and are never answered
  boost::asio::io_context silent_io;
  tcp::acceptor silent(silent_io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
  test::write_file(dir_.sub("src/a.sql"), test::make_bytes(5000));

  ccfg_.chunk_timeout = 50ms;
  net::TcpChannelFactory channels("127.0.0.1", silent.local_endpoint().port());
  TransferCoordinator coordinator(ccfg_, store_, channels);

  auto started = std::chrono::steady_clock::now();
  auto r = coordinator.transfer(dir_.sub("src/a.sql"), options(1));
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->kind, ErrorKind::RetriesExhausted);
  ASSERT_TRUE(r.error->exhausted.has_value());
  EXPECT_EQ(r.error->exhausted->attempts, 3);
  EXPECT_NE(r.error->exhausted->last_error.find("timed out"), std::string::npos);
  EXPECT_TRUE(r.resume_token.has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST_F(TcpTransferTest, TransferDeadlineCapsOperationTimeout) {
  boost::asio::io_context silent_io;
  tcp::acceptor silent(silent_io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
  test::write_file(dir_.sub("src/a.sql"), test::make_bytes(5000));

  ccfg_.chunk_timeout = 30s;
  ccfg_.transfer_timeout = 100ms;
  net::TcpChannelFactory channels("127.0.0.1", silent.local_endpoint().port());
  TransferCoordinator coordinator(ccfg_, store_, channels);

  auto started = std::chrono::steady_clock::now();
  auto r = coordinator.transfer(dir_.sub("src/a.sql"), options(1));
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->kind, ErrorKind::RetriesExhausted);
  EXPECT_TRUE(r.resume_token.has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(TcpChunkChannel, StopRequestedDuringResolveCancels) {
  net::TcpChunkChannel channel("mbt-receiver.invalid", 9000);
  std::stop_source stop;
  stop.request_stop();
  TransferRequest req;
  req.transfer_id = "x";
  auto r = channel.open(req, 5s, stop.get_token());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, ErrorKind::Cancelled);
}

TEST_F(TcpTransferTest, ChunkWorkRunsOffTheNetworkThreads) {
  // nothing runs on this executor until the test drives it
  boost::asio::io_context disk;
  auto guard = boost::asio::make_work_guard(disk);
  net::TcpServer server(io_, 0, *receiver_, rcfg_.max_chunk_bytes, disk.get_executor());
  server.start();
  const tcp::endpoint ep(boost::asio::ip::address_v4::loopback(), server.local_port());

  auto data = test::make_bytes(3000, 8);
  TransferRequest req;
  req.transfer_id = "held-transfer";
  req.metadata.file_name = "held.sql";
  req.metadata.file_size = data.size();
  req.metadata.checksum_md5 = integrity::ChecksumValidator::compute(data.data(), data.size(),
                                                                    integrity::HashAlgorithm::MD5);
  req.metadata.checksum_sha256 = integrity::ChecksumValidator::compute(data.data(), data.size(),
                                                                       integrity::HashAlgorithm::SHA256);
  req.strategy.chunk_size = 4096;
  req.strategy.max_concurrent_chunks = 1;
  req.authentication_token = "secret";
  req.client_id = "tcp-test";

  boost::asio::io_context client_io;
  tcp::socket a(client_io);
  a.connect(ep);
  write_frame(a, protocol::MsgType::TRANSFER_REQ, protocol::serialize(req));
  auto [resp_type, resp_body] = read_frame(a);
  ASSERT_EQ(resp_type, protocol::MsgType::TRANSFER_RESP);
  ASSERT_TRUE(protocol::deserialize_transfer_response(resp_body).success);

  ChunkData chunk;
  chunk.transfer_id = req.transfer_id;
  chunk.chunk_index = 0;
  chunk.data = data;
  chunk.chunk_checksum = integrity::ChecksumValidator::chunk_checksum(data);
  chunk.is_last_chunk = true;
  write_frame(a, protocol::MsgType::CHUNK_DATA, protocol::serialize(chunk));

  // another connection is served while the last chunk waits for the disk executor
  tcp::socket b(client_io);
  b.connect(ep);
  write_frame(b, protocol::MsgType::PING, {});
  EXPECT_EQ(read_frame(b).first, protocol::MsgType::PONG);

  const auto target = fs::path(rcfg_.storage_dir) / req.transfer_id / "held.sql";
  EXPECT_FALSE(fs::exists(target));

  ASSERT_EQ(disk.run_one_for(5s), 1u);
  auto [result_type, result_body] = read_frame(a);
  ASSERT_EQ(result_type, protocol::MsgType::CHUNK_RESULT);
  auto result = protocol::deserialize_chunk_result(result_body);
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.is_complete);
  EXPECT_EQ(test::read_file(target.string()), data);

  server.stop();
  guard.reset();
}
