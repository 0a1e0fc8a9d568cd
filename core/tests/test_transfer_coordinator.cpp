#include <gtest/gtest.h>
#include <filesystem>
#include <thread>
#include "mbt/crypto/encryption_engine.h"
#include "mbt/integrity/checksum.h"
#include "mbt/transfer/transfer_coordinator.h"
#include "support/memory_resume_store.h"
#include "support/temp_dir.h"
#include "support/test_channels.h"

using namespace mbt;
using namespace mbt::transfer;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kChunk = 1024;

class TransferCoordinatorTest : public ::testing::Test {
protected:
  TransferCoordinatorTest() : authorizer_("secret") {
    rcfg_.storage_dir = dir_.sub("backups");
    rcfg_.temp_dir = dir_.sub("incoming");
    receiver_ = std::make_unique<ChunkReceiver>(rcfg_, authorizer_);
    EXPECT_TRUE(receiver_->initialize());
    factory_ = std::make_unique<test::LoopbackFactory>(*receiver_, plan_);

    ccfg_.retry.max_retries = 3;
    ccfg_.retry.base_delay = 1ms;
    ccfg_.retry.max_delay = 5ms;
    ccfg_.retry.jitter = false;
    ccfg_.work_dir = dir_.sub("outgoing");
    coordinator_ = std::make_unique<TransferCoordinator>(ccfg_, store_, *factory_, &progress_);
  }

  TransferOptions options(int concurrency = 2) {
    TransferOptions o;
    o.chunk_size = kChunk;
    o.max_concurrent_chunks = concurrency;
    o.authentication_token = "secret";
    o.client_id = "db-host-1";
    o.encryption.iterations = 1000;
    return o;
  }

  std::string source(const std::vector<uint8_t>& data, const std::string& name = "dump.sql") {
    auto p = dir_.sub("src/" + name);
    test::write_file(p, data);
    return p;
  }

  std::string received_path(const TransferResult& r, const std::string& name = "dump.sql") const {
    return (fs::path(rcfg_.storage_dir) / r.transfer_id / name).string();
  }

  test::TempDir dir_;
  ReceiverConfig rcfg_;
  auth::StaticTokenAuthorizer authorizer_;
  std::unique_ptr<ChunkReceiver> receiver_;
  test::FaultPlan plan_;
  std::unique_ptr<test::LoopbackFactory> factory_;
  test::MemoryResumeStore store_;
  ProgressChannel progress_;
  CoordinatorConfig ccfg_;
  std::unique_ptr<TransferCoordinator> coordinator_;
};

} // namespace

TEST_F(TransferCoordinatorTest, TransfersFileAndClearsResumeState) {
  auto data = test::make_bytes(10 * kChunk + 333);
  auto r = coordinator_->transfer(source(data), options(4));

  ASSERT_TRUE(r.success) << r.error_message.value_or("");
  EXPECT_EQ(r.final_state, TransferState::Completed);
  EXPECT_EQ(r.bytes_transferred, data.size());
  EXPECT_FALSE(r.resume_token.has_value());
  EXPECT_EQ(r.checksum_hash,
            std::optional<std::string>(integrity::ChecksumValidator::compute(data.data(), data.size(),
                                                                            integrity::HashAlgorithm::SHA256)));
  EXPECT_EQ(test::read_file(received_path(r)), data);
  EXPECT_EQ(store_.token_count(), 0u);
  EXPECT_EQ(plan_.finalizes, 0);

  auto last = progress_.try_pop();
  ASSERT_TRUE(last);
  EXPECT_EQ(last->chunks_done, 11u);
  EXPECT_DOUBLE_EQ(last->percent, 100.0);
}

TEST_F(TransferCoordinatorTest, LargeFileWithExplicitChunkSize) {
  constexpr uint64_t MiB = 1024ull * 1024;
  auto data = test::make_bytes(105 * MiB, 5);
  auto opts = options(2);
  opts.chunk_size = 50 * MiB;

  auto r = coordinator_->transfer(source(data), opts);
  ASSERT_TRUE(r.success) << r.error_message.value_or("");
  EXPECT_EQ(r.bytes_transferred, 110100480u);
  EXPECT_EQ(plan_.delivered.size(), 3u);
}

TEST_F(TransferCoordinatorTest, ConcurrencyAloneKeepsTieredChunkSize) {
  constexpr uint64_t MiB = 1024ull * 1024;
  auto data = test::make_bytes(3 * MiB + 10, 6);
  auto opts = options(3);
  opts.chunk_size.reset();

  auto r = coordinator_->transfer(source(data), opts);
  ASSERT_TRUE(r.success) << r.error_message.value_or("");
  // 1 MiB chunks from the tier for files under 10 MiB
  EXPECT_EQ(plan_.delivered.size(), 4u);
  EXPECT_EQ(test::read_file(received_path(r)), data);
}

TEST_F(TransferCoordinatorTest, TransientFailuresAreRetried) {
  plan_.transient_failures = 2;
  auto data = test::make_bytes(3 * kChunk);
  auto r = coordinator_->transfer(source(data), options(1));
  ASSERT_TRUE(r.success) << r.error_message.value_or("");
  EXPECT_EQ(plan_.send_attempts, 5);
}

TEST_F(TransferCoordinatorTest, ExhaustedRetriesLeaveResumableState) {
  plan_.network_down = true;
  auto data = test::make_bytes(3 * kChunk);
  auto r = coordinator_->transfer(source(data), options(1));

  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.final_state, TransferState::Failed);
  ASSERT_TRUE(r.error.has_value());
  EXPECT_EQ(r.error->kind, ErrorKind::RetriesExhausted);
  ASSERT_TRUE(r.error->exhausted.has_value());
  EXPECT_EQ(r.error->exhausted->attempts, 4);
  EXPECT_EQ(plan_.opens, 4);
  ASSERT_TRUE(r.resume_token.has_value());
  EXPECT_EQ(store_.token_count(), 1u);

  plan_.network_down = false;
  auto resumed = coordinator_->resume(*r.resume_token, source(data), options(1));
  ASSERT_TRUE(resumed.success) << resumed.error_message.value_or("");
  EXPECT_EQ(resumed.transfer_id, r.transfer_id);
  EXPECT_EQ(test::read_file(received_path(resumed)), data);
}

TEST_F(TransferCoordinatorTest, ResumeSendsOnlyMissingChunks) {
  std::stop_source stop;
  plan_.stop = &stop;
  plan_.stop_after = 2;
  auto data = test::make_bytes(5 * kChunk);
  auto path = source(data);

  auto first = coordinator_->transfer(path, options(1), stop.get_token());
  ASSERT_FALSE(first.success);
  EXPECT_EQ(first.final_state, TransferState::Failed);
  EXPECT_EQ(first.error->kind, ErrorKind::Cancelled);
  ASSERT_TRUE(first.resume_token.has_value());
  EXPECT_EQ(first.bytes_transferred, 2u * kChunk);

  auto info = coordinator_->resume_info(*first.resume_token);
  ASSERT_TRUE(info);
  EXPECT_EQ(info->completed_chunks, (std::vector<uint32_t>{0, 1}));
  EXPECT_EQ(info->last_completed_chunk, 1);
  EXPECT_EQ(info->chunk_count, 5u);

  plan_.stop = nullptr;
  plan_.delivered.clear();
  auto second = coordinator_->resume(*first.resume_token, path, options(1));
  ASSERT_TRUE(second.success) << second.error_message.value_or("");
  EXPECT_EQ(plan_.delivered, (std::vector<uint32_t>{2, 3, 4}));
  EXPECT_EQ(second.bytes_transferred, 3u * kChunk);
  EXPECT_EQ(test::read_file(received_path(second)), data);
  EXPECT_EQ(store_.token_count(), 0u);
}

TEST_F(TransferCoordinatorTest, ResumeWithNothingMissingMakesNoNetworkCall) {
  auto data = test::make_bytes(3 * kChunk);
  auto path = source(data);
  auto digests = integrity::ChecksumValidator::digest_file(path);
  ASSERT_TRUE(digests);

  storage::ResumeToken tok;
  tok.token = "tok-all-done";
  tok.transfer_id = "xfer-1";
  tok.file_name = "dump.sql";
  tok.file_size = data.size();
  tok.checksum_md5 = digests->md5;
  tok.checksum_sha256 = digests->sha256;
  tok.chunk_size = kChunk;
  tok.created_at = storage::Clock::now();
  tok.last_activity = tok.created_at;
  store_.create(tok);
  for (uint32_t i = 0; i < 3; i++) store_.mark_chunk_complete({"xfer-1", i, kChunk, "", storage::Clock::now()});

  auto r = coordinator_->resume("tok-all-done", path, options());
  ASSERT_TRUE(r.success) << r.error_message.value_or("");
  EXPECT_EQ(r.final_state, TransferState::Completed);
  EXPECT_EQ(r.bytes_transferred, 0u);
  EXPECT_EQ(plan_.opens, 0);
  EXPECT_EQ(plan_.send_attempts, 0);
  EXPECT_EQ(store_.token_count(), 0u);
}

TEST_F(TransferCoordinatorTest, ModifiedSourceIsStaleResume) {
  std::stop_source stop;
  plan_.stop = &stop;
  plan_.stop_after = 1;
  auto data = test::make_bytes(4 * kChunk);
  auto path = source(data);
  auto first = coordinator_->transfer(path, options(1), stop.get_token());
  ASSERT_TRUE(first.resume_token.has_value());

  data[5] ^= 0x01;
  test::write_file(path, data);
  plan_.stop = nullptr;
  auto r = coordinator_->resume(*first.resume_token, path, options(1));
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->kind, ErrorKind::StaleResume);
  EXPECT_FALSE(r.resume_token.has_value());
  // the stored state is left for cleanup
  EXPECT_EQ(store_.token_count(), 1u);
}

TEST_F(TransferCoordinatorTest, IntegrityFailureDiscardsResumeState) {
  plan_.corrupt_chunk = 1;
  auto data = test::make_bytes(3 * kChunk);
  auto r = coordinator_->transfer(source(data), options(1));
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->kind, ErrorKind::Integrity);
  EXPECT_FALSE(r.resume_token.has_value());
  EXPECT_EQ(store_.token_count(), 0u);
  // rejected once, not retried
  EXPECT_EQ(plan_.send_attempts, 2);
}

TEST_F(TransferCoordinatorTest, LostCompletionTriggersFinalize) {
  plan_.hide_completion = true;
  auto data = test::make_bytes(2 * kChunk + 1);
  auto r = coordinator_->transfer(source(data), options(2));
  ASSERT_TRUE(r.success) << r.error_message.value_or("");
  EXPECT_EQ(plan_.finalizes, 1);
  EXPECT_EQ(test::read_file(received_path(r)), data);
}

TEST_F(TransferCoordinatorTest, ZeroByteFile) {
  auto r = coordinator_->transfer(source({}), options());
  ASSERT_TRUE(r.success) << r.error_message.value_or("");
  EXPECT_EQ(r.bytes_transferred, 0u);
  EXPECT_EQ(plan_.delivered.size(), 1u);
  EXPECT_EQ(fs::file_size(received_path(r)), 0u);
}

TEST_F(TransferCoordinatorTest, EncryptedTransferDecryptsAtReceiver) {
  auto data = test::make_bytes(6 * kChunk + 77, 9);
  auto opts = options(3);
  opts.password = "backup-pass";

  auto r = coordinator_->transfer(source(data), opts);
  ASSERT_TRUE(r.success) << r.error_message.value_or("");
  auto cipher = received_path(r, "dump.sql.enc");
  ASSERT_TRUE(fs::exists(cipher));
  EXPECT_FALSE(fs::exists(fs::path(ccfg_.work_dir) / r.transfer_id));

  auto meta = crypto::EncryptionMetadata::load(crypto::EncryptionEngine::metadata_path(cipher));
  crypto::EncryptionEngine engine(opts.encryption);
  EXPECT_FALSE(engine.validate_password(cipher, "not-the-pass", meta));
  ASSERT_TRUE(engine.decrypt_file(cipher, dir_.sub("restored.sql"), "backup-pass", meta));
  EXPECT_EQ(test::read_file(dir_.sub("restored.sql")), data);
}

TEST_F(TransferCoordinatorTest, EncryptedResumeReusesStagedCiphertext) {
  std::stop_source stop;
  plan_.stop = &stop;
  plan_.stop_after = 2;
  auto data = test::make_bytes(5 * kChunk, 4);
  auto path = source(data);
  auto opts = options(1);
  opts.password = "backup-pass";

  auto first = coordinator_->transfer(path, opts, stop.get_token());
  ASSERT_TRUE(first.resume_token.has_value());
  EXPECT_TRUE(fs::exists(fs::path(ccfg_.work_dir) / first.transfer_id / "dump.sql.enc"));

  plan_.stop = nullptr;
  auto second = coordinator_->resume(*first.resume_token, path, opts);
  ASSERT_TRUE(second.success) << second.error_message.value_or("");
  EXPECT_FALSE(fs::exists(fs::path(ccfg_.work_dir) / first.transfer_id));

  auto cipher = received_path(second, "dump.sql.enc");
  auto meta = crypto::EncryptionMetadata::load(crypto::EncryptionEngine::metadata_path(cipher));
  ASSERT_TRUE(crypto::EncryptionEngine(opts.encryption).decrypt_file(cipher, dir_.sub("out.sql"), "backup-pass", meta));
  EXPECT_EQ(test::read_file(dir_.sub("out.sql")), data);
}

TEST_F(TransferCoordinatorTest, ConfigurationErrorsPrecedeNetwork) {
  auto path = source(test::make_bytes(kChunk));

  auto opts = options();
  opts.authentication_token.clear();
  auto r = coordinator_->transfer(path, opts);
  EXPECT_EQ(r.error->kind, ErrorKind::Configuration);

  opts = options();
  opts.chunk_size = 100;
  r = coordinator_->transfer(path, opts);
  EXPECT_EQ(r.error->kind, ErrorKind::Configuration);

  opts = options();
  opts.max_concurrent_chunks = 11;
  r = coordinator_->transfer(path, opts);
  EXPECT_EQ(r.error->kind, ErrorKind::Configuration);

  EXPECT_EQ(plan_.opens, 0);
  EXPECT_EQ(store_.token_count(), 0u);
}

TEST_F(TransferCoordinatorTest, RejectedCredentialsAreFatal) {
  auto opts = options();
  opts.authentication_token = "not-secret";
  auto r = coordinator_->transfer(source(test::make_bytes(kChunk)), opts);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error->kind, ErrorKind::Fatal);
  EXPECT_EQ(plan_.opens, 1);
}

TEST_F(TransferCoordinatorTest, UnknownTokenAndMissingFile) {
  auto r = coordinator_->resume("no-such-token", source(test::make_bytes(10)), options());
  EXPECT_EQ(r.error->kind, ErrorKind::Fatal);
  EXPECT_FALSE(coordinator_->resume_info("no-such-token"));

  r = coordinator_->transfer(dir_.sub("missing.sql"), options());
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error->kind, ErrorKind::Fatal);
}

TEST_F(TransferCoordinatorTest, CleanupRemovesOnlyStaleIncompleteTokens) {
  std::stop_source stop;
  plan_.stop = &stop;
  plan_.stop_after = 1;
  auto first = coordinator_->transfer(source(test::make_bytes(3 * kChunk), "a.sql"), options(1), stop.get_token());
  ASSERT_TRUE(first.resume_token.has_value());

  std::stop_source stop2;
  plan_.stop = &stop2;
  plan_.delivered.clear();
  auto second = coordinator_->transfer(source(test::make_bytes(3 * kChunk), "b.sql"), options(1), stop2.get_token());
  ASSERT_TRUE(second.resume_token.has_value());

  store_.set_last_activity(first.transfer_id, storage::Clock::now() - 100h);
  auto removed = coordinator_->cleanup_stale(std::chrono::hours(72));
  ASSERT_TRUE(removed);
  EXPECT_EQ(*removed, 1);
  EXPECT_FALSE(store_.find_by_transfer(first.transfer_id));
  EXPECT_TRUE(store_.find_by_transfer(second.transfer_id));
}

TEST_F(TransferCoordinatorTest, CancelledBeforeAnyStateIsCancelled) {
  std::stop_source stop;
  stop.request_stop();
  auto r = coordinator_->transfer(source(test::make_bytes(kChunk)), options(), stop.get_token());
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.final_state, TransferState::Cancelled);
  EXPECT_FALSE(r.resume_token.has_value());
  EXPECT_EQ(store_.token_count(), 0u);
}

TEST_F(TransferCoordinatorTest, ChunkRetriesExhaustedMidUploadKeepEarlierChunks) {
  plan_.fail_chunk = 3;
  auto data = test::make_bytes(6 * kChunk, 12);
  auto path = source(data);

  auto first = coordinator_->transfer(path, options(1));
  ASSERT_FALSE(first.success);
  EXPECT_EQ(first.final_state, TransferState::Failed);
  EXPECT_EQ(first.error->kind, ErrorKind::RetriesExhausted);
  ASSERT_TRUE(first.error->exhausted.has_value());
  EXPECT_EQ(first.error->exhausted->attempts, 4);
  ASSERT_TRUE(first.resume_token.has_value());
  EXPECT_EQ(first.bytes_transferred, 3u * kChunk);
  EXPECT_EQ(plan_.delivered, (std::vector<uint32_t>{0, 1, 2}));

  std::vector<uint32_t> recorded;
  for (const auto& c : store_.completed_chunks(first.transfer_id)) recorded.push_back(c.chunk_index);
  EXPECT_EQ(recorded, (std::vector<uint32_t>{0, 1, 2}));

  plan_.fail_chunk.reset();
  plan_.delivered.clear();
  auto second = coordinator_->resume(*first.resume_token, path, options(1));
  ASSERT_TRUE(second.success) << second.error_message.value_or("");
  EXPECT_EQ(plan_.delivered, (std::vector<uint32_t>{3, 4, 5}));
  EXPECT_EQ(second.bytes_transferred, 3u * kChunk);
  EXPECT_EQ(test::read_file(received_path(second)), data);
}

TEST_F(TransferCoordinatorTest, LiveUploadIsGuardedFromResumeAndCleanup) {
  plan_.hold = true;
  auto data = test::make_bytes(3 * kChunk, 13);
  auto path = source(data);

  TransferResult first;
  std::thread upload([&] { first = coordinator_->transfer(path, options(1)); });

  bool parked = false;
  {
    std::unique_lock<std::mutex> lk(plan_.mu);
    parked = plan_.cv.wait_for(lk, 5s, [this] { return plan_.holding; });
  }
  EXPECT_TRUE(parked);
  auto active = store_.list_active();
  EXPECT_EQ(active.size(), 1u);

  if (parked && active.size() == 1) {
    const auto tok = active.front();
    EXPECT_TRUE(coordinator_->is_active(tok.transfer_id));

    auto second = coordinator_->resume(tok.token, path, options(1));
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.error.value_or(Error::cancelled()).kind, ErrorKind::Fatal);
    EXPECT_EQ(second.resume_token, std::optional<std::string>(tok.token));

    store_.set_last_activity(tok.transfer_id, storage::Clock::now() - 100h);
    auto removed = coordinator_->cleanup_stale(std::chrono::hours(72));
    EXPECT_TRUE(removed && *removed == 0);
    EXPECT_TRUE(store_.find_by_transfer(tok.transfer_id));
  }

  {
    std::lock_guard<std::mutex> lk(plan_.mu);
    plan_.hold = false;
  }
  plan_.cv.notify_all();
  upload.join();

  ASSERT_TRUE(first.success) << first.error_message.value_or("");
  EXPECT_EQ(test::read_file(received_path(first)), data);
  EXPECT_EQ(store_.token_count(), 0u);
}

TEST_F(TransferCoordinatorTest, CleanupSkipsCompletedTokens) {
  storage::ResumeToken tok;
  tok.token = "tok-done";
  tok.transfer_id = "xfer-done";
  tok.file_name = "dump.sql";
  tok.file_size = kChunk;
  tok.chunk_size = kChunk;
  tok.created_at = storage::Clock::now() - 200h;
  tok.last_activity = tok.created_at;
  store_.create(tok);
  store_.mark_completed("xfer-done");
  store_.set_last_activity("xfer-done", storage::Clock::now() - 100h);

  auto removed = coordinator_->cleanup_stale(std::chrono::hours(72));
  ASSERT_TRUE(removed);
  EXPECT_EQ(*removed, 0);
  EXPECT_TRUE(store_.find_by_transfer("xfer-done"));
}
