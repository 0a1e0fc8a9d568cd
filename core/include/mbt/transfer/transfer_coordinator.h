#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include "mbt/common/config.h"
#include "mbt/common/error.h"
#include "mbt/crypto/encryption_engine.h"
#include "mbt/net/retry_policy.h"
#include "mbt/storage/resume_store.h"
#include "mbt/transfer/chunk_channel.h"
#include "mbt/transfer/chunk_planner.h"
#include "mbt/transfer/progress.h"
#include "mbt/transfer/types.h"

namespace mbt::transfer {

struct CoordinatorConfig {
  net::RetryConfig retry;
  std::chrono::milliseconds chunk_timeout{300000};
  std::chrono::milliseconds transfer_timeout{0};  // 0 = unlimited
  std::string work_dir = "./storage/outgoing";

  static CoordinatorConfig from(const Config& c);
  Status validate() const;
};

struct TransferOptions {
  // Unset fields take the planner's tier for the file size.
  std::optional<uint32_t> chunk_size;
  std::optional<int> max_concurrent_chunks;
  std::string authentication_token;
  std::string client_id;
  std::string target_path;
  std::optional<std::string> password;  // encrypt before sending when set
  crypto::EncryptionConfig encryption;
};

// Runtime state of one attempt; discarded when the attempt ends.
struct TransferSession {
  std::string transfer_id;
  FileMetadata metadata;
  ChunkPlan plan;
  std::set<uint32_t> acknowledged;
  uint64_t bytes_transferred = 0;
  Clock::time_point started_at = Clock::now();
  TransferState state = TransferState::Initiating;

  // Throws std::logic_error on a transition the state machine does not allow.
  void transition(TransferState to);
  std::chrono::milliseconds elapsed() const;
};

class TransferCoordinator {
public:
  TransferCoordinator(CoordinatorConfig cfg, storage::ResumeStore& store,
                      ChannelFactory& channels, ProgressChannel* progress = nullptr);

  TransferResult transfer(const std::string& file_path, const TransferOptions& opts,
                          std::stop_token stop = {});

  TransferResult resume(const std::string& resume_token, const std::string& file_path,
                        const TransferOptions& opts, std::stop_token stop = {});

  Result<ResumeInfo> resume_info(const std::string& resume_token);

  // Removes resume state inactive for longer than max_inactive, skipping
  // completed tokens and transfers with a live upload. Returns the count.
  Result<int> cleanup_stale(std::chrono::seconds max_inactive);

  bool is_active(const std::string& transfer_id);

private:
  struct Upload;

  Status validate(const TransferOptions& opts) const;
  bool activate(const std::string& transfer_id);

  TransferResult run_upload(Upload& up, std::stop_token stop);
  void upload_worker(Upload& up, std::stop_token stop);
  TransferResult finish(Upload& up, std::optional<Error> failure);
  TransferResult fail(TransferSession& session, Error error, std::optional<std::string> resume_token);

  std::string staging_dir(const std::string& transfer_id) const;
  void remove_staging(const std::string& dir);
  void publish_progress(Upload& up);

  CoordinatorConfig cfg_;
  storage::ResumeStore& store_;
  ChannelFactory& channels_;
  ProgressChannel* progress_;
  net::RetryPolicy retry_;

  std::set<std::string> active_;
  std::mutex active_mu_;
};

} // namespace mbt::transfer
