#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include "mbt/auth/authorizer.h"
#include "mbt/common/config.h"
#include "mbt/storage/chunk_store.h"
#include "mbt/transfer/chunk_planner.h"
#include "mbt/transfer/types.h"

namespace mbt::transfer {

struct ReceiverConfig {
  std::string storage_dir = "./storage/backups";
  std::string temp_dir = "./storage/incoming";
  uint64_t max_chunk_bytes = 64ull * 1024 * 1024;

  static ReceiverConfig from(const Config& c);
};

// Server-side state of one incoming transfer.
struct ReceiveSession {
  std::string transfer_id;
  FileMetadata metadata;
  ChunkPlan plan;
  std::string final_path;
  std::optional<crypto::EncryptionMetadata> encryption;
  Clock::time_point started_at{};
  Clock::time_point last_activity{};

  std::set<uint32_t> received;  // distinct indices durably on disk
  uint64_t bytes_received = 0;
  bool finalizing = false;
  std::optional<ReceiveResult> result;  // set once reassembly ran

  std::mutex mu;
  std::condition_variable cv;
};

// Accepts chunks in any order, completes a transfer when every distinct index
// 0..N-1 is present, and reassembles in index order.
class ChunkReceiver {
public:
  ChunkReceiver(ReceiverConfig cfg, auth::Authorizer& authorizer);

  bool initialize();

  // Handshake. Creates the session or re-attaches to one, including one
  // persisted by a previous server process.
  TransferResponse begin(const TransferRequest& req);

  // Validates the request and prepares the target location.
  ReceiveResult receive(const ReceiveRequest& req);

  ChunkResult receive_chunk(const ChunkData& chunk);

  // Reassembles if every chunk is present; waits for a reassembly already running.
  ReceiveResult finalize(const FinalizeRequest& req);

  // Drops sessions and temp dirs inactive longer than max_age.
  int cleanup_stale(std::chrono::seconds max_age);

  size_t session_count();

  // <storage_dir>/<target_path>, or <storage_dir>/<transfer_id>/<file_name>
  // when no target is given. Absolute targets and ".." are rejected.
  Result<std::string> resolve_target(const std::string& transfer_id, const FileMetadata& meta,
                                     const std::string& target_path) const;

private:
  std::shared_ptr<ReceiveSession> find(const std::string& transfer_id);
  // Caller holds mutex_.
  std::shared_ptr<ReceiveSession> restore(const std::string& transfer_id);
  std::string manifest_text(const ReceiveSession& s) const;

  ReceiveResult reassemble(ReceiveSession& s);

  ReceiverConfig cfg_;
  auth::Authorizer& authorizer_;
  storage::ChunkStore chunks_;

  std::unordered_map<std::string, std::shared_ptr<ReceiveSession>> sessions_;
  std::mutex mutex_;
};

} // namespace mbt::transfer
