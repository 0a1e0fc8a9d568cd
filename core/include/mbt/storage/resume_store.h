#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mbt::storage {

using Clock = std::chrono::system_clock;

// One row per in-flight transfer.
struct ResumeToken {
  std::string token;
  std::string transfer_id;
  std::string file_name;
  uint64_t file_size = 0;
  std::string checksum_md5;
  std::string checksum_sha256;
  uint32_t chunk_size = 0;
  std::string temp_directory;  // sender staging dir, empty when unencrypted
  bool encrypted = false;
  Clock::time_point created_at{};
  Clock::time_point last_activity{};
  bool is_completed = false;

  uint32_t chunk_count() const;
};

// One row per durably acknowledged chunk, keyed by (transfer_id, chunk_index).
struct ResumeChunk {
  std::string transfer_id;
  uint32_t chunk_index = 0;
  uint64_t chunk_size = 0;
  std::string chunk_checksum;
  Clock::time_point completed_at{};
};

// Durable record of in-flight transfers. Implementations throw on
// infrastructure failure (db::DbError for PostgreSQL).
class ResumeStore {
public:
  virtual ~ResumeStore() = default;

  virtual void create(const ResumeToken& token) = 0;
  virtual std::optional<ResumeToken> find_by_token(const std::string& token) = 0;
  virtual std::optional<ResumeToken> find_by_transfer(const std::string& transfer_id) = 0;

  // Ordered by chunk index.
  virtual std::vector<ResumeChunk> completed_chunks(const std::string& transfer_id) = 0;

  // Insert-if-absent. Returns false when the chunk was already recorded.
  virtual bool mark_chunk_complete(const ResumeChunk& chunk) = 0;

  virtual void touch(const std::string& transfer_id) = 0;
  virtual void mark_completed(const std::string& transfer_id) = 0;

  // Removes the token and its chunks. Returns false when nothing was removed.
  virtual bool remove(const std::string& transfer_id) = 0;

  // Tokens not completed whose last activity is older than cutoff.
  virtual std::vector<ResumeToken> list_stale(Clock::time_point cutoff) = 0;
  virtual std::vector<ResumeToken> list_active() = 0;
};

} // namespace mbt::storage
