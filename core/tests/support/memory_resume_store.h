#pragma once
#include <map>
#include <mutex>
#include "mbt/storage/resume_store.h"

namespace mbt::test {

class MemoryResumeStore : public storage::ResumeStore {
public:
  void create(const storage::ResumeToken& token) override;
  std::optional<storage::ResumeToken> find_by_token(const std::string& token) override;
  std::optional<storage::ResumeToken> find_by_transfer(const std::string& transfer_id) override;
  std::vector<storage::ResumeChunk> completed_chunks(const std::string& transfer_id) override;
  bool mark_chunk_complete(const storage::ResumeChunk& chunk) override;
  void touch(const std::string& transfer_id) override;
  void mark_completed(const std::string& transfer_id) override;
  bool remove(const std::string& transfer_id) override;
  std::vector<storage::ResumeToken> list_stale(storage::Clock::time_point cutoff) override;
  std::vector<storage::ResumeToken> list_active() override;

  // Test hook: backdate a token's last activity.
  void set_last_activity(const std::string& transfer_id, storage::Clock::time_point t);
  size_t token_count();

private:
  std::mutex mu_;
  std::map<std::string, storage::ResumeToken> tokens_;  // by transfer id
  std::map<std::string, std::map<uint32_t, storage::ResumeChunk>> chunks_;
};

} // namespace mbt::test
