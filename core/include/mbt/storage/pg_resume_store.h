#pragma once

#include <mutex>
#include "mbt/db/db.h"
#include "mbt/storage/resume_store.h"

namespace mbt::storage {

// ResumeStore over the resume_tokens / resume_chunks tables.
// Calls are serialized: one libpq connection is not safe for concurrent use.
class PgResumeStore : public ResumeStore {
public:
  explicit PgResumeStore(db::Db& db) : db_(db) {}

  // CREATE TABLE IF NOT EXISTS for both tables.
  void ensure_schema();

  void create(const ResumeToken& token) override;
  std::optional<ResumeToken> find_by_token(const std::string& token) override;
  std::optional<ResumeToken> find_by_transfer(const std::string& transfer_id) override;
  std::vector<ResumeChunk> completed_chunks(const std::string& transfer_id) override;
  bool mark_chunk_complete(const ResumeChunk& chunk) override;
  void touch(const std::string& transfer_id) override;
  void mark_completed(const std::string& transfer_id) override;
  bool remove(const std::string& transfer_id) override;
  std::vector<ResumeToken> list_stale(Clock::time_point cutoff) override;
  std::vector<ResumeToken> list_active() override;

private:
  std::vector<ResumeToken> query_tokens(const std::string& where, const std::vector<std::string>& params,
                                        const std::string& ctx);

  db::Db& db_;
  std::mutex mu_;
};

} // namespace mbt::storage
