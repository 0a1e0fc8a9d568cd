#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "mbt/common/error.h"

namespace mbt::storage {

// Receiver-side disk layout:
//   <temp_root>/<transfer_id>/chunk_000000.dat ...
//   <temp_root>/<transfer_id>/transfer.meta
class ChunkStore {
public:
  explicit ChunkStore(std::string temp_root = "./storage/incoming");

  // Ensure the temp root exists
  bool initialize();

  std::string transfer_dir(const std::string& transfer_id) const;
  std::string chunk_path(const std::string& transfer_id, uint32_t index) const;
  std::string manifest_path(const std::string& transfer_id) const;

  // Written to a unique temporary name, flushed, fsynced, then renamed into
  // place, so a chunk file is either absent or complete.
  Status write_chunk(const std::string& transfer_id, uint32_t index, const std::vector<uint8_t>& data);

  // Indices of chunk files present on disk.
  std::set<uint32_t> list_chunks(const std::string& transfer_id) const;
  std::optional<uint64_t> chunk_size(const std::string& transfer_id, uint32_t index) const;

  // Concatenates chunks 0..chunk_count-1 in index order into "<final_path>.part".
  // Returns bytes written. The caller verifies and commits the .part file.
  Result<uint64_t> assemble(const std::string& transfer_id, uint32_t chunk_count,
                            const std::string& final_path) const;

  Status save_manifest(const std::string& transfer_id, const std::string& text);
  std::optional<std::string> load_manifest(const std::string& transfer_id) const;

  std::vector<std::string> list_transfers() const;

  // Remove the transfer's temp directory
  bool cleanup_transfer(const std::string& transfer_id);

  // Removes transfer dirs whose newest file is older than max_age, except
  // those listed in keep. Returns the number removed.
  int cleanup_stale(std::chrono::seconds max_age, const std::set<std::string>& keep = {});

private:
  std::string root_;
};

} // namespace mbt::storage
