#include "mbt/transfer/chunk_planner.h"
#include <algorithm>
#include <limits>

namespace mbt::transfer {

static constexpr uint64_t MiB = 1024ull * 1024;

ChunkSpan ChunkPlan::span(uint32_t index) const {
  ChunkSpan s;
  s.index = index;
  s.offset = static_cast<uint64_t>(index) * strategy.chunk_size;
  s.length = s.offset >= file_size ? 0 : std::min<uint64_t>(strategy.chunk_size, file_size - s.offset);
  s.is_first = index == 0;
  s.is_last = index + 1 == chunk_count;
  return s;
}

ChunkingStrategy ChunkPlanner::default_strategy(uint64_t file_size) {
  ChunkingStrategy s;
  if (file_size < 10 * MiB) {
    s.chunk_size = 1 * MiB;
    s.max_concurrent_chunks = 2;
  } else if (file_size < 100 * MiB) {
    s.chunk_size = 5 * MiB;
    s.max_concurrent_chunks = 4;
  } else if (file_size < 1024 * MiB) {
    s.chunk_size = 10 * MiB;
    s.max_concurrent_chunks = 6;
  } else {
    s.chunk_size = 25 * MiB;
    s.max_concurrent_chunks = 8;
  }
  return s;
}

ChunkingStrategy ChunkPlanner::default_strategy(uint64_t file_size, std::optional<uint32_t> chunk_size,
                                                std::optional<int> max_concurrent_chunks) {
  ChunkingStrategy s = default_strategy(file_size);
  if (chunk_size) s.chunk_size = *chunk_size;
  if (max_concurrent_chunks) s.max_concurrent_chunks = *max_concurrent_chunks;
  return s;
}

uint32_t ChunkPlanner::chunk_count(uint64_t file_size, uint32_t chunk_size) {
  if (file_size == 0 || chunk_size == 0) return 1;
  return static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

Status ChunkPlanner::validate(const ChunkingStrategy& s) {
  if (s.chunk_size < kMinChunkSize) {
    return Error::configuration("chunk size " + std::to_string(s.chunk_size) +
                                " is below the minimum of " + std::to_string(kMinChunkSize) + " bytes");
  }
  if (s.max_concurrent_chunks < kMinConcurrency || s.max_concurrent_chunks > kMaxConcurrency) {
    return Error::configuration("max concurrent chunks must be between 1 and 10, got " +
                                std::to_string(s.max_concurrent_chunks));
  }
  return {};
}

Result<ChunkPlan> ChunkPlanner::plan(uint64_t file_size, const std::optional<ChunkingStrategy>& requested) {
  ChunkPlan p;
  p.file_size = file_size;
  p.strategy = requested ? *requested : default_strategy(file_size);
  if (auto st = validate(p.strategy); !st) return st.error();

  uint64_t count = file_size == 0 ? 1 : (file_size + p.strategy.chunk_size - 1) / p.strategy.chunk_size;
  if (count > std::numeric_limits<uint32_t>::max()) {
    return Error::configuration("file too large for chunk size " + std::to_string(p.strategy.chunk_size));
  }
  p.chunk_count = static_cast<uint32_t>(count);
  return p;
}

} // namespace mbt::transfer
