#pragma once

#include <cstdint>
#include <optional>
#include "mbt/common/error.h"
#include "mbt/transfer/types.h"

namespace mbt::transfer {

struct ChunkSpan {
  uint32_t index = 0;
  uint64_t offset = 0;
  uint64_t length = 0;
  bool is_first = false;
  bool is_last = false;
};

struct ChunkPlan {
  uint64_t file_size = 0;
  ChunkingStrategy strategy;
  uint32_t chunk_count = 1;

  ChunkSpan span(uint32_t index) const;
};

class ChunkPlanner {
public:
  static constexpr uint32_t kMinChunkSize = 1024;
  static constexpr int kMinConcurrency = 1;
  static constexpr int kMaxConcurrency = 10;

  // Tiered default for a file of this size.
  static ChunkingStrategy default_strategy(uint64_t file_size);
  // The tiered default with only the given fields replaced.
  static ChunkingStrategy default_strategy(uint64_t file_size, std::optional<uint32_t> chunk_size,
                                           std::optional<int> max_concurrent_chunks);

  // ceil(file_size / chunk_size), and 1 for an empty file.
  static uint32_t chunk_count(uint64_t file_size, uint32_t chunk_size);

  static Status validate(const ChunkingStrategy& s);

  // Uses `requested` when given, else the tiered default. Invalid strategies
  // are configuration errors.
  static Result<ChunkPlan> plan(uint64_t file_size,
                                const std::optional<ChunkingStrategy>& requested = std::nullopt);
};

} // namespace mbt::transfer
