#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace mbt::transfer {

struct ProgressEvent {
  std::string transfer_id;
  uint32_t chunks_done = 0;
  uint32_t chunk_count = 0;
  uint64_t bytes_done = 0;
  uint64_t bytes_total = 0;
  double percent = 0.0;
};

// Single-slot mailbox between a transfer and its observer. push() never waits
// for the consumer: an unread event is replaced by the newer one.
class ProgressChannel {
public:
  void push(ProgressEvent e);

  std::optional<ProgressEvent> try_pop();
  // Empty on timeout, or once closed and drained.
  std::optional<ProgressEvent> wait_pop(std::chrono::milliseconds timeout);

  void close();
  bool closed();

  // Events replaced before being read.
  uint64_t coalesced();

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::optional<ProgressEvent> latest_;
  uint64_t coalesced_ = 0;
  bool closed_ = false;
};

} // namespace mbt::transfer
