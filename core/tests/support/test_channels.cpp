#include "support/test_channels.h"

namespace mbt::test {

Result<transfer::TransferResponse> LoopbackChannel::open(const transfer::TransferRequest& req,
                                                         std::chrono::milliseconds, std::stop_token stop) {
  {
    std::lock_guard<std::mutex> lk(plan_.mu);
    plan_.opens++;
    if (plan_.network_down) return Error::transient("connection refused");
  }
  if (stop.stop_requested()) return Error::cancelled("open cancelled");
  return receiver_.begin(req);
}

Result<transfer::ChunkResult> LoopbackChannel::send_chunk(const transfer::ChunkData& chunk,
                                                          std::chrono::milliseconds, std::stop_token stop) {
  transfer::ChunkData delivered = chunk;
  {
    std::unique_lock<std::mutex> lk(plan_.mu);
    if (plan_.hold) {
      plan_.holding = true;
      plan_.cv.notify_all();
      plan_.cv.wait(lk, [this] { return !plan_.hold; });
    }
    plan_.send_attempts++;
    if (plan_.network_down) return Error::transient("connection reset");
    if (plan_.fail_chunk && *plan_.fail_chunk == chunk.chunk_index) return Error::transient("connection reset");
    if (plan_.transient_failures > 0) {
      plan_.transient_failures--;
      return Error::transient("connection reset");
    }
    if (plan_.corrupt_chunk && *plan_.corrupt_chunk == chunk.chunk_index && !delivered.data.empty()) {
      delivered.data[0] ^= 0xFF;
    }
  }
  if (stop.stop_requested()) return Error::cancelled("send cancelled");

  auto r = receiver_.receive_chunk(delivered);

  std::lock_guard<std::mutex> lk(plan_.mu);
  if (r.success) {
    plan_.delivered.push_back(chunk.chunk_index);
    if (plan_.hide_completion) r.is_complete = false;
    if (plan_.stop && plan_.stop_after && plan_.delivered.size() == *plan_.stop_after) plan_.stop->request_stop();
  }
  return r;
}

Result<transfer::ReceiveResult> LoopbackChannel::finalize(const transfer::FinalizeRequest& req,
                                                          std::chrono::milliseconds, std::stop_token) {
  {
    std::lock_guard<std::mutex> lk(plan_.mu);
    plan_.finalizes++;
    if (plan_.network_down) return Error::transient("connection reset");
  }
  return receiver_.finalize(req);
}

} // namespace mbt::test
