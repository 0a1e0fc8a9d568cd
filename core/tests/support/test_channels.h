#pragma once
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <vector>
#include "mbt/transfer/chunk_channel.h"
#include "mbt/transfer/chunk_receiver.h"

namespace mbt::test {

// Faults injected into, and observations from, every channel of a factory.
struct FaultPlan {
  std::mutex mu;

  int transient_failures = 0;             // fail this many send attempts, then recover
  bool network_down = false;              // every send and handshake fails transiently
  std::optional<uint32_t> corrupt_chunk;  // flip a byte of this chunk before delivery
  std::optional<size_t> stop_after;       // request stop once this many chunks were delivered
  std::stop_source* stop = nullptr;
  bool hide_completion = false;           // drop is_complete from acks
  std::optional<uint32_t> fail_chunk;     // every send of this chunk fails transiently
  bool hold = false;                      // park every send until cleared
  bool holding = false;                   // set once a send is parked
  std::condition_variable cv;

  int opens = 0;
  int finalizes = 0;
  int send_attempts = 0;
  std::vector<uint32_t> delivered;        // indices accepted by the receiver, in order
};

// Calls the receiver in-process; no sockets.
class LoopbackChannel : public transfer::ChunkChannel {
public:
  LoopbackChannel(transfer::ChunkReceiver& receiver, FaultPlan& plan) : receiver_(receiver), plan_(plan) {}

  Result<transfer::TransferResponse> open(const transfer::TransferRequest& req,
                                          std::chrono::milliseconds timeout, std::stop_token stop) override;
  Result<transfer::ChunkResult> send_chunk(const transfer::ChunkData& chunk,
                                           std::chrono::milliseconds timeout, std::stop_token stop) override;
  Result<transfer::ReceiveResult> finalize(const transfer::FinalizeRequest& req,
                                           std::chrono::milliseconds timeout, std::stop_token stop) override;
  void close() override {}

private:
  transfer::ChunkReceiver& receiver_;
  FaultPlan& plan_;
};

class LoopbackFactory : public transfer::ChannelFactory {
public:
  LoopbackFactory(transfer::ChunkReceiver& receiver, FaultPlan& plan) : receiver_(receiver), plan_(plan) {}
  std::unique_ptr<transfer::ChunkChannel> create() override {
    return std::make_unique<LoopbackChannel>(receiver_, plan_);
  }

private:
  transfer::ChunkReceiver& receiver_;
  FaultPlan& plan_;
};

} // namespace mbt::test
