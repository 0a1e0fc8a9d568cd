#pragma once

#include <chrono>
#include <memory>
#include <stop_token>
#include "mbt/common/error.h"
#include "mbt/transfer/types.h"

namespace mbt::transfer {

// One sender-side connection to a receiver. A channel remembers the request
// passed to open() and re-sends it after reconnecting, so send_chunk() and
// finalize() may be retried on the same channel after a transient failure.
// Transport failures are Transient errors; a request the receiver answered
// is returned as a value even when it reports failure.
class ChunkChannel {
public:
  virtual ~ChunkChannel() = default;

  virtual Result<TransferResponse> open(const TransferRequest& req,
                                        std::chrono::milliseconds timeout,
                                        std::stop_token stop) = 0;
  virtual Result<ChunkResult> send_chunk(const ChunkData& chunk,
                                         std::chrono::milliseconds timeout,
                                         std::stop_token stop) = 0;
  virtual Result<ReceiveResult> finalize(const FinalizeRequest& req,
                                         std::chrono::milliseconds timeout,
                                         std::stop_token stop) = 0;
  virtual void close() = 0;
};

class ChannelFactory {
public:
  virtual ~ChannelFactory() = default;
  virtual std::unique_ptr<ChunkChannel> create() = 0;
};

} // namespace mbt::transfer
