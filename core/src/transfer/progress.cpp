#include "mbt/transfer/progress.h"
#include <utility>

namespace mbt::transfer {

void ProgressChannel::push(ProgressEvent e) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return;
    if (latest_) coalesced_++;
    latest_ = std::move(e);
  }
  cv_.notify_one();
}

std::optional<ProgressEvent> ProgressChannel::try_pop() {
  std::lock_guard<std::mutex> lk(mu_);
  std::optional<ProgressEvent> out;
  out.swap(latest_);
  return out;
}

std::optional<ProgressEvent> ProgressChannel::wait_pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_for(lk, timeout, [this] { return latest_.has_value() || closed_; });
  std::optional<ProgressEvent> out;
  out.swap(latest_);
  return out;
}

void ProgressChannel::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool ProgressChannel::closed() {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

uint64_t ProgressChannel::coalesced() {
  std::lock_guard<std::mutex> lk(mu_);
  return coalesced_;
}

} // namespace mbt::transfer
