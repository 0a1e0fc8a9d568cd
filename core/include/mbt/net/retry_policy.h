#pragma once

#include <chrono>
#include <stop_token>
#include <string>
#include <type_traits>
#include "mbt/common/config.h"
#include "mbt/common/error.h"
#include "mbt/log/logger.h"

namespace mbt::net {

struct RetryConfig {
  int max_retries = 5;
  std::chrono::milliseconds base_delay{2000};
  std::chrono::milliseconds max_delay{120000};
  bool jitter = true;
  double jitter_fraction = 0.10;

  static RetryConfig from(const Config& c);
  Status validate() const;
};

// Bounded exponential backoff around operations returning Result<T>.
// Only Transient errors are retried; every other error is returned as is.
class RetryPolicy {
public:
  explicit RetryPolicy(RetryConfig cfg = {});

  const RetryConfig& config() const { return cfg_; }
  int max_attempts() const { return cfg_.max_retries + 1; }

  // min(max_delay, base_delay * 2^(retry-1)), retry >= 1
  std::chrono::milliseconds backoff(int retry) const;
  // backoff plus up to jitter_fraction of it, never above max_delay
  std::chrono::milliseconds delay_before(int retry) const;

  // op is called as op(attempt) with attempt starting at 1.
  template <typename F>
  std::invoke_result_t<F&, int> execute(const std::string& operation, F&& op,
                                        std::stop_token stop = {}) const;

private:
  // false when stop was requested before the delay elapsed
  bool wait(std::chrono::milliseconds d, std::stop_token stop) const;

  RetryConfig cfg_;
};

template <typename F>
std::invoke_result_t<F&, int> RetryPolicy::execute(const std::string& operation, F&& op,
                                                   std::stop_token stop) const {
  using R = std::invoke_result_t<F&, int>;
  using namespace std::chrono;

  const auto start = steady_clock::now();
  const int attempts = max_attempts();
  std::string last_error;

  for (int attempt = 1; attempt <= attempts; attempt++) {
    if (stop.stop_requested()) return R(Error::cancelled(operation + " cancelled"));

    R r = op(attempt);
    if (r.ok()) {
      if (attempt > 1) {
        Logger::instance().info(operation + " succeeded on attempt " + std::to_string(attempt));
      }
      return r;
    }
    if (!r.error().retryable()) return r;

    last_error = r.error().message;
    if (attempt == attempts) break;

    auto d = delay_before(attempt);
    Logger::instance().warn(operation + " attempt " + std::to_string(attempt) + "/" +
                            std::to_string(attempts) + " failed: " + last_error +
                            "; retrying in " + std::to_string(d.count()) + "ms");
    if (!wait(d, stop)) return R(Error::cancelled(operation + " cancelled during backoff"));
  }

  RetryExhaustion info;
  info.operation = operation;
  info.attempts = attempts;
  info.elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
  info.last_error = last_error;
  Error e = Error::retries_exhausted(std::move(info));
  Logger::instance().error(e.message);
  return R(std::move(e));
}

} // namespace mbt::net
