#include "mbt/net/retry_policy.h"
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <random>

namespace mbt::net {

RetryConfig RetryConfig::from(const Config& c) {
  RetryConfig r;
  r.max_retries = c.max_retries;
  r.base_delay = c.retry_base_delay;
  r.max_delay = c.retry_max_delay;
  r.jitter = c.retry_jitter;
  return r;
}

Status RetryConfig::validate() const {
  if (max_retries < 0) return Error::configuration("max retries must not be negative");
  if (base_delay.count() < 0 || max_delay.count() < 0) return Error::configuration("retry delays must not be negative");
  if (max_delay < base_delay) return Error::configuration("max retry delay is below the base delay");
  if (jitter_fraction < 0.0 || jitter_fraction > 1.0) return Error::configuration("jitter fraction must be within [0, 1]");
  return {};
}

RetryPolicy::RetryPolicy(RetryConfig cfg) : cfg_(cfg) {}

std::chrono::milliseconds RetryPolicy::backoff(int retry) const {
  if (retry < 1) retry = 1;
  auto d = cfg_.base_delay.count();
  const auto cap = cfg_.max_delay.count();
  for (int i = 1; i < retry && d < cap; i++) d *= 2;
  return std::chrono::milliseconds(std::min(d, cap));
}

std::chrono::milliseconds RetryPolicy::delay_before(int retry) const {
  auto d = backoff(retry);
  if (!cfg_.jitter || d.count() == 0) return d;

  thread_local std::mt19937_64 rng{std::random_device{}()};
  auto span = static_cast<long long>(static_cast<double>(d.count()) * cfg_.jitter_fraction);
  if (span <= 0) return d;
  std::uniform_int_distribution<long long> dist(0, span);
  return std::min(d + std::chrono::milliseconds(dist(rng)), cfg_.max_delay);
}

bool RetryPolicy::wait(std::chrono::milliseconds d, std::stop_token stop) const {
  std::mutex m;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lk(m);
  cv.wait_for(lk, stop, d, [] { return false; });
  return !stop.stop_requested();
}

} // namespace mbt::net
