#include "cadence/scheduler/backoff.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>

namespace cadence {

auto compute_backoff(int attempt, std::chrono::milliseconds base,
                     double jitter) noexcept -> std::chrono::milliseconds {
  if (base.count() <= 0) {
    return std::chrono::milliseconds{0};
  }
  attempt = std::max(attempt, 0);
  jitter = std::clamp(jitter, 0.0, kMaxJitter);

  // 2^64 already exceeds any representable cap, so larger exponents only
  // risk inf arithmetic.
  auto exponent = std::min(attempt, 64);
  double raw = std::ldexp(static_cast<double>(base.count()), exponent) *
               (1.0 + jitter);
  auto cap = static_cast<double>(kMaxBackoff.count());
  if (!(raw < cap)) {
    return kMaxBackoff;
  }
  return std::chrono::milliseconds{static_cast<std::int64_t>(raw)};
}

BackoffPolicy::BackoffPolicy() {
  auto state = std::make_shared<std::pair<std::mutex, std::mt19937_64>>();
  state->second.seed(std::random_device{}());
  jitter_ = [state] {
    std::lock_guard lock(state->first);
    std::uniform_real_distribution<double> dist(0.0, kMaxJitter);
    return dist(state->second);
  };
}

BackoffPolicy::BackoffPolicy(JitterSource jitter) : jitter_(std::move(jitter)) {
}

auto BackoffPolicy::delay(int attempt, std::chrono::milliseconds base)
    -> std::chrono::milliseconds {
  return compute_backoff(attempt, base, jitter_ ? jitter_() : 0.0);
}

}  // namespace cadence
