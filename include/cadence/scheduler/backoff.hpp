#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>

namespace cadence {

inline constexpr std::chrono::milliseconds kMaxBackoff{3'600'000};
inline constexpr double kMaxJitter = 0.3;

// min(base * 2^attempt * (1 + jitter), kMaxBackoff). jitter is expected in
// [0, kMaxJitter); values outside are clamped. Saturates instead of
// overflowing for large attempt counts.
[[nodiscard]] auto compute_backoff(int attempt, std::chrono::milliseconds base,
                                   double jitter) noexcept
    -> std::chrono::milliseconds;

// Owns the jitter source. The default draws from a seeded mt19937; tests
// inject a deterministic source.
class BackoffPolicy {
public:
  using JitterSource = std::function<double()>;

  BackoffPolicy();
  explicit BackoffPolicy(JitterSource jitter);

  [[nodiscard]] auto delay(int attempt, std::chrono::milliseconds base)
      -> std::chrono::milliseconds;

private:
  JitterSource jitter_;
};

}  // namespace cadence
