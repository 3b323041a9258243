#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace cadence {

class CancellationToken;

class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;
  auto cancel() noexcept -> void {
    state_->cancelled.store(true, std::memory_order_release);
  }
  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return !is_cancelled();
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

// Per-dispatch execution bound: a deadline plus the owning worker's
// cancellation token. Handlers pass remaining() to their collaborators.
class ExecutionContext {
public:
  using Clock = std::chrono::steady_clock;

  ExecutionContext() = default;
  ExecutionContext(std::chrono::milliseconds budget, CancellationToken token)
      : deadline_(Clock::now() + budget), token_(std::move(token)) {
  }

  [[nodiscard]] static auto unbounded() -> ExecutionContext {
    return {};
  }

  [[nodiscard]] auto expired() const noexcept -> bool {
    return deadline_ != Clock::time_point::max() && Clock::now() >= deadline_;
  }

  [[nodiscard]] auto cancelled() const noexcept -> bool {
    return token_.is_cancelled();
  }

  [[nodiscard]] auto remaining() const noexcept -> std::chrono::milliseconds {
    if (deadline_ == Clock::time_point::max()) {
      return std::chrono::milliseconds::max();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline_ - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds{0};
  }

private:
  Clock::time_point deadline_{Clock::time_point::max()};
  CancellationToken token_;
};

}  // namespace cadence
