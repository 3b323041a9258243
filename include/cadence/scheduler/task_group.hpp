#pragma once

#include "cadence/core/error.hpp"

#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cadence {

// Fan-out of independent jobs, one thread each. Every job's outcome is
// captured exactly once in its own slot; a failing job never cancels or
// affects its siblings. wait() returns outcomes in spawn order.
template <typename T>
class TaskGroup {
public:
  using Job = std::move_only_function<Outcome<T>()>;

  TaskGroup() = default;
  ~TaskGroup() {
    join_all();
  }

  TaskGroup(const TaskGroup&) = delete;
  auto operator=(const TaskGroup&) -> TaskGroup& = delete;

  auto spawn(Job job) -> void {
    // deque keeps earlier slots in place while later ones are added
    auto& slot = slots_.emplace_back();
    threads_.emplace_back([&slot, job = std::move(job)]() mutable {
      try {
        slot = job();
      } catch (const std::exception& e) {
        slot = Outcome<T>{failure(Error::ExecutionFailed, e.what())};
      }
    });
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return slots_.size();
  }

  [[nodiscard]] auto wait() -> std::vector<Outcome<T>> {
    join_all();
    std::vector<Outcome<T>> outcomes;
    outcomes.reserve(slots_.size());
    for (auto& slot : slots_) {
      if (slot) {
        outcomes.push_back(std::move(*slot));
      } else {
        outcomes.push_back(failure(Error::Unknown, "job produced no outcome"));
      }
    }
    slots_.clear();
    return outcomes;
  }

private:
  auto join_all() -> void {
    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    threads_.clear();
  }

  std::deque<std::optional<Outcome<T>>> slots_;
  std::vector<std::jthread> threads_;
};

}  // namespace cadence
