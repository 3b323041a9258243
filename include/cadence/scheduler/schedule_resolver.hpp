#pragma once

#include "cadence/core/error.hpp"
#include "cadence/task/task.hpp"
#include "cadence/util/util.hpp"

#include <chrono>
#include <optional>

namespace cadence {

class ITaskStore;

// Turns a task's opaque schedule into its next due instant.
class IScheduleResolver {
public:
  virtual ~IScheduleResolver() = default;

  // Next run strictly after a run finishing at `after`; nullopt when the
  // task should not run again on its own.
  [[nodiscard]] virtual auto next_run(const ScheduledTask& task,
                                      TimePoint after) const
      -> std::optional<TimePoint> = 0;

  // Next run for a task that is being created, updated or resumed.
  [[nodiscard]] virtual auto initial_run(const ScheduledTask& task,
                                         TimePoint now) const
      -> std::optional<TimePoint> = 0;

  // Called once when the worker starts.
  [[nodiscard]] virtual auto initialize(ITaskStore& store, TimePoint now)
      -> Result<void> = 0;
  virtual auto shutdown() -> void = 0;
};

// one-time: `schedule.at` (ISO-8601 string or epoch milliseconds) when
// created, nothing after a run. recurring: a fixed interval from the last
// run. trigger: never self-scheduled.
class DefaultScheduleResolver final : public IScheduleResolver {
public:
  explicit DefaultScheduleResolver(
      std::chrono::milliseconds recurring_interval = std::chrono::minutes(1));

  [[nodiscard]] auto next_run(const ScheduledTask& task, TimePoint after) const
      -> std::optional<TimePoint> override;
  [[nodiscard]] auto initial_run(const ScheduledTask& task, TimePoint now) const
      -> std::optional<TimePoint> override;
  [[nodiscard]] auto initialize(ITaskStore& store, TimePoint now)
      -> Result<void> override;
  auto shutdown() -> void override;

  [[nodiscard]] auto recurring_interval() const noexcept
      -> std::chrono::milliseconds {
    return interval_;
  }

private:
  std::chrono::milliseconds interval_;
};

// Reads `schedule.at`; nullopt when absent or malformed.
[[nodiscard]] auto schedule_at(const nlohmann::json& schedule)
    -> std::optional<TimePoint>;

}  // namespace cadence
