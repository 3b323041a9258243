#pragma once

#include "cadence/core/error.hpp"
#include "cadence/util/util.hpp"

#include <bitset>
#include <string>
#include <string_view>

namespace cadence {

// Five-field cron expression: minute hour day-of-month month day-of-week.
// Fields take `*`, lists, ranges, `/step`, and month or weekday names; the
// @yearly..@hourly macros expand to their usual forms. Times are UTC.
class CronExpr {
public:
  CronExpr() = default;

  // Error::ParseError for anything that is not a valid expression.
  [[nodiscard]] static auto parse(std::string_view expr) -> Result<CronExpr>;

  // True when the minute containing `tp` is one the expression fires on.
  [[nodiscard]] auto matches(TimePoint tp) const -> bool;

  [[nodiscard]] auto raw() const noexcept -> std::string_view {
    return raw_;
  }

private:
  struct Fields {
    std::bitset<60> minute;
    std::bitset<24> hour;
    std::bitset<32> dom;
    std::bitset<13> month;
    std::bitset<7> dow;
    bool dom_restricted{false};
    bool dow_restricted{false};
  };

  CronExpr(std::string raw, Fields fields);

  std::string raw_;
  Fields fields_;
};

}  // namespace cadence
