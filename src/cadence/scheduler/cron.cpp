#include "cadence/scheduler/cron.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <ctime>
#include <optional>
#include <ranges>
#include <utility>
#include <vector>

namespace cadence {
namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kMacros{{
    {"@yearly", "0 0 1 1 *"},
    {"@annually", "0 0 1 1 *"},
    {"@monthly", "0 0 1 * *"},
    {"@weekly", "0 0 * * 0"},
    {"@daily", "0 0 * * *"},
    {"@hourly", "0 * * * *"},
}};

constexpr std::array<std::string_view, 12> kMonthNames{
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};

constexpr std::array<std::string_view, 7> kDowNames{"sun", "mon", "tue", "wed",
                                                    "thu", "fri", "sat"};

constexpr auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

auto trim(std::string_view s) -> std::string_view {
  auto start = std::ranges::find_if_not(s, is_space);
  auto end = std::ranges::find_if_not(s | std::views::reverse, is_space);
  if (start == s.end())
    return {};
  return {start, end.base()};
}

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
  if (a.size() != b.size())
    return false;
  for (auto [ca, cb] : std::views::zip(a, b)) {
    if (std::tolower(static_cast<unsigned char>(ca)) !=
        std::tolower(static_cast<unsigned char>(cb))) {
      return false;
    }
  }
  return true;
}

// Empty pieces are kept so that "1,,2" is rejected.
auto split(std::string_view s, char delim) -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    auto end = s.find(delim, start);
    if (end == std::string_view::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, end - start));
    start = end + 1;
  }
}

auto tokens_of(std::string_view s) -> std::vector<std::string_view> {
  std::vector<std::string_view> tokens;
  for (auto part : split(s, ' ')) {
    if (auto t = trim(part); !t.empty()) {
      tokens.push_back(t);
    }
  }
  return tokens;
}

auto parse_int(std::string_view s) -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec == std::errc{} && ptr == s.data() + s.size()) {
    return value;
  }
  return std::nullopt;
}

template <std::size_t N>
auto index_of(const std::array<std::string_view, N>& names, std::string_view s)
    -> std::optional<int> {
  for (auto [i, name] : std::views::enumerate(names)) {
    if (iequals(s, name)) {
      return static_cast<int>(i);
    }
  }
  return std::nullopt;
}

enum class FieldKind : std::uint8_t {
  Plain,
  Month,
  Weekday,
};

struct FieldSpec {
  int min_val;
  int max_val;
  FieldKind kind{FieldKind::Plain};
};

auto parse_value(std::string_view s, FieldKind kind) -> std::optional<int> {
  if (auto v = parse_int(s)) {
    return v;
  }
  switch (kind) {
    case FieldKind::Month:
      if (auto v = index_of(kMonthNames, s)) {
        return *v + 1;
      }
      break;
    case FieldKind::Weekday:
      return index_of(kDowNames, s);
    case FieldKind::Plain:
      break;
  }
  return std::nullopt;
}

// Sets every value the field selects. Weekday 7 is Sunday.
template <std::size_t N>
auto parse_field(std::string_view field, const FieldSpec& spec,
                 std::bitset<N>& bits, bool& restricted) -> bool {
  bits.reset();
  restricted = true;
  const bool weekday = spec.kind == FieldKind::Weekday;
  const int upper = weekday ? 7 : spec.max_val;

  for (auto part : split(field, ',')) {
    part = trim(part);
    if (part.empty())
      return false;

    int step = 1;
    if (auto slash = part.find('/'); slash != std::string_view::npos) {
      auto step_opt = parse_int(part.substr(slash + 1));
      if (!step_opt || *step_opt <= 0)
        return false;
      step = *step_opt;
      part = part.substr(0, slash);
    }

    int start = 0;
    int end = 0;
    if (part == "*" || part == "?") {
      start = spec.min_val;
      end = spec.max_val;
      if (step == 1)
        restricted = false;
    } else if (auto dash = part.find('-'); dash != std::string_view::npos) {
      auto a = parse_value(trim(part.substr(0, dash)), spec.kind);
      auto b = parse_value(trim(part.substr(dash + 1)), spec.kind);
      if (!a || !b)
        return false;
      start = *a;
      end = *b;
    } else {
      auto v = parse_value(part, spec.kind);
      if (!v)
        return false;
      start = end = *v;
    }

    if (start < spec.min_val || end > upper || start > end)
      return false;
    for (int v = start; v <= end; v += step) {
      bits.set(static_cast<std::size_t>(weekday && v == 7 ? 0 : v));
    }
  }
  return bits.any();
}

}  // namespace

CronExpr::CronExpr(std::string raw, Fields fields)
    : raw_(std::move(raw)), fields_(std::move(fields)) {
}

auto CronExpr::parse(std::string_view expr) -> Result<CronExpr> {
  auto trimmed = trim(expr);
  if (trimmed.empty())
    return fail(Error::ParseError);

  std::string_view to_parse = trimmed;
  if (trimmed.front() == '@') {
    auto macro = std::ranges::find_if(
        kMacros, [&](const auto& m) { return iequals(trimmed, m.first); });
    if (macro == kMacros.end())
      return fail(Error::ParseError);
    to_parse = macro->second;
  }

  auto tokens = tokens_of(to_parse);
  if (tokens.size() != 5)
    return fail(Error::ParseError);

  Fields f{};
  bool unused = false;
  if (!parse_field(tokens[0], {0, 59}, f.minute, unused) ||
      !parse_field(tokens[1], {0, 23}, f.hour, unused) ||
      !parse_field(tokens[2], {1, 31}, f.dom, f.dom_restricted) ||
      !parse_field(tokens[3], {1, 12, FieldKind::Month}, f.month, unused) ||
      !parse_field(tokens[4], {0, 6, FieldKind::Weekday}, f.dow,
                   f.dow_restricted)) {
    return fail(Error::ParseError);
  }

  return ok(CronExpr(std::string(trimmed), std::move(f)));
}

auto CronExpr::matches(TimePoint tp) const -> bool {
  auto t = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);

  if (!fields_.minute.test(static_cast<std::size_t>(tm.tm_min)) ||
      !fields_.hour.test(static_cast<std::size_t>(tm.tm_hour)) ||
      !fields_.month.test(static_cast<std::size_t>(tm.tm_mon + 1))) {
    return false;
  }

  bool dom_ok = fields_.dom.test(static_cast<std::size_t>(tm.tm_mday));
  bool dow_ok = fields_.dow.test(static_cast<std::size_t>(tm.tm_wday));
  // Standard cron: when both day fields are restricted either may match.
  if (fields_.dom_restricted && fields_.dow_restricted)
    return dom_ok || dow_ok;
  if (fields_.dom_restricted)
    return dom_ok;
  if (fields_.dow_restricted)
    return dow_ok;
  return true;
}

}  // namespace cadence
