#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace cadence {

// Phantom type tags for type-safe ID disambiguation
struct TaskTag {};
struct ExecutionTag {};
struct UserTag {};
struct WorkerTag {};
struct WebhookTag {};

template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto c_str() const -> const char* { return value_.c_str(); }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using ExecutionId = TypedId<ExecutionTag>;
using UserId = TypedId<UserTag>;
using WorkerId = TypedId<WorkerTag>;
using WebhookId = TypedId<WebhookTag>;

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace cadence

template <typename Tag>
struct std::hash<cadence::TypedId<Tag>> {
  auto operator()(const cadence::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<cadence::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const cadence::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
