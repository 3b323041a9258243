#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace cadence {

enum class Error : int {
  Success,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  AlreadyClaimed,
  Timeout,
  Cancelled,
  MissingDependency,
  ExecutionFailed,
  HttpError,
  NetworkError,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "file not found",
      "failed to open file",
      "parse error",
      "database error",
      "failed to open database",
      "database query failed",
      "invalid argument",
      "not found",
      "already exists",
      "task is claimed by another worker",
      "timeout",
      "cancelled",
      "missing dependency",
      "execution failed",
      "http error",
      "network error",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "cadence";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace cadence

template <>
struct std::is_error_code_enum<cadence::Error> : std::true_type {};

namespace cadence {

// Failure of a single action or task attempt. The code classifies the
// failure; the message is what ends up in the execution log.
struct ExecutionError {
  std::error_code code;
  std::string message;

  [[nodiscard]] auto is_configuration_error() const noexcept -> bool {
    return code == Error::MissingDependency;
  }

  [[nodiscard]] auto is_store_error() const noexcept -> bool {
    return code == Error::DatabaseError || code == Error::DatabaseOpenFailed ||
           code == Error::DatabaseQueryFailed;
  }
};

template <typename T>
using Outcome = std::expected<T, ExecutionError>;

[[nodiscard]] inline auto failure(Error e, std::string message)
    -> std::unexpected<ExecutionError> {
  return std::unexpected{ExecutionError{make_error_code(e), std::move(message)}};
}

[[nodiscard]] inline auto failure(std::error_code ec, std::string message)
    -> std::unexpected<ExecutionError> {
  return std::unexpected{ExecutionError{ec, std::move(message)}};
}

// Lifts a store error into an execution failure so that it counts toward
// retry exhaustion like any other attempt failure.
[[nodiscard]] inline auto store_failure(std::error_code ec,
                                        std::string_view what)
    -> std::unexpected<ExecutionError> {
  return failure(ec, std::string(what) + ": " + ec.message());
}

struct StringHash {
  using is_transparent = void;

  [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
    return std::hash<std::string_view>{}(sv);
  }

  [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }

  [[nodiscard]] std::size_t operator()(const char* s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace cadence
