#pragma once

#include "cadence/core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cadence {

enum class CodeLanguage : std::uint8_t {
  Python,
  JavaScript,
};

[[nodiscard]] constexpr auto code_language_name(CodeLanguage lang) noexcept
    -> std::string_view {
  switch (lang) {
    case CodeLanguage::Python: return "python";
    case CodeLanguage::JavaScript: return "javascript";
  }
  return "python";
}

struct AiPromptAction {
  std::string prompt;
  std::optional<std::string> model;
};

struct SendEmailAction {
  std::string to;
  std::string subject;
  std::string body;
};

struct WebhookAction {
  std::string url;
  std::string method{"POST"};
  std::map<std::string, std::string> headers;
  std::optional<nlohmann::json> body;
};

struct RunCodeAction {
  CodeLanguage language{CodeLanguage::Python};
  std::string code;
};

struct GenerateReportAction {
  nlohmann::json config;
};

struct WebScrapeAction {
  std::string url;
  std::optional<std::string> selector;
};

struct FileOperationAction {
  std::string operation;
  std::string path;
};

struct GoogleWorkspaceAction {
  std::string service;
  std::string action;
  nlohmann::json params;
};

struct TaskAction;

struct ChainAction {
  std::vector<TaskAction> tasks;
};

// Closed set of work a task can perform. Only ChainAction nests.
struct TaskAction {
  using Kind = std::variant<AiPromptAction, SendEmailAction, WebhookAction,
                            RunCodeAction, GenerateReportAction, ChainAction,
                            WebScrapeAction, FileOperationAction,
                            GoogleWorkspaceAction>;

  Kind kind;

  TaskAction() = default;

  template <typename T>
    requires(!std::is_same_v<std::remove_cvref_t<T>, TaskAction> &&
             std::is_constructible_v<Kind, T &&>)
  TaskAction(T&& action) : kind(std::forward<T>(action)) {}  // NOLINT

  // Wire name, e.g. "ai-prompt"
  [[nodiscard]] auto type_name() const -> std::string_view;

  template <typename T>
  [[nodiscard]] auto is() const noexcept -> bool {
    return std::holds_alternative<T>(kind);
  }
};

// {"type": "<kebab-name>", ...fields}. Unknown types and missing required
// fields are Error::ParseError.
[[nodiscard]] auto action_from_json(const nlohmann::json& j)
    -> Result<TaskAction>;
[[nodiscard]] auto action_to_json(const TaskAction& action) -> nlohmann::json;

}  // namespace cadence
