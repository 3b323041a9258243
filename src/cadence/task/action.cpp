#include "cadence/task/action.hpp"

#include "cadence/util/log.hpp"

namespace cadence {

namespace {

using json = nlohmann::json;

template <typename>
inline constexpr bool always_false = false;

auto required_string(const json& j, const char* key)
    -> Result<std::string> {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    log::warn("Action field '{}' is missing or not a string", key);
    return fail(Error::ParseError);
  }
  return it->get<std::string>();
}

auto optional_string(const json& j, const char* key)
    -> std::optional<std::string> {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

auto optional_value(const json& j, const char* key) -> json {
  auto it = j.find(key);
  return it == j.end() ? json() : *it;
}

auto parse_language(std::string_view name) -> Result<CodeLanguage> {
  if (name == "python") return CodeLanguage::Python;
  if (name == "javascript") return CodeLanguage::JavaScript;
  log::warn("Unsupported code language: {}", name);
  return fail(Error::ParseError);
}

}  // namespace

auto TaskAction::type_name() const -> std::string_view {
  return std::visit(
      [](const auto& a) -> std::string_view {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, AiPromptAction>) {
          return "ai-prompt";
        } else if constexpr (std::is_same_v<T, SendEmailAction>) {
          return "send-email";
        } else if constexpr (std::is_same_v<T, WebhookAction>) {
          return "webhook";
        } else if constexpr (std::is_same_v<T, RunCodeAction>) {
          return "run-code";
        } else if constexpr (std::is_same_v<T, GenerateReportAction>) {
          return "generate-report";
        } else if constexpr (std::is_same_v<T, ChainAction>) {
          return "chain";
        } else if constexpr (std::is_same_v<T, WebScrapeAction>) {
          return "web-scrape";
        } else if constexpr (std::is_same_v<T, FileOperationAction>) {
          return "file-operation";
        } else if constexpr (std::is_same_v<T, GoogleWorkspaceAction>) {
          return "google-workspace";
        } else {
          static_assert(always_false<T>, "unhandled action type");
        }
      },
      kind);
}

auto action_from_json(const json& j) -> Result<TaskAction> {
  if (!j.is_object()) {
    log::warn("Action must be a JSON object");
    return fail(Error::ParseError);
  }
  auto type = required_string(j, "type");
  if (!type) {
    return fail(type.error());
  }

  if (*type == "ai-prompt") {
    auto prompt = required_string(j, "prompt");
    if (!prompt) return fail(prompt.error());
    return TaskAction{AiPromptAction{std::move(*prompt), optional_string(j, "model")}};
  }

  if (*type == "send-email") {
    auto to = required_string(j, "to");
    auto subject = required_string(j, "subject");
    auto body = required_string(j, "body");
    if (!to || !subject || !body) return fail(Error::ParseError);
    return TaskAction{
        SendEmailAction{std::move(*to), std::move(*subject), std::move(*body)}};
  }

  if (*type == "webhook") {
    auto url = required_string(j, "url");
    if (!url) return fail(url.error());
    WebhookAction action;
    action.url = std::move(*url);
    action.method = optional_string(j, "method").value_or("POST");
    if (auto it = j.find("headers"); it != j.end() && it->is_object()) {
      for (const auto& [name, value] : it->items()) {
        action.headers[name] =
            value.is_string() ? value.get<std::string>() : value.dump();
      }
    }
    if (auto it = j.find("body"); it != j.end() && !it->is_null()) {
      action.body = *it;
    }
    return TaskAction{std::move(action)};
  }

  if (*type == "run-code") {
    auto language = required_string(j, "language");
    auto code = required_string(j, "code");
    if (!language || !code) return fail(Error::ParseError);
    auto lang = parse_language(*language);
    if (!lang) return fail(lang.error());
    return TaskAction{RunCodeAction{*lang, std::move(*code)}};
  }

  if (*type == "generate-report") {
    return TaskAction{GenerateReportAction{optional_value(j, "config")}};
  }

  if (*type == "chain") {
    auto it = j.find("tasks");
    if (it == j.end() || !it->is_array()) {
      log::warn("Chain action requires a 'tasks' array");
      return fail(Error::ParseError);
    }
    ChainAction chain;
    chain.tasks.reserve(it->size());
    for (const auto& step : *it) {
      auto parsed = action_from_json(step);
      if (!parsed) return fail(parsed.error());
      chain.tasks.push_back(std::move(*parsed));
    }
    return TaskAction{std::move(chain)};
  }

  if (*type == "web-scrape") {
    auto url = required_string(j, "url");
    if (!url) return fail(url.error());
    return TaskAction{WebScrapeAction{std::move(*url), optional_string(j, "selector")}};
  }

  if (*type == "file-operation") {
    auto operation = required_string(j, "operation");
    auto path = required_string(j, "path");
    if (!operation || !path) return fail(Error::ParseError);
    return TaskAction{FileOperationAction{std::move(*operation), std::move(*path)}};
  }

  if (*type == "google-workspace") {
    auto service = required_string(j, "service");
    auto action = required_string(j, "action");
    if (!service || !action) return fail(Error::ParseError);
    return TaskAction{GoogleWorkspaceAction{std::move(*service), std::move(*action),
                                            optional_value(j, "params")}};
  }

  log::warn("Unknown action type: {}", *type);
  return fail(Error::ParseError);
}

auto action_to_json(const TaskAction& action) -> json {
  json j = std::visit(
      [](const auto& a) -> json {
        using T = std::decay_t<decltype(a)>;
        json out = json::object();
        if constexpr (std::is_same_v<T, AiPromptAction>) {
          out["prompt"] = a.prompt;
          if (a.model) out["model"] = *a.model;
        } else if constexpr (std::is_same_v<T, SendEmailAction>) {
          out["to"] = a.to;
          out["subject"] = a.subject;
          out["body"] = a.body;
        } else if constexpr (std::is_same_v<T, WebhookAction>) {
          out["url"] = a.url;
          out["method"] = a.method;
          if (!a.headers.empty()) out["headers"] = a.headers;
          if (a.body) out["body"] = *a.body;
        } else if constexpr (std::is_same_v<T, RunCodeAction>) {
          out["language"] = std::string(code_language_name(a.language));
          out["code"] = a.code;
        } else if constexpr (std::is_same_v<T, GenerateReportAction>) {
          out["config"] = a.config;
        } else if constexpr (std::is_same_v<T, ChainAction>) {
          json tasks = json::array();
          for (const auto& step : a.tasks) {
            tasks.push_back(action_to_json(step));
          }
          out["tasks"] = std::move(tasks);
        } else if constexpr (std::is_same_v<T, WebScrapeAction>) {
          out["url"] = a.url;
          if (a.selector) out["selector"] = *a.selector;
        } else if constexpr (std::is_same_v<T, FileOperationAction>) {
          out["operation"] = a.operation;
          out["path"] = a.path;
        } else if constexpr (std::is_same_v<T, GoogleWorkspaceAction>) {
          out["service"] = a.service;
          out["action"] = a.action;
          out["params"] = a.params;
        }
        return out;
      },
      action.kind);
  j["type"] = std::string(action.type_name());
  return j;
}

}  // namespace cadence
