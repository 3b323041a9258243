#include "cadence/client/anthropic_client.hpp"

#include "cadence/util/log.hpp"
#include "cadence/util/util.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace cadence {

namespace {

using json = nlohmann::json;

constexpr std::string_view kApiVersion = "2023-06-01";
constexpr std::size_t kErrorExcerpt = 300;

auto status_failure(const http::HttpResponse& response)
    -> std::unexpected<ExecutionError> {
  std::string detail{truncate(response.body, kErrorExcerpt)};
  auto body = json::parse(response.body, nullptr, false);
  if (!body.is_discarded() && body.contains("error") &&
      body["error"].is_object()) {
    detail = body["error"].value("message", detail);
  }

  if (response.status == 401 || response.status == 403) {
    return failure(Error::HttpError,
                   std::format("authentication failed ({}): {}",
                               response.status, detail));
  }
  if (response.status == 429) {
    return failure(Error::HttpError,
                   std::format("rate limited (429): {}", detail));
  }
  return failure(Error::HttpError,
                 std::format("API error ({}): {}", response.status, detail));
}

}  // namespace

AnthropicClient::AnthropicClient(std::string api_key, LlmConfig config,
                                 std::shared_ptr<IHttpTransport> http)
    : api_key_(std::move(api_key)), config_(std::move(config)),
      http_(std::move(http)) {
  while (!config_.base_url.empty() && config_.base_url.back() == '/') {
    config_.base_url.pop_back();
  }
}

auto AnthropicClient::messages_url() const -> std::string {
  return config_.base_url + "/v1/messages";
}

auto AnthropicClient::complete(const CompletionRequest& request,
                               std::chrono::milliseconds timeout)
    -> Outcome<Completion> {
  if (api_key_.empty()) {
    return failure(Error::MissingDependency,
                   std::format("missing API key (set {})", config_.api_key_env));
  }
  if (!http_) {
    return failure(Error::MissingDependency, "HTTP transport not configured");
  }

  json body{{"model", request.model},
            {"max_tokens", request.max_tokens},
            {"messages",
             json::array({json{{"role", "user"}, {"content", request.prompt}}})}};

  http::HttpRequest req;
  req.method = http::HttpMethod::POST;
  req.url = messages_url();
  req.headers["Content-Type"] = "application/json";
  req.headers["anthropic-version"] = std::string(kApiVersion);
  req.headers["x-api-key"] = api_key_;
  req.body = body.dump();

  log::debug("POST {} model={} max_tokens={}", req.url, request.model,
             request.max_tokens);

  auto response = http_->send(req, timeout);
  if (!response) {
    return std::unexpected{std::move(response.error())};
  }
  if (!response->is_success()) {
    return status_failure(*response);
  }
  return parse_completion(response->body);
}

auto parse_completion(const std::string& body) -> Outcome<Completion> {
  auto parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return failure(Error::ParseError, "invalid JSON in completion response");
  }

  Completion completion;
  completion.model = parsed.value("model", std::string{});
  completion.usage = parsed.value("usage", json::object());

  auto content = parsed.find("content");
  if (content == parsed.end() || !content->is_array()) {
    return failure(Error::ParseError, "completion response has no content");
  }
  if (!content->empty()) {
    const auto& first = content->front();
    if (first.is_object() && first.value("type", "") == "text" &&
        first.contains("text") && first["text"].is_string()) {
      completion.text = first["text"].get<std::string>();
    }
  }
  return completion;
}

}  // namespace cadence
