#pragma once

#include "cadence/client/http/http_types.hpp"
#include "cadence/core/error.hpp"
#include "cadence/task/action.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace cadence {

// Capabilities the action handlers delegate to. Every call receives the time
// left in the dispatch budget and must not block past it.

struct CompletionRequest {
  std::string model;
  std::string prompt;
  int max_tokens{4096};
};

struct Completion {
  // nullopt when the first content block is not text
  std::optional<std::string> text;
  std::string model;
  nlohmann::json usage;
};

class ILlmClient {
public:
  virtual ~ILlmClient() = default;
  [[nodiscard]] virtual auto complete(const CompletionRequest& request,
                                      std::chrono::milliseconds timeout)
      -> Outcome<Completion> = 0;
};

struct EmailMessage {
  std::string to;
  std::string subject;
  std::string body;
};

class IEmailSender {
public:
  virtual ~IEmailSender() = default;
  [[nodiscard]] virtual auto send(const EmailMessage& message,
                                  std::chrono::milliseconds timeout)
      -> Outcome<void> = 0;
};

struct CodeOutput {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code{0};
};

class ICodeSandbox {
public:
  virtual ~ICodeSandbox() = default;
  [[nodiscard]] virtual auto run(CodeLanguage language, const std::string& code,
                                 std::chrono::milliseconds timeout)
      -> Outcome<CodeOutput> = 0;
};

// Returns {items?: [...], content?: "..."}
class IWebScraper {
public:
  virtual ~IWebScraper() = default;
  [[nodiscard]] virtual auto scrape(const std::string& url,
                                    const std::optional<std::string>& selector,
                                    std::chrono::milliseconds timeout)
      -> Outcome<nlohmann::json> = 0;
};

class IWorkspaceClient {
public:
  virtual ~IWorkspaceClient() = default;
  [[nodiscard]] virtual auto execute(const std::string& service,
                                     const std::string& action,
                                     const nlohmann::json& params,
                                     std::chrono::milliseconds timeout)
      -> Outcome<nlohmann::json> = 0;
};

class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;
  [[nodiscard]] virtual auto send(const http::HttpRequest& request,
                                  std::chrono::milliseconds timeout)
      -> Outcome<http::HttpResponse> = 0;
};

// Resolved once when the executor is built. A null member means the
// capability is not configured.
struct Collaborators {
  std::shared_ptr<ILlmClient> llm;
  std::shared_ptr<IEmailSender> email;
  std::shared_ptr<ICodeSandbox> sandbox;
  std::shared_ptr<IWebScraper> scraper;
  std::shared_ptr<IWorkspaceClient> workspace;
  std::shared_ptr<IHttpTransport> http;
};

}  // namespace cadence
