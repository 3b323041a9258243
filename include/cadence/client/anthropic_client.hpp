#pragma once

#include "cadence/config/system_config.hpp"
#include "cadence/executor/collaborators.hpp"

#include <memory>
#include <string>

namespace cadence {

// ILlmClient over the Anthropic Messages API.
class AnthropicClient final : public ILlmClient {
public:
  AnthropicClient(std::string api_key, LlmConfig config,
                  std::shared_ptr<IHttpTransport> http);

  [[nodiscard]] auto complete(const CompletionRequest& request,
                              std::chrono::milliseconds timeout)
      -> Outcome<Completion> override;

  [[nodiscard]] auto messages_url() const -> std::string;

private:
  std::string api_key_;
  LlmConfig config_;
  std::shared_ptr<IHttpTransport> http_;
};

// Decodes a Messages API response body. Only the first content block is
// considered; when it is not a text block the completion carries no text.
[[nodiscard]] auto parse_completion(const std::string& body) -> Outcome<Completion>;

}  // namespace cadence
