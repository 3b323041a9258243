#pragma once

#include "cadence/config/system_config.hpp"
#include "cadence/executor/collaborators.hpp"

#include <memory>

namespace cadence {

// Fetches a page and returns {url, status, content, selector?}, with content
// cut to the configured size. Selector extraction is left to downstream
// consumers; the selector is echoed back unchanged.
class HttpWebScraper final : public IWebScraper {
public:
  HttpWebScraper(ScraperConfig config, std::shared_ptr<IHttpTransport> http);

  [[nodiscard]] auto scrape(const std::string& url,
                            const std::optional<std::string>& selector,
                            std::chrono::milliseconds timeout)
      -> Outcome<nlohmann::json> override;

private:
  ScraperConfig config_;
  std::shared_ptr<IHttpTransport> http_;
};

}  // namespace cadence
