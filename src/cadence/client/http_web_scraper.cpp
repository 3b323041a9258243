#include "cadence/client/http_web_scraper.hpp"

#include "cadence/util/log.hpp"
#include "cadence/util/util.hpp"

#include <format>

namespace cadence {

HttpWebScraper::HttpWebScraper(ScraperConfig config,
                               std::shared_ptr<IHttpTransport> http)
    : config_(std::move(config)), http_(std::move(http)) {
}

auto HttpWebScraper::scrape(const std::string& url,
                            const std::optional<std::string>& selector,
                            std::chrono::milliseconds timeout)
    -> Outcome<nlohmann::json> {
  if (!http_) {
    return failure(Error::MissingDependency, "HTTP transport not configured");
  }

  http::HttpRequest request;
  request.method = http::HttpMethod::GET;
  request.url = url;
  request.headers["Accept"] = "text/html,application/xhtml+xml,*/*";

  auto response = http_->send(request, timeout);
  if (!response) {
    return std::unexpected{std::move(response.error())};
  }
  if (!response->is_success()) {
    return failure(Error::HttpError,
                   std::format("GET {} returned status {}", url, response->status));
  }

  log::debug("Fetched {} ({} bytes)", url, response->body.size());

  nlohmann::json result{
      {"url", url},
      {"status", response->status},
      {"content",
       std::string(truncate(response->body, config_.max_content_bytes))}};
  if (selector) {
    result["selector"] = *selector;
  }
  return result;
}

}  // namespace cadence
