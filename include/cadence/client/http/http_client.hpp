#pragma once

#include "cadence/client/http/http_types.hpp"
#include "cadence/executor/collaborators.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace cadence::http {

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds request_timeout{60000};
  std::size_t max_response_size{10 * 1024 * 1024};  // 10MB
  bool verify_peer{true};
  std::string user_agent{"cadence/0.1"};
};

// Blocking HTTP/1.1 client: one connection per request, TLS via OpenSSL for
// https URLs. Safe to share between threads.
class HttpClient final : public IHttpTransport {
public:
  explicit HttpClient(HttpClientConfig config = {});
  ~HttpClient() override;

  HttpClient(const HttpClient&) = delete;
  auto operator=(const HttpClient&) -> HttpClient& = delete;

  [[nodiscard]] auto send(const HttpRequest& request,
                          std::chrono::milliseconds timeout)
      -> Outcome<HttpResponse> override;

  [[nodiscard]] auto get(const std::string& url,
                         std::chrono::milliseconds timeout)
      -> Outcome<HttpResponse>;
  [[nodiscard]] auto post_json(const std::string& url, std::string body,
                               const HttpHeaders& headers,
                               std::chrono::milliseconds timeout)
      -> Outcome<HttpResponse>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace cadence::http
