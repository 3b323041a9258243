#pragma once

#include "cadence/client/http/http_types.hpp"

#include <llhttp.h>

#include <memory>
#include <optional>
#include <string_view>

namespace cadence::http {

// Incremental HTTP/1.1 response parser on top of llhttp.
class HttpResponseParser {
public:
  HttpResponseParser();
  ~HttpResponseParser();

  HttpResponseParser(const HttpResponseParser&) = delete;
  auto operator=(const HttpResponseParser&) -> HttpResponseParser& = delete;

  // Feeds bytes; returns the response once the message is complete.
  auto parse(std::string_view data) -> std::optional<HttpResponse>;
  // Signals EOF. Completes responses delimited by connection close.
  auto finish() -> std::optional<HttpResponse>;
  // The request being answered was HEAD, so no body follows the headers.
  auto expect_no_body() -> void;
  auto reset() -> void;

  [[nodiscard]] auto failed() const noexcept -> bool;
  [[nodiscard]] auto headers_done() const noexcept -> bool;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace cadence::http
