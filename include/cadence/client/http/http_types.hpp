#pragma once

#include "cadence/core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cadence::http {

enum class HttpMethod : std::uint8_t {
  GET,
  POST,
  PUT,
  DELETE,
  PATCH,
  OPTIONS,
  HEAD
};

[[nodiscard]] auto method_name(HttpMethod method) noexcept -> std::string_view;
// Case-insensitive; nullopt for methods the client does not speak.
[[nodiscard]] auto parse_method(std::string_view name) noexcept
    -> std::optional<HttpMethod>;

using HttpHeaders = std::unordered_map<std::string, std::string,
                                       cadence::StringHash, cadence::StringEqual>;

// Absolute http:// or https:// URL split into what the client needs.
struct Url {
  std::string scheme;
  std::string host;
  std::uint16_t port{80};
  std::string target{"/"};

  [[nodiscard]] static auto parse(std::string_view url) -> Result<Url>;
  [[nodiscard]] auto is_tls() const noexcept -> bool {
    return scheme == "https";
  }
  [[nodiscard]] auto host_header() const -> std::string;
};

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string url;
  HttpHeaders headers;
  std::string body;

  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string>;
  // Request head and body for a one-shot connection to `target`.
  [[nodiscard]] auto serialize(const Url& target) const -> std::string;
};

struct HttpResponse {
  int status{0};
  HttpHeaders headers;
  std::string body;

  [[nodiscard]] auto is_success() const noexcept -> bool {
    return status >= 200 && status < 300;
  }
  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string>;
};

}  // namespace cadence::http
