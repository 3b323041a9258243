#include "cadence/client/http/http_types.hpp"

#include "cadence/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <iterator>

namespace cadence::http {

namespace {

auto iequals(std::string_view a, std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

auto find_header(const HttpHeaders& headers, std::string_view key)
    -> std::optional<std::string> {
  if (auto it = headers.find(key); it != headers.end()) {
    return it->second;
  }
  for (const auto& [name, value] : headers) {
    if (iequals(name, key)) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace

auto method_name(HttpMethod method) noexcept -> std::string_view {
  switch (method) {
    case HttpMethod::GET: return "GET";
    case HttpMethod::POST: return "POST";
    case HttpMethod::PUT: return "PUT";
    case HttpMethod::DELETE: return "DELETE";
    case HttpMethod::PATCH: return "PATCH";
    case HttpMethod::OPTIONS: return "OPTIONS";
    case HttpMethod::HEAD: return "HEAD";
  }
  return "GET";
}

auto parse_method(std::string_view name) noexcept -> std::optional<HttpMethod> {
  for (auto m : {HttpMethod::GET, HttpMethod::POST, HttpMethod::PUT,
                 HttpMethod::DELETE, HttpMethod::PATCH, HttpMethod::OPTIONS,
                 HttpMethod::HEAD}) {
    if (iequals(method_name(m), name)) {
      return m;
    }
  }
  return std::nullopt;
}

auto Url::parse(std::string_view url) -> Result<Url> {
  Url out;
  auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) {
    log::warn("URL has no scheme: {}", url);
    return fail(Error::InvalidArgument);
  }
  out.scheme = std::string(url.substr(0, scheme_end));
  std::ranges::transform(out.scheme, out.scheme.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (out.scheme != "http" && out.scheme != "https") {
    log::warn("Unsupported URL scheme: {}", out.scheme);
    return fail(Error::InvalidArgument);
  }
  out.port = out.is_tls() ? 443 : 80;

  auto rest = url.substr(scheme_end + 3);
  auto path_start = rest.find_first_of("/?#");
  auto authority = rest.substr(0, path_start);
  if (path_start != std::string_view::npos) {
    auto target = rest.substr(path_start);
    if (auto hash = target.find('#'); hash != std::string_view::npos) {
      target = target.substr(0, hash);
    }
    out.target = target.empty() || target.front() != '/'
                     ? "/" + std::string(target)
                     : std::string(target);
  }

  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }

  std::string_view host = authority;
  std::string_view port;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return fail(Error::InvalidArgument);
    }
    host = authority.substr(1, close - 1);
    if (close + 1 < authority.size() && authority[close + 1] == ':') {
      port = authority.substr(close + 2);
    }
  } else if (auto colon = authority.rfind(':');
             colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    port = authority.substr(colon + 1);
  }

  if (host.empty()) {
    log::warn("URL has no host: {}", url);
    return fail(Error::InvalidArgument);
  }
  out.host = std::string(host);

  if (!port.empty()) {
    std::uint16_t value = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (ec != std::errc{} || ptr != port.data() + port.size() || value == 0) {
      log::warn("Invalid port in URL: {}", url);
      return fail(Error::InvalidArgument);
    }
    out.port = value;
  }
  return ok(std::move(out));
}

auto Url::host_header() const -> std::string {
  bool default_port = (is_tls() && port == 443) || (!is_tls() && port == 80);
  bool ipv6 = host.find(':') != std::string::npos;
  auto name = ipv6 ? "[" + host + "]" : host;
  return default_port ? name : std::format("{}:{}", name, port);
}

auto HttpRequest::header(std::string_view key) const
    -> std::optional<std::string> {
  return find_header(headers, key);
}

auto HttpRequest::serialize(const Url& target) const -> std::string {
  std::string result;
  result.reserve(256 + body.size());

  std::format_to(std::back_inserter(result), "{} {} HTTP/1.1\r\n",
                 method_name(method), target.target);

  bool has_host = false;
  bool has_content_length = false;
  for (const auto& [key, value] : headers) {
    if (iequals(key, "Content-Length")) {
      has_content_length = true;
    } else if (iequals(key, "Host")) {
      has_host = true;
    } else if (iequals(key, "Connection")) {
      continue;
    }
    std::format_to(std::back_inserter(result), "{}: {}\r\n", key, value);
  }

  if (!has_host) {
    std::format_to(std::back_inserter(result), "Host: {}\r\n",
                   target.host_header());
  }
  if (!has_content_length &&
      (!body.empty() || method == HttpMethod::POST ||
       method == HttpMethod::PUT || method == HttpMethod::PATCH)) {
    std::format_to(std::back_inserter(result), "Content-Length: {}\r\n",
                   body.size());
  }
  // One request per connection; the response ends at EOF at the latest.
  result += "Connection: close\r\n\r\n";
  result += body;
  return result;
}

auto HttpResponse::header(std::string_view key) const
    -> std::optional<std::string> {
  return find_header(headers, key);
}

}  // namespace cadence::http
