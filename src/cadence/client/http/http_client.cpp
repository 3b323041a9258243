#include "cadence/client/http/http_client.hpp"

#include "cadence/client/http/http_parser.hpp"
#include "cadence/util/log.hpp"

#include <netdb.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <format>
#include <mutex>

namespace cadence::http {

namespace {

using SteadyClock = std::chrono::steady_clock;

auto remaining_ms(SteadyClock::time_point deadline) -> int {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - SteadyClock::now());
  if (left.count() <= 0) {
    return 0;
  }
  return static_cast<int>(std::min<std::int64_t>(left.count(), INT_MAX));
}

auto wait_fd(int fd, short events, SteadyClock::time_point deadline)
    -> Result<void> {
  while (true) {
    int timeout = remaining_ms(deadline);
    if (timeout == 0) {
      return fail(Error::Timeout);
    }
    pollfd pfd{fd, events, 0};
    int rc = ::poll(&pfd, 1, timeout);
    if (rc > 0) {
      return ok();
    }
    if (rc == 0) {
      return fail(Error::Timeout);
    }
    if (errno != EINTR) {
      return fail(Error::NetworkError);
    }
  }
}

auto tls_error_string() -> std::string {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return std::strerror(errno);
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

class Connection {
public:
  explicit Connection(int fd) : fd_(fd) {
  }
  ~Connection() {
    if (ssl_ != nullptr) {
      SSL_shutdown(ssl_);
      SSL_free(ssl_);
    }
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  [[nodiscard]] auto handshake(SSL_CTX* ctx, const std::string& host,
                               bool verify, SteadyClock::time_point deadline)
      -> Result<void> {
    ssl_ = SSL_new(ctx);
    if (ssl_ == nullptr) {
      log::error("SSL_new failed: {}", tls_error_string());
      return fail(Error::NetworkError);
    }
    SSL_set_fd(ssl_, fd_);
    SSL_set_tlsext_host_name(ssl_, host.c_str());
    if (verify) {
      SSL_set1_host(ssl_, host.c_str());
    }

    while (true) {
      int rc = SSL_connect(ssl_);
      if (rc == 1) {
        return ok();
      }
      if (auto r = wait_for(rc, deadline); !r) {
        if (r.error() != Error::Timeout) {
          log::warn("TLS handshake with {} failed: {}", host,
                    tls_error_string());
        }
        return r;
      }
    }
  }

  [[nodiscard]] auto write_all(std::string_view data,
                               SteadyClock::time_point deadline)
      -> Result<void> {
    while (!data.empty()) {
      ssize_t n = 0;
      if (ssl_ != nullptr) {
        int rc = SSL_write(ssl_, data.data(), static_cast<int>(data.size()));
        if (rc <= 0) {
          if (auto r = wait_for(rc, deadline); !r) {
            return r;
          }
          continue;
        }
        n = rc;
      } else {
        n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
          if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (auto r = wait_fd(fd_, POLLOUT, deadline); !r) {
              return r;
            }
            continue;
          }
          if (errno == EINTR) {
            continue;
          }
          return fail(Error::NetworkError);
        }
      }
      data.remove_prefix(static_cast<std::size_t>(n));
    }
    return ok();
  }

  // 0 means the peer closed the connection.
  [[nodiscard]] auto read_some(char* buf, std::size_t size,
                               SteadyClock::time_point deadline)
      -> Result<std::size_t> {
    while (true) {
      if (ssl_ != nullptr) {
        int rc = SSL_read(ssl_, buf, static_cast<int>(size));
        if (rc > 0) {
          return static_cast<std::size_t>(rc);
        }
        int err = SSL_get_error(ssl_, rc);
        if (err == SSL_ERROR_ZERO_RETURN ||
            (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)) {
          return std::size_t{0};
        }
        if (auto r = wait_for(rc, deadline); !r) {
          return std::unexpected(r.error());
        }
        continue;
      }

      ssize_t n = ::recv(fd_, buf, size, 0);
      if (n >= 0) {
        return static_cast<std::size_t>(n);
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        if (auto r = wait_fd(fd_, POLLIN, deadline); !r) {
          return std::unexpected(r.error());
        }
        continue;
      }
      if (errno != EINTR) {
        return fail(Error::NetworkError);
      }
    }
  }

private:
  // Waits for whatever the last SSL call asked for; anything else is fatal.
  [[nodiscard]] auto wait_for(int rc, SteadyClock::time_point deadline)
      -> Result<void> {
    switch (SSL_get_error(ssl_, rc)) {
      case SSL_ERROR_WANT_READ:
        return wait_fd(fd_, POLLIN, deadline);
      case SSL_ERROR_WANT_WRITE:
        return wait_fd(fd_, POLLOUT, deadline);
      default:
        return fail(Error::NetworkError);
    }
  }

  int fd_{-1};
  SSL* ssl_{nullptr};
};

auto connect_to(const Url& url, SteadyClock::time_point deadline)
    -> Result<int> {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* result = nullptr;
  std::string port_str = std::to_string(url.port);
  int ret = ::getaddrinfo(url.host.c_str(), port_str.c_str(), &hints, &result);
  if (ret != 0 || result == nullptr) {
    log::warn("Failed to resolve {}:{} - {}", url.host, url.port,
              gai_strerror(ret));
    return fail(Error::NetworkError);
  }
  auto addr_guard =
      std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>(result, freeaddrinfo);

  for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      return fd;
    }
    if (errno == EINPROGRESS) {
      auto ready = wait_fd(fd, POLLOUT, deadline);
      if (!ready) {
        ::close(fd);
        if (ready.error() == Error::Timeout) {
          return std::unexpected(ready.error());
        }
        continue;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 &&
          so_error == 0) {
        return fd;
      }
    }
    ::close(fd);
  }

  log::warn("Failed to connect to {}:{}", url.host, url.port);
  return fail(Error::NetworkError);
}

}  // namespace

struct HttpClient::Impl {
  HttpClientConfig config;
  std::once_flag tls_once;
  SSL_CTX* tls_ctx{nullptr};

  explicit Impl(HttpClientConfig cfg) : config(std::move(cfg)) {
  }

  ~Impl() {
    if (tls_ctx != nullptr) {
      SSL_CTX_free(tls_ctx);
    }
  }

  auto tls_context() -> SSL_CTX* {
    std::call_once(tls_once, [this] {
      SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
      if (ctx == nullptr) {
        log::error("Failed to create TLS context: {}", tls_error_string());
        return;
      }
      SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
      SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
      if (config.verify_peer) {
        if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
          log::warn("Failed to load default CA certificates");
        }
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
      }
      tls_ctx = ctx;
    });
    return tls_ctx;
  }
};

HttpClient::HttpClient(HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {
}

HttpClient::~HttpClient() = default;

auto HttpClient::send(const HttpRequest& request,
                      std::chrono::milliseconds timeout)
    -> Outcome<HttpResponse> {
  auto url = Url::parse(request.url);
  if (!url) {
    return failure(url.error(), std::format("Invalid URL: {}", request.url));
  }

  const auto& config = impl_->config;
  auto budget = std::min(timeout, config.request_timeout);
  auto start = SteadyClock::now();
  auto deadline = start + budget;
  auto connect_deadline = std::min(deadline, start + config.connect_timeout);

  auto timed_out = [&] {
    return failure(Error::Timeout,
                   std::format("Request to {} timed out", url->host));
  };

  auto fd = connect_to(*url, connect_deadline);
  if (!fd) {
    if (fd.error() == Error::Timeout) {
      return timed_out();
    }
    return failure(fd.error(), std::format("Failed to connect to {}:{}",
                                           url->host, url->port));
  }
  Connection conn(*fd);

  if (url->is_tls()) {
    SSL_CTX* ctx = impl_->tls_context();
    if (ctx == nullptr) {
      return failure(Error::NetworkError, "TLS is unavailable");
    }
    if (auto r = conn.handshake(ctx, url->host, config.verify_peer, deadline);
        !r) {
      if (r.error() == Error::Timeout) {
        return timed_out();
      }
      return failure(r.error(),
                     std::format("TLS handshake with {} failed", url->host));
    }
  }

  HttpRequest outgoing = request;
  if (!outgoing.header("User-Agent")) {
    outgoing.headers["User-Agent"] = config.user_agent;
  }
  if (auto r = conn.write_all(outgoing.serialize(*url), deadline); !r) {
    if (r.error() == Error::Timeout) {
      return timed_out();
    }
    return failure(r.error(),
                   std::format("Failed to send request to {}", url->host));
  }

  HttpResponseParser parser;
  if (request.method == HttpMethod::HEAD) {
    parser.expect_no_body();
  }

  std::size_t total = 0;
  char buf[16384];
  while (true) {
    auto n = conn.read_some(buf, sizeof(buf), deadline);
    if (!n) {
      if (n.error() == Error::Timeout) {
        return timed_out();
      }
      return failure(n.error(),
                     std::format("Failed to read response from {}", url->host));
    }
    if (*n == 0) {
      if (auto resp = parser.finish()) {
        return std::move(*resp);
      }
      return failure(Error::NetworkError,
                     std::format("Connection to {} closed before a complete "
                                 "response",
                                 url->host));
    }

    total += *n;
    if (total > config.max_response_size) {
      return failure(Error::HttpError,
                     std::format("Response from {} exceeds {} bytes", url->host,
                                 config.max_response_size));
    }
    if (auto resp = parser.parse(std::string_view(buf, *n))) {
      return std::move(*resp);
    }
    if (parser.failed()) {
      return failure(Error::HttpError,
                     std::format("Malformed HTTP response from {}", url->host));
    }
  }
}

auto HttpClient::get(const std::string& url, std::chrono::milliseconds timeout)
    -> Outcome<HttpResponse> {
  HttpRequest req;
  req.method = HttpMethod::GET;
  req.url = url;
  return send(req, timeout);
}

auto HttpClient::post_json(const std::string& url, std::string body,
                           const HttpHeaders& headers,
                           std::chrono::milliseconds timeout)
    -> Outcome<HttpResponse> {
  HttpRequest req;
  req.method = HttpMethod::POST;
  req.url = url;
  req.headers = headers;
  if (!req.header("Content-Type")) {
    req.headers["Content-Type"] = "application/json";
  }
  req.body = std::move(body);
  return send(req, timeout);
}

}  // namespace cadence::http
