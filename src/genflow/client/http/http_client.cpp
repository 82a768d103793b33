#include "genflow/client/http/http_client.hpp"

#include "genflow/client/http/http_parser.hpp"
#include "genflow/core/runtime.hpp"
#include "genflow/util/log.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace genflow::http {

namespace {

auto errc_message(std::errc ec) -> std::string {
  return std::make_error_code(ec).message();
}

}  // namespace

struct HttpClient::Impl {
  int fd{-1};
  std::string host;
  HttpClientConfig config;

  Impl(int socket_fd, std::string h, HttpClientConfig cfg)
      : fd(socket_fd), host(std::move(h)), config(cfg) {}

  ~Impl() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
};

HttpClient::HttpClient(int fd, std::string host, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(fd, std::move(host), config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
auto HttpClient::operator=(HttpClient&&) noexcept -> HttpClient& = default;

auto HttpClient::connect_tcp(std::string_view host, std::uint16_t port,
                             HttpClientConfig config)
    -> task<HttpResult<std::unique_ptr<HttpClient>>> {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* result = nullptr;
  std::string host_str(host);
  std::string port_str = std::to_string(port);

  int ret = ::getaddrinfo(host_str.c_str(), port_str.c_str(), &hints, &result);
  if (ret != 0 || result == nullptr) {
    co_return std::unexpected(HttpError{
        HttpError::Kind::Resolve,
        std::format("failed to resolve {}:{}: {}", host, port,
                    gai_strerror(ret))});
  }
  auto addr_guard = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>(
      result, freeaddrinfo);

  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    co_return std::unexpected(HttpError{
        HttpError::Kind::Connect,
        std::format("socket: {}", std::strerror(errno))});
  }
  auto client = std::make_unique<HttpClient>(fd, host_str, config);

  if (::connect(fd, result->ai_addr, result->ai_addrlen) < 0) {
    if (errno != EINPROGRESS) {
      co_return std::unexpected(HttpError{
          HttpError::Kind::Connect,
          std::format("connection refused by {}:{}: {}", host, port,
                      std::strerror(errno))});
    }
    auto ready = co_await async_poll_timeout(fd, POLLOUT,
                                             config.connect_timeout);
    if (ready.timed_out) {
      co_return std::unexpected(HttpError{
          HttpError::Kind::Timeout,
          std::format("connect to {}:{} timed out", host, port)});
    }
    if (!ready) {
      co_return std::unexpected(HttpError{
          HttpError::Kind::Connect,
          std::format("connect to {}:{} failed: {}", host, port,
                      errc_message(ready.error))});
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
    if (so_error != 0) {
      co_return std::unexpected(HttpError{
          HttpError::Kind::Connect,
          std::format("connect to {}:{} failed: {}", host, port,
                      std::strerror(so_error))});
    }
  }

  co_return std::move(client);
}

auto HttpClient::request(HttpRequest req) -> task<HttpResult<HttpResponse>> {
  if (!is_connected()) {
    co_return std::unexpected(
        HttpError{HttpError::Kind::Io, "client is not connected"});
  }

  if (!find_header(req.headers, "Host")) {
    req.headers["Host"] = impl_->host;
  }
  req.headers["Connection"] = "close";

  auto wire = req.serialize();
  std::size_t written = 0;
  while (written < wire.size()) {
    auto n = co_await async_write(
        impl_->fd, wire.data() + written,
        static_cast<std::uint32_t>(wire.size() - written));
    if (!n) {
      co_return std::unexpected(HttpError{
          HttpError::Kind::Io,
          std::format("write failed: {}", errc_message(n.error()))});
    }
    written += *n;
  }

  HttpResponseParser parser;
  std::array<char, 8192> buffer{};
  std::size_t total_read = 0;

  while (total_read < impl_->config.max_response_size) {
    auto ready = co_await async_poll_timeout(impl_->fd, POLLIN,
                                             impl_->config.io_timeout);
    if (ready.timed_out) {
      co_return std::unexpected(HttpError{
          HttpError::Kind::Timeout,
          std::format("no response within {}ms",
                      impl_->config.io_timeout.count())});
    }

    auto n = co_await async_read(impl_->fd, buffer.data(),
                                 static_cast<std::uint32_t>(buffer.size()));
    if (!n) {
      co_return std::unexpected(HttpError{
          HttpError::Kind::Io,
          std::format("read failed: {}", errc_message(n.error()))});
    }

    auto parsed = *n == 0 ? parser.finish()
                          : parser.feed(std::span<const char>(buffer.data(), *n));
    if (!parsed) {
      co_return std::unexpected(
          HttpError{HttpError::Kind::Protocol, "unparseable HTTP response"});
    }
    if (*parsed) {
      co_return std::move(**parsed);
    }
    if (*n == 0) {
      co_return std::unexpected(HttpError{
          HttpError::Kind::Io, "connection reset before response completed"});
    }
    total_read += *n;
  }

  co_return std::unexpected(
      HttpError{HttpError::Kind::Protocol, "response exceeds size limit"});
}

auto HttpClient::get(std::string_view path, HttpHeaders headers)
    -> task<HttpResult<HttpResponse>> {
  HttpRequest req{.method = HttpMethod::GET,
                  .path = std::string(path),
                  .headers = std::move(headers)};
  co_return co_await request(std::move(req));
}

auto HttpClient::post_json(std::string_view path, std::string body,
                           HttpHeaders headers)
    -> task<HttpResult<HttpResponse>> {
  headers["Content-Type"] = "application/json";
  HttpRequest req{.method = HttpMethod::POST,
                  .path = std::string(path),
                  .headers = std::move(headers),
                  .body = std::move(body)};
  co_return co_await request(std::move(req));
}

auto HttpClient::delete_(std::string_view path, HttpHeaders headers)
    -> task<HttpResult<HttpResponse>> {
  HttpRequest req{.method = HttpMethod::DELETE,
                  .path = std::string(path),
                  .headers = std::move(headers)};
  co_return co_await request(std::move(req));
}

auto HttpClient::is_connected() const noexcept -> bool {
  return impl_ && impl_->fd >= 0;
}

auto HttpClient::close() -> void {
  if (impl_ && impl_->fd >= 0) {
    ::close(impl_->fd);
    impl_->fd = -1;
  }
}

}  // namespace genflow::http
