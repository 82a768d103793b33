#pragma once

#include "genflow/client/http/http_types.hpp"
#include "genflow/core/coroutine.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace genflow::http {

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds io_timeout{30000};
  std::size_t max_response_size{16 * 1024 * 1024};
};

struct HttpError {
  enum class Kind : std::uint8_t {
    Resolve,
    Connect,
    Timeout,
    Io,
    Protocol,
  };

  Kind kind{Kind::Io};
  std::string message;
};

template <typename T>
using HttpResult = std::expected<T, HttpError>;

// One connection per request ("Connection: close"); runs on a runtime shard
// and does all socket I/O through the shard's io_uring.
class HttpClient {
public:
  HttpClient(int fd, std::string host, HttpClientConfig config);
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  auto operator=(const HttpClient&) -> HttpClient& = delete;
  HttpClient(HttpClient&&) noexcept;
  auto operator=(HttpClient&&) noexcept -> HttpClient&;

  [[nodiscard]] static auto connect_tcp(std::string_view host,
                                        std::uint16_t port,
                                        HttpClientConfig config = {})
      -> task<HttpResult<std::unique_ptr<HttpClient>>>;

  [[nodiscard]] auto request(HttpRequest req) -> task<HttpResult<HttpResponse>>;

  [[nodiscard]] auto get(std::string_view path, HttpHeaders headers = {})
      -> task<HttpResult<HttpResponse>>;
  [[nodiscard]] auto post_json(std::string_view path, std::string body,
                               HttpHeaders headers = {})
      -> task<HttpResult<HttpResponse>>;
  [[nodiscard]] auto delete_(std::string_view path, HttpHeaders headers = {})
      -> task<HttpResult<HttpResponse>>;

  [[nodiscard]] auto is_connected() const noexcept -> bool;
  auto close() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace genflow::http
