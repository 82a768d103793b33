#pragma once

#include "genflow/core/error.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace genflow::http {

enum class HttpMethod : std::uint8_t {
  GET,
  POST,
  DELETE,
};

[[nodiscard]] constexpr auto method_name(HttpMethod method) noexcept
    -> std::string_view {
  switch (method) {
    case HttpMethod::GET: return "GET";
    case HttpMethod::POST: return "POST";
    case HttpMethod::DELETE: return "DELETE";
  }
  return "GET";
}

using HttpHeaders =
    std::unordered_map<std::string, std::string, StringHash, StringEqual>;

// Header names compare case-insensitively on the wire.
[[nodiscard]] auto find_header(const HttpHeaders& headers,
                               std::string_view name)
    -> std::optional<std::string_view>;

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path{"/"};
  HttpHeaders headers;
  std::string body;

  [[nodiscard]] auto serialize() const -> std::string;
};

struct HttpResponse {
  int status{0};
  HttpHeaders headers;
  std::string body;

  [[nodiscard]] auto header(std::string_view name) const
      -> std::optional<std::string_view> {
    return find_header(headers, name);
  }
  [[nodiscard]] auto is_success() const noexcept -> bool {
    return status >= 200 && status < 300;
  }
};

// Plain-http endpoint; TLS is terminated by a gateway in front of providers.
struct HttpUrl {
  std::string host;
  std::uint16_t port{80};
  std::string base_path;
};

[[nodiscard]] auto parse_http_url(std::string_view url) -> Result<HttpUrl>;

}  // namespace genflow::http

template <>
struct std::formatter<genflow::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(genflow::http::HttpMethod method, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        genflow::http::method_name(method), ctx);
  }
};
