#include "genflow/client/http/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace genflow::http {

namespace {

auto iequals(std::string_view a, std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
    return std::tolower(x) == std::tolower(y);
  });
}

}  // namespace

auto find_header(const HttpHeaders& headers, std::string_view name)
    -> std::optional<std::string_view> {
  if (auto it = headers.find(name); it != headers.end()) {
    return it->second;
  }
  for (const auto& [key, value] : headers) {
    if (iequals(key, name))
      return value;
  }
  return std::nullopt;
}

auto HttpRequest::serialize() const -> std::string {
  std::string out =
      std::format("{} {} HTTP/1.1\r\n", method_name(method), path);
  for (const auto& [key, value] : headers) {
    out += std::format("{}: {}\r\n", key, value);
  }
  if (!body.empty() || method == HttpMethod::POST) {
    out += std::format("Content-Length: {}\r\n", body.size());
  }
  out += "\r\n";
  out += body;
  return out;
}

auto parse_http_url(std::string_view url) -> Result<HttpUrl> {
  constexpr std::string_view kHttpPrefix = "http://";
  if (!url.starts_with(kHttpPrefix)) {
    return fail(Error::InvalidArgument);
  }
  url.remove_prefix(kHttpPrefix.size());

  auto slash = url.find('/');
  auto hostport = slash == std::string_view::npos ? url : url.substr(0, slash);
  auto path = slash == std::string_view::npos ? std::string_view{}
                                              : url.substr(slash);
  while (path.ends_with('/')) {
    path.remove_suffix(1);
  }

  HttpUrl out;
  out.base_path = std::string(path);

  auto colon = hostport.rfind(':');
  if (colon != std::string_view::npos) {
    auto port_sv = hostport.substr(colon + 1);
    unsigned port = 0;
    auto [ptr, ec] =
        std::from_chars(port_sv.data(), port_sv.data() + port_sv.size(), port);
    if (ec != std::errc{} || ptr != port_sv.data() + port_sv.size() ||
        port == 0 || port > 65535) {
      return fail(Error::InvalidArgument);
    }
    out.port = static_cast<std::uint16_t>(port);
    hostport = hostport.substr(0, colon);
  }

  if (hostport.empty()) {
    return fail(Error::InvalidArgument);
  }
  out.host = std::string(hostport);
  return out;
}

}  // namespace genflow::http
