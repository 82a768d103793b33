#pragma once

#include "genflow/client/http/http_types.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>

namespace genflow::http {

// Incremental HTTP/1.1 response parser on top of llhttp.
class HttpResponseParser {
public:
  HttpResponseParser();
  ~HttpResponseParser();

  HttpResponseParser(const HttpResponseParser&) = delete;
  auto operator=(const HttpResponseParser&) -> HttpResponseParser& = delete;

  // Feeds bytes; yields the response once it is complete. Fails with
  // Error::ParseError on malformed input.
  auto feed(std::span<const char> data) -> Result<std::optional<HttpResponse>>;
  // Signals EOF; completes a response whose body is delimited by close.
  auto finish() -> Result<std::optional<HttpResponse>>;
  auto reset() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace genflow::http
