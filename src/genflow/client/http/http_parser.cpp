#include "genflow/client/http/http_parser.hpp"

#include "genflow/util/log.hpp"

#include <llhttp.h>

namespace genflow::http {

struct HttpResponseParser::Impl {
  llhttp_t parser;
  llhttp_settings_t settings;
  HttpResponse current;
  bool complete = false;
  std::string header_field;
  std::string header_value;
  bool in_header_field = false;

  auto flush_header() -> void {
    if (!header_field.empty()) {
      current.headers[std::move(header_field)] = std::move(header_value);
      header_field.clear();
      header_value.clear();
    }
  }

  static auto self(llhttp_t* parser) -> Impl* {
    return static_cast<Impl*>(parser->data);
  }

  static auto on_header_field(llhttp_t* parser, const char* at,
                              size_t length) -> int {
    auto* impl = self(parser);
    if (!impl->in_header_field) {
      impl->flush_header();
    }
    impl->header_field.append(at, length);
    impl->in_header_field = true;
    return 0;
  }

  static auto on_header_value(llhttp_t* parser, const char* at,
                              size_t length) -> int {
    auto* impl = self(parser);
    impl->header_value.append(at, length);
    impl->in_header_field = false;
    return 0;
  }

  static auto on_headers_complete(llhttp_t* parser) -> int {
    auto* impl = self(parser);
    impl->flush_header();
    impl->current.status = llhttp_get_status_code(parser);
    return 0;
  }

  static auto on_body(llhttp_t* parser, const char* at, size_t length) -> int {
    self(parser)->current.body.append(at, length);
    return 0;
  }

  static auto on_message_complete(llhttp_t* parser) -> int {
    self(parser)->complete = true;
    return HPE_PAUSED;
  }

  auto take() -> std::optional<HttpResponse> {
    if (!complete)
      return std::nullopt;
    auto resp = std::move(current);
    return resp;
  }
};

HttpResponseParser::HttpResponseParser() : impl_(std::make_unique<Impl>()) {
  llhttp_settings_init(&impl_->settings);
  impl_->settings.on_header_field = Impl::on_header_field;
  impl_->settings.on_header_value = Impl::on_header_value;
  impl_->settings.on_headers_complete = Impl::on_headers_complete;
  impl_->settings.on_body = Impl::on_body;
  impl_->settings.on_message_complete = Impl::on_message_complete;
  reset();
}

HttpResponseParser::~HttpResponseParser() = default;

auto HttpResponseParser::feed(std::span<const char> data)
    -> Result<std::optional<HttpResponse>> {
  if (impl_->complete) {
    return impl_->take();
  }
  auto err = llhttp_execute(&impl_->parser, data.data(), data.size());
  if (err != HPE_OK && err != HPE_PAUSED) {
    const char* reason = llhttp_get_error_reason(&impl_->parser);
    log::warn("HTTP response parse error: {} (reason: {})",
              llhttp_errno_name(err), reason ? reason : "");
    return fail(Error::ParseError);
  }
  return impl_->take();
}

auto HttpResponseParser::finish() -> Result<std::optional<HttpResponse>> {
  if (impl_->complete) {
    return impl_->take();
  }
  auto err = llhttp_finish(&impl_->parser);
  if (err != HPE_OK && err != HPE_PAUSED) {
    log::warn("HTTP response truncated: {}", llhttp_errno_name(err));
    return fail(Error::ParseError);
  }
  return impl_->take();
}

auto HttpResponseParser::reset() -> void {
  impl_->current = HttpResponse{};
  impl_->complete = false;
  impl_->header_field.clear();
  impl_->header_value.clear();
  impl_->in_header_field = false;
  llhttp_init(&impl_->parser, HTTP_RESPONSE, &impl_->settings);
  impl_->parser.data = impl_.get();
}

}  // namespace genflow::http
