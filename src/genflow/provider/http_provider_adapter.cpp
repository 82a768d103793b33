#include "genflow/provider/http_provider_adapter.hpp"

#include "genflow/core/runtime.hpp"
#include "genflow/util/log.hpp"

#include <algorithm>
#include <format>

namespace genflow {

namespace {

constexpr std::chrono::milliseconds kMaxConnectTimeout{5000};

auto missing_key_failure(const ProviderId& id) -> RawFailure {
  return RawFailure{.status_code = 401,
                    .message = std::format("no API key configured for {}", id)};
}

}  // namespace

auto HttpProviderAdapter::create(Runtime& runtime, const ProviderConfig& config)
    -> Result<std::shared_ptr<HttpProviderAdapter>> {
  auto profile = parse_api_profile(config.profile);
  if (!profile) {
    log::error("Provider {}: unknown API profile '{}'", config.id,
               config.profile);
    return fail(Error::InvalidArgument);
  }
  auto url = http::parse_http_url(config.base_url);
  if (!url) {
    log::error("Provider {}: invalid base_url '{}'", config.id,
               config.base_url);
    return fail(url.error());
  }

  ApiTarget target{.profile = *profile,
                   .base_path = url->base_path,
                   .api_key = config.api_key,
                   .model = config.model};
  http::HttpClientConfig client_config{
      .connect_timeout = std::min(config.request_timeout, kMaxConnectTimeout),
      .io_timeout = config.request_timeout,
  };

  // Private constructor; make_shared cannot reach it.
  return std::shared_ptr<HttpProviderAdapter>(new HttpProviderAdapter(
      runtime, config.id, std::move(*url), std::move(target), client_config));
}

HttpProviderAdapter::HttpProviderAdapter(Runtime& runtime, ProviderId id,
                                         http::HttpUrl url, ApiTarget target,
                                         http::HttpClientConfig client_config)
    : runtime_(runtime),
      id_(std::move(id)),
      url_(std::move(url)),
      target_(std::move(target)),
      client_config_(client_config) {}

auto HttpProviderAdapter::submit(const GenerationRequest& request,
                                 SubmitCallback done) -> void {
  if (auto rejected = validate_request(target_.profile, request)) {
    log::debug("Provider {}: request rejected locally: {}", id_,
               rejected->message);
    done(std::unexpected(std::move(*rejected)));
    return;
  }
  if (missing_credential()) {
    done(std::unexpected(missing_key_failure(id_)));
    return;
  }
  runtime_.spawn(run_submit(shared_from_this(),
                            build_submit_request(target_, request),
                            std::move(done)));
}

auto HttpProviderAdapter::poll(const JobRef& job, PollCallback done) -> void {
  if (missing_credential()) {
    done(std::unexpected(missing_key_failure(id_)));
    return;
  }
  runtime_.spawn(
      run_poll(shared_from_this(), build_poll_request(target_, job),
               std::move(done)));
}

auto HttpProviderAdapter::cancel(const JobRef& job, CancelCallback done)
    -> void {
  if (missing_credential()) {
    done(std::unexpected(missing_key_failure(id_)));
    return;
  }
  runtime_.spawn(
      run_cancel(shared_from_this(), build_cancel_request(target_, job),
                 std::move(done)));
}

auto HttpProviderAdapter::exchange(http::HttpRequest request)
    -> task<http::HttpResult<http::HttpResponse>> {
  auto client =
      co_await http::HttpClient::connect_tcp(url_.host, url_.port,
                                             client_config_);
  if (!client) {
    co_return std::unexpected(std::move(client.error()));
  }
  log::trace("Provider {}: {} {}", id_, request.method, request.path);
  co_return co_await (*client)->request(std::move(request));
}

auto HttpProviderAdapter::run_submit(std::shared_ptr<HttpProviderAdapter> self,
                                     http::HttpRequest request,
                                     SubmitCallback done) -> spawn_task {
  auto response = co_await self->exchange(std::move(request));
  if (!response) {
    done(std::unexpected(failure_from_transport(response.error())));
    co_return;
  }
  auto job = parse_submit_response(self->target_.profile, *response);
  if (job) {
    log::debug("Provider {}: submitted job {}", self->id_, *job);
  }
  done(std::move(job));
}

auto HttpProviderAdapter::run_poll(std::shared_ptr<HttpProviderAdapter> self,
                                   http::HttpRequest request,
                                   PollCallback done) -> spawn_task {
  auto response = co_await self->exchange(std::move(request));
  if (!response) {
    done(std::unexpected(failure_from_transport(response.error())));
    co_return;
  }
  done(parse_poll_response(self->target_.profile, *response));
}

auto HttpProviderAdapter::run_cancel(std::shared_ptr<HttpProviderAdapter> self,
                                     http::HttpRequest request,
                                     CancelCallback done) -> spawn_task {
  auto response = co_await self->exchange(std::move(request));
  if (!response) {
    done(std::unexpected(failure_from_transport(response.error())));
    co_return;
  }
  done(parse_cancel_response(*response));
}

}  // namespace genflow
