#pragma once

#include "genflow/client/http/http_client.hpp"
#include "genflow/client/http/http_types.hpp"
#include "genflow/config/config.hpp"
#include "genflow/core/coroutine.hpp"
#include "genflow/core/error.hpp"
#include "genflow/provider/api_profile.hpp"
#include "genflow/provider/provider_adapter.hpp"

#include <memory>

namespace genflow {

class Runtime;

// Reference adapter for HTTP/JSON generation APIs. Each call opens its own
// connection and runs as a coroutine on the runtime; the callback fires from
// whichever shard finished the exchange.
class HttpProviderAdapter
    : public IProviderAdapter,
      public std::enable_shared_from_this<HttpProviderAdapter> {
public:
  [[nodiscard]] static auto create(Runtime& runtime,
                                   const ProviderConfig& config)
      -> Result<std::shared_ptr<HttpProviderAdapter>>;

  auto submit(const GenerationRequest& request, SubmitCallback done)
      -> void override;
  auto poll(const JobRef& job, PollCallback done) -> void override;
  auto cancel(const JobRef& job, CancelCallback done) -> void override;

  [[nodiscard]] auto profile() const noexcept -> ApiProfile {
    return target_.profile;
  }

private:
  HttpProviderAdapter(Runtime& runtime, ProviderId id, http::HttpUrl url,
                      ApiTarget target, http::HttpClientConfig client_config);

  [[nodiscard]] auto missing_credential() const -> bool {
    return target_.api_key.empty();
  }

  [[nodiscard]] auto exchange(http::HttpRequest request)
      -> task<http::HttpResult<http::HttpResponse>>;

  static auto run_submit(std::shared_ptr<HttpProviderAdapter> self,
                         http::HttpRequest request, SubmitCallback done)
      -> spawn_task;
  static auto run_poll(std::shared_ptr<HttpProviderAdapter> self,
                       http::HttpRequest request, PollCallback done)
      -> spawn_task;
  static auto run_cancel(std::shared_ptr<HttpProviderAdapter> self,
                         http::HttpRequest request, CancelCallback done)
      -> spawn_task;

  Runtime& runtime_;
  ProviderId id_;
  http::HttpUrl url_;
  ApiTarget target_;
  http::HttpClientConfig client_config_;
};

}  // namespace genflow
