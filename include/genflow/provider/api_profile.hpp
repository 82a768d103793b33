#pragma once

#include "genflow/client/http/http_client.hpp"
#include "genflow/client/http/http_types.hpp"
#include "genflow/provider/generation.hpp"
#include "genflow/provider/provider_adapter.hpp"
#include "genflow/resilience/error_classifier.hpp"
#include "genflow/util/id.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace genflow {

// Wire dialect spoken by an HTTP generation provider.
enum class ApiProfile : std::uint8_t {
  Luma,
  Runway,
  Pika,
};

[[nodiscard]] constexpr auto to_string_view(ApiProfile profile) noexcept
    -> std::string_view {
  switch (profile) {
    case ApiProfile::Luma: return "luma";
    case ApiProfile::Runway: return "runway";
    case ApiProfile::Pika: return "pika";
  }
  return "luma";
}

[[nodiscard]] constexpr auto parse_api_profile(std::string_view name) noexcept
    -> std::optional<ApiProfile> {
  if (name == "luma")
    return ApiProfile::Luma;
  if (name == "runway")
    return ApiProfile::Runway;
  if (name == "pika")
    return ApiProfile::Pika;
  return std::nullopt;
}

struct ProfileLimits {
  std::span<const std::string_view> operations;
  std::span<const std::string_view> aspect_ratios;
  std::string_view default_aspect_ratio;
  double max_duration_seconds{0.0};
};

[[nodiscard]] auto profile_limits(ApiProfile profile) noexcept
    -> const ProfileLimits&;

// Everything needed to address one provider endpoint.
struct ApiTarget {
  ApiProfile profile{ApiProfile::Luma};
  std::string base_path;
  std::string api_key;
  std::string model;
};

// Local checks run before any network I/O; a rejection is shaped like an
// HTTP 400 so it classifies as InvalidRequest.
[[nodiscard]] auto validate_request(ApiProfile profile,
                                    const GenerationRequest& request)
    -> std::optional<RawFailure>;

[[nodiscard]] auto build_submit_request(const ApiTarget& target,
                                        const GenerationRequest& request)
    -> http::HttpRequest;
[[nodiscard]] auto build_poll_request(const ApiTarget& target,
                                      const JobRef& job) -> http::HttpRequest;
[[nodiscard]] auto build_cancel_request(const ApiTarget& target,
                                        const JobRef& job) -> http::HttpRequest;

[[nodiscard]] auto parse_submit_response(ApiProfile profile,
                                         const http::HttpResponse& response)
    -> AdapterResult<JobRef>;
[[nodiscard]] auto parse_poll_response(ApiProfile profile,
                                       const http::HttpResponse& response)
    -> AdapterResult<JobStatus>;
[[nodiscard]] auto parse_cancel_response(const http::HttpResponse& response)
    -> AdapterResult<void>;

// Status code, Retry-After and the provider's error text of a non-2xx reply.
[[nodiscard]] auto failure_from_response(const http::HttpResponse& response)
    -> RawFailure;
[[nodiscard]] auto failure_from_transport(const http::HttpError& error)
    -> RawFailure;

}  // namespace genflow
