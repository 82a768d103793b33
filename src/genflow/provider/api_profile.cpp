#include "genflow/provider/api_profile.hpp"

#include "genflow/util/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <format>

namespace genflow {

namespace {

using json = nlohmann::json;

constexpr std::string_view kLumaAspectRatios[] = {
    "16:9", "9:16", "1:1", "4:3", "3:4", "21:9", "9:21"};

constexpr std::string_view kVideoOperations[] = {"image_to_video",
                                                 "text_to_video"};
constexpr std::string_view kRunwayAspectRatios[] = {"16:9", "9:16", "1:1",
                                                    "4:3", "3:4"};
constexpr std::string_view kPikaAspectRatios[] = {"16:9", "9:16", "1:1"};

const ProfileLimits kLumaLimits{
    .operations = kVideoOperations,
    .aspect_ratios = kLumaAspectRatios,
    .default_aspect_ratio = "16:9",
    .max_duration_seconds = 10.0,
};

const ProfileLimits kRunwayLimits{
    .operations = kVideoOperations,
    .aspect_ratios = kRunwayAspectRatios,
    .default_aspect_ratio = "16:9",
    .max_duration_seconds = 18.0,
};

const ProfileLimits kPikaLimits{
    .operations = kVideoOperations,
    .aspect_ratios = kPikaAspectRatios,
    .default_aspect_ratio = "16:9",
    .max_duration_seconds = 3.0,
};

constexpr std::string_view kRunwayApiVersion = "2024-09-13";
constexpr std::string_view kRunwayDefaultModel = "gen2";
constexpr int kPikaFrameRate = 24;
constexpr double kPikaPromptStrength = 0.8;

constexpr std::size_t kMaxBodyExcerpt = 200;

auto bad_request(std::string message) -> RawFailure {
  return RawFailure{.status_code = 400, .message = std::move(message)};
}

auto contains(std::span<const std::string_view> values, std::string_view v)
    -> bool {
  return std::ranges::find(values, v) != values.end();
}

auto is_video(std::string_view operation) -> bool {
  return operation.ends_with("video");
}

// Accepts 5, 5.0 and "5s".
auto parse_duration_seconds(const json& value) -> std::optional<double> {
  if (value.is_number())
    return value.get<double>();
  if (!value.is_string())
    return std::nullopt;
  auto text = value.get_ref<const std::string&>();
  std::string_view sv = text;
  if (sv.ends_with('s'))
    sv.remove_suffix(1);
  double seconds = 0.0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), seconds);
  if (ec != std::errc{} || ptr != sv.data() + sv.size())
    return std::nullopt;
  return seconds;
}

auto aspect_ratio_of(ApiProfile profile, const GenerationRequest& request)
    -> std::string {
  if (auto it = request.parameters.find("aspect_ratio");
      it != request.parameters.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return std::string(profile_limits(profile).default_aspect_ratio);
}

auto auth_headers(const ApiTarget& target) -> http::HttpHeaders {
  http::HttpHeaders headers;
  headers["Authorization"] = std::format("Bearer {}", target.api_key);
  headers["Accept"] = "application/json";
  switch (target.profile) {
    case ApiProfile::Runway:
      headers["X-Runway-Version"] = std::string(kRunwayApiVersion);
      break;
    case ApiProfile::Pika:
      headers["X-Pika-Client"] = "genflow";
      break;
    case ApiProfile::Luma:
      break;
  }
  return headers;
}

auto submit_path(const ApiTarget& target) -> std::string {
  switch (target.profile) {
    case ApiProfile::Runway:
      return std::format("{}/image-to-video", target.base_path);
    case ApiProfile::Pika:
      return std::format("{}/generate", target.base_path);
    case ApiProfile::Luma:
      break;
  }
  return std::format("{}/generations", target.base_path);
}

auto job_path(const ApiTarget& target, const JobRef& job) -> std::string {
  switch (target.profile) {
    case ApiProfile::Runway:
      return std::format("{}/tasks/{}", target.base_path, job);
    case ApiProfile::Pika:
      return std::format("{}/jobs/{}", target.base_path, job);
    case ApiProfile::Luma:
      break;
  }
  return std::format("{}/generations/{}", target.base_path, job);
}

// Runway sizes its output by resolution instead of aspect ratio.
auto runway_resolution(std::string_view aspect_ratio) -> std::string_view {
  if (aspect_ratio == "9:16")
    return "1080:1920";
  if (aspect_ratio == "1:1")
    return "1080:1080";
  if (aspect_ratio == "4:3")
    return "1440:1080";
  if (aspect_ratio == "3:4")
    return "1080:1440";
  return "1920:1080";
}

auto number_param(const GenerationRequest& request, const char* key)
    -> std::optional<double> {
  if (auto it = request.parameters.find(key);
      it != request.parameters.end() && it->is_number()) {
    return it->get<double>();
  }
  return std::nullopt;
}

auto copy_param(const GenerationRequest& request, const char* key,
                json& out, const char* as) -> void {
  if (auto it = request.parameters.find(key); it != request.parameters.end())
    out[as] = *it;
}

auto parse_body(const http::HttpResponse& response) -> std::optional<json> {
  try {
    return json::parse(response.body.begin(), response.body.end());
  } catch (const json::exception& e) {
    log::debug("Unparseable provider response (HTTP {}): {}", response.status,
               e.what());
    return std::nullopt;
  }
}

auto text_of(const json& value) -> std::optional<std::string> {
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_object()) {
    if (auto it = value.find("message"); it != value.end() && it->is_string())
      return it->get<std::string>();
    return value.dump();
  }
  return std::nullopt;
}

auto error_text(const json& body) -> std::optional<std::string> {
  if (!body.is_object())
    return std::nullopt;
  for (const auto* key : {"detail", "error", "message", "failure_reason"}) {
    if (auto it = body.find(key); it != body.end() && !it->is_null()) {
      if (auto text = text_of(*it))
        return text;
    }
  }
  return std::nullopt;
}

// "Retry-After: <seconds>"; the HTTP-date form is ignored.
auto retry_after_hint(const http::HttpResponse& response)
    -> std::optional<std::chrono::milliseconds> {
  auto value = response.header("Retry-After");
  if (!value)
    return std::nullopt;
  long long seconds = 0;
  auto [ptr, ec] =
      std::from_chars(value->data(), value->data() + value->size(), seconds);
  if (ec != std::errc{} || seconds < 0)
    return std::nullopt;
  return std::chrono::seconds{seconds};
}

auto unparseable(const http::HttpResponse& response) -> RawFailure {
  return RawFailure{
      .message = std::format("unparseable provider response (HTTP {})",
                             response.status)};
}

auto progress_of(const json& body) -> std::optional<int> {
  if (auto it = body.find("progress"); it != body.end() && it->is_number()) {
    return std::clamp(static_cast<int>(it->get<double>()), 0, 100);
  }
  return std::nullopt;
}

auto luma_result(const json& body) -> AdapterResult<JobStatus> {
  auto state = body.value("state", std::string{});
  if (state == "completed") {
    const auto& assets = body.value("assets", json::object());
    auto uri = assets.is_object() ? assets.value("video", std::string{})
                                  : std::string{};
    if (uri.empty())
      uri = assets.is_object() ? assets.value("image", std::string{})
                               : std::string{};
    if (uri.empty())
      return std::unexpected(
          RawFailure{.message = "completed job carries no asset"});
    GenerationResult result{.uri = std::move(uri)};
    result.metadata["provider_state"] = state;
    if (auto it = body.find("model"); it != body.end())
      result.metadata["model"] = *it;
    return JobStatus{JobSucceeded{std::move(result)}};
  }
  if (state == "failed") {
    auto reason = body.value("failure_reason", json{});
    return JobStatus{JobFailed{RawFailure{
        .message = text_of(reason).value_or("generation failed")}}};
  }
  if (state == "queued" || state == "dreaming" || state.empty()) {
    return JobStatus{JobPending{.detail = state}};
  }
  return std::unexpected(RawFailure{
      .message = std::format("unrecognised generation state '{}'", state)});
}

auto runway_result(const json& body) -> AdapterResult<JobStatus> {
  auto status = body.value("status", std::string{});
  if (status == "SUCCEEDED") {
    auto output = body.value("output", json{});
    std::string uri;
    if (output.is_array() && !output.empty() && output.front().is_string()) {
      uri = output.front().get<std::string>();
    } else if (output.is_string()) {
      uri = output.get<std::string>();
    }
    if (uri.empty())
      return std::unexpected(
          RawFailure{.message = "completed task carries no output"});
    GenerationResult result{.uri = std::move(uri)};
    result.metadata["provider_state"] = status;
    if (auto it = body.find("thumbnailUrl"); it != body.end() && it->is_string())
      result.metadata["thumbnail"] = *it;
    return JobStatus{JobSucceeded{std::move(result)}};
  }
  if (status == "FAILED") {
    std::optional<std::string> reason;
    if (auto it = body.find("failure"); it != body.end()) {
      if (it->is_object() && it->contains("reason"))
        reason = text_of(it->at("reason"));
      else
        reason = text_of(*it);
    }
    return JobStatus{JobFailed{
        RawFailure{.message = reason.value_or("generation failed")}}};
  }
  if (status == "CANCELLED") {
    return JobStatus{
        JobFailed{RawFailure{.message = "task cancelled by provider"}}};
  }
  // PENDING, RUNNING, THROTTLED and states added later all mean "not yet".
  return JobStatus{
      JobPending{.progress_percent = progress_of(body), .detail = status}};
}

auto pika_result(const json& body) -> AdapterResult<JobStatus> {
  auto status = body.value("status", std::string{});
  if (status == "completed") {
    const auto& output = body.value("result", json::object());
    std::string uri;
    if (output.is_object()) {
      uri = output.value("videoUrl", std::string{});
      if (uri.empty())
        uri = output.value("url", std::string{});
    }
    if (uri.empty())
      return std::unexpected(
          RawFailure{.message = "completed job carries no video"});
    GenerationResult result{.uri = std::move(uri)};
    result.metadata["provider_state"] = status;
    return JobStatus{JobSucceeded{std::move(result)}};
  }
  if (status == "failed" || status == "error") {
    auto error = body.value("error", json{});
    return JobStatus{JobFailed{
        RawFailure{.message = text_of(error).value_or("generation failed")}}};
  }
  if (status == "cancelled") {
    return JobStatus{
        JobFailed{RawFailure{.message = "job cancelled by provider"}}};
  }
  if (status == "pending" || status == "queued" || status == "generating" ||
      status.empty()) {
    return JobStatus{
        JobPending{.progress_percent = progress_of(body), .detail = status}};
  }
  return std::unexpected(RawFailure{
      .message = std::format("unrecognised job status '{}'", status)});
}

}  // namespace

auto profile_limits(ApiProfile profile) noexcept -> const ProfileLimits& {
  switch (profile) {
    case ApiProfile::Runway: return kRunwayLimits;
    case ApiProfile::Pika: return kPikaLimits;
    case ApiProfile::Luma: break;
  }
  return kLumaLimits;
}

auto validate_request(ApiProfile profile, const GenerationRequest& request)
    -> std::optional<RawFailure> {
  const auto& limits = profile_limits(profile);

  if (!contains(limits.operations, request.operation)) {
    return bad_request(std::format("operation '{}' is not supported by {}",
                                   request.operation, to_string_view(profile)));
  }
  if (is_video(request.operation) && request.prompt.empty()) {
    return bad_request("a prompt is required for video generation");
  }
  if (request.operation == "image_to_video" && request.assets.empty()) {
    return bad_request(std::format("operation '{}' requires an input asset",
                                   request.operation));
  }

  if (auto it = request.parameters.find("aspect_ratio");
      it != request.parameters.end()) {
    if (!it->is_string() ||
        !contains(limits.aspect_ratios, it->get_ref<const std::string&>())) {
      return bad_request(std::format("aspect ratio {} is not supported by {}",
                                     it->dump(), to_string_view(profile)));
    }
  }

  if (auto it = request.parameters.find("duration");
      it != request.parameters.end()) {
    auto seconds = parse_duration_seconds(*it);
    if (!seconds || *seconds <= 0.0) {
      return bad_request(std::format("duration {} is not a positive number of seconds",
                                     it->dump()));
    }
    if (*seconds > limits.max_duration_seconds) {
      return bad_request(std::format("duration {}s exceeds the maximum of {}s",
                                     *seconds, limits.max_duration_seconds));
    }
  }
  return std::nullopt;
}

auto build_submit_request(const ApiTarget& target,
                          const GenerationRequest& request)
    -> http::HttpRequest {
  json body;
  auto aspect_ratio = aspect_ratio_of(target.profile, request);

  if (target.profile == ApiProfile::Luma) {
    body["prompt"] = request.prompt;
    body["aspect_ratio"] = aspect_ratio;
    if (!target.model.empty())
      body["model"] = target.model;
    if (auto it = request.parameters.find("duration");
        it != request.parameters.end()) {
      auto seconds = parse_duration_seconds(*it).value_or(5.0);
      body["duration"] = std::format("{}s", static_cast<int>(seconds));
    }
    if (auto it = request.parameters.find("loop");
        it != request.parameters.end())
      body["loop"] = *it;
    if (!request.assets.empty()) {
      body["keyframes"]["frame0"] = {{"type", "image"},
                                     {"url", request.assets.front().uri}};
    }
  } else if (target.profile == ApiProfile::Runway) {
    body["model"] =
        target.model.empty() ? std::string(kRunwayDefaultModel) : target.model;
    body["promptText"] = request.prompt;
    body["resolution"] = std::string(runway_resolution(aspect_ratio));
    if (!request.assets.empty())
      body["init_image"] = request.assets.front().uri;
    if (auto it = request.parameters.find("duration");
        it != request.parameters.end()) {
      auto seconds = parse_duration_seconds(*it).value_or(4.0);
      body["duration"] = static_cast<int>(
          std::min(seconds, kRunwayLimits.max_duration_seconds));
    }
    if (auto strength = number_param(request, "motion_strength"))
      body["motion_score"] = static_cast<int>(*strength * 10);
    if (auto it = request.parameters.find("resolution");
        it != request.parameters.end() && *it == "4k")
      body["upscale"] = true;
    copy_param(request, "seed", body, "seed");
    copy_param(request, "style", body, "style");
  } else {
    body["prompt"] = request.prompt;
    body["aspectRatio"] = aspect_ratio;
    json options{{"frameRate", kPikaFrameRate},
                 {"boomerang", false},
                 {"loop", false}};
    if (auto strength = number_param(request, "motion_strength"))
      options["motion"] = static_cast<int>(*strength * 4);
    if (auto it = request.parameters.find("resolution");
        it != request.parameters.end() && *it == "1080p")
      options["hd"] = true;
    copy_param(request, "seed", options, "seed");
    copy_param(request, "style", options, "style");
    body["options"] = std::move(options);
    if (!request.assets.empty()) {
      body["image"] = request.assets.front().uri;
      body["promptStrength"] = kPikaPromptStrength;
    }
    if (!target.model.empty())
      body["model"] = target.model;
  }

  auto headers = auth_headers(target);
  headers["Content-Type"] = "application/json";
  return http::HttpRequest{.method = http::HttpMethod::POST,
                           .path = submit_path(target),
                           .headers = std::move(headers),
                           .body = body.dump()};
}

auto build_poll_request(const ApiTarget& target, const JobRef& job)
    -> http::HttpRequest {
  return http::HttpRequest{
      .method = http::HttpMethod::GET,
      .path = job_path(target, job),
      .headers = auth_headers(target)};
}

auto build_cancel_request(const ApiTarget& target, const JobRef& job)
    -> http::HttpRequest {
  if (target.profile == ApiProfile::Runway) {
    return http::HttpRequest{
        .method = http::HttpMethod::POST,
        .path = std::format("{}/cancel", job_path(target, job)),
        .headers = auth_headers(target)};
  }
  return http::HttpRequest{.method = http::HttpMethod::DELETE,
                           .path = job_path(target, job),
                           .headers = auth_headers(target)};
}

auto parse_submit_response(ApiProfile profile,
                           const http::HttpResponse& response)
    -> AdapterResult<JobRef> {
  if (!response.is_success())
    return std::unexpected(failure_from_response(response));

  auto body = parse_body(response);
  if (!body || !body->is_object())
    return std::unexpected(unparseable(response));

  auto id = body->value("id", std::string{});
  if (id.empty())
    id = body->value("jobId", std::string{});
  if (id.empty()) {
    return std::unexpected(RawFailure{
        .message = std::format("{} returned no job id",
                               to_string_view(profile))});
  }
  return JobRef{std::move(id)};
}

auto parse_poll_response(ApiProfile profile, const http::HttpResponse& response)
    -> AdapterResult<JobStatus> {
  if (!response.is_success())
    return std::unexpected(failure_from_response(response));

  auto body = parse_body(response);
  if (!body || !body->is_object())
    return std::unexpected(unparseable(response));

  switch (profile) {
    case ApiProfile::Runway: return runway_result(*body);
    case ApiProfile::Pika: return pika_result(*body);
    case ApiProfile::Luma: break;
  }
  return luma_result(*body);
}

auto parse_cancel_response(const http::HttpResponse& response)
    -> AdapterResult<void> {
  // A job the provider no longer knows about is as good as cancelled.
  if (response.is_success() || response.status == 404)
    return {};
  return std::unexpected(failure_from_response(response));
}

auto failure_from_response(const http::HttpResponse& response) -> RawFailure {
  RawFailure failure{.status_code = response.status,
                     .retry_after = retry_after_hint(response)};
  if (auto body = parse_body(response)) {
    if (auto text = error_text(*body))
      failure.message = std::move(*text);
  } else if (!response.body.empty()) {
    failure.message = response.body.substr(0, kMaxBodyExcerpt);
  }
  return failure;
}

auto failure_from_transport(const http::HttpError& error) -> RawFailure {
  using Kind = http::HttpError::Kind;
  switch (error.kind) {
    case Kind::Timeout:
      return RawFailure{.timed_out = true, .message = error.message};
    case Kind::Resolve:
    case Kind::Connect:
    case Kind::Io:
      return RawFailure{.connection_error = true, .message = error.message};
    case Kind::Protocol:
      break;
  }
  return RawFailure{.message = error.message};
}

}  // namespace genflow
