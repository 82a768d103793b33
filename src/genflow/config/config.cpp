#include "genflow/config/config.hpp"

#include "genflow/client/http/http_types.hpp"
#include "genflow/config/yaml_utils.hpp"
#include "genflow/provider/api_profile.hpp"
#include "genflow/provider/provider_registry.hpp"
#include "genflow/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <unordered_set>

namespace genflow {

namespace {

void from_yaml(const YAML::Node& node, RetryConfig& r) {
  r.max_attempts = read_field(node, "max_attempts", r.max_attempts);
  r.base_delay = read_millis(node, "base_delay_ms", r.base_delay);
  r.max_delay = read_millis(node, "max_delay_ms", r.max_delay);
  r.unknown_max_attempts =
      read_field(node, "unknown_max_attempts", r.unknown_max_attempts);
  r.jitter = read_field(node, "jitter", r.jitter);
}

void from_yaml(const YAML::Node& node, BreakerConfig& b) {
  b.failure_threshold =
      read_field(node, "failure_threshold", b.failure_threshold);
  b.cooldown = read_millis(node, "cooldown_ms", b.cooldown);
  b.cooldown_jitter = read_millis(node, "cooldown_jitter_ms", b.cooldown_jitter);
}

void from_yaml(const YAML::Node& node, RateLimitConfig& r) {
  r.max_requests = read_field(node, "max_requests", r.max_requests);
  r.window = read_millis(node, "window_ms", r.window);
  r.burst = read_field(node, "burst", r.burst);
}

void from_yaml(const YAML::Node& node, ProviderConfig& p) {
  p.id = node["id"].as<ProviderId>();
  p.kind = read_field<std::string>(node, "kind", p.kind);
  p.profile = read_field<std::string>(node, "profile", p.profile);
  p.base_url = read_field<std::string>(node, "base_url", "");
  p.api_key = read_field<std::string>(node, "api_key", "");
  p.api_key_env = read_field<std::string>(node, "api_key_env", "");
  p.model = read_field<std::string>(node, "model", "");
  p.request_timeout =
      read_millis(node, "request_timeout_ms", p.request_timeout);
  p.job_timeout = read_millis(node, "job_timeout_ms", p.job_timeout);
  p.poll_interval = read_millis(node, "poll_interval_ms", p.poll_interval);
  p.max_concurrency = read_field(node, "max_concurrency", p.max_concurrency);
  if (auto attempts = node["max_attempts"]) {
    p.max_attempts = attempts.as<int>();
  }
  p.enabled = read_field(node, "enabled", p.enabled);
  if (auto fallback = node["fallback"]) {
    p.fallback = fallback.as<ProviderId>();
  }
  if (auto rate_limit = node["rate_limit"]) {
    from_yaml(rate_limit, p.rate_limit);
  }
}

void from_yaml(const YAML::Node& node, OrchestratorConfig& o, unsigned& shards) {
  o.max_concurrency = read_field(node, "max_concurrency", o.max_concurrency);
  o.max_queue_depth = read_field(node, "max_queue_depth", o.max_queue_depth);
  o.cancel_grace = read_millis(node, "cancel_grace_ms", o.cancel_grace);
  o.retention = std::chrono::minutes{
      read_field<long long>(node, "retention_minutes", o.retention.count())};
  o.sweep_interval = read_millis(node, "sweep_interval_ms", o.sweep_interval);
  shards = read_field(node, "shards", shards);
}

void from_yaml(const YAML::Node& node, Config& c) {
  if (auto orchestrator = node["orchestrator"])
    from_yaml(orchestrator, c.orchestrator, c.shards);
  if (auto retry = node["retry"])
    from_yaml(retry, c.orchestrator.retry);
  if (auto breaker = node["breaker"])
    from_yaml(breaker, c.orchestrator.breaker);
  if (auto logging = node["logging"])
    c.logging.level = read_field<std::string>(logging, "level", "info");

  if (auto providers = node["providers"]) {
    c.providers.reserve(providers.size());
    for (const auto& provider_node : providers) {
      ProviderConfig provider;
      from_yaml(provider_node, provider);
      // Per-provider overrides start from the global section.
      if (auto breaker = provider_node["breaker"]) {
        BreakerConfig override_cfg = c.orchestrator.breaker;
        from_yaml(breaker, override_cfg);
        provider.breaker = override_cfg;
      }
      c.providers.push_back(std::move(provider));
    }
  }
}

auto resolve_credentials(Config& config) -> void {
  for (auto& provider : config.providers) {
    if (provider.api_key_env.empty() || !provider.api_key.empty())
      continue;
    if (const char* value = std::getenv(provider.api_key_env.c_str())) {
      provider.api_key = value;
    } else {
      log::warn("Provider {}: environment variable {} is not set",
                provider.id, provider.api_key_env);
    }
  }
}

auto invalid(std::string_view what) -> std::unexpected<std::error_code> {
  log::error("Invalid configuration: {}", what);
  return fail(Error::InvalidArgument);
}

auto parse_config(const YAML::Node& node) -> Result<Config> {
  Config config;
  from_yaml(node, config);
  config.rebuild_index();
  if (auto valid = validate_config(config); !valid) {
    return std::unexpected(valid.error());
  }
  resolve_credentials(config);
  return ok(std::move(config));
}

void to_yaml(YAML::Emitter& out, const BreakerConfig& b) {
  out << YAML::BeginMap;
  write_field(out, "failure_threshold", b.failure_threshold);
  write_field(out, "cooldown_ms", b.cooldown.count());
  write_field(out, "cooldown_jitter_ms", b.cooldown_jitter.count());
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const ProviderConfig& p) {
  out << YAML::BeginMap;
  write_field(out, "id", p.id.str());
  write_field(out, "kind", p.kind);
  write_field(out, "profile", p.profile);
  write_field(out, "base_url", p.base_url);
  write_field(out, "api_key", std::string(p.api_key.empty() ? "" : "****"));
  if (!p.model.empty())
    write_field(out, "model", p.model);
  write_field(out, "request_timeout_ms", p.request_timeout.count());
  write_field(out, "job_timeout_ms", p.job_timeout.count());
  write_field(out, "poll_interval_ms", p.poll_interval.count());
  write_field(out, "max_concurrency", p.max_concurrency);
  if (p.max_attempts)
    write_field(out, "max_attempts", *p.max_attempts);
  write_field(out, "enabled", p.enabled);
  if (p.fallback)
    write_field(out, "fallback", p.fallback->str());
  if (p.rate_limit.max_requests > 0) {
    out << YAML::Key << "rate_limit" << YAML::Value << YAML::BeginMap;
    write_field(out, "max_requests", p.rate_limit.max_requests);
    write_field(out, "window_ms", p.rate_limit.window.count());
    write_field(out, "burst", p.rate_limit.burst);
    out << YAML::EndMap;
  }
  if (p.breaker) {
    out << YAML::Key << "breaker" << YAML::Value;
    to_yaml(out, *p.breaker);
  }
  out << YAML::EndMap;
}

}  // namespace

auto validate_config(const Config& config) -> Result<void> {
  const auto& o = config.orchestrator;
  if (config.shards == 0)
    return invalid("orchestrator.shards must be positive");
  if (o.max_concurrency == 0)
    return invalid("orchestrator.max_concurrency must be positive");
  if (o.cancel_grace.count() <= 0)
    return invalid("orchestrator.cancel_grace_ms must be positive");
  if (o.retention.count() <= 0)
    return invalid("orchestrator.retention_minutes must be positive");
  if (o.sweep_interval.count() <= 0)
    return invalid("orchestrator.sweep_interval_ms must be positive");

  if (o.retry.max_attempts <= 0 || o.retry.unknown_max_attempts <= 0)
    return invalid("retry attempts must be positive");
  if (o.retry.base_delay.count() <= 0 ||
      o.retry.max_delay < o.retry.base_delay)
    return invalid("retry delays must satisfy 0 < base_delay <= max_delay");

  auto check_breaker = [](const BreakerConfig& b) {
    return b.failure_threshold > 0 && b.cooldown.count() > 0 &&
           b.cooldown_jitter.count() >= 0;
  };
  if (!check_breaker(o.breaker))
    return invalid("breaker limits must be positive");

  if (!log::parse_level(config.logging.level))
    return invalid(std::format("unknown log level '{}'", config.logging.level));

  std::unordered_set<std::string_view> seen;
  for (const auto& p : config.providers) {
    if (p.id.empty())
      return invalid("provider without id");
    if (!seen.insert(p.id.value()).second)
      return invalid(std::format("duplicate provider id '{}'", p.id));
    if (!AdapterFactory::instance().contains(p.kind))
      return invalid(std::format("provider {}: unknown kind '{}'", p.id, p.kind));
    if (p.kind == "http") {
      if (!parse_api_profile(p.profile))
        return invalid(
            std::format("provider {}: unknown profile '{}'", p.id, p.profile));
      if (!http::parse_http_url(p.base_url))
        return invalid(std::format("provider {}: base_url '{}' is not http://",
                                   p.id, p.base_url));
    }
    if (p.request_timeout.count() <= 0 || p.job_timeout.count() <= 0 ||
        p.poll_interval.count() <= 0)
      return invalid(std::format("provider {}: timeouts must be positive", p.id));
    if (p.max_concurrency < 0)
      return invalid(
          std::format("provider {}: max_concurrency must not be negative", p.id));
    if (p.max_attempts && *p.max_attempts <= 0)
      return invalid(std::format("provider {}: max_attempts must be positive", p.id));
    if (p.rate_limit.max_requests < 0 || p.rate_limit.burst < 0 ||
        p.rate_limit.window.count() <= 0)
      return invalid(std::format("provider {}: invalid rate_limit", p.id));
    if (p.breaker && !check_breaker(*p.breaker))
      return invalid(std::format("provider {}: breaker limits must be positive", p.id));
  }

  for (const auto& p : config.providers) {
    if (!p.fallback)
      continue;
    if (*p.fallback == p.id)
      return invalid(std::format("provider {}: fallback points to itself", p.id));
    if (!config.find_provider(p.fallback->value()))
      return invalid(std::format("provider {}: unknown fallback '{}'", p.id,
                                 *p.fallback));
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path) -> Result<Config> {
  std::error_code ec;
  if (!std::filesystem::exists(std::filesystem::path(path), ec)) {
    log::error("Config file not found: {}", path);
    return fail(Error::FileNotFound);
  }
  try {
    YAML::Node node = YAML::LoadFile(std::string(path));
    return parse_config(node);
  } catch (const YAML::BadFile& e) {
    log::error("Failed to open config file {}: {}", path, e.what());
    return fail(Error::FileOpenFailed);
  } catch (const YAML::Exception& e) {
    log::error("Failed to load config file {}: {}", path, e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<Config> {
  try {
    YAML::Node node = YAML::Load(std::string(yaml_str));
    return parse_config(node);
  } catch (const YAML::Exception& e) {
    log::error("Failed to parse YAML config: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const Config& config) -> std::string {
  const auto& o = config.orchestrator;
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "orchestrator" << YAML::Value << YAML::BeginMap;
  write_field(out, "max_concurrency", o.max_concurrency);
  write_field(out, "max_queue_depth", o.max_queue_depth);
  write_field(out, "cancel_grace_ms", o.cancel_grace.count());
  write_field(out, "retention_minutes", o.retention.count());
  write_field(out, "sweep_interval_ms", o.sweep_interval.count());
  write_field(out, "shards", config.shards);
  out << YAML::EndMap;

  out << YAML::Key << "retry" << YAML::Value << YAML::BeginMap;
  write_field(out, "max_attempts", o.retry.max_attempts);
  write_field(out, "base_delay_ms", o.retry.base_delay.count());
  write_field(out, "max_delay_ms", o.retry.max_delay.count());
  write_field(out, "unknown_max_attempts", o.retry.unknown_max_attempts);
  write_field(out, "jitter", o.retry.jitter);
  out << YAML::EndMap;

  out << YAML::Key << "breaker" << YAML::Value;
  to_yaml(out, o.breaker);

  out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
  write_field(out, "level", config.logging.level);
  out << YAML::EndMap;

  out << YAML::Key << "providers" << YAML::Value << YAML::BeginSeq;
  for (const auto& p : config.providers) {
    to_yaml(out, p);
  }
  out << YAML::EndSeq;

  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace genflow
