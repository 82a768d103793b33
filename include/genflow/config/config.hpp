#pragma once

#include "genflow/core/error.hpp"
#include "genflow/resilience/circuit_breaker.hpp"
#include "genflow/resilience/rate_limiter.hpp"
#include "genflow/resilience/retry_policy.hpp"
#include "genflow/util/id.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace genflow {

struct ProviderConfig {
  ProviderId id;
  std::string kind{"http"};
  std::string profile{"luma"};
  std::string base_url;
  // Resolved credential; filled from api_key_env at load time when set.
  std::string api_key;
  std::string api_key_env;
  std::string model;
  std::chrono::milliseconds request_timeout{30000};
  std::chrono::milliseconds job_timeout{600000};
  std::chrono::milliseconds poll_interval{5000};
  // 0: bounded only by the global budget.
  int max_concurrency{0};
  std::optional<int> max_attempts;
  bool enabled{true};
  std::optional<ProviderId> fallback;
  RateLimitConfig rate_limit;
  std::optional<BreakerConfig> breaker;
};

struct OrchestratorConfig {
  std::size_t max_concurrency{4};
  // 0: unbounded.
  std::size_t max_queue_depth{0};
  std::chrono::milliseconds cancel_grace{5000};
  std::chrono::minutes retention{2880};
  std::chrono::milliseconds sweep_interval{60000};
  RetryConfig retry;
  BreakerConfig breaker;
};

struct LoggingConfig {
  std::string level{"info"};
};

struct Config {
  unsigned shards{2};
  OrchestratorConfig orchestrator;
  LoggingConfig logging;
  std::vector<ProviderConfig> providers;
  std::unordered_map<std::string, std::size_t, StringHash, std::equal_to<>>
      provider_index;

  [[nodiscard]] auto find_provider(std::string_view id) const
      -> const ProviderConfig* {
    auto it = provider_index.find(id);
    return it != provider_index.end() ? &providers[it->second] : nullptr;
  }

  auto rebuild_index() -> void {
    provider_index.clear();
    for (std::size_t i = 0; i < providers.size(); ++i) {
      provider_index[providers[i].id.str()] = i;
    }
  }
};

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<Config>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<Config>;
  // Effective configuration with credentials masked.
  [[nodiscard]] static auto to_string(const Config& config) -> std::string;
};

// Checks cross-field rules that YAML typing cannot express.
[[nodiscard]] auto validate_config(const Config& config) -> Result<void>;

}  // namespace genflow
