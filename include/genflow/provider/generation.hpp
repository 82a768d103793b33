#pragma once

#include "genflow/core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace genflow {

// Reference to an already validated, size-bounded asset. Only the reference
// travels through the engine, never the bytes.
struct AssetRef {
  std::string uri;
  std::string mime_type;
  std::uint64_t size_bytes{0};
};

// Resolved generation payload. The orchestrator stores it and hands it to
// the adapter untouched.
struct GenerationRequest {
  std::string operation;  // "composite", "image_to_video", ...
  std::string prompt;
  std::string template_id;
  std::vector<AssetRef> assets;
  nlohmann::json parameters = nlohmann::json::object();
};

struct GenerationResult {
  std::string uri;
  nlohmann::json metadata = nlohmann::json::object();
};

auto to_json(nlohmann::json& j, const AssetRef& asset) -> void;
auto from_json(const nlohmann::json& j, AssetRef& asset) -> void;
auto to_json(nlohmann::json& j, const GenerationRequest& request) -> void;
auto from_json(const nlohmann::json& j, GenerationRequest& request) -> void;
auto to_json(nlohmann::json& j, const GenerationResult& result) -> void;

[[nodiscard]] auto parse_generation_request(std::string_view text)
    -> Result<GenerationRequest>;
[[nodiscard]] auto load_generation_request(std::string_view path)
    -> Result<GenerationRequest>;

}  // namespace genflow
