#include "genflow/provider/generation.hpp"

#include "genflow/util/log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace genflow {

auto to_json(nlohmann::json& j, const AssetRef& asset) -> void {
  j = {{"uri", asset.uri},
       {"mime_type", asset.mime_type},
       {"size_bytes", asset.size_bytes}};
}

auto from_json(const nlohmann::json& j, AssetRef& asset) -> void {
  j.at("uri").get_to(asset.uri);
  asset.mime_type = j.value("mime_type", std::string{});
  asset.size_bytes = j.value("size_bytes", std::uint64_t{0});
}

auto to_json(nlohmann::json& j, const GenerationRequest& request) -> void {
  j = {{"operation", request.operation},
       {"prompt", request.prompt},
       {"template_id", request.template_id},
       {"assets", request.assets},
       {"parameters", request.parameters}};
}

auto from_json(const nlohmann::json& j, GenerationRequest& request) -> void {
  j.at("operation").get_to(request.operation);
  request.prompt = j.value("prompt", std::string{});
  request.template_id = j.value("template_id", std::string{});
  if (auto it = j.find("assets"); it != j.end()) {
    it->get_to(request.assets);
  }
  if (auto it = j.find("parameters"); it != j.end()) {
    // Throws type_error for anything but an object.
    request.parameters = it->get<nlohmann::json::object_t>();
  }
}

auto to_json(nlohmann::json& j, const GenerationResult& result) -> void {
  j = {{"uri", result.uri}, {"metadata", result.metadata}};
}

auto parse_generation_request(std::string_view text)
    -> Result<GenerationRequest> {
  try {
    return nlohmann::json::parse(text).get<GenerationRequest>();
  } catch (const nlohmann::json::exception& e) {
    log::error("Invalid generation request: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto load_generation_request(std::string_view path)
    -> Result<GenerationRequest> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return fail(Error::FileNotFound);
  }
  std::ifstream file{std::string(path)};
  if (!file) {
    return fail(Error::FileOpenFailed);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_generation_request(buffer.str());
}

}  // namespace genflow
