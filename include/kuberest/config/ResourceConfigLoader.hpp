#pragma once
#include <kuberest/core/Error.hpp>
#include <kuberest/resource/ResourceDescriptor.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace KR {

// Reads {"kind": "...", "group": "...", "version": "...", "namespace": "..."}. Only kind is
// required here; a missing group or version is reported later by makeResource.
[[nodiscard]] auto parseResourceConfig(nlohmann::json const& document) -> Expected<ResourceConfig>;

[[nodiscard]] auto loadResourceConfig(std::string_view jsonText) -> Expected<ResourceConfig>;

// Applies {prefix}_GROUP, {prefix}_VERSION and {prefix}_NAMESPACE. An empty namespace value
// switches the config to cluster scope, an empty version is rejected.
[[nodiscard]] auto applyResourceEnvOverrides(ResourceConfig& config, std::string_view prefix) -> Expected<void>;

[[nodiscard]] auto resourceConfigToJson(ResourceConfig const& config) -> nlohmann::json;

} // namespace KR
