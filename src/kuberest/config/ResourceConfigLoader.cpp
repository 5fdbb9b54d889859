#include <kuberest/config/ResourceConfigLoader.hpp>

#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <optional>
#include <string>

namespace KR {

namespace {

using json = nlohmann::json;

auto malformed(std::string message) -> std::unexpected<Error> {
    kr_log(message, "ResourceConfig", "ERROR");
    return std::unexpected{Error{Error::Code::MalformedInput, std::move(message)}};
}

auto read_optional_string(json const& document, char const* key, std::optional<std::string>& out) -> bool {
    if (!document.contains(key) || document[key].is_null()) {
        return true;
    }
    if (!document[key].is_string()) {
        return false;
    }
    out = document[key].get<std::string>();
    return true;
}

auto read_env(std::string_view prefix, std::string_view suffix) -> std::optional<std::string> {
    std::string key{prefix};
    key.push_back('_');
    key.append(suffix);
    if (char const* raw = std::getenv(key.c_str())) {
        return std::string{raw};
    }
    return std::nullopt;
}

} // namespace

auto parseResourceConfig(json const& document) -> Expected<ResourceConfig> {
    if (!document.is_object()) {
        return malformed("resource config must be a JSON object");
    }
    if (!document.contains("kind") || !document["kind"].is_string()) {
        return malformed("resource config requires a string 'kind'");
    }

    ResourceConfig config;
    config.kind = document["kind"].get<std::string>();
    if (!read_optional_string(document, "group", config.group)) {
        return malformed("resource config 'group' must be a string");
    }
    if (!read_optional_string(document, "version", config.version)) {
        return malformed("resource config 'version' must be a string");
    }
    if (!read_optional_string(document, "namespace", config.ns)) {
        return malformed("resource config 'namespace' must be a string");
    }
    return config;
}

auto loadResourceConfig(std::string_view jsonText) -> Expected<ResourceConfig> {
    auto document = json::parse(jsonText, nullptr, false);
    if (document.is_discarded()) {
        return malformed("resource config is not valid JSON");
    }
    return parseResourceConfig(document);
}

auto applyResourceEnvOverrides(ResourceConfig& config, std::string_view prefix) -> Expected<void> {
    auto group   = read_env(prefix, "GROUP");
    auto version = read_env(prefix, "VERSION");
    auto ns      = read_env(prefix, "NAMESPACE");
    if (version && version->empty()) {
        return malformed(std::string{prefix} + "_VERSION must not be empty");
    }

    if (group) {
        config.group = std::move(*group);
    }
    if (version) {
        config.version = std::move(*version);
    }
    if (ns) {
        if (ns->empty()) {
            config.ns.reset();
        } else {
            config.ns = std::move(*ns);
        }
    }
    return {};
}

auto resourceConfigToJson(ResourceConfig const& config) -> json {
    json document{{"kind", config.kind}};
    if (config.group) {
        document["group"] = *config.group;
    }
    if (config.version) {
        document["version"] = *config.version;
    }
    if (config.ns) {
        document["namespace"] = *config.ns;
    }
    return document;
}

} // namespace KR
