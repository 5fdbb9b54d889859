#include <kuberest/config/ResourceConfigLoader.hpp>

#include <doctest/doctest.h>

#include <cstdlib>
#include <optional>
#include <string>

using namespace KR;

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

} // namespace

TEST_SUITE("config.resource") {
TEST_CASE("loadResourceConfig reads all fields") {
    auto config = loadResourceConfig(R"({"kind":"Foo","group":"clux.dev","version":"v1","namespace":"myns"})");
    REQUIRE(config.has_value());
    CHECK(config->kind == "Foo");
    CHECK(config->group == std::optional<std::string>{"clux.dev"});
    CHECK(config->version == std::optional<std::string>{"v1"});
    CHECK(config->ns == std::optional<std::string>{"myns"});

    auto descriptor = makeResource(*config);
    REQUIRE(descriptor.has_value());
    CHECK(descriptor->getApiVersion() == "clux.dev/v1");
}

TEST_CASE("missing group surfaces when the descriptor is made") {
    auto config = loadResourceConfig(R"({"kind":"Foo","version":"v1"})");
    REQUIRE(config.has_value());
    CHECK_FALSE(config->group.has_value());
    CHECK_FALSE(config->ns.has_value());

    auto descriptor = makeResource(*config);
    REQUIRE_FALSE(descriptor.has_value());
    CHECK(descriptor.error().code == Error::Code::MissingGroup);
}

TEST_CASE("malformed documents are rejected") {
    CHECK(loadResourceConfig("{not json").error().code == Error::Code::MalformedInput);
    CHECK(loadResourceConfig("[]").error().code == Error::Code::MalformedInput);
    CHECK(loadResourceConfig(R"({"group":"clux.dev"})").error().code == Error::Code::MalformedInput);
    CHECK(loadResourceConfig(R"({"kind":7})").error().code == Error::Code::MalformedInput);
    CHECK(loadResourceConfig(R"({"kind":"Foo","version":1})").error().code == Error::Code::MalformedInput);
    CHECK(loadResourceConfig(R"({"kind":"Foo","namespace":["a"]})").error().code == Error::Code::MalformedInput);
}

TEST_CASE("null fields read as absent") {
    auto config = parseResourceConfig(nlohmann::json{{"kind", "Foo"}, {"group", ""}, {"version", "v1"}, {"namespace", nullptr}});
    REQUIRE(config.has_value());
    CHECK(config->group == std::optional<std::string>{""});
    CHECK_FALSE(config->ns.has_value());
}

TEST_CASE("environment overrides apply on top of the document") {
    EnvGuard group{"KRTEST_GROUP", "override.dev"};
    EnvGuard version{"KRTEST_VERSION", "v2"};
    EnvGuard ns{"KRTEST_NAMESPACE", "prod"};

    ResourceConfig config{.kind = "Foo", .group = "clux.dev", .version = "v1", .ns = std::nullopt};
    REQUIRE(applyResourceEnvOverrides(config, "KRTEST").has_value());
    CHECK(config.group == std::optional<std::string>{"override.dev"});
    CHECK(config.version == std::optional<std::string>{"v2"});
    CHECK(config.ns == std::optional<std::string>{"prod"});
}

TEST_CASE("empty namespace override selects cluster scope") {
    EnvGuard group{"KRTEST_GROUP", nullptr};
    EnvGuard version{"KRTEST_VERSION", nullptr};
    EnvGuard ns{"KRTEST_NAMESPACE", ""};

    ResourceConfig config{.kind = "Foo", .group = "clux.dev", .version = "v1", .ns = "myns"};
    REQUIRE(applyResourceEnvOverrides(config, "KRTEST").has_value());
    CHECK_FALSE(config.ns.has_value());
    CHECK(config.version == std::optional<std::string>{"v1"});
}

TEST_CASE("empty version override is rejected") {
    EnvGuard version{"KRTEST_VERSION", ""};
    ResourceConfig config{.kind = "Foo", .group = "clux.dev", .version = "v1", .ns = std::nullopt};
    auto result = applyResourceEnvOverrides(config, "KRTEST");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::MalformedInput);
}

TEST_CASE("a rejected override leaves the config untouched") {
    EnvGuard group{"KRTEST_GROUP", "other.dev"};
    EnvGuard version{"KRTEST_VERSION", ""};
    EnvGuard ns{"KRTEST_NAMESPACE", "prod"};
    ResourceConfig config{.kind = "Foo", .group = "clux.dev", .version = "v1", .ns = "myns"};
    auto result = applyResourceEnvOverrides(config, "KRTEST");
    REQUIRE_FALSE(result.has_value());
    CHECK(config.group == std::optional<std::string>{"clux.dev"});
    CHECK(config.version == std::optional<std::string>{"v1"});
    CHECK(config.ns == std::optional<std::string>{"myns"});
}

TEST_CASE("resourceConfigToJson writes only present fields") {
    ResourceConfig config{.kind = "Foo", .group = "clux.dev", .version = std::nullopt, .ns = std::nullopt};
    auto document = resourceConfigToJson(config);
    CHECK(document == nlohmann::json{{"kind", "Foo"}, {"group", "clux.dev"}});

    auto reparsed = parseResourceConfig(document);
    REQUIRE(reparsed.has_value());
    CHECK(reparsed->group == config.group);
    CHECK_FALSE(reparsed->version.has_value());
}
}
