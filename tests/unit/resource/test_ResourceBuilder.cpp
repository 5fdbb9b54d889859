#include <kuberest/resource/ResourceBuilder.hpp>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace KR;

TEST_SUITE("resource.builder") {
TEST_CASE("build derives apiVersion from group and version") {
    auto foos = ResourceBuilder{"Foo"}.group("clux.dev").version("v1").build();
    REQUIRE(foos.has_value());
    CHECK(foos->getKind() == "Foo");
    CHECK(foos->getGroup() == "clux.dev");
    CHECK(foos->getVersion() == "v1");
    CHECK(foos->getApiVersion() == "clux.dev/v1");
    CHECK(foos->getPlural() == "foos");
    CHECK_FALSE(foos->isNamespaced());
    CHECK_FALSE(foos->getNamespace().has_value());
}

TEST_CASE("empty group selects the core group") {
    auto pods = ResourceBuilder{"Pod"}.group("").version("v1").within("default").build();
    REQUIRE(pods.has_value());
    CHECK(pods->isCoreGroup());
    CHECK(pods->getApiVersion() == "v1");
    CHECK(pods->getNamespace() == std::optional<std::string>{"default"});
}

TEST_CASE("apiVersion composition holds across kinds and groups") {
    struct Case {
        char const* kind;
        char const* group;
        char const* version;
        char const* apiVersion;
        char const* plural;
    };
    std::vector<Case> cases{
            {"Foo", "clux.dev", "v1", "clux.dev/v1", "foos"},
            {"Policy", "example.com", "v1beta1", "example.com/v1beta1", "policies"},
            {"Box", "", "v1", "v1", "boxes"},
            {"CronJob", "batch", "v1", "batch/v1", "cronjobs"},
            {"Ingress", "networking.k8s.io", "v1", "networking.k8s.io/v1", "ingresses"},
    };
    for (auto const& c : cases) {
        CAPTURE(c.kind);
        auto descriptor = CustomResource::builder(c.kind).group(c.group).version(c.version).build();
        REQUIRE(descriptor.has_value());
        CHECK(descriptor->getApiVersion() == c.apiVersion);
        CHECK(descriptor->getPlural() == c.plural);
    }
}

TEST_CASE("build without group or version fails") {
    auto noGroup = ResourceBuilder{"Foo"}.version("v1").build();
    REQUIRE_FALSE(noGroup.has_value());
    CHECK(noGroup.error().code == Error::Code::MissingGroup);

    auto noVersion = ResourceBuilder{"Foo"}.group("clux.dev").build();
    REQUIRE_FALSE(noVersion.has_value());
    CHECK(noVersion.error().code == Error::Code::MissingVersion);

    auto neither = ResourceBuilder{"Foo"}.build();
    REQUIRE_FALSE(neither.has_value());
    CHECK(neither.error().code == Error::Code::MissingGroup);

    auto emptyVersion = ResourceBuilder{"Foo"}.group("clux.dev").version("").build();
    REQUIRE_FALSE(emptyVersion.has_value());
    CHECK(emptyVersion.error().code == Error::Code::MissingVersion);
}

TEST_CASE("malformed kinds are rejected") {
    for (auto kind : {"", "foo", "Foos", "Policies", "Cron_Job", "cron-job", "Foo Bar"}) {
        CAPTURE(kind);
        auto descriptor = ResourceBuilder{kind}.group("clux.dev").version("v1").build();
        REQUIRE_FALSE(descriptor.has_value());
        CHECK(descriptor.error().code == Error::Code::InvalidKind);
        CHECK(descriptor.error().message.has_value());
    }
}

TEST_CASE("empty namespace is rejected") {
    auto descriptor = ResourceBuilder{"Foo"}.group("clux.dev").version("v1").within("").build();
    REQUIRE_FALSE(descriptor.has_value());
    CHECK(descriptor.error().code == Error::Code::InvalidNamespace);
}

TEST_CASE("mutating the builder after build leaves descriptors unchanged") {
    ResourceBuilder builder{"Foo"};
    builder.group("clux.dev").version("v1").within("myns");
    auto first = builder.build();
    REQUIRE(first.has_value());

    builder.group("other.dev").version("v2").within("elsewhere");
    auto second = builder.build();
    REQUIRE(second.has_value());

    CHECK(first->getApiVersion() == "clux.dev/v1");
    CHECK(first->getNamespace() == std::optional<std::string>{"myns"});
    CHECK(second->getApiVersion() == "other.dev/v2");
    CHECK(second->getNamespace() == std::optional<std::string>{"elsewhere"});
    CHECK_FALSE(*first == *second);
}

TEST_CASE("later setter calls win") {
    auto descriptor = ResourceBuilder{"Foo"}.group("a.dev").group("b.dev").version("v1").version("v2").build();
    REQUIRE(descriptor.has_value());
    CHECK(descriptor->getApiVersion() == "b.dev/v2");
}
}
