#pragma once
#include <kuberest/core/Error.hpp>
#include <kuberest/resource/ResourceDescriptor.hpp>

#include <optional>
#include <string_view>

namespace KR {

/**
 * Fluent front end to makeResource.
 *
 *     auto foos = ResourceBuilder{"Foo"}.group("clux.dev").version("v1").within("myns").build();
 *
 * A malformed kind is detected when the builder is created and reported by build(). The
 * builder stages plain values, so descriptors built earlier never observe later setter calls.
 */
class ResourceBuilder {
public:
    explicit ResourceBuilder(std::string_view kind);

    auto group(std::string_view group) -> ResourceBuilder&;
    auto version(std::string_view version) -> ResourceBuilder&;
    auto within(std::string_view ns) -> ResourceBuilder&;

    [[nodiscard]] auto build() const -> Expected<ResourceDescriptor>;

private:
    ResourceConfig       staged;
    std::optional<Error> kindError;
};

struct CustomResource {
    static auto builder(std::string_view kind) -> ResourceBuilder { return ResourceBuilder{kind}; }
};

} // namespace KR
