#pragma once
#include <kuberest/core/Error.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace KR {

/**
 * Identity of a resource as supplied by the caller. group and version are optional so that a
 * forgotten field is reported instead of defaulted; an explicitly empty group selects the
 * core ("/api") group.
 */
struct ResourceConfig {
    std::string                kind;
    std::optional<std::string> group;
    std::optional<std::string> version;
    std::optional<std::string> ns;
};

/**
 * Validated, immutable identity of a resource type. apiVersion and plural are derived once
 * when the descriptor is made. Without a namespace the descriptor addresses the resource at
 * cluster scope.
 */
class ResourceDescriptor {
public:
    auto getKind() const -> std::string const& { return this->kind; }
    auto getGroup() const -> std::string const& { return this->group; }
    auto getVersion() const -> std::string const& { return this->version; }
    auto getApiVersion() const -> std::string const& { return this->apiVersion; }
    auto getPlural() const -> std::string const& { return this->plural; }
    auto getNamespace() const -> std::optional<std::string> const& { return this->ns; }

    auto isNamespaced() const -> bool { return this->ns.has_value(); }
    auto isCoreGroup() const -> bool { return this->group.empty(); }

    // Same resource type addressed in another namespace.
    auto within(std::string_view ns) const -> Expected<ResourceDescriptor>;
    auto clusterScoped() const -> ResourceDescriptor;

    auto operator==(ResourceDescriptor const& other) const -> bool = default;

    friend auto makeResource(ResourceConfig const& config) -> Expected<ResourceDescriptor>;

private:
    ResourceDescriptor() = default;

    std::string                kind;
    std::string                group;
    std::string                version;
    std::string                apiVersion;
    std::string                plural;
    std::optional<std::string> ns;
};

// Checks that kind is a non-empty, PascalCase, singular type name.
[[nodiscard]] auto validateKind(std::string_view kind) -> Expected<void>;

// The single construction path for descriptors. Fails on a malformed kind, a missing group
// or version, an empty version, or an empty namespace.
[[nodiscard]] auto makeResource(ResourceConfig const& config) -> Expected<ResourceDescriptor>;

[[nodiscard]] auto makeApiVersion(std::string_view group, std::string_view version) -> std::string;

} // namespace KR
