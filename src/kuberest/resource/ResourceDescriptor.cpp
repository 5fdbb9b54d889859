#include <kuberest/resource/ResourceDescriptor.hpp>

#include "log/TaggedLogger.hpp"
#include "text/Inflection.hpp"

#include <string>

namespace KR {

namespace {

auto fail(Error::Code code, std::string message) -> std::unexpected<Error> {
    kr_log("makeResource failed: " + message, "ResourceDescriptor", "ERROR");
    return std::unexpected{Error{code, std::move(message)}};
}

} // namespace

auto validateKind(std::string_view kind) -> Expected<void> {
    if (kind.empty()) {
        return std::unexpected{Error{Error::Code::InvalidKind, "kind must not be empty"}};
    }
    if (!Text::is_pascal_case(kind)) {
        return std::unexpected{Error{Error::Code::InvalidKind, "kind '" + std::string{kind} + "' must be PascalCase"}};
    }
    if (Text::is_plural(kind)) {
        return std::unexpected{Error{Error::Code::InvalidKind, "kind '" + std::string{kind} + "' must be singular"}};
    }
    return {};
}

auto makeApiVersion(std::string_view group, std::string_view version) -> std::string {
    if (group.empty()) {
        return std::string{version};
    }
    std::string apiVersion;
    apiVersion.reserve(group.size() + 1 + version.size());
    apiVersion.append(group);
    apiVersion.push_back('/');
    apiVersion.append(version);
    return apiVersion;
}

auto makeResource(ResourceConfig const& config) -> Expected<ResourceDescriptor> {
    if (auto valid = validateKind(config.kind); !valid) {
        return fail(valid.error().code, valid.error().message.value_or("invalid kind"));
    }
    if (!config.group) {
        return fail(Error::Code::MissingGroup, "resource " + config.kind + " must have a group");
    }
    if (!config.version) {
        return fail(Error::Code::MissingVersion, "resource " + config.kind + " must have a version");
    }
    if (config.version->empty()) {
        return fail(Error::Code::MissingVersion, "resource " + config.kind + " has an empty version");
    }
    if (config.ns && config.ns->empty()) {
        return fail(Error::Code::InvalidNamespace, "resource " + config.kind + " has an empty namespace");
    }

    ResourceDescriptor descriptor;
    descriptor.kind       = config.kind;
    descriptor.group      = *config.group;
    descriptor.version    = *config.version;
    descriptor.apiVersion = makeApiVersion(descriptor.group, descriptor.version);
    descriptor.plural     = Text::to_plural(Text::to_lower(descriptor.kind));
    descriptor.ns         = config.ns;
    kr_log("Made resource " + descriptor.apiVersion + " " + descriptor.kind, "ResourceDescriptor", "INFO");
    return descriptor;
}

auto ResourceDescriptor::within(std::string_view ns) const -> Expected<ResourceDescriptor> {
    if (ns.empty()) {
        return std::unexpected{Error{Error::Code::InvalidNamespace, "namespace must not be empty"}};
    }
    ResourceDescriptor scoped = *this;
    scoped.ns                 = std::string{ns};
    return scoped;
}

auto ResourceDescriptor::clusterScoped() const -> ResourceDescriptor {
    ResourceDescriptor unscoped = *this;
    unscoped.ns.reset();
    return unscoped;
}

} // namespace KR
