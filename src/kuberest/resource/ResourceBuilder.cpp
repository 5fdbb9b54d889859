#include <kuberest/resource/ResourceBuilder.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace KR {

ResourceBuilder::ResourceBuilder(std::string_view kind) {
    this->staged.kind = std::string{kind};
    if (auto valid = validateKind(kind); !valid) {
        kr_log("Rejected kind: " + describeError(valid.error()), "ResourceBuilder", "ERROR");
        this->kindError = valid.error();
    }
}

auto ResourceBuilder::group(std::string_view group) -> ResourceBuilder& {
    this->staged.group = std::string{group};
    return *this;
}

auto ResourceBuilder::version(std::string_view version) -> ResourceBuilder& {
    this->staged.version = std::string{version};
    return *this;
}

auto ResourceBuilder::within(std::string_view ns) -> ResourceBuilder& {
    this->staged.ns = std::string{ns};
    return *this;
}

auto ResourceBuilder::build() const -> Expected<ResourceDescriptor> {
    if (this->kindError) {
        return std::unexpected{*this->kindError};
    }
    return makeResource(this->staged);
}

} // namespace KR
