#pragma once
#include <kuberest/core/Error.hpp>
#include <kuberest/request/Params.hpp>
#include <kuberest/request/RequestSpec.hpp>
#include <kuberest/resource/ResourceDescriptor.hpp>

#include <string>
#include <string_view>

namespace KR {

/**
 * Turns a ResourceDescriptor into RequestSpecs, one per call.
 *
 * Collection paths are "/api/{apiVersion}/{plural}" for the core group and
 * "/apis/{group}/{version}/{plural}" otherwise, with "namespaces/{ns}/" inserted before the
 * plural when the descriptor is namespaced. Item verbs append "/{name}", subresource verbs
 * append "/{name}/{subresource}". The namespace and the name are percent-encoded as single path
 * segments.
 *
 * Every operation is a pure function of the descriptor and its arguments. Item-level verbs
 * fail with Error::Code::MissingName when given an empty name; names are not otherwise
 * validated.
 */
class RequestBuilder {
public:
    explicit RequestBuilder(ResourceDescriptor resource);

    auto getResource() const -> ResourceDescriptor const& { return this->resource; }

    auto collectionPath() const -> std::string;
    auto itemPath(std::string_view name) const -> Expected<std::string>;

    auto create(PostParams const& params, Bytes body) const -> Expected<RequestSpec>;
    auto get(std::string_view name) const -> Expected<RequestSpec>;
    auto list(ListParams const& params) const -> Expected<RequestSpec>;
    // A non-empty resourceVersion overrides params.resourceVersion.
    auto watch(ListParams const& params, std::string_view resourceVersion) const -> Expected<RequestSpec>;
    auto watchSingle(std::string_view name, ListParams const& params, std::string_view resourceVersion) const -> Expected<RequestSpec>;
    auto patch(std::string_view name, PatchParams const& params, Patch const& patch) const -> Expected<RequestSpec>;
    auto replace(std::string_view name, PostParams const& params, Bytes body) const -> Expected<RequestSpec>;
    auto deleteItem(std::string_view name, DeleteParams const& params) const -> Expected<RequestSpec>;
    auto deleteCollection(DeleteParams const& deleteParams, ListParams const& listParams) const -> Expected<RequestSpec>;

    auto getStatus(std::string_view name) const -> Expected<RequestSpec>;
    auto patchStatus(std::string_view name, PatchParams const& params, Patch const& patch) const -> Expected<RequestSpec>;
    auto replaceStatus(std::string_view name, PostParams const& params, Bytes body) const -> Expected<RequestSpec>;

    auto getScale(std::string_view name) const -> Expected<RequestSpec>;
    auto patchScale(std::string_view name, PatchParams const& params, Patch const& patch) const -> Expected<RequestSpec>;
    auto replaceScale(std::string_view name, PostParams const& params, Bytes body) const -> Expected<RequestSpec>;

private:
    ResourceDescriptor resource;

    auto subresourcePath(std::string_view name, std::string_view subresource) const -> Expected<std::string>;
    auto makeGet(Expected<std::string> path) const -> Expected<RequestSpec>;
    auto makePatch(Expected<std::string> path, PatchParams const& params, Patch const& patch) const -> Expected<RequestSpec>;
    auto makeReplace(Expected<std::string> path, PostParams const& params, Bytes body) const -> Expected<RequestSpec>;
};

} // namespace KR
