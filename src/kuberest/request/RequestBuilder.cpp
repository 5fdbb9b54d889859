#include <kuberest/request/RequestBuilder.hpp>

#include "log/TaggedLogger.hpp"
#include "text/QueryEncoding.hpp"

#include <string>
#include <utility>

namespace KR {

namespace {

constexpr std::string_view kJsonContentType = "application/json";

auto fail(Error::Code code, std::string message) -> std::unexpected<Error> {
    kr_log(message, "RequestBuilder", "ERROR");
    return std::unexpected{Error{code, std::move(message)}};
}

void append_post_params(Text::QueryBuilder& query, PostParams const& params) {
    if (params.dryRun)
        query.append("dryRun", "All");
    if (params.fieldManager)
        query.append("fieldManager", *params.fieldManager);
    if (params.fieldValidation)
        query.append("fieldValidation", fieldValidationToString(*params.fieldValidation));
}

void append_patch_params(Text::QueryBuilder& query, PatchParams const& params) {
    if (params.dryRun)
        query.append("dryRun", "All");
    if (params.force)
        query.append("force", "true");
    if (params.fieldManager)
        query.append("fieldManager", *params.fieldManager);
    if (params.fieldValidation)
        query.append("fieldValidation", fieldValidationToString(*params.fieldValidation));
}

void append_selectors(Text::QueryBuilder& query, ListParams const& params) {
    if (params.labelSelector)
        query.append("labelSelector", *params.labelSelector);
    if (params.fieldSelector)
        query.append("fieldSelector", *params.fieldSelector);
}

void append_list_params(Text::QueryBuilder& query, ListParams const& params) {
    append_selectors(query, params);
    if (params.resourceVersion)
        query.append("resourceVersion", *params.resourceVersion);
    if (params.timeoutSeconds)
        query.append("timeoutSeconds", std::to_string(*params.timeoutSeconds));
    if (params.limit)
        query.append("limit", std::to_string(*params.limit));
    if (params.continueToken)
        query.append("continue", *params.continueToken);
}

void append_watch_params(Text::QueryBuilder& query, ListParams const& params, std::string_view resourceVersion) {
    query.append("watch", "true");
    append_selectors(query, params);
    if (!resourceVersion.empty())
        query.append("resourceVersion", resourceVersion);
    else if (params.resourceVersion)
        query.append("resourceVersion", *params.resourceVersion);
    if (params.timeoutSeconds)
        query.append("timeoutSeconds", std::to_string(*params.timeoutSeconds));
    if (params.allowWatchBookmarks)
        query.append("allowWatchBookmarks", "true");
}

void append_delete_params(Text::QueryBuilder& query, DeleteParams const& params) {
    if (params.dryRun)
        query.append("dryRun", "All");
    if (params.gracePeriodSeconds)
        query.append("gracePeriodSeconds", std::to_string(*params.gracePeriodSeconds));
    if (params.propagationPolicy)
        query.append("propagationPolicy", propagationPolicyToString(*params.propagationPolicy));
}

auto validate_patch(PatchParams const& params, Patch const& patch) -> Expected<void> {
    bool const isApply = patch.getStrategy() == PatchStrategy::Apply;
    if (isApply && (!params.fieldManager || params.fieldManager->empty())) {
        return fail(Error::Code::InvalidParams, "server-side apply requires a fieldManager");
    }
    if (params.force && !isApply) {
        return fail(Error::Code::InvalidParams, "force is only valid for server-side apply patches");
    }
    return {};
}

auto make_request(std::string_view method, std::string path, Text::QueryBuilder const& query) -> RequestSpec {
    RequestSpec request;
    request.method = std::string{method};
    request.path   = std::move(path);
    request.query  = query.str();
    return request;
}

} // namespace

RequestBuilder::RequestBuilder(ResourceDescriptor resource)
    : resource(std::move(resource)) {}

auto RequestBuilder::collectionPath() const -> std::string {
    std::string path = this->resource.isCoreGroup() ? "/api/" : "/apis/";
    path.append(this->resource.getApiVersion());
    path.push_back('/');
    if (auto const& ns = this->resource.getNamespace()) {
        path.append("namespaces/");
        path.append(Text::path_encode(*ns));
        path.push_back('/');
    }
    path.append(this->resource.getPlural());
    return path;
}

auto RequestBuilder::itemPath(std::string_view name) const -> Expected<std::string> {
    if (name.empty()) {
        return fail(Error::Code::MissingName, "item request on " + this->resource.getPlural() + " requires a name");
    }
    std::string path = this->collectionPath();
    path.push_back('/');
    path.append(Text::path_encode(name));
    return path;
}

auto RequestBuilder::subresourcePath(std::string_view name, std::string_view subresource) const -> Expected<std::string> {
    auto path = this->itemPath(name);
    if (!path) {
        return path;
    }
    path->push_back('/');
    path->append(subresource);
    return path;
}

auto RequestBuilder::create(PostParams const& params, Bytes body) const -> Expected<RequestSpec> {
    Text::QueryBuilder query;
    append_post_params(query, params);
    auto request        = make_request("POST", this->collectionPath(), query);
    request.body        = std::move(body);
    request.contentType = std::string{kJsonContentType};
    return request;
}

auto RequestBuilder::get(std::string_view name) const -> Expected<RequestSpec> {
    return this->makeGet(this->itemPath(name));
}

auto RequestBuilder::list(ListParams const& params) const -> Expected<RequestSpec> {
    Text::QueryBuilder query;
    append_list_params(query, params);
    return make_request("GET", this->collectionPath(), query);
}

auto RequestBuilder::watch(ListParams const& params, std::string_view resourceVersion) const -> Expected<RequestSpec> {
    Text::QueryBuilder query;
    append_watch_params(query, params, resourceVersion);
    return make_request("GET", this->collectionPath(), query);
}

auto RequestBuilder::watchSingle(std::string_view name, ListParams const& params, std::string_view resourceVersion) const
        -> Expected<RequestSpec> {
    auto path = this->itemPath(name);
    if (!path) {
        return std::unexpected{path.error()};
    }
    Text::QueryBuilder query;
    append_watch_params(query, params, resourceVersion);
    return make_request("GET", std::move(*path), query);
}

auto RequestBuilder::patch(std::string_view name, PatchParams const& params, Patch const& patch) const -> Expected<RequestSpec> {
    return this->makePatch(this->itemPath(name), params, patch);
}

auto RequestBuilder::replace(std::string_view name, PostParams const& params, Bytes body) const -> Expected<RequestSpec> {
    return this->makeReplace(this->itemPath(name), params, std::move(body));
}

auto RequestBuilder::deleteItem(std::string_view name, DeleteParams const& params) const -> Expected<RequestSpec> {
    auto path = this->itemPath(name);
    if (!path) {
        return std::unexpected{path.error()};
    }
    Text::QueryBuilder query;
    append_delete_params(query, params);
    return make_request("DELETE", std::move(*path), query);
}

auto RequestBuilder::deleteCollection(DeleteParams const& deleteParams, ListParams const& listParams) const -> Expected<RequestSpec> {
    Text::QueryBuilder query;
    append_delete_params(query, deleteParams);
    append_list_params(query, listParams);
    return make_request("DELETE", this->collectionPath(), query);
}

auto RequestBuilder::getStatus(std::string_view name) const -> Expected<RequestSpec> {
    return this->makeGet(this->subresourcePath(name, "status"));
}

auto RequestBuilder::patchStatus(std::string_view name, PatchParams const& params, Patch const& patch) const -> Expected<RequestSpec> {
    return this->makePatch(this->subresourcePath(name, "status"), params, patch);
}

auto RequestBuilder::replaceStatus(std::string_view name, PostParams const& params, Bytes body) const -> Expected<RequestSpec> {
    return this->makeReplace(this->subresourcePath(name, "status"), params, std::move(body));
}

auto RequestBuilder::getScale(std::string_view name) const -> Expected<RequestSpec> {
    return this->makeGet(this->subresourcePath(name, "scale"));
}

auto RequestBuilder::patchScale(std::string_view name, PatchParams const& params, Patch const& patch) const -> Expected<RequestSpec> {
    return this->makePatch(this->subresourcePath(name, "scale"), params, patch);
}

auto RequestBuilder::replaceScale(std::string_view name, PostParams const& params, Bytes body) const -> Expected<RequestSpec> {
    return this->makeReplace(this->subresourcePath(name, "scale"), params, std::move(body));
}

auto RequestBuilder::makeGet(Expected<std::string> path) const -> Expected<RequestSpec> {
    if (!path) {
        return std::unexpected{path.error()};
    }
    return make_request("GET", std::move(*path), Text::QueryBuilder{});
}

auto RequestBuilder::makePatch(Expected<std::string> path, PatchParams const& params, Patch const& patch) const -> Expected<RequestSpec> {
    if (!path) {
        return std::unexpected{path.error()};
    }
    if (auto valid = validate_patch(params, patch); !valid) {
        return std::unexpected{valid.error()};
    }
    Text::QueryBuilder query;
    append_patch_params(query, params);
    auto request        = make_request("PATCH", std::move(*path), query);
    request.body        = patch.getPayload();
    request.contentType = std::string{patch.getContentType()};
    return request;
}

auto RequestBuilder::makeReplace(Expected<std::string> path, PostParams const& params, Bytes body) const -> Expected<RequestSpec> {
    if (!path) {
        return std::unexpected{path.error()};
    }
    Text::QueryBuilder query;
    append_post_params(query, params);
    auto request        = make_request("PUT", std::move(*path), query);
    request.body        = std::move(body);
    request.contentType = std::string{kJsonContentType};
    return request;
}

} // namespace KR
