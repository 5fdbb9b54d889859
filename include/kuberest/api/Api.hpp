#pragma once
#include <kuberest/api/Transport.hpp>
#include <kuberest/core/Error.hpp>
#include <kuberest/request/RequestBuilder.hpp>
#include <kuberest/resource/ResourceDescriptor.hpp>

#include <string_view>
#include <utility>

namespace KR {

/**
 * Binds a ResourceDescriptor to a Transport. K names the object type the caller will decode
 * responses into; it is a tag only and is never instantiated here.
 *
 * The transport is borrowed and must outlive the Api. Requests that fail to synthesize are
 * returned as errors without reaching the transport.
 */
template <typename K>
class Api {
public:
    using Object = K;

    Api(ResourceDescriptor resource, Transport& transport)
        : requests(std::move(resource)), transport(&transport) {}

    auto getResource() const -> ResourceDescriptor const& { return this->requests.getResource(); }
    auto getRequests() const -> RequestBuilder const& { return this->requests; }

    auto create(PostParams const& params, Bytes body) const -> Expected<Response> {
        return this->send(this->requests.create(params, std::move(body)));
    }
    auto get(std::string_view name) const -> Expected<Response> {
        return this->send(this->requests.get(name));
    }
    auto list(ListParams const& params) const -> Expected<Response> {
        return this->send(this->requests.list(params));
    }
    auto watch(ListParams const& params, std::string_view resourceVersion) const -> Expected<Response> {
        return this->send(this->requests.watch(params, resourceVersion));
    }
    auto watchSingle(std::string_view name, ListParams const& params, std::string_view resourceVersion) const -> Expected<Response> {
        return this->send(this->requests.watchSingle(name, params, resourceVersion));
    }
    auto patch(std::string_view name, PatchParams const& params, Patch const& patch) const -> Expected<Response> {
        return this->send(this->requests.patch(name, params, patch));
    }
    auto replace(std::string_view name, PostParams const& params, Bytes body) const -> Expected<Response> {
        return this->send(this->requests.replace(name, params, std::move(body)));
    }
    auto deleteItem(std::string_view name, DeleteParams const& params) const -> Expected<Response> {
        return this->send(this->requests.deleteItem(name, params));
    }
    auto deleteCollection(DeleteParams const& deleteParams, ListParams const& listParams) const -> Expected<Response> {
        return this->send(this->requests.deleteCollection(deleteParams, listParams));
    }
    auto getStatus(std::string_view name) const -> Expected<Response> {
        return this->send(this->requests.getStatus(name));
    }
    auto patchStatus(std::string_view name, PatchParams const& params, Patch const& patch) const -> Expected<Response> {
        return this->send(this->requests.patchStatus(name, params, patch));
    }
    auto replaceStatus(std::string_view name, PostParams const& params, Bytes body) const -> Expected<Response> {
        return this->send(this->requests.replaceStatus(name, params, std::move(body)));
    }
    auto getScale(std::string_view name) const -> Expected<Response> {
        return this->send(this->requests.getScale(name));
    }
    auto patchScale(std::string_view name, PatchParams const& params, Patch const& patch) const -> Expected<Response> {
        return this->send(this->requests.patchScale(name, params, patch));
    }
    auto replaceScale(std::string_view name, PostParams const& params, Bytes body) const -> Expected<Response> {
        return this->send(this->requests.replaceScale(name, params, std::move(body)));
    }

private:
    RequestBuilder requests;
    Transport*     transport;

    auto send(Expected<RequestSpec> request) const -> Expected<Response> {
        if (!request) {
            return std::unexpected{request.error()};
        }
        return this->transport->execute(*request);
    }
};

template <typename K>
auto makeApi(ResourceDescriptor resource, Transport& transport) -> Api<K> {
    return Api<K>{std::move(resource), transport};
}

} // namespace KR
