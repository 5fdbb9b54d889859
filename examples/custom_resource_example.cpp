#include <kuberest/KubeRest.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace {

struct Foo {};

// Prints each request instead of sending it.
class EchoTransport : public KR::Transport {
public:
    auto execute(KR::RequestSpec const& request) -> KR::Expected<KR::Response> override {
        std::cout << request.method << ' ' << request.uri();
        if (request.contentType) {
            std::cout << "  [" << *request.contentType << ']';
        }
        if (request.body) {
            std::cout << "  " << std::string(request.body->begin(), request.body->end());
        }
        std::cout << '\n';
        return KR::Response{.status = 200, .body = {}};
    }
};

auto report(std::string_view what, KR::Expected<KR::Response> const& result) -> bool {
    if (!result) {
        std::cerr << what << " failed: " << KR::describeError(result.error()) << '\n';
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string configText = R"({"kind":"Foo","group":"clux.dev","version":"v1","namespace":"myns"})";
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--config" && idx + 1 < argc) {
            configText = argv[++idx];
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--config <json>]\n";
            std::cerr << "Environment: KUBEREST_RESOURCE_GROUP, KUBEREST_RESOURCE_VERSION, KUBEREST_RESOURCE_NAMESPACE\n";
            return 1;
        }
    }

    auto config = KR::loadResourceConfig(configText);
    if (!config) {
        std::cerr << "Invalid config: " << KR::describeError(config.error()) << '\n';
        return 1;
    }
    if (auto applied = KR::applyResourceEnvOverrides(*config, "KUBEREST_RESOURCE"); !applied) {
        std::cerr << "Invalid environment: " << KR::describeError(applied.error()) << '\n';
        return 1;
    }

    auto resource = KR::makeResource(*config);
    if (!resource) {
        std::cerr << "Invalid resource: " << KR::describeError(resource.error()) << '\n';
        return 1;
    }

    EchoTransport transport;
    auto          foos = KR::makeApi<Foo>(*resource, transport);

    KR::PatchParams apply;
    apply.fieldManager = "custom-resource-example";

    bool ok = true;
    ok &= report("create", foos.create(KR::PostParams{.dryRun = true}, KR::Bytes{'{', '}'}));
    ok &= report("list", foos.list(KR::ListParams{.labelSelector = "app=web", .limit = 50}));
    ok &= report("watch", foos.watch(KR::ListParams{.timeoutSeconds = 290}, "0"));
    ok &= report("get", foos.get("baz"));
    ok &= report("patch", foos.patch("baz", KR::PatchParams{}, KR::Patch::merge({{"spec", {{"replicas", 3}}}})));
    ok &= report("apply", foos.patch("baz", apply, KR::Patch::apply({{"apiVersion", resource->getApiVersion()}, {"kind", resource->getKind()}})));
    ok &= report("delete", foos.deleteItem("baz", KR::DeleteParams{.propagationPolicy = KR::PropagationPolicy::Foreground}));
    return ok ? 0 : 1;
}
