#pragma once
#include <kuberest/core/Error.hpp>
#include <kuberest/request/RequestSpec.hpp>

namespace KR {

struct Response {
    int   status{0};
    Bytes body;
};

/**
 * Seam to the HTTP layer. Implementations own connection handling, TLS, authentication and
 * retries, and report connection-level failures as Error::Code::TransportFailure. Non-2xx
 * responses are returned as a Response, not as an error.
 */
class Transport {
public:
    virtual ~Transport();

    virtual auto execute(RequestSpec const& request) -> Expected<Response> = 0;
};

} // namespace KR
