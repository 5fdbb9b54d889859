#pragma once
#include <kuberest/request/Params.hpp>

#include <optional>
#include <string>

namespace KR {

// Everything a transport needs to issue one API call. query never carries the leading '?'.
struct RequestSpec {
    std::string                method;
    std::string                path;
    std::string                query;
    std::optional<Bytes>       body;
    std::optional<std::string> contentType;

    // path, followed by "?query" only when query is non-empty.
    auto uri() const -> std::string {
        if (this->query.empty()) {
            return this->path;
        }
        return this->path + "?" + this->query;
    }
};

} // namespace KR
