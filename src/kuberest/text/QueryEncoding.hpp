#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace KR::Text {

// application/x-www-form-urlencoded: [A-Za-z0-9*-._] verbatim, space as '+', rest as %XX.
auto form_encode(std::string_view value) -> std::string;

// RFC 3986 path segment: unreserved [A-Za-z0-9-._~] verbatim, everything else as %XX.
auto path_encode(std::string_view segment) -> std::string;

// Ordered key/value pairs rendered as "k1=v1&k2=v2". No pairs renders as "".
class QueryBuilder {
public:
    auto append(std::string_view key, std::string_view value) -> QueryBuilder&;

    auto str() const -> std::string;

private:
    std::vector<std::pair<std::string, std::string>> params;
};

} // namespace KR::Text
