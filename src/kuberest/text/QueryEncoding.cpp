#include "text/QueryEncoding.hpp"

#include <cctype>

namespace KR::Text {

auto form_encode(std::string_view value) -> std::string {
    static constexpr char kHexDigits[] = "0123456789ABCDEF";
    std::string           encoded;
    encoded.reserve(value.size() * 2);
    for (unsigned char ch : value) {
        if ((std::isalnum(ch) != 0) || ch == '*' || ch == '-' || ch == '.' || ch == '_') {
            encoded.push_back(static_cast<char>(ch));
        } else if (ch == ' ') {
            encoded.push_back('+');
        } else {
            encoded.push_back('%');
            encoded.push_back(kHexDigits[(ch >> 4) & 0x0F]);
            encoded.push_back(kHexDigits[ch & 0x0F]);
        }
    }
    return encoded;
}

auto path_encode(std::string_view segment) -> std::string {
    static constexpr char kHexDigits[] = "0123456789ABCDEF";
    std::string           encoded;
    encoded.reserve(segment.size() * 2);
    for (unsigned char ch : segment) {
        if ((std::isalnum(ch) != 0) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            encoded.push_back(static_cast<char>(ch));
        } else {
            encoded.push_back('%');
            encoded.push_back(kHexDigits[(ch >> 4) & 0x0F]);
            encoded.push_back(kHexDigits[ch & 0x0F]);
        }
    }
    return encoded;
}

auto QueryBuilder::append(std::string_view key, std::string_view value) -> QueryBuilder& {
    this->params.emplace_back(std::string{key}, std::string{value});
    return *this;
}

auto QueryBuilder::str() const -> std::string {
    std::string query;
    bool        first = true;
    for (auto const& param : this->params) {
        if (!first) {
            query.push_back('&');
        }
        first = false;
        query.append(form_encode(param.first));
        query.push_back('=');
        query.append(form_encode(param.second));
    }
    return query;
}

} // namespace KR::Text
