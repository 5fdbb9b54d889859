#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace KR {

struct Error {
    enum class Code {
        UnknownError = 0,
        InvalidKind,
        MissingGroup,
        MissingVersion,
        InvalidNamespace,
        MissingName,
        InvalidParams,
        MalformedInput,
        TransportFailure
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidKind:
        return "invalid_kind";
    case Error::Code::MissingGroup:
        return "missing_group";
    case Error::Code::MissingVersion:
        return "missing_version";
    case Error::Code::InvalidNamespace:
        return "invalid_namespace";
    case Error::Code::MissingName:
        return "missing_name";
    case Error::Code::InvalidParams:
        return "invalid_params";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::TransportFailure:
        return "transport_failure";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace KR
