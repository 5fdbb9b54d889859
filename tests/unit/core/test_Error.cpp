#include <kuberest/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace KR;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::UnknownError);
             i <= static_cast<int>(Error::Code::TransportFailure);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::MissingGroup, "resource Foo must have a group"};
        CHECK(describeError(withMsg) == "missing_group:resource Foo must have a group");

        Error withoutMsg{Error::Code::MissingName, {}};
        CHECK(describeError(withoutMsg) == "missing_name");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Expected carries an Error") {
        Expected<int> failed = std::unexpected{Error{Error::Code::InvalidKind, "bad"}};
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::InvalidKind);
        CHECK(failed.error().message == "bad");
    }
}
