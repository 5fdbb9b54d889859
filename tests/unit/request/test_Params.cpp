#include <kuberest/request/Params.hpp>

#include <doctest/doctest.h>

#include <string>

using namespace KR;

TEST_SUITE("request.params") {
TEST_CASE("enum labels match the API server spelling") {
    CHECK(fieldValidationToString(FieldValidation::Strict) == "Strict");
    CHECK(fieldValidationToString(FieldValidation::Warn) == "Warn");
    CHECK(fieldValidationToString(FieldValidation::Ignore) == "Ignore");
    CHECK(propagationPolicyToString(PropagationPolicy::Orphan) == "Orphan");
    CHECK(propagationPolicyToString(PropagationPolicy::Background) == "Background");
    CHECK(propagationPolicyToString(PropagationPolicy::Foreground) == "Foreground");
}

TEST_CASE("patch content types") {
    CHECK(patchContentType(PatchStrategy::Merge) == "application/merge-patch+json");
    CHECK(patchContentType(PatchStrategy::Json) == "application/json-patch+json");
    CHECK(patchContentType(PatchStrategy::Strategic) == "application/strategic-merge-patch+json");
    CHECK(patchContentType(PatchStrategy::Apply) == "application/apply-patch+yaml");
}

TEST_CASE("json patch factories serialize the document") {
    auto merge = Patch::merge({{"spec", {{"replicas", 3}}}});
    CHECK(merge.getStrategy() == PatchStrategy::Merge);
    CHECK(std::string(merge.getPayload().begin(), merge.getPayload().end()) == R"({"spec":{"replicas":3}})");

    auto ops = nlohmann::json::array({{{"op", "remove"}, {"path", "/metadata/labels/app"}}});
    auto jsonPatch = Patch::json(ops);
    CHECK(jsonPatch.getStrategy() == PatchStrategy::Json);
    CHECK(jsonPatch.getContentType() == "application/json-patch+json");
    CHECK(nlohmann::json::parse(jsonPatch.getPayload()) == ops);

    CHECK(Patch::strategic(nlohmann::json::object()).getStrategy() == PatchStrategy::Strategic);
    CHECK(Patch::apply(nlohmann::json::object()).getContentType() == "application/apply-patch+yaml");
}

TEST_CASE("raw patch payloads are kept byte for byte") {
    Bytes raw{0x7B, 0x20, 0x7D};
    Patch patch{PatchStrategy::Merge, raw};
    CHECK(patch.getPayload() == raw);
}
}
