#include <kuberest/request/Params.hpp>

namespace KR {

namespace {

auto to_bytes(std::string_view text) -> Bytes {
    return Bytes(text.begin(), text.end());
}

} // namespace

auto fieldValidationToString(FieldValidation validation) -> std::string_view {
    switch (validation) {
    case FieldValidation::Strict:
        return "Strict";
    case FieldValidation::Warn:
        return "Warn";
    case FieldValidation::Ignore:
        return "Ignore";
    }
    return "Strict";
}

auto propagationPolicyToString(PropagationPolicy policy) -> std::string_view {
    switch (policy) {
    case PropagationPolicy::Orphan:
        return "Orphan";
    case PropagationPolicy::Background:
        return "Background";
    case PropagationPolicy::Foreground:
        return "Foreground";
    }
    return "Background";
}

auto patchContentType(PatchStrategy strategy) -> std::string_view {
    switch (strategy) {
    case PatchStrategy::Merge:
        return "application/merge-patch+json";
    case PatchStrategy::Json:
        return "application/json-patch+json";
    case PatchStrategy::Strategic:
        return "application/strategic-merge-patch+json";
    case PatchStrategy::Apply:
        return "application/apply-patch+yaml";
    }
    return "application/merge-patch+json";
}

Patch::Patch(PatchStrategy strategy, Bytes payload)
    : strategy(strategy), payload(std::move(payload)) {}

Patch::Patch(PatchStrategy strategy, std::string_view payload)
    : strategy(strategy), payload(to_bytes(payload)) {}

auto Patch::merge(nlohmann::json const& document) -> Patch {
    return Patch{PatchStrategy::Merge, std::string_view{document.dump()}};
}

auto Patch::json(nlohmann::json const& operations) -> Patch {
    return Patch{PatchStrategy::Json, std::string_view{operations.dump()}};
}

auto Patch::strategic(nlohmann::json const& document) -> Patch {
    return Patch{PatchStrategy::Strategic, std::string_view{document.dump()}};
}

// JSON is a subset of YAML, so the apply body can be sent as serialized JSON.
auto Patch::apply(nlohmann::json const& manifest) -> Patch {
    return Patch{PatchStrategy::Apply, std::string_view{manifest.dump()}};
}

} // namespace KR
