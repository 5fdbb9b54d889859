#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace KR {

using Bytes = std::vector<std::uint8_t>;

enum struct FieldValidation {
    Strict,
    Warn,
    Ignore
};

enum struct PropagationPolicy {
    Orphan,
    Background,
    Foreground
};

enum struct PatchStrategy {
    Merge,
    Json,
    Strategic,
    Apply
};

[[nodiscard]] auto fieldValidationToString(FieldValidation validation) -> std::string_view;
[[nodiscard]] auto propagationPolicyToString(PropagationPolicy policy) -> std::string_view;
[[nodiscard]] auto patchContentType(PatchStrategy strategy) -> std::string_view;

// Options for create and replace.
struct PostParams {
    bool                           dryRun{false};
    std::optional<std::string>     fieldManager;
    std::optional<FieldValidation> fieldValidation;
};

struct PatchParams {
    bool                           dryRun{false};
    bool                           force{false}; // server-side apply only
    std::optional<std::string>     fieldManager; // required for server-side apply
    std::optional<FieldValidation> fieldValidation;
};

struct ListParams {
    std::optional<std::string>   labelSelector;
    std::optional<std::string>   fieldSelector;
    std::optional<std::string>   resourceVersion;
    std::optional<std::uint32_t> timeoutSeconds;
    std::optional<std::uint32_t> limit;
    std::optional<std::string>   continueToken;
    bool                         allowWatchBookmarks{false};
};

struct DeleteParams {
    bool                             dryRun{false};
    std::optional<std::uint32_t>     gracePeriodSeconds;
    std::optional<PropagationPolicy> propagationPolicy;
};

/**
 * A patch payload together with the strategy it is written in. The payload is sent exactly as
 * given; the strategy only selects the Content-Type of the request.
 */
class Patch {
public:
    Patch(PatchStrategy strategy, Bytes payload);
    Patch(PatchStrategy strategy, std::string_view payload);

    static auto merge(nlohmann::json const& document) -> Patch;
    static auto json(nlohmann::json const& operations) -> Patch;
    static auto strategic(nlohmann::json const& document) -> Patch;
    static auto apply(nlohmann::json const& manifest) -> Patch;

    auto getStrategy() const -> PatchStrategy { return this->strategy; }
    auto getPayload() const -> Bytes const& { return this->payload; }
    auto getContentType() const -> std::string_view { return patchContentType(this->strategy); }

private:
    PatchStrategy strategy;
    Bytes         payload;
};

} // namespace KR
