#pragma once
#include <string>
#include <string_view>

namespace KR::Text {

// English pluralization of a lowercase noun: regular suffix rules plus the common irregular
// and uncountable words. Input outside [a-z0-9] is passed through untouched.
auto to_plural(std::string_view word) -> std::string;

auto to_lower(std::string_view word) -> std::string;

// A single PascalCase identifier: leading ASCII uppercase letter, ASCII alphanumerics after it.
auto is_pascal_case(std::string_view word) -> bool;

// Best-effort guard, misfires for nouns whose plural equals the singular ("sheep").
auto is_plural(std::string_view word) -> bool;

} // namespace KR::Text
