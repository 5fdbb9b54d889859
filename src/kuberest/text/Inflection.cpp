#include "text/Inflection.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace KR::Text {

namespace {

constexpr std::array<std::string_view, 13> uncountables{
        "equipment", "information", "rice", "money", "species", "series", "fish",
        "sheep",     "deer",        "news", "moose", "swine",   "bison"};

constexpr std::array<std::pair<std::string_view, std::string_view>, 11> irregulars{{
        {"person", "people"},
        {"man", "men"},
        {"woman", "women"},
        {"child", "children"},
        {"ox", "oxen"},
        {"mouse", "mice"},
        {"louse", "lice"},
        {"goose", "geese"},
        {"foot", "feet"},
        {"tooth", "teeth"},
        {"quiz", "quizzes"},
}};

struct SuffixRule {
    std::string_view suffix;
    std::size_t      keep; // characters of the suffix kept before the replacement
    std::string_view replacement;
};

// Checked in order, first match wins.
constexpr std::array<SuffixRule, 23> suffixRules{{
        {"matrix", 4, "ices"},
        {"vertex", 4, "ices"},
        {"index", 3, "ices"},
        {"octopus", 5, "i"},
        {"virus", 3, "i"},
        {"alias", 5, "es"},
        {"status", 6, "es"},
        {"bus", 3, "es"},
        {"buffalo", 7, "es"},
        {"tomato", 6, "es"},
        {"potato", 6, "es"},
        {"axis", 2, "es"},
        {"testis", 4, "es"},
        {"sis", 1, "es"},
        {"tum", 1, "a"},
        {"ium", 1, "a"},
        {"hive", 4, "s"},
        {"eaf", 2, "ves"},
        {"lf", 1, "ves"},
        {"rf", 1, "ves"},
        {"ch", 2, "es"},
        {"sh", 2, "es"},
        {"ss", 2, "es"},
}};

bool is_vowel(char ch) {
    return ch == 'a' || ch == 'e' || ch == 'i' || ch == 'o' || ch == 'u';
}

} // namespace

auto to_lower(std::string_view word) -> std::string {
    std::string lowered{word};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

auto is_pascal_case(std::string_view word) -> bool {
    if (word.empty() || std::isupper(static_cast<unsigned char>(word.front())) == 0) {
        return false;
    }
    return std::all_of(word.begin() + 1, word.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0;
    });
}

auto to_plural(std::string_view word) -> std::string {
    if (word.empty()) {
        return {};
    }
    for (auto uncountable : uncountables) {
        if (word == uncountable) {
            return std::string{word};
        }
    }
    for (auto const& [singular, plural] : irregulars) {
        if (word == singular || word == plural) {
            return std::string{plural};
        }
    }
    for (auto const& rule : suffixRules) {
        if (word.ends_with(rule.suffix)) {
            std::string result{word.substr(0, word.size() - rule.suffix.size() + rule.keep)};
            result.append(rule.replacement);
            return result;
        }
    }

    auto const last = word.back();
    if (last == 'x' || last == 'z') {
        return std::string{word} + "es";
    }
    if (last == 'e' && word.size() >= 2 && word[word.size() - 2] == 'f' && !word.ends_with("ffe")) {
        return std::string{word.substr(0, word.size() - 2)} + "ves";
    }
    if (last == 'y' && word.size() >= 2) {
        auto const before = word[word.size() - 2];
        bool const quy    = word.size() >= 3 && word.ends_with("uy") && word[word.size() - 3] == 'q';
        if ((!is_vowel(before) && before != 'y') || quy) {
            return std::string{word.substr(0, word.size() - 1)} + "ies";
        }
    }
    if (last == 's') {
        return std::string{word};
    }
    return std::string{word} + "s";
}

auto is_plural(std::string_view word) -> bool {
    auto const lowered = to_lower(word);
    return to_plural(lowered) == lowered;
}

} // namespace KR::Text
