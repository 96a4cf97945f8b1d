#pragma once

// Internal header, not installed.
// Substring search and context comparison used by quote resolution.

#include <anchorpoint-cpp/options.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string_view>
#include <vector>

namespace anchorpoint_cpp::detail {

inline auto is_space(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline auto fold(char c) -> char {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline auto chars_equal(char a, char b, bool ignore_case) -> bool {
    return ignore_case ? fold(a) == fold(b) : a == b;
}

inline auto text_equal(std::string_view a, std::string_view b, bool ignore_case) -> bool {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(),
                      [ignore_case](char x, char y) { return chars_equal(x, y, ignore_case); });
}

inline auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

inline auto trim_chars(std::string_view s, std::string_view chars) -> std::string_view {
    const auto first = s.find_first_not_of(chars);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(chars);
    return s.substr(first, last - first + 1);
}

/// Every offset at which `needle` occurs in `haystack`, overlapping
/// occurrences included. An empty needle occurs nowhere.
inline auto find_all(std::string_view haystack, std::string_view needle, bool ignore_case)
    -> std::vector<std::size_t> {
    auto result = std::vector<std::size_t>{};
    if (needle.empty() || needle.size() > haystack.size()) return result;
    const auto pred = [ignore_case](char x, char y) { return chars_equal(x, y, ignore_case); };
    auto it = haystack.begin();
    while (true) {
        it = std::search(it, haystack.end(), needle.begin(), needle.end(), pred);
        if (it == haystack.end()) break;
        result.push_back(static_cast<std::size_t>(it - haystack.begin()));
        ++it;
    }
    return result;
}

/// Context as it is compared against the document: trimmed when
/// whitespace between context and quote is tolerated.
inline auto effective_context(std::string_view context, const ResolveOptions& options)
    -> std::string_view {
    return options.skip_whitespace ? trim(context) : context;
}

/// Whether the text before `pos` ends with `prefix`.
inline auto preceded_by(std::string_view document, std::size_t pos,
                        std::string_view prefix, const ResolveOptions& options) -> bool {
    if (prefix.empty()) return true;
    auto before = document.substr(0, pos);
    if (options.skip_whitespace) {
        while (!before.empty() && is_space(before.back())) before.remove_suffix(1);
    }
    if (before.size() < prefix.size()) return false;
    return text_equal(before.substr(before.size() - prefix.size()), prefix, options.ignore_case);
}

/// Whether the text from `pos` onwards starts with `suffix`.
inline auto followed_by(std::string_view document, std::size_t pos,
                        std::string_view suffix, const ResolveOptions& options) -> bool {
    if (suffix.empty()) return true;
    auto after = document.substr(std::min(pos, document.size()));
    if (options.skip_whitespace) {
        while (!after.empty() && is_space(after.front())) after.remove_prefix(1);
    }
    if (after.size() < suffix.size()) return false;
    return text_equal(after.substr(0, suffix.size()), suffix, options.ignore_case);
}

}  // namespace anchorpoint_cpp::detail
