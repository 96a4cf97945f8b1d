#include <anchorpoint-cpp/shorthand.hpp>

#include <anchorpoint-cpp/error.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace anchorpoint_cpp::shorthand {

auto split_anchor_text(std::string_view text) -> std::array<std::string, 3> {
    const auto pipes = std::ranges::count(text, '|');
    if (pipes == 0) {
        return {std::string{}, std::string{text}, std::string{}};
    }
    if (pipes != 2) {
        throw InvalidSelectorError{
            "shorthand \"" + truncate_for_message(text) + "\" must contain exactly two '|' "
            "separators, splitting it into prefix, exact and suffix"};
    }
    const auto first = text.find('|');
    const auto second = text.find('|', first + 1);
    return {std::string{text.substr(0, first)},
            std::string{text.substr(first + 1, second - first - 1)},
            std::string{text.substr(second + 1)}};
}

auto quote_from_text(std::string_view text) -> QuoteSelector {
    auto [prefix, exact, suffix] = split_anchor_text(text);
    return QuoteSelector{std::move(exact), std::move(prefix), std::move(suffix)};
}

auto position_from_pair(std::int64_t start, std::int64_t end) -> PositionSelector {
    if (start < 0 || end < 0) {
        throw InvalidSelectorError{
            "position pair (" + std::to_string(start) + ", " + std::to_string(end)
            + ") contains a negative offset"};
    }
    return PositionSelector{static_cast<std::size_t>(start), static_cast<std::size_t>(end)};
}

}  // namespace anchorpoint_cpp::shorthand
