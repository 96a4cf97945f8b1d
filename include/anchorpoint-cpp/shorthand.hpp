/// @file shorthand.hpp
/// @brief Expansion of compact selector notations into full selectors.
///
/// Stored citations often abbreviate selectors: a quote as a single
/// string with optional "prefix|exact|suffix" pipes, a position as a bare
/// (start, end) pair. These helpers expand the abbreviations and reject
/// malformed ones before any selector is constructed.

#pragma once

#include <anchorpoint-cpp/position_selector.hpp>
#include <anchorpoint-cpp/quote_selector.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace anchorpoint_cpp::shorthand {

/// Split "prefix|exact|suffix" into its three fields.
///
/// Text without pipes is returned as the exact field.
/// @return {prefix, exact, suffix}
/// @throws InvalidSelectorError if the text holds one pipe or more than two.
auto split_anchor_text(std::string_view text) -> std::array<std::string, 3>;

/// QuoteSelector from the pipe shorthand.
/// @throws InvalidSelectorError on a malformed shorthand or an empty quote.
auto quote_from_text(std::string_view text) -> QuoteSelector;

/// PositionSelector from a bare (start, end) pair of signed numbers.
/// @throws InvalidSelectorError if either number is negative or the pair
///   does not form a non-empty interval.
auto position_from_pair(std::int64_t start, std::int64_t end) -> PositionSelector;

}  // namespace anchorpoint_cpp::shorthand
