/// @file options.hpp
/// @brief Tunables shared by every operation that searches a document.

#pragma once

#include <cstddef>
#include <string_view>

namespace anchorpoint_cpp {

/// How a QuoteSelector is compared against document text.
///
/// By default matching is exact: byte-for-byte, with the prefix ending
/// immediately before the match and the suffix starting immediately after
/// it. Both flags relax that for re-rendered copies of a document.
struct ResolveOptions {
    /// Compare ASCII letters without regard to case.
    bool ignore_case{false};

    /// Allow whitespace between the exact text and its prefix or suffix,
    /// ignore whitespace at the ends of the prefix and suffix, and drop
    /// whitespace from the ends of a span found between two contexts.
    bool skip_whitespace{false};

    /// Both relaxations, for copies of a document that were re-rendered.
    static constexpr auto tolerant() -> ResolveOptions { return {true, true}; }

    auto operator==(const ResolveOptions&) const -> bool = default;
};

/// Widest gap PositionSet::bridge_gaps() fills by default.
inline constexpr std::size_t default_margin_width = 3;

/// Characters PositionSet::bridge_gaps() may absorb by default.
inline constexpr std::string_view default_margin_characters = ",.\"' ;[]()";

/// Marker substituted for omitted text in previews (U+2026, UTF-8).
inline constexpr std::string_view ellipsis = "\xE2\x80\xA6";

}  // namespace anchorpoint_cpp
