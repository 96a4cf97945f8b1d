/// @file position_set.hpp
/// @brief PositionSet: a normalized set of selected intervals plus quotes.

#pragma once

#include <anchorpoint-cpp/options.hpp>
#include <anchorpoint-cpp/position_selector.hpp>
#include <anchorpoint-cpp/quote_selector.hpp>
#include <anchorpoint-cpp/text_sequence.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace anchorpoint_cpp {

/// A set of selected intervals, plus quotes not yet anchored to a document.
///
/// The intervals are always normalized: sorted by start, with overlapping
/// and adjacent intervals merged, so no two stored intervals touch. Every
/// operation returns a new, normalized set.
///
/// Quotes carry no offsets. They survive union(), shift() and add_margin()
/// unchanged and are turned into intervals by resolve_quotes() once a
/// document is available.
///
/// @code
/// auto set = PositionSet{{4, 17}, {30, 41}};
/// set.shift(-3).positions();  // [(1, 14), (27, 38)]
/// @endcode
class PositionSet {
public:
    PositionSet() = default;

    /// Construct from intervals in any order, and optional quotes.
    explicit PositionSet(std::vector<PositionSelector> positions,
                         std::vector<QuoteSelector> quotes = {});

    /// Construct from intervals in any order.
    PositionSet(std::initializer_list<PositionSelector> positions);

    /// Set holding a single interval.
    explicit PositionSet(const PositionSelector& position);

    /// Set holding only unresolved quotes.
    static auto from_quotes(std::vector<QuoteSelector> quotes) -> PositionSet;

    /// Set of intervals given as (start, end) pairs.
    /// @throws InvalidSelectorError if any pair has `start >= end`.
    static auto from_pairs(const std::vector<std::pair<std::size_t, std::size_t>>& pairs)
        -> PositionSet;

    /// The normalized intervals, in ascending order.
    auto positions() const noexcept -> const std::vector<PositionSelector>& { return positions_; }

    /// The unresolved quotes, in insertion order.
    auto quotes() const noexcept -> const std::vector<QuoteSelector>& { return quotes_; }

    /// True if the set holds neither intervals nor quotes.
    auto empty() const noexcept -> bool { return positions_.empty() && quotes_.empty(); }

    // -- Set algebra ----------------------------------------------------------

    /// Intervals and quotes of both sets.
    auto union_with(const PositionSet& other) const -> PositionSet;
    auto union_with(const PositionSelector& other) const -> PositionSet;

    /// Characters selected by both sets. The result holds no quotes.
    auto intersect(const PositionSet& other) const -> PositionSet;
    auto intersect(const PositionSelector& other) const -> PositionSet;

    /// Characters of this set not selected by `other`. Quotes are kept.
    auto difference(const PositionSet& other) const -> PositionSet;
    auto difference(const PositionSelector& other) const -> PositionSet;

    /// Translate every interval by `n`; quotes are unchanged.
    /// @throws RangeUnderflowError if any start would become negative.
    auto shift(std::int64_t n) const -> PositionSet;

    /// Widen every interval by `left` characters before and `right`
    /// characters after (stopping at 0), merging intervals that come to
    /// touch. Quotes are unchanged.
    auto add_margin(std::size_t left, std::size_t right) const -> PositionSet;

    /// Resolve every quote against `document` and merge the results into
    /// the intervals. All or nothing: the first quote that fails aborts the
    /// whole operation. The result holds no quotes.
    /// @throws TextSelectionError naming the quote that failed.
    auto resolve_quotes(std::string_view document,
                        const ResolveOptions& options = {}) const -> PositionSet;

    /// Resolve quotes, then fill each gap between two intervals that is at
    /// most `width` characters wide and made only of `characters`.
    /// @throws InvalidSelectorError if `width` is 0.
    /// @throws TextSelectionError as resolve_quotes().
    auto bridge_gaps(std::string_view document,
                     std::size_t width = default_margin_width,
                     std::string_view characters = default_margin_characters,
                     const ResolveOptions& options = {}) const -> PositionSet;

    // -- Comparison -----------------------------------------------------------

    /// True if every character selected by `other` is selected by this set.
    /// Unresolved quotes are not considered.
    auto covers(const PositionSet& other) const -> bool;
    auto covers(const PositionSelector& other) const -> bool;

    /// covers(other) and this set selects characters `other` does not.
    auto strictly_covers(const PositionSet& other) const -> bool;
    auto strictly_covers(const PositionSelector& other) const -> bool;

    /// Equal intervals, and the same quotes regardless of order.
    auto operator==(const PositionSet& other) const -> bool;

    // -- Document access ------------------------------------------------------

    /// Every interval as a unique QuoteSelector, followed by the stored
    /// quotes. The result locates the same passages in any copy of the
    /// document, without relying on offsets.
    auto as_quotes(std::string_view document,
                   const ResolveOptions& options = {}) const -> std::vector<QuoteSelector>;

    /// Selected and omitted passages of `document`.
    auto as_text_sequence(std::string_view document,
                          const ResolveOptions& options = {}) const -> TextSequence;

    /// Selected text of `document`, with an ellipsis for each omission.
    auto as_string(std::string_view document,
                   const ResolveOptions& options = {}) const -> std::string;

    /// bridge_gaps() followed by as_string().
    auto select_text(std::string_view document,
                     std::size_t width = default_margin_width,
                     std::string_view characters = default_margin_characters,
                     const ResolveOptions& options = {}) const -> std::string;

private:
    void normalize();

    std::vector<PositionSelector> positions_;
    std::vector<QuoteSelector> quotes_;
};

}  // namespace anchorpoint_cpp
