/// @file position_selector.hpp
/// @brief PositionSelector: a half-open character interval in a document.

#pragma once

#include <anchorpoint-cpp/options.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace anchorpoint_cpp {

class PositionSet;
class QuoteSelector;

/// Selects the characters `[start, end)` of some document.
///
/// Based on the W3C Web Annotation TextPositionSelector. Offsets count
/// bytes of the document string; the first byte is position 0 and is
/// included, the byte at `end` is not. An end of `unbounded` selects
/// through the end of whatever document the selector is applied to.
///
/// PositionSelector is an immutable value type. The constructor rejects
/// empty and inverted intervals, so every instance covers at least one
/// character.
///
/// @code
/// auto s = PositionSelector{65, 93};
/// s.select_text(document);  // "original works of authorship"
/// @endcode
class PositionSelector {
public:
    /// Sentinel end offset meaning "through the end of the document".
    static constexpr std::size_t unbounded = std::numeric_limits<std::size_t>::max();

    /// Construct the interval `[start, end)`.
    /// @throws InvalidSelectorError if `start >= end`.
    PositionSelector(std::size_t start, std::size_t end);

    /// Selector from `start` through the end of the document.
    static auto from_start(std::size_t start) -> PositionSelector;

    /// Selector from the first occurrence of `start_phrase` through the end
    /// of the first occurrence of `end_phrase` in `document`.
    ///
    /// An empty `start_phrase` starts at 0; an empty `end_phrase` leaves the
    /// end unbounded.
    /// @throws TextSelectionError if a phrase does not occur in `document`.
    static auto from_text(std::string_view document,
                          std::string_view start_phrase,
                          std::string_view end_phrase = {}) -> PositionSelector;

    auto start() const noexcept -> std::size_t { return start_; }
    auto end() const noexcept -> std::size_t { return end_; }

    /// Whether the selector runs through the end of the document.
    auto is_unbounded() const noexcept -> bool { return end_ == unbounded; }

    /// Number of characters selected, or `unbounded`.
    auto length() const noexcept -> std::size_t;

    // -- Interval relations ---------------------------------------------------

    /// True if both selectors include at least one common character.
    auto overlaps(const PositionSelector& other) const noexcept -> bool;

    /// True if the selectors overlap or are directly adjacent.
    auto touches(const PositionSelector& other) const noexcept -> bool;

    /// True if every character of `other` is inside this selector.
    auto covers(const PositionSelector& other) const noexcept -> bool;

    /// True if every selected character of `other` is inside this selector.
    auto covers(const PositionSet& other) const -> bool;

    /// covers(other) and the two are not identical.
    auto strictly_covers(const PositionSelector& other) const noexcept -> bool;

    /// covers(other) and `other` does not select exactly this interval.
    auto strictly_covers(const PositionSet& other) const -> bool;

    // -- Interval algebra -----------------------------------------------------

    /// The single interval spanning both selectors.
    /// @throws IncompatibleRangeError if the selectors do not touch.
    auto union_with(const PositionSelector& other) const -> PositionSelector;

    /// Union with another selector, as a PositionSet.
    ///
    /// Unlike union_with(), never fails: disjoint selectors become a set of
    /// two intervals.
    auto combine(const PositionSelector& other) const -> PositionSet;

    /// Union with a PositionSet. Quotes held by `other` are kept.
    auto combine(const PositionSet& other) const -> PositionSet;

    /// The characters selected by both, or nullopt if there are none.
    auto intersect(const PositionSelector& other) const -> std::optional<PositionSelector>;

    /// The characters selected by both this selector and `other`.
    auto intersect(const PositionSet& other) const -> PositionSet;

    /// The characters of this selector not selected by `other`.
    auto difference(const PositionSelector& other) const -> PositionSet;

    /// The characters of this selector not selected by `other`.
    auto difference(const PositionSet& other) const -> PositionSet;

    /// Translate both offsets by `n`. An unbounded end stays unbounded.
    /// @throws RangeUnderflowError if the start would become negative.
    /// @throws InvalidSelectorError if an offset would overflow.
    auto shift(std::int64_t n) const -> PositionSelector;

    // -- Document access ------------------------------------------------------

    /// Throw unless the selector lies within `document`.
    /// @throws OutOfBoundsError if `end` exceeds the document length, or
    ///   an unbounded selector starts past the end of the document.
    void verify_within(std::string_view document) const;

    /// The selected passage of `document`.
    /// @throws OutOfBoundsError as verify_within().
    auto select_text(std::string_view document) const -> std::string;

    /// Make a QuoteSelector for the selected passage.
    ///
    /// The prefix and suffix are the `left_margin` and `right_margin`
    /// characters immediately outside the interval, clipped at the
    /// document bounds.
    /// @throws OutOfBoundsError if `start` is not inside `document` or the
    ///   selector reaches past its end.
    auto as_quote(std::string_view document,
                  std::size_t left_margin = 0,
                  std::size_t right_margin = 0) const -> QuoteSelector;

    /// Make the shortest QuoteSelector (margins growing 5 characters at a
    /// time) that resolves back to exactly this interval in `document`.
    ///
    /// Falls back to the whole rest of the document as context when no
    /// shorter quote is unique.
    auto unique_quote(std::string_view document,
                      const ResolveOptions& options = {}) const -> QuoteSelector;

    auto operator<=>(const PositionSelector&) const = default;
    auto operator==(const PositionSelector&) const -> bool = default;

private:
    std::size_t start_;
    std::size_t end_;
};

}  // namespace anchorpoint_cpp
