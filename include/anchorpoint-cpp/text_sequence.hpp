/// @file text_sequence.hpp
/// @brief TextSequence: selected and omitted passages of a document.

#pragma once

#include <anchorpoint-cpp/options.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace anchorpoint_cpp {

class PositionSet;

/// One contiguous run of document text, either selected or omitted.
struct TextPassage {
    std::string text;     ///< The characters of the run (may be empty for a gap).
    bool included{true};  ///< False for a gap between selected passages.

    /// True if both are included passages with the same text, ignoring
    /// punctuation and spaces at either end.
    auto means(const TextPassage& other) const -> bool;

    /// True if the text of `other`, trimmed as in means(), occurs within
    /// this passage. Every passage implies a gap.
    auto implies(const TextPassage& other) const -> bool;

    auto operator==(const TextPassage&) const -> bool = default;
};

/// Passages of a document that need not be consecutive.
///
/// Gap passages stand for document text that exists but was not
/// selected. A TextSequence is built on demand for display and is not
/// meant to be stored; store the PositionSet or QuoteSelectors instead.
class TextSequence {
public:
    TextSequence() = default;

    /// Construct from passages in document order.
    explicit TextSequence(std::vector<TextPassage> passages)
        : passages_{std::move(passages)} {}

    /// Walk `document` with the intervals of `selection`.
    ///
    /// Quotes held by `selection` are resolved first. Emits a gap before
    /// each interval that does not start where the previous one ended,
    /// the interval's own text, and a trailing gap when the last interval
    /// ends before the document does. Intervals are clipped at the end of
    /// the document.
    /// @throws TextSelectionError if a quote cannot be resolved.
    static auto render(std::string_view document,
                       const PositionSet& selection,
                       const ResolveOptions& options = {}) -> TextSequence;

    auto passages() const noexcept -> const std::vector<TextPassage>& { return passages_; }
    auto size() const noexcept -> std::size_t { return passages_.size(); }
    auto empty() const noexcept -> bool { return passages_.empty(); }
    auto operator[](std::size_t i) const -> const TextPassage& { return passages_[i]; }
    auto begin() const noexcept { return passages_.begin(); }
    auto end() const noexcept { return passages_.end(); }

    /// The selected text, with an ellipsis wherever a gap separates two
    /// selected passages. Leading and trailing gaps are dropped.
    auto preview() const -> std::string;

    /// The selected text with every gap shown as an ellipsis, including
    /// gaps at either end. A sequence containing nothing but gaps renders
    /// as the empty string.
    auto to_string() const -> std::string;

    /// Append `other`, collapsing a trailing gap and a leading gap into one.
    auto concat(const TextSequence& other) const -> TextSequence;

    /// Copy without a leading or trailing gap.
    auto strip() const -> TextSequence;

    /// True if both sequences select the same passages in the same order,
    /// disregarding gaps at the ends.
    auto means(const TextSequence& other) const -> bool;

    /// True if every selected passage of `other` is implied by some
    /// selected passage of this sequence.
    auto implies(const TextSequence& other) const -> bool;

    /// implies(other) and not means(other).
    auto strictly_implies(const TextSequence& other) const -> bool;

    auto operator==(const TextSequence&) const -> bool = default;

private:
    std::vector<TextPassage> passages_;
};

}  // namespace anchorpoint_cpp
