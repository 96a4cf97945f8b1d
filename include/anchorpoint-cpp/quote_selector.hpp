/// @file quote_selector.hpp
/// @brief QuoteSelector: locates a passage by quoting it and its context.

#pragma once

#include <anchorpoint-cpp/options.hpp>
#include <anchorpoint-cpp/position_selector.hpp>

#include <compare>
#include <string>
#include <string_view>

namespace anchorpoint_cpp {

/// Describes a passage by quoting it, or the passages around it.
///
/// Based on the W3C Web Annotation TextQuoteSelector. A QuoteSelector
/// carries no offsets; it is resolved against a concrete document with
/// resolve(), which fails closed: a quote that matches zero passages or
/// more than one passage is an error, never a guess.
///
/// If `exact` is empty the selected passage is the text between the
/// prefix and the suffix (or the document start/end when one of them is
/// absent).
///
/// @code
/// auto q = QuoteSelector{"authorship", "", " include"};
/// q.resolve(document);  // PositionSelector{306, 316}
/// @endcode
class QuoteSelector {
public:
    /// Construct from the three fields.
    /// @param exact  The selected text itself.
    /// @param prefix Text immediately before the selected text.
    /// @param suffix Text immediately after the selected text.
    /// @throws InvalidSelectorError if all three fields are empty.
    explicit QuoteSelector(std::string exact,
                           std::string prefix = {},
                           std::string suffix = {});

    /// Build from the "prefix|exact|suffix" shorthand.
    ///
    /// Text without pipes is taken as `exact`.
    /// @throws InvalidSelectorError if the text contains a number of pipes
    ///   other than zero or two.
    static auto from_text(std::string_view text) -> QuoteSelector;

    auto exact() const noexcept -> const std::string& { return exact_; }
    auto prefix() const noexcept -> const std::string& { return prefix_; }
    auto suffix() const noexcept -> const std::string& { return suffix_; }

    /// Locate the quoted passage in `document`. Matching is exact unless
    /// `options` relaxes it.
    /// @throws TextSelectionError if the quote matches no passage, or more
    ///   than one passage.
    auto resolve(std::string_view document,
                 const ResolveOptions& options = {}) const -> PositionSelector;

    /// Alias for resolve().
    auto as_position(std::string_view document,
                     const ResolveOptions& options = {}) const -> PositionSelector {
        return resolve(document, options);
    }

    /// The passage of `document` the quote resolves to.
    /// @throws TextSelectionError as resolve().
    auto select_text(std::string_view document,
                     const ResolveOptions& options = {}) const -> std::string;

    /// Whether the quote resolves to exactly one passage of `document`.
    auto is_unique_in(std::string_view document,
                      const ResolveOptions& options = {}) const -> bool;

    /// Copy of this selector with `exact` set to the text it resolves to.
    ///
    /// Used to complete a selector written with only a prefix and suffix.
    /// @throws TextSelectionError as resolve().
    auto rebuild_from_text(std::string_view document,
                           const ResolveOptions& options = {}) const -> QuoteSelector;

    auto operator<=>(const QuoteSelector&) const = default;
    auto operator==(const QuoteSelector&) const -> bool = default;

private:
    auto resolve_exact(std::string_view document,
                       const ResolveOptions& options) const -> PositionSelector;
    auto resolve_between(std::string_view document,
                         const ResolveOptions& options) const -> PositionSelector;
    auto describe() const -> std::string;

    std::string exact_;
    std::string prefix_;
    std::string suffix_;
};

}  // namespace anchorpoint_cpp
