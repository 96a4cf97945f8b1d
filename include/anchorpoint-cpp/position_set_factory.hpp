/// @file position_set_factory.hpp
/// @brief Builds PositionSets for one document from any kind of selection.

#pragma once

#include <anchorpoint-cpp/options.hpp>
#include <anchorpoint-cpp/position_selector.hpp>
#include <anchorpoint-cpp/position_set.hpp>
#include <anchorpoint-cpp/quote_selector.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace anchorpoint_cpp {

/// One element of a mixed selection list.
///
/// A string is an exact quotation (no pipe shorthand), a pair is a
/// (start, end) interval.
using Selection = std::variant<std::string,
                               QuoteSelector,
                               PositionSelector,
                               std::pair<std::size_t, std::size_t>>;

/// Turns loosely specified selections into PositionSets for one document.
///
/// Quotes are resolved immediately, so every set the factory returns holds
/// intervals only.
///
/// @code
/// auto factory = PositionSetFactory{"Here is some great text."};
/// auto set = factory.from_exact_strings({"some", "text"});
/// set.positions();  // [(8, 12), (19, 23)]
/// @endcode
class PositionSetFactory {
public:
    explicit PositionSetFactory(std::string document, ResolveOptions options = {})
        : document_{std::move(document)}, options_{options} {}

    auto document() const noexcept -> const std::string& { return document_; }
    auto options() const noexcept -> const ResolveOptions& { return options_; }

    /// The whole document for `true`, nothing for `false`.
    auto from_bool(bool selection) const -> PositionSet;

    /// Select with a "prefix|exact|suffix" shorthand string.
    auto from_selection(std::string_view shorthand) const -> PositionSet;
    auto from_selection(const char* shorthand) const -> PositionSet {
        return from_selection(std::string_view{shorthand});
    }
    auto from_selection(bool selection) const -> PositionSet { return from_bool(selection); }
    auto from_selection(const QuoteSelector& quote) const -> PositionSet;
    auto from_selection(const PositionSelector& position) const -> PositionSet;
    auto from_selection(const std::vector<Selection>& selections) const -> PositionSet;

    /// Select every exact quotation in `quotations`.
    auto from_exact_strings(const std::vector<std::string>& quotations) const -> PositionSet;

    /// Resolve every quote against the document.
    /// @throws TextSelectionError if any quote does not resolve.
    auto from_quote_selectors(const std::vector<QuoteSelector>& quotes) const -> PositionSet;

private:
    std::string document_;
    ResolveOptions options_;
};

}  // namespace anchorpoint_cpp
