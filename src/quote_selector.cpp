#include <anchorpoint-cpp/quote_selector.hpp>

#include <anchorpoint-cpp/error.hpp>
#include <anchorpoint-cpp/shorthand.hpp>

#include "text_search.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace anchorpoint_cpp {

namespace {

// Offset of the single occurrence of a context string, or an error naming
// what went wrong.
auto locate_unique(std::string_view document, std::string_view needle,
                   std::string_view role, const ResolveOptions& options) -> std::size_t {
    const auto found = detail::find_all(document, needle, options.ignore_case);
    if (found.empty()) {
        throw TextSelectionError{
            "unable to find " + std::string{role} + " \"" + truncate_for_message(needle)
            + "\" in text \"" + truncate_for_message(document) + "\""};
    }
    if (found.size() > 1) {
        throw TextSelectionError{
            std::string{role} + " \"" + truncate_for_message(needle) + "\" is ambiguous: it occurs "
            + std::to_string(found.size()) + " times in the text"};
    }
    return found.front();
}

}  // anonymous namespace

QuoteSelector::QuoteSelector(std::string exact, std::string prefix, std::string suffix)
    : exact_{std::move(exact)}, prefix_{std::move(prefix)}, suffix_{std::move(suffix)} {
    if (exact_.empty() && prefix_.empty() && suffix_.empty()) {
        throw InvalidSelectorError{
            "a quote selector with no exact text needs a prefix or a suffix"};
    }
}

auto QuoteSelector::from_text(std::string_view text) -> QuoteSelector {
    return shorthand::quote_from_text(text);
}

auto QuoteSelector::resolve(std::string_view document,
                            const ResolveOptions& options) const -> PositionSelector {
    return exact_.empty() ? resolve_between(document, options) : resolve_exact(document, options);
}

auto QuoteSelector::resolve_exact(std::string_view document,
                                  const ResolveOptions& options) const -> PositionSelector {
    const auto occurrences = detail::find_all(document, exact_, options.ignore_case);
    if (occurrences.empty()) {
        throw TextSelectionError{
            "unable to find " + describe() + " in text \"" + truncate_for_message(document) + "\""};
    }

    const auto prefix = detail::effective_context(prefix_, options);
    const auto suffix = detail::effective_context(suffix_, options);
    if (occurrences.size() > 1 && prefix.empty() && suffix.empty()) {
        throw TextSelectionError{
            describe() + " is ambiguous: it occurs " + std::to_string(occurrences.size())
            + " times and has no prefix or suffix to tell them apart"};
    }

    auto survivors = std::vector<std::size_t>{};
    std::ranges::copy_if(occurrences, std::back_inserter(survivors), [&](std::size_t pos) {
        return detail::preceded_by(document, pos, prefix, options)
            && detail::followed_by(document, pos + exact_.size(), suffix, options);
    });
    spdlog::debug("{}: {} of {} occurrences match the context",
                  describe(), survivors.size(), occurrences.size());

    if (survivors.empty()) {
        throw TextSelectionError{
            "no occurrence of " + describe() + " is surrounded by the given prefix and suffix"};
    }
    if (survivors.size() > 1) {
        throw TextSelectionError{
            describe() + " is ambiguous: " + std::to_string(survivors.size())
            + " occurrences match the given prefix and suffix"};
    }
    return PositionSelector{survivors.front(), survivors.front() + exact_.size()};
}

auto QuoteSelector::resolve_between(std::string_view document,
                                    const ResolveOptions& options) const -> PositionSelector {
    const auto prefix = detail::effective_context(prefix_, options);
    const auto suffix = detail::effective_context(suffix_, options);
    if (prefix.empty() && suffix.empty()) {
        throw TextSelectionError{describe() + " has only whitespace for context"};
    }

    auto start = std::size_t{0};
    if (!prefix.empty()) {
        start = locate_unique(document, prefix, "prefix", options) + prefix.size();
    }
    auto end = document.size();
    if (!suffix.empty()) {
        end = locate_unique(document, suffix, "suffix", options);
        if (end < start) {
            throw TextSelectionError{
                "suffix \"" + truncate_for_message(suffix) + "\" does not follow prefix \""
                + truncate_for_message(prefix) + "\""};
        }
    }

    if (options.skip_whitespace) {
        while (start < end && detail::is_space(document[start])) ++start;
        while (end > start && detail::is_space(document[end - 1])) --end;
    }
    if (start >= end) {
        throw TextSelectionError{"no text between the context of " + describe()};
    }
    return PositionSelector{start, end};
}

auto QuoteSelector::select_text(std::string_view document,
                                const ResolveOptions& options) const -> std::string {
    return resolve(document, options).select_text(document);
}

auto QuoteSelector::is_unique_in(std::string_view document,
                                 const ResolveOptions& options) const -> bool {
    try {
        (void)resolve(document, options);
        return true;
    } catch (const TextSelectionError&) {
        return false;
    }
}

auto QuoteSelector::rebuild_from_text(std::string_view document,
                                      const ResolveOptions& options) const -> QuoteSelector {
    return QuoteSelector{select_text(document, options), prefix_, suffix_};
}

auto QuoteSelector::describe() const -> std::string {
    auto result = std::string{"quote "};
    if (!prefix_.empty()) result += "prefix=\"" + truncate_for_message(prefix_) + "\" ";
    result += "exact=\"" + truncate_for_message(exact_) + "\"";
    if (!suffix_.empty()) result += " suffix=\"" + truncate_for_message(suffix_) + "\"";
    return result;
}

}  // namespace anchorpoint_cpp
