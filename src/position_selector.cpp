#include <anchorpoint-cpp/position_selector.hpp>

#include <anchorpoint-cpp/error.hpp>
#include <anchorpoint-cpp/position_set.hpp>
#include <anchorpoint-cpp/quote_selector.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

namespace anchorpoint_cpp {

namespace {

auto describe(std::size_t start, std::size_t end) -> std::string {
    auto result = "(" + std::to_string(start) + ", ";
    result += end == PositionSelector::unbounded ? std::string{"unbounded"} : std::to_string(end);
    result += ")";
    return result;
}

}  // anonymous namespace

PositionSelector::PositionSelector(std::size_t start, std::size_t end)
    : start_{start}, end_{end} {
    if (start_ >= end_) {
        throw InvalidSelectorError{
            "end position must be greater than start position, got " + describe(start, end)};
    }
}

auto PositionSelector::from_start(std::size_t start) -> PositionSelector {
    return PositionSelector{start, unbounded};
}

auto PositionSelector::from_text(std::string_view document,
                                 std::string_view start_phrase,
                                 std::string_view end_phrase) -> PositionSelector {
    auto start = std::size_t{0};
    if (!start_phrase.empty()) {
        start = document.find(start_phrase);
        if (start == std::string_view::npos) {
            throw TextSelectionError{
                "string \"" + truncate_for_message(start_phrase) + "\" not found in text"};
        }
    }
    auto end = unbounded;
    if (!end_phrase.empty()) {
        end = document.find(end_phrase);
        if (end == std::string_view::npos) {
            throw TextSelectionError{
                "string \"" + truncate_for_message(end_phrase) + "\" not found in text"};
        }
        end += end_phrase.size();
    }
    return PositionSelector{start, end};
}

auto PositionSelector::length() const noexcept -> std::size_t {
    return is_unbounded() ? unbounded : end_ - start_;
}

// -- Interval relations -------------------------------------------------------

auto PositionSelector::overlaps(const PositionSelector& other) const noexcept -> bool {
    return start_ < other.end_ && other.start_ < end_;
}

auto PositionSelector::touches(const PositionSelector& other) const noexcept -> bool {
    return start_ <= other.end_ && other.start_ <= end_;
}

auto PositionSelector::covers(const PositionSelector& other) const noexcept -> bool {
    return other.start_ >= start_ && other.end_ <= end_;
}

auto PositionSelector::covers(const PositionSet& other) const -> bool {
    return PositionSet{*this}.covers(other);
}

auto PositionSelector::strictly_covers(const PositionSelector& other) const noexcept -> bool {
    return covers(other) && other != *this;
}

auto PositionSelector::strictly_covers(const PositionSet& other) const -> bool {
    return PositionSet{*this}.strictly_covers(other);
}

// -- Interval algebra ---------------------------------------------------------

auto PositionSelector::union_with(const PositionSelector& other) const -> PositionSelector {
    if (!touches(other)) {
        throw IncompatibleRangeError{
            "cannot join disjoint intervals " + describe(start_, end_) + " and "
            + describe(other.start_, other.end_) + " into one selector"};
    }
    return PositionSelector{std::min(start_, other.start_), std::max(end_, other.end_)};
}

auto PositionSelector::combine(const PositionSelector& other) const -> PositionSet {
    return PositionSet{*this, other};
}

auto PositionSelector::combine(const PositionSet& other) const -> PositionSet {
    return other.union_with(*this);
}

auto PositionSelector::intersect(const PositionSelector& other) const
    -> std::optional<PositionSelector> {
    if (!overlaps(other)) return std::nullopt;
    return PositionSelector{std::max(start_, other.start_), std::min(end_, other.end_)};
}

auto PositionSelector::intersect(const PositionSet& other) const -> PositionSet {
    return PositionSet{*this}.intersect(other);
}

auto PositionSelector::difference(const PositionSelector& other) const -> PositionSet {
    return PositionSet{*this}.difference(other);
}

auto PositionSelector::difference(const PositionSet& other) const -> PositionSet {
    return PositionSet{*this}.difference(other);
}

auto PositionSelector::shift(std::int64_t n) const -> PositionSelector {
    if (n < 0) {
        // -(n + 1) + 1 avoids negating INT64_MIN
        const auto distance = static_cast<std::size_t>(-(n + 1)) + 1;
        if (distance > start_) {
            throw RangeUnderflowError{
                "shifting " + describe(start_, end_) + " by " + std::to_string(n)
                + " would result in a negative start position"};
        }
        return PositionSelector{start_ - distance, is_unbounded() ? unbounded : end_ - distance};
    }
    const auto distance = static_cast<std::size_t>(n);
    const auto last = is_unbounded() ? start_ : end_;
    if (distance >= unbounded - last) {
        throw InvalidSelectorError{
            "shifting " + describe(start_, end_) + " by " + std::to_string(n)
            + " would overflow the largest position"};
    }
    return PositionSelector{start_ + distance, is_unbounded() ? unbounded : end_ + distance};
}

// -- Document access ----------------------------------------------------------

void PositionSelector::verify_within(std::string_view document) const {
    const auto too_short = is_unbounded() ? start_ >= document.size() : end_ > document.size();
    if (too_short) {
        throw OutOfBoundsError{
            "text \"" + truncate_for_message(document) + "\" of length "
            + std::to_string(document.size()) + " is too short to include the interval "
            + describe(start_, end_)};
    }
}

auto PositionSelector::select_text(std::string_view document) const -> std::string {
    verify_within(document);
    return std::string{document.substr(start_, length())};
}

auto PositionSelector::as_quote(std::string_view document,
                                std::size_t left_margin,
                                std::size_t right_margin) const -> QuoteSelector {
    if (start_ >= document.size()) {
        throw OutOfBoundsError{
            "string of length " + std::to_string(document.size())
            + " is not long enough to include any of the interval " + describe(start_, end_)};
    }
    auto exact = select_text(document);
    const auto stop = start_ + exact.size();
    const auto prefix_start = start_ - std::min(left_margin, start_);
    auto prefix = document.substr(prefix_start, start_ - prefix_start);
    auto suffix = document.substr(stop, std::min(right_margin, document.size() - stop));
    return QuoteSelector{std::move(exact), std::string{prefix}, std::string{suffix}};
}

auto PositionSelector::unique_quote(std::string_view document,
                                    const ResolveOptions& options) const -> QuoteSelector {
    const auto exact = select_text(document);
    const auto stop = start_ + exact.size();
    for (std::size_t margin = 0; margin < document.size() - exact.size(); margin += 5) {
        auto candidate = as_quote(document, margin, margin);
        if (candidate.is_unique_in(document, options)) {
            spdlog::trace("interval {} is unique with a margin of {}",
                          describe(start_, end_), margin);
            return candidate;
        }
    }
    spdlog::debug("interval {} has no unique quote, using the whole document as context",
                  describe(start_, end_));
    return QuoteSelector{exact, std::string{document.substr(0, start_)},
                         std::string{document.substr(stop)}};
}

}  // namespace anchorpoint_cpp
