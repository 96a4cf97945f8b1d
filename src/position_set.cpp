#include <anchorpoint-cpp/position_set.hpp>

#include <anchorpoint-cpp/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>

namespace anchorpoint_cpp {

PositionSet::PositionSet(std::vector<PositionSelector> positions,
                         std::vector<QuoteSelector> quotes)
    : positions_{std::move(positions)}, quotes_{std::move(quotes)} {
    normalize();
}

PositionSet::PositionSet(std::initializer_list<PositionSelector> positions)
    : positions_{positions} {
    normalize();
}

PositionSet::PositionSet(const PositionSelector& position)
    : positions_{position} {}

auto PositionSet::from_quotes(std::vector<QuoteSelector> quotes) -> PositionSet {
    return PositionSet{std::vector<PositionSelector>{}, std::move(quotes)};
}

auto PositionSet::from_pairs(const std::vector<std::pair<std::size_t, std::size_t>>& pairs)
    -> PositionSet {
    auto positions = std::vector<PositionSelector>{};
    positions.reserve(pairs.size());
    for (const auto& [start, end] : pairs) {
        positions.emplace_back(start, end);
    }
    return PositionSet{std::move(positions)};
}

// Sort, then fold each interval into the previous one when they touch.
void PositionSet::normalize() {
    if (positions_.size() < 2) return;
    std::ranges::sort(positions_);

    auto merged = std::vector<PositionSelector>{};
    merged.reserve(positions_.size());
    for (const auto& position : positions_) {
        if (!merged.empty() && merged.back().touches(position)) {
            merged.back() = merged.back().union_with(position);
        } else {
            merged.push_back(position);
        }
    }
    if (merged.size() != positions_.size()) {
        spdlog::trace("normalized {} intervals into {}", positions_.size(), merged.size());
    }
    positions_ = std::move(merged);
}

// -- Set algebra --------------------------------------------------------------

auto PositionSet::union_with(const PositionSet& other) const -> PositionSet {
    auto positions = positions_;
    positions.insert(positions.end(), other.positions_.begin(), other.positions_.end());
    auto quotes = quotes_;
    quotes.insert(quotes.end(), other.quotes_.begin(), other.quotes_.end());
    return PositionSet{std::move(positions), std::move(quotes)};
}

auto PositionSet::union_with(const PositionSelector& other) const -> PositionSet {
    auto positions = positions_;
    positions.push_back(other);
    return PositionSet{std::move(positions), quotes_};
}

auto PositionSet::intersect(const PositionSet& other) const -> PositionSet {
    auto positions = std::vector<PositionSelector>{};
    for (const auto& left : positions_) {
        for (const auto& right : other.positions_) {
            if (auto overlap = left.intersect(right)) {
                positions.push_back(*overlap);
            }
        }
    }
    return PositionSet{std::move(positions)};
}

auto PositionSet::intersect(const PositionSelector& other) const -> PositionSet {
    return intersect(PositionSet{other});
}

auto PositionSet::difference(const PositionSet& other) const -> PositionSet {
    auto positions = std::vector<PositionSelector>{};
    for (const auto& position : positions_) {
        auto cursor = position.start();
        for (const auto& removed : other.positions_) {
            if (removed.end() <= cursor) continue;
            if (removed.start() >= position.end()) break;
            if (removed.start() > cursor) {
                positions.emplace_back(cursor, removed.start());
            }
            cursor = removed.end();
            if (cursor >= position.end()) break;
        }
        if (cursor < position.end()) {
            positions.emplace_back(cursor, position.end());
        }
    }
    return PositionSet{std::move(positions), quotes_};
}

auto PositionSet::difference(const PositionSelector& other) const -> PositionSet {
    return difference(PositionSet{other});
}

auto PositionSet::shift(std::int64_t n) const -> PositionSet {
    auto positions = std::vector<PositionSelector>{};
    positions.reserve(positions_.size());
    for (const auto& position : positions_) {
        positions.push_back(position.shift(n));
    }
    return PositionSet{std::move(positions), quotes_};
}

auto PositionSet::add_margin(std::size_t left, std::size_t right) const -> PositionSet {
    auto positions = std::vector<PositionSelector>{};
    positions.reserve(positions_.size());
    for (const auto& position : positions_) {
        const auto start = position.start() - std::min(left, position.start());
        auto end = PositionSelector::unbounded;
        if (!position.is_unbounded() && right < PositionSelector::unbounded - position.end()) {
            end = position.end() + right;
        }
        positions.emplace_back(start, end);
    }
    return PositionSet{std::move(positions), quotes_};
}

auto PositionSet::resolve_quotes(std::string_view document,
                                 const ResolveOptions& options) const -> PositionSet {
    auto positions = positions_;
    positions.reserve(positions_.size() + quotes_.size());
    for (std::size_t i = 0; i < quotes_.size(); ++i) {
        try {
            positions.push_back(quotes_[i].resolve(document, options));
        } catch (const TextSelectionError& e) {
            throw TextSelectionError{
                "cannot resolve quote " + std::to_string(i) + " (\""
                + truncate_for_message(quotes_[i].exact().empty() ? quotes_[i].prefix()
                                                                  : quotes_[i].exact())
                + "\"): " + e.what()};
        }
    }
    if (!quotes_.empty()) {
        spdlog::debug("resolved {} quotes against a document of length {}",
                      quotes_.size(), document.size());
    }
    return PositionSet{std::move(positions)};
}

auto PositionSet::bridge_gaps(std::string_view document,
                              std::size_t width,
                              std::string_view characters,
                              const ResolveOptions& options) const -> PositionSet {
    if (width == 0) {
        throw InvalidSelectorError{"margin width must be a positive integer"};
    }
    const auto resolved = resolve_quotes(document, options);
    auto positions = resolved.positions_;
    const auto& sorted = resolved.positions_;
    for (std::size_t i = 0; i + 1 < sorted.size(); ++i) {
        const auto gap_start = sorted[i].end();
        const auto gap_end = sorted[i + 1].start();
        if (gap_end - gap_start > width || gap_end > document.size()) continue;
        const auto gap = document.substr(gap_start, gap_end - gap_start);
        if (gap.find_first_not_of(characters) == std::string_view::npos) {
            positions.emplace_back(gap_start, gap_end);
        }
    }
    return PositionSet{std::move(positions)};
}

// -- Comparison ---------------------------------------------------------------

auto PositionSet::covers(const PositionSet& other) const -> bool {
    return intersect(other).positions_ == other.positions_;
}

auto PositionSet::covers(const PositionSelector& other) const -> bool {
    return covers(PositionSet{other});
}

auto PositionSet::strictly_covers(const PositionSet& other) const -> bool {
    return covers(other) && positions_ != other.positions_;
}

auto PositionSet::strictly_covers(const PositionSelector& other) const -> bool {
    return strictly_covers(PositionSet{other});
}

auto PositionSet::operator==(const PositionSet& other) const -> bool {
    if (positions_ != other.positions_) return false;
    auto mine = quotes_;
    auto theirs = other.quotes_;
    std::ranges::sort(mine);
    std::ranges::sort(theirs);
    mine.erase(std::ranges::unique(mine).begin(), mine.end());
    theirs.erase(std::ranges::unique(theirs).begin(), theirs.end());
    return mine == theirs;
}

// -- Document access ----------------------------------------------------------

auto PositionSet::as_quotes(std::string_view document,
                            const ResolveOptions& options) const -> std::vector<QuoteSelector> {
    auto result = std::vector<QuoteSelector>{};
    result.reserve(positions_.size() + quotes_.size());
    for (const auto& position : positions_) {
        result.push_back(position.unique_quote(document, options));
    }
    result.insert(result.end(), quotes_.begin(), quotes_.end());
    return result;
}

auto PositionSet::as_text_sequence(std::string_view document,
                                   const ResolveOptions& options) const -> TextSequence {
    return TextSequence::render(document, *this, options);
}

auto PositionSet::as_string(std::string_view document,
                            const ResolveOptions& options) const -> std::string {
    return as_text_sequence(document, options).to_string();
}

auto PositionSet::select_text(std::string_view document,
                              std::size_t width,
                              std::string_view characters,
                              const ResolveOptions& options) const -> std::string {
    return bridge_gaps(document, width, characters, options).as_string(document, options);
}

}  // namespace anchorpoint_cpp
