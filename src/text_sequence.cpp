#include <anchorpoint-cpp/text_sequence.hpp>

#include <anchorpoint-cpp/position_set.hpp>

#include "text_search.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace anchorpoint_cpp {

namespace {

constexpr std::string_view passage_padding = ",:;. ";

auto ends_with(std::string_view text, std::string_view tail) -> bool {
    return text.size() >= tail.size() && text.substr(text.size() - tail.size()) == tail;
}

}  // anonymous namespace

// -- TextPassage --------------------------------------------------------------

auto TextPassage::means(const TextPassage& other) const -> bool {
    if (!included || !other.included) return false;
    return detail::trim_chars(text, passage_padding) == detail::trim_chars(other.text, passage_padding);
}

auto TextPassage::implies(const TextPassage& other) const -> bool {
    if (!other.included) return true;
    if (!included) return false;
    return text.find(detail::trim_chars(other.text, passage_padding)) != std::string::npos;
}

// -- TextSequence -------------------------------------------------------------

auto TextSequence::render(std::string_view document,
                          const PositionSet& selection,
                          const ResolveOptions& options) -> TextSequence {
    const auto resolved = selection.resolve_quotes(document, options);

    auto passages = std::vector<TextPassage>{};
    auto cursor = std::size_t{0};
    for (const auto& position : resolved.positions()) {
        if (position.start() >= document.size()) {
            spdlog::debug("interval starting at {} lies past the end of a document of length {}",
                          position.start(), document.size());
            break;
        }
        const auto end = std::min(position.end(), document.size());
        if (!position.is_unbounded() && position.end() > document.size()) {
            spdlog::debug("clipping interval ending at {} to document length {}",
                          position.end(), document.size());
        }
        if (position.start() > cursor) {
            passages.push_back(TextPassage{
                std::string{document.substr(cursor, position.start() - cursor)}, false});
        }
        passages.push_back(TextPassage{
            std::string{document.substr(position.start(), end - position.start())}, true});
        cursor = end;
    }
    if (cursor < document.size()) {
        passages.push_back(TextPassage{std::string{document.substr(cursor)}, false});
    }
    return TextSequence{std::move(passages)};
}

auto TextSequence::preview() const -> std::string {
    auto result = std::string{};
    auto any_included = false;
    auto gap_pending = false;
    for (const auto& passage : passages_) {
        if (!passage.included) {
            gap_pending = any_included;
            continue;
        }
        if (gap_pending) {
            result += ellipsis;
        } else if (any_included && !result.empty() && result.back() != ' ') {
            result += ' ';
        }
        result += passage.text;
        any_included = true;
        gap_pending = false;
    }
    return result;
}

auto TextSequence::to_string() const -> std::string {
    auto result = std::string{};
    for (const auto& passage : passages_) {
        if (!passage.included) {
            if (!ends_with(result, ellipsis)) result += ellipsis;
            continue;
        }
        if (!result.empty() && !ends_with(result, ellipsis) && result.back() != ' ') {
            result += ' ';
        }
        result += passage.text;
    }
    if (result == ellipsis) return {};
    return result;
}

auto TextSequence::concat(const TextSequence& other) const -> TextSequence {
    if (other.empty()) return *this;
    if (empty()) return other;
    auto passages = passages_;
    auto rest = other.passages_.begin();
    if (!passages.back().included && !rest->included) {
        passages.back().text += rest->text;
        ++rest;
    }
    passages.insert(passages.end(), rest, other.passages_.end());
    return TextSequence{std::move(passages)};
}

auto TextSequence::strip() const -> TextSequence {
    auto first = passages_.begin();
    auto last = passages_.end();
    if (first != last && !first->included) ++first;
    if (first != last && !std::prev(last)->included) --last;
    return TextSequence{std::vector<TextPassage>(first, last)};
}

auto TextSequence::means(const TextSequence& other) const -> bool {
    const auto mine = strip();
    const auto theirs = other.strip();
    if (mine.size() != theirs.size()) return false;
    return std::ranges::equal(mine.passages_, theirs.passages_,
        [](const TextPassage& a, const TextPassage& b) {
            return a.included ? a.means(b) : !b.included;
        });
}

auto TextSequence::implies(const TextSequence& other) const -> bool {
    return std::ranges::all_of(other.passages_, [this](const TextPassage& wanted) {
        if (!wanted.included) return true;
        return std::ranges::any_of(passages_, [&wanted](const TextPassage& have) {
            return have.included && have.implies(wanted);
        });
    });
}

auto TextSequence::strictly_implies(const TextSequence& other) const -> bool {
    return !means(other) && implies(other);
}

}  // namespace anchorpoint_cpp
