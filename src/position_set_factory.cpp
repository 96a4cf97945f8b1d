#include <anchorpoint-cpp/position_set_factory.hpp>

#include <anchorpoint-cpp/error.hpp>
#include <anchorpoint-cpp/shorthand.hpp>

namespace anchorpoint_cpp {

namespace {

template <class... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <class... Ts>
overload(Ts...) -> overload<Ts...>;

}  // anonymous namespace

auto PositionSetFactory::from_bool(bool selection) const -> PositionSet {
    if (!selection || document_.empty()) return PositionSet{};
    return PositionSet{PositionSelector{0, document_.size()}};
}

auto PositionSetFactory::from_selection(std::string_view shorthand) const -> PositionSet {
    return from_selection(shorthand::quote_from_text(shorthand));
}

auto PositionSetFactory::from_selection(const QuoteSelector& quote) const -> PositionSet {
    return from_quote_selectors({quote});
}

auto PositionSetFactory::from_selection(const PositionSelector& position) const -> PositionSet {
    return PositionSet{position};
}

auto PositionSetFactory::from_selection(const std::vector<Selection>& selections) const
    -> PositionSet {
    auto positions = std::vector<PositionSelector>{};
    positions.reserve(selections.size());
    for (const auto& selection : selections) {
        positions.push_back(std::visit(overload{
            [&](const std::string& exact) {
                return QuoteSelector{exact}.resolve(document_, options_);
            },
            [&](const QuoteSelector& quote) { return quote.resolve(document_, options_); },
            [](const PositionSelector& position) { return position; },
            [](const std::pair<std::size_t, std::size_t>& pair) {
                return PositionSelector{pair.first, pair.second};
            },
        }, selection));
    }
    return PositionSet{std::move(positions)};
}

auto PositionSetFactory::from_exact_strings(const std::vector<std::string>& quotations) const
    -> PositionSet {
    auto quotes = std::vector<QuoteSelector>{};
    quotes.reserve(quotations.size());
    for (const auto& exact : quotations) {
        quotes.emplace_back(exact);
    }
    return from_quote_selectors(quotes);
}

auto PositionSetFactory::from_quote_selectors(const std::vector<QuoteSelector>& quotes) const
    -> PositionSet {
    return PositionSet::from_quotes(quotes).resolve_quotes(document_, options_);
}

}  // namespace anchorpoint_cpp
