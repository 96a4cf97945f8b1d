#include <anchorpoint-cpp/json.hpp>

#include <anchorpoint-cpp/error.hpp>
#include <anchorpoint-cpp/shorthand.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace anchorpoint_cpp {

// =============================================================================
// Shared helpers, written once for json and ordered_json
// =============================================================================

namespace {

// Run a reader, reporting nlohmann type errors as malformed selectors.
template <typename Fn>
auto guarded(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const nlohmann::json::exception& e) {
        throw InvalidSelectorError{std::string{"malformed selector record: "} + e.what()};
    }
}

template <typename Json>
auto read_offset(const Json& j, std::string_view field) -> std::int64_t {
    if (!j.is_number_integer()) {
        throw InvalidSelectorError{"\"" + std::string{field} + "\" must be an integer, got "
                                   + truncate_for_message(j.dump())};
    }
    return j.template get<std::int64_t>();
}

template <typename Json>
auto read_string(const Json& j, const char* field) -> std::string {
    const auto it = j.find(field);
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_string()) {
        throw InvalidSelectorError{"\"" + std::string{field} + "\" must be a string, got "
                                   + truncate_for_message(it->dump())};
    }
    return it->template get<std::string>();
}

template <typename Json>
auto is_pair(const Json& j) -> bool {
    return j.is_array() && j.size() == 2 && j[0].is_number_integer() && j[1].is_number_integer();
}

template <typename Json>
auto position_from(const Json& j) -> PositionSelector {
    if (j.is_array()) {
        if (!is_pair(j)) {
            throw InvalidSelectorError{"a position pair must hold exactly two integers, got "
                                       + truncate_for_message(j.dump())};
        }
        return shorthand::position_from_pair(read_offset(j[0], "start"), read_offset(j[1], "end"));
    }
    if (j.is_boolean()) {
        if (j.template get<bool>()) return PositionSelector::from_start(0);
        throw InvalidSelectorError{"false selects no position"};
    }
    if (!j.is_object()) {
        throw InvalidSelectorError{"a position selector must be an object or a [start, end] pair, got "
                                   + truncate_for_message(j.dump())};
    }
    auto start = std::int64_t{0};
    if (const auto it = j.find("start"); it != j.end() && !it->is_null()) {
        start = read_offset(*it, "start");
    }
    const auto end = j.find("end");
    if (end == j.end() || end->is_null()) {
        if (start < 0) {
            throw InvalidSelectorError{"\"start\" must not be negative, got " + std::to_string(start)};
        }
        return PositionSelector::from_start(static_cast<std::size_t>(start));
    }
    return shorthand::position_from_pair(start, read_offset(*end, "end"));
}

template <typename Json>
void position_to(Json& j, const PositionSelector& p) {
    j = Json::object();
    j["start"] = p.start();
    if (p.is_unbounded()) {
        j["end"] = nullptr;
    } else {
        j["end"] = p.end();
    }
}

template <typename Json>
auto quote_from(const Json& j) -> QuoteSelector {
    if (j.is_string()) {
        return shorthand::quote_from_text(j.template get<std::string>());
    }
    if (!j.is_object()) {
        throw InvalidSelectorError{"a quote selector must be an object or a string, got "
                                   + truncate_for_message(j.dump())};
    }
    if (j.contains("text")) {
        return shorthand::quote_from_text(read_string(j, "text"));
    }
    return QuoteSelector{read_string(j, "exact"), read_string(j, "prefix"), read_string(j, "suffix")};
}

template <typename Json>
void quote_to(Json& j, const QuoteSelector& q) {
    j = Json::object();
    j["exact"] = q.exact();
    j["prefix"] = q.prefix();
    j["suffix"] = q.suffix();
}

template <typename Json>
auto is_position_record(const Json& j) -> bool {
    return is_pair(j) || (j.is_object() && (j.contains("start") || j.contains("end")));
}

template <typename Json>
auto is_quote_record(const Json& j) -> bool {
    return j.is_object()
        && (j.contains("exact") || j.contains("prefix") || j.contains("suffix") || j.contains("text"));
}

// A field holding either one item or a list of items.
template <typename Json, typename Read>
void read_items(const Json& j, const char* field, Read&& read) {
    const auto it = j.find(field);
    if (it == j.end() || it->is_null()) return;
    if (it->is_array() && !is_pair(*it)) {
        for (const auto& item : *it) read(item);
    } else {
        read(*it);
    }
}

template <typename Json>
auto set_from(const Json& j) -> PositionSet {
    if (j.is_boolean()) {
        if (!j.template get<bool>()) return PositionSet{};
        return PositionSet{PositionSelector::from_start(0)};
    }

    auto positions = std::vector<PositionSelector>{};
    auto quotes = std::vector<QuoteSelector>{};
    const auto read_any = [&](const Json& item) {
        if (is_position_record(item) || item.is_boolean()) {
            if (item.is_boolean() && !item.template get<bool>()) return;
            positions.push_back(position_from(item));
        } else {
            quotes.push_back(quote_from(item));
        }
    };

    if (j.is_array()) {
        if (is_pair(j)) {
            positions.push_back(position_from(j));
        } else {
            for (const auto& item : j) read_any(item);
        }
    } else if (j.is_object() && (j.contains("positions") || j.contains("quotes"))) {
        read_items(j, "positions", [&](const Json& item) { positions.push_back(position_from(item)); });
        read_items(j, "quotes", [&](const Json& item) { quotes.push_back(quote_from(item)); });
    } else if (is_position_record(j) || is_quote_record(j)) {
        // A lone selector record
        read_any(j);
    } else if (j.is_object()) {
        throw InvalidSelectorError{"a position set needs \"positions\" or \"quotes\", got "
                                   + truncate_for_message(j.dump())};
    } else {
        throw InvalidSelectorError{"a position set must be an object, a list or a boolean, got "
                                   + truncate_for_message(j.dump())};
    }
    return PositionSet{std::move(positions), std::move(quotes)};
}

template <typename Json>
void set_to(Json& j, const PositionSet& set) {
    j = Json::object();
    auto positions = Json::array();
    for (const auto& p : set.positions()) positions.push_back(Json(p));
    auto quotes = Json::array();
    for (const auto& q : set.quotes()) quotes.push_back(Json(q));
    j["positions"] = std::move(positions);
    j["quotes"] = std::move(quotes);
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const PositionSet& set) { set_to(j, set); }
void to_json(nlohmann::ordered_json& j, const PositionSet& set) { set_to(j, set); }

void from_json(const nlohmann::json& j, PositionSet& set) {
    set = guarded([&] { return set_from(j); });
}

void from_json(const nlohmann::ordered_json& j, PositionSet& set) {
    set = guarded([&] { return set_from(j); });
}

// =============================================================================
// Selectors of either kind
// =============================================================================

auto load_selector(const nlohmann::json& j) -> std::optional<Selector> {
    return guarded([&]() -> std::optional<Selector> {
        if (j.is_boolean()) {
            if (!j.get<bool>()) return std::nullopt;
            return Selector{PositionSelector::from_start(0)};
        }
        if (is_position_record(j) || j.is_array()) {
            return Selector{position_from(j)};
        }
        return Selector{quote_from(j)};
    });
}

auto dump_selector(const Selector& selector) -> nlohmann::ordered_json {
    auto j = nlohmann::ordered_json{};
    std::visit([&j](const auto& s) { j = nlohmann::ordered_json(s); }, selector);
    return j;
}

auto dump(const PositionSet& set, int indent) -> std::string {
    auto j = nlohmann::ordered_json{};
    to_json(j, set);
    return j.dump(indent);
}

auto load_position_set(std::string_view text) -> PositionSet {
    auto j = nlohmann::ordered_json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded()) {
        throw InvalidSelectorError{"not valid JSON: \"" + truncate_for_message(text) + "\""};
    }
    auto set = PositionSet{};
    from_json(j, set);
    return set;
}

}  // namespace anchorpoint_cpp

// =============================================================================
// Serializers for the selector types
// =============================================================================

using anchorpoint_cpp::PositionSelector;
using anchorpoint_cpp::QuoteSelector;

auto nlohmann::adl_serializer<PositionSelector>::from_json(const nlohmann::json& j)
    -> PositionSelector {
    return anchorpoint_cpp::guarded([&] { return anchorpoint_cpp::position_from(j); });
}

auto nlohmann::adl_serializer<PositionSelector>::from_json(const nlohmann::ordered_json& j)
    -> PositionSelector {
    return anchorpoint_cpp::guarded([&] { return anchorpoint_cpp::position_from(j); });
}

void nlohmann::adl_serializer<PositionSelector>::to_json(nlohmann::json& j,
                                                         const PositionSelector& p) {
    anchorpoint_cpp::position_to(j, p);
}

void nlohmann::adl_serializer<PositionSelector>::to_json(nlohmann::ordered_json& j,
                                                         const PositionSelector& p) {
    anchorpoint_cpp::position_to(j, p);
}

auto nlohmann::adl_serializer<QuoteSelector>::from_json(const nlohmann::json& j)
    -> QuoteSelector {
    return anchorpoint_cpp::guarded([&] { return anchorpoint_cpp::quote_from(j); });
}

auto nlohmann::adl_serializer<QuoteSelector>::from_json(const nlohmann::ordered_json& j)
    -> QuoteSelector {
    return anchorpoint_cpp::guarded([&] { return anchorpoint_cpp::quote_from(j); });
}

void nlohmann::adl_serializer<QuoteSelector>::to_json(nlohmann::json& j,
                                                      const QuoteSelector& q) {
    anchorpoint_cpp::quote_to(j, q);
}

void nlohmann::adl_serializer<QuoteSelector>::to_json(nlohmann::ordered_json& j,
                                                      const QuoteSelector& q) {
    anchorpoint_cpp::quote_to(j, q);
}
