/// @file json.hpp
/// @brief nlohmann/json interoperability for anchorpoint-cpp.
///
/// Serializes PositionSelector, QuoteSelector and PositionSet as JSON
/// records, for both nlohmann::json and nlohmann::ordered_json (the latter
/// keeps the field order: "start" before "end", "positions" before
/// "quotes"). Reading accepts the shorthand notations of shorthand.hpp as
/// well as the full records.

#pragma once

#include <anchorpoint-cpp/position_selector.hpp>
#include <anchorpoint-cpp/position_set.hpp>
#include <anchorpoint-cpp/quote_selector.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace anchorpoint_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- PositionSet --------------------------------------------------------------

void to_json(nlohmann::json& j, const PositionSet& set);
void to_json(nlohmann::ordered_json& j, const PositionSet& set);

/// Accepts {"positions": [...], "quotes": [...]} with either field
/// optional or given as a single item, a bare list of selectors, or a
/// boolean (true: everything, false: nothing).
/// @throws InvalidSelectorError on malformed input.
void from_json(const nlohmann::json& j, PositionSet& set);
void from_json(const nlohmann::ordered_json& j, PositionSet& set);

// =============================================================================
// Selectors of either kind
// =============================================================================

/// A selector of either kind, as found in stored citations.
using Selector = std::variant<PositionSelector, QuoteSelector>;

/// Read a selector from any supported notation.
///
/// Objects with "start" or "end" are positions; objects with "exact",
/// "prefix", "suffix" or "text" are quotes; strings use the pipe
/// shorthand; [start, end] pairs are positions; true selects the whole
/// document and false selects nothing (nullopt).
/// @throws InvalidSelectorError on malformed input.
auto load_selector(const nlohmann::json& j) -> std::optional<Selector>;

/// Write a selector as its canonical record.
auto dump_selector(const Selector& selector) -> nlohmann::ordered_json;

/// Serialize a PositionSet to a JSON string with fields in canonical order.
auto dump(const PositionSet& set, int indent = -1) -> std::string;

/// Parse a PositionSet from a JSON string.
/// @throws InvalidSelectorError on malformed input.
auto load_position_set(std::string_view text) -> PositionSet;

}  // namespace anchorpoint_cpp

// =============================================================================
// Serializers for the selector types, which have no default constructor
// =============================================================================

/// @cond SERIALIZER_SPECIALIZATIONS

template <>
struct nlohmann::adl_serializer<anchorpoint_cpp::PositionSelector> {
    /// Reads {"start": n, "end": m} (start defaults to 0, a missing or null
    /// end is unbounded) or a bare [start, end] pair.
    static auto from_json(const nlohmann::json& j) -> anchorpoint_cpp::PositionSelector;
    static auto from_json(const nlohmann::ordered_json& j) -> anchorpoint_cpp::PositionSelector;

    static void to_json(nlohmann::json& j, const anchorpoint_cpp::PositionSelector& p);
    static void to_json(nlohmann::ordered_json& j, const anchorpoint_cpp::PositionSelector& p);
};

template <>
struct nlohmann::adl_serializer<anchorpoint_cpp::QuoteSelector> {
    /// Reads {"exact", "prefix", "suffix"} (all optional), {"text": "a|b|c"}
    /// or a bare shorthand string.
    static auto from_json(const nlohmann::json& j) -> anchorpoint_cpp::QuoteSelector;
    static auto from_json(const nlohmann::ordered_json& j) -> anchorpoint_cpp::QuoteSelector;

    static void to_json(nlohmann::json& j, const anchorpoint_cpp::QuoteSelector& q);
    static void to_json(nlohmann::ordered_json& j, const anchorpoint_cpp::QuoteSelector& q);
};

/// @endcond
