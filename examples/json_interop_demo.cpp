// json_interop_demo: anchorpoint-cpp + nlohmann/json interoperability
//
// Demonstrates:
//   - Serializing selectors and sets with field order preserved
//   - Loading citations written with the compact shorthand notations
//   - Reporting malformed records
//
// Build: cmake --build build -DANCHORPOINT_BUILD_EXAMPLES=ON
// Run:   ./build/examples/json_interop_demo

#include <anchorpoint-cpp/anchorpoint.hpp>
#include <anchorpoint-cpp/json.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>
#include <variant>

namespace ap = anchorpoint_cpp;
using json = nlohmann::json;

static const auto amendment = std::string{
    "All persons born or naturalized in the United States and subject to the "
    "jurisdiction thereof, are citizens of the United States and of the State "
    "wherein they reside. No State shall make or enforce any law which shall "
    "abridge the privileges or immunities of citizens of the United States; "
    "nor shall any State deprive any person of life, liberty, or property, "
    "without due process of law; nor deny to any person within its "
    "jurisdiction the equal protection of the laws."};

int main() {
    // =========================================================================
    // Export
    // =========================================================================

    auto set = ap::PositionSet{{53, 84}}.union_with(
        ap::PositionSet::from_quotes({ap::QuoteSelector{"due process of law"}}));
    std::printf("Set:\n%s\n\n", ap::dump(set, 2).c_str());

    const nlohmann::ordered_json quote = ap::QuoteSelector{"", "the State", "they reside"};
    std::printf("Quote: %s\n\n", quote.dump().c_str());

    // =========================================================================
    // Import with shorthand
    // =========================================================================

    const auto stored = json::parse(R"({
        "positions": [[4, 11], {"start": 229, "end": 239}],
        "quotes": [
            "immunities of citizens of the United States;||nor deny to any person",
            {"text": "equal |protection| of the laws"}
        ]
    })");
    const auto loaded = stored.get<ap::PositionSet>();
    std::printf("Loaded %zu positions and %zu quotes\n",
                loaded.positions().size(), loaded.quotes().size());
    std::printf("Rendered: %s\n\n", loaded.as_string(amendment).c_str());

    for (const auto& record : {json(true), json("United States| and subject"), json(false)}) {
        try {
            const auto selector = ap::load_selector(record);
            if (!selector) {
                std::printf("%s selects nothing\n", record.dump().c_str());
                continue;
            }
            std::printf("%s -> %s\n", record.dump().c_str(),
                        ap::dump_selector(*selector).dump().c_str());
        } catch (const ap::InvalidSelectorError& e) {
            std::printf("%s rejected: %s\n", record.dump().c_str(), e.what());
        }
    }

    // =========================================================================
    // Round trip
    // =========================================================================

    const auto text = ap::dump(loaded);
    const auto reloaded = ap::load_position_set(text);
    std::printf("\nRound trip equal: %s\n", reloaded == loaded ? "yes" : "no");

    return 0;
}
