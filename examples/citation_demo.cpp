// citation_demo: storing durable citations to passages of a statute
//
// Demonstrates:
//   - Building a selection from several kinds of selectors
//   - Converting offsets into quote selectors that survive re-rendering
//   - Re-anchoring the stored quotes in a reformatted copy of the text
//   - Bridging punctuation gaps and comparing selections
//
// Build: cmake --build build -DANCHORPOINT_BUILD_EXAMPLES=ON
// Run:   ./build/examples/citation_demo [--debug | --trace]

#include <anchorpoint-cpp/anchorpoint.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace ap = anchorpoint_cpp;

static const auto s102b = std::string{
    "In no case does copyright protection for an original work of authorship "
    "extend to any idea, procedure, process, system, method of operation, "
    "concept, principle, or discovery, regardless of the form in which it is "
    "described, explained, illustrated, or embodied in such work."};

// The same provision as published elsewhere, with a heading in front.
static const auto reformatted = std::string{
    "(b) IN GENERAL.  In no case does copyright protection for an original "
    "work of authorship extend to any idea, procedure, process, system, "
    "method of operation, concept, principle, or discovery, regardless of "
    "the form in which it is described, explained, illustrated, or embodied "
    "in such work."};

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        if (arg == "--trace") {
            spdlog::set_level(spdlog::level::trace);
        } else if (arg == "--debug") {
            spdlog::set_level(spdlog::level::debug);
        }
    }

    // -- Select passages in the original copy ---------------------------------
    const auto factory = ap::PositionSetFactory{s102b};
    const auto selection = factory.from_selection(std::vector<ap::Selection>{
        std::string{"In no case does copyright protection"},
        ap::QuoteSelector{"", "method of operation,", "principle"},
        ap::PositionSelector{72, 90},
    });
    std::printf("Selected: %s\n", selection.as_string(s102b).c_str());

    // -- Store the selection as quotes ----------------------------------------
    const auto quotes = selection.as_quotes(s102b);
    std::printf("Stored %zu quotes:\n", quotes.size());
    for (const auto& q : quotes) {
        std::printf("  prefix=\"%s\" exact=\"%s\" suffix=\"%s\"\n",
                    q.prefix().c_str(), q.exact().c_str(), q.suffix().c_str());
    }

    // -- Re-anchor in the reformatted copy ------------------------------------
    try {
        const auto reanchored = ap::PositionSet::from_quotes(quotes).resolve_quotes(
            reformatted, ap::ResolveOptions::tolerant());
        std::printf("Re-anchored: %s\n", reanchored.as_string(reformatted).c_str());

        const auto offset = static_cast<std::int64_t>(reformatted.find("In no case"));
        const auto shifted = selection.shift(offset);
        std::printf("Offsets shifted by %ld match: %s\n", static_cast<long>(offset),
                    shifted == reanchored ? "yes" : "no");
    } catch (const ap::SelectorError& e) {
        std::printf("Re-anchoring failed (%s): %s\n",
                    std::string{ap::to_string_view(e.kind())}.c_str(), e.what());
        return 1;
    }

    // -- Bridge punctuation and compare ---------------------------------------
    const auto list = ap::PositionSetFactory{s102b}.from_exact_strings(
        {"idea", "procedure", "process", "system"});
    std::printf("Listed:  %s\n", list.as_string(s102b).c_str());
    std::printf("Bridged: %s\n", list.select_text(s102b).c_str());

    const auto whole_clause = ap::PositionSet{{72, 120}};
    std::printf("Clause covers list: %s\n", whole_clause.covers(list) ? "yes" : "no");

    return 0;
}
