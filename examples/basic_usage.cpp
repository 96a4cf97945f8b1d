// basic_usage: demonstrates the core anchorpoint-cpp API
//
// Shows position selectors, quote selectors, set algebra over intervals,
// and previews of a selection.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage [--debug | --trace]

#include <anchorpoint-cpp/anchorpoint.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <string>
#include <string_view>

namespace ap = anchorpoint_cpp;

static constexpr std::string_view legal_text =
    "Copyright protection subsists, in accordance with this title, in original "
    "works of authorship fixed in any tangible medium of expression, now known "
    "or later developed, from which they can be perceived, reproduced, or "
    "otherwise communicated, either directly or with the aid of a machine or "
    "device. Works of authorship include the following categories:";

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        if (arg == "--trace") {
            spdlog::set_level(spdlog::level::trace);
        } else if (arg == "--debug") {
            spdlog::set_level(spdlog::level::debug);
        }
    }

    // -- Position selectors ---------------------------------------------------
    const auto works = ap::PositionSelector{65, 93};
    std::printf("(65, 93): %s\n", works.select_text(legal_text).c_str());

    // -- Quote selectors: the suffix tells the two occurrences apart ----------
    const auto quote = ap::QuoteSelector{"authorship", "", " include"};
    const auto position = quote.resolve(legal_text);
    std::printf("\"authorship\" before \"include\": (%zu, %zu)\n",
                position.start(), position.end());

    try {
        (void)ap::QuoteSelector{"authorship"}.resolve(legal_text);
    } catch (const ap::TextSelectionError& e) {
        std::printf("Bare \"authorship\" fails: %s\n", e.what());
    }

    // -- Interval algebra -----------------------------------------------------
    const auto joined = ap::PositionSelector{5, 22}.union_with(ap::PositionSelector{12, 27});
    std::printf("(5, 22) union (12, 27) = (%zu, %zu)\n", joined.start(), joined.end());

    const auto both = ap::PositionSelector{65, 79}.combine(ap::PositionSelector{100, 136});
    std::printf("(65, 79) combined with (100, 136) holds %zu intervals\n",
                both.positions().size());

    if (auto overlap = ap::PositionSelector{2, 10}.intersect(ap::PositionSelector{5, 20})) {
        std::printf("(2, 10) intersect (5, 20) = (%zu, %zu)\n", overlap->start(), overlap->end());
    }

    // -- Shifting a set -------------------------------------------------------
    const auto cited = ap::PositionSet{{4, 17}};
    try {
        (void)cited.shift(-7);
    } catch (const ap::RangeUnderflowError& e) {
        std::printf("Shift by -7 fails: %s\n", e.what());
    }
    const auto moved = cited.shift(-3);
    std::printf("Shift by -3: (%zu, %zu)\n",
                moved.positions()[0].start(), moved.positions()[0].end());

    // -- Previews -------------------------------------------------------------
    const auto selection = ap::PositionSet{{65, 93}}.union_with(quote.resolve(legal_text));
    const auto sequence = selection.as_text_sequence(legal_text);
    std::printf("Preview:   %s\n", sequence.preview().c_str());
    std::printf("As string: %s\n", sequence.to_string().c_str());

    return 0;
}
