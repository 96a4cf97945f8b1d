// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <anchorpoint-cpp/anchorpoint.hpp>
#include <anchorpoint-cpp/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    namespace ap = anchorpoint_cpp;
    const auto json_dir = std::string{"fuzz/corpus/json_load"};
    const auto resolve_dir = std::string{"fuzz/corpus/resolve"};
    fs::create_directories(json_dir);
    fs::create_directories(resolve_dir);

    // -- fuzz_json_load seeds -------------------------------------------------
    write_seed(json_dir + "/seed_empty.json", ap::dump(ap::PositionSet{}));
    write_seed(json_dir + "/seed_positions.json", ap::dump(ap::PositionSet{{0, 4}, {5, 10}}));
    write_seed(json_dir + "/seed_unbounded.json",
               ap::dump(ap::PositionSet{ap::PositionSelector::from_start(12)}));
    write_seed(json_dir + "/seed_quotes.json",
               ap::dump(ap::PositionSet::from_quotes({
                   ap::QuoteSelector{"shoots,", "eats,", "and leaves"},
                   ap::QuoteSelector{"", "method of operation,"},
               })));
    write_seed(json_dir + "/seed_shorthand.json",
               R"({"positions": [0, 12], "quotes": "eats,|shoots,|and leaves"})");
    write_seed(json_dir + "/seed_list.json", R"([{"start": 0, "end": 7}, "great", [19, 23]])");
    write_seed(json_dir + "/seed_true.json", "true");

    // -- fuzz_resolve seeds (options byte, shorthand line, document) ----------
    const auto document = std::string{
        "In no case does copyright protection for an original work of authorship "
        "extend to any idea, procedure, process, system, method of operation."};
    const auto quotes = std::vector<std::string>{
        "does copyright",
        "In no case |does copyright| protection",
        "method of operation,||",
        "||idea, procedure,",
        "a",
    };
    for (std::size_t i = 0; i < quotes.size(); ++i) {
        write_seed(resolve_dir + "/seed_" + std::to_string(i) + ".txt",
                   std::string{"\x03"} + quotes[i] + "\n" + document);
    }

    return 0;
}
