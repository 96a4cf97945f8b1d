// Fuzz target for load_position_set(): exercises the JSON reader and the
// shorthand expansion. Any set that loads must survive a dump/load round trip.

#include <anchorpoint-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        const auto set = anchorpoint_cpp::load_position_set(text);
        const auto reloaded = anchorpoint_cpp::load_position_set(anchorpoint_cpp::dump(set));
        if (!(reloaded == set)) __builtin_trap();
    } catch (const anchorpoint_cpp::InvalidSelectorError&) {
        // Malformed record
    }
    return 0;
}
