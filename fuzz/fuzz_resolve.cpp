// Fuzz target for QuoteSelector::resolve(): the first line of the input is a
// "prefix|exact|suffix" shorthand, the rest is the document. Any quote that
// resolves must select text inside the document and resolve the same way
// once rebuilt from that text.

#include <anchorpoint-cpp/anchorpoint.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;

    // First byte picks the resolution options
    const auto options = anchorpoint_cpp::ResolveOptions{
        .ignore_case = (data[0] & 1) != 0,
        .skip_whitespace = (data[0] & 2) != 0,
    };
    const auto input = std::string_view{reinterpret_cast<const char*>(data) + 1, size - 1};
    const auto newline = input.find('\n');
    if (newline == std::string_view::npos) return 0;
    const auto shorthand = input.substr(0, newline);
    const auto document = input.substr(newline + 1);

    try {
        const auto quote = anchorpoint_cpp::QuoteSelector::from_text(shorthand);
        const auto position = quote.resolve(document, options);
        if (position.end() > document.size()) __builtin_trap();

        const auto rebuilt = quote.rebuild_from_text(document, options);
        if (rebuilt.resolve(document, options) != position) __builtin_trap();
    } catch (const anchorpoint_cpp::SelectorError&) {
        // Rejected shorthand or unresolvable quote
    }
    return 0;
}
