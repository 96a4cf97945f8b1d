#include <anchorpoint-cpp/error.hpp>

namespace anchorpoint_cpp {

auto truncate_for_message(std::string_view text) -> std::string {
    if (text.size() <= max_quoted_length) {
        return std::string{text};
    }
    auto result = std::string{text.substr(0, max_quoted_length)};
    result += "...";
    return result;
}

}  // namespace anchorpoint_cpp
