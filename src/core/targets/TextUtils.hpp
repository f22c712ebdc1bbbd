#pragma once

#include <string_view>

namespace portsweep::core {

/**
 * @brief Strips leading and trailing ASCII whitespace.
 */
inline std::string_view trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace portsweep::core
