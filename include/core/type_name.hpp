#pragma once

#include <string>
#include <string_view>

namespace rowmap {

/**
 * @brief Human-readable name of T, for messages and logs
 *
 * Parsed from the GCC/Clang pretty function signature. Never use it as a
 * key; std::type_index identifies types.
 */
template<typename T>
[[nodiscard]] std::string type_name() {
    const std::string_view sig = __PRETTY_FUNCTION__;
    constexpr std::string_view marker = "T = ";

    const auto start = sig.find(marker);
    if (start == std::string_view::npos) return std::string(sig);
    const auto from = start + marker.size();

    // GCC appends "; std::string = ..." after the template argument
    auto end = sig.find(';', from);
    if (end == std::string_view::npos) end = sig.rfind(']');
    if (end == std::string_view::npos || end < from) end = sig.size();
    return std::string(sig.substr(from, end - from));
}

} // namespace rowmap
