#pragma once

#ifndef BASE_FORMAT_STRING_H
#define BASE_FORMAT_STRING_H

#include <concepts>
#include <source_location>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

namespace stackerr::core::base {

/**
 * @brief Compile-time checked format string that remembers where it was written
 *
 * Variadic functions cannot take a defaulted std::source_location after
 * their argument pack, so the location is captured when the string literal
 * converts to this type at the call site.
 *
 * Usage:
 *   template<typename... Args>
 *   void report(format_string_t<Args...> fmt, Args&&... args) {
 *       auto text = fmt::format(fmt.format, std::forward<Args>(args)...);
 *       auto line = fmt.location.line();
 *   }
 */
template<typename... Args>
struct FormatString {
    fmt::format_string<Args...> format;
    std::source_location location;

    template<typename S>
        requires std::convertible_to<const S&, std::string_view>
    consteval FormatString(const S& s,
                           const std::source_location& loc = std::source_location::current())
        : format(s)
        , location(loc) {
    }
};

// Keeps the argument types deducible from the arguments only
template<typename... Args>
using format_string_t = FormatString<std::type_identity_t<Args>...>;

} // namespace stackerr::core::base

#endif // BASE_FORMAT_STRING_H
