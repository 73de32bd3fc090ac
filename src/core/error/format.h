#pragma once

#ifndef CORE_ERROR_FORMAT_H
#define CORE_ERROR_FORMAT_H

#include <algorithm>
#include <ostream>
#include <string>

#include <fmt/format.h>

#include "error.h"
#include "frame.h"
#include "stack.h"
#include "trace_config.h"

namespace stackerr::core::error {

/**
 * @brief Output forms of an error
 *
 * Compact: message only.
 * Verbose: message, then "\n\tat function(file:line)" per frame, newest first.
 * Quoted:  message as an escaped, double-quoted string.
 */
enum class RenderMode {
    Compact,
    Verbose,
    Quoted
};

/**
 * @brief Render an error with an explicit trace configuration
 *
 * The absent error renders as "<nil>".
 */
std::string to_string(const Error& err,
                      RenderMode mode = RenderMode::Compact,
                      const TraceConfig& config = TraceConfig::process());

inline std::ostream& operator<<(std::ostream& os, const Error& err) {
    return os << to_string(err);
}

inline std::ostream& operator<<(std::ostream& os, const Frame& frame) {
    return os << frame.to_string();
}

// Stacks print nothing in the compact form
inline std::ostream& operator<<(std::ostream& os, const Stack& stack) {
    return os << stack.format(false);
}

namespace detail {

/**
 * @brief Format specifier parser shared by the fmt formatters below
 *
 * Accepts "", "s", "v", "+", "+v" and "q".
 */
struct RenderSpec {
    RenderMode mode = RenderMode::Compact;

    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) -> decltype(ctx.begin()) {
        auto it = ctx.begin();
        auto end = ctx.end();

        if (it != end && *it == '+') {
            mode = RenderMode::Verbose;
            ++it;
        }
        if (it != end && (*it == 'v' || *it == 's')) {
            ++it;
        } else if (it != end && *it == 'q' && mode == RenderMode::Compact) {
            mode = RenderMode::Quoted;
            ++it;
        }

        if (it != end && *it != '}') {
            throw fmt::format_error("invalid format specifier for stackerr value");
        }
        return it;
    }
};

} // namespace detail

} // namespace stackerr::core::error

template<>
struct fmt::formatter<stackerr::core::error::Error> : stackerr::core::error::detail::RenderSpec {
    template<typename FormatContext>
    auto format(const stackerr::core::error::Error& err, FormatContext& ctx) const
        -> decltype(ctx.out()) {
        auto text = stackerr::core::error::to_string(err, mode);
        return std::copy(text.begin(), text.end(), ctx.out());
    }
};

template<>
struct fmt::formatter<stackerr::core::error::Frame> : stackerr::core::error::detail::RenderSpec {
    template<typename FormatContext>
    auto format(const stackerr::core::error::Frame& frame, FormatContext& ctx) const
        -> decltype(ctx.out()) {
        auto text = frame.format(mode == stackerr::core::error::RenderMode::Verbose);
        return std::copy(text.begin(), text.end(), ctx.out());
    }
};

template<>
struct fmt::formatter<stackerr::core::error::Stack> : stackerr::core::error::detail::RenderSpec {
    template<typename FormatContext>
    auto format(const stackerr::core::error::Stack& stack, FormatContext& ctx) const
        -> decltype(ctx.out()) {
        auto text = stack.format(mode == stackerr::core::error::RenderMode::Verbose);
        return std::copy(text.begin(), text.end(), ctx.out());
    }
};

#endif // CORE_ERROR_FORMAT_H
