#pragma once

#ifndef CORE_ERROR_ERRORS_H
#define CORE_ERROR_ERRORS_H

#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <base/format_string.h>
#include <config/config.h>

#include "annotated_error.h"
#include "error.h"
#include "format.h"
#include "stack.h"

namespace stackerr::core::error {

using base::format_string_t;

namespace detail {

template<typename T>
void collect_cause(std::vector<Error>& causes, const T& arg) {
    if constexpr (std::is_same_v<std::remove_cvref_t<T>, Error>) {
        if (arg) {
            causes.push_back(arg);
        }
    } else {
        STACKERR_UNUSED(arg);
    }
}

// Every non-absent Error among the format arguments
template<typename... Args>
std::vector<Error> collect_causes(const Args&... args) {
    std::vector<Error> causes;
    (collect_cause(causes, args), ...);
    return causes;
}

Error formatted_error(std::string message, std::vector<Error> causes,
                      const std::source_location& loc);

Error wrap_message(const Error& err, std::string message,
                   const std::source_location& loc);

} // namespace detail

/**
 * @brief New error with a message and the caller's frame
 */
Error make_error(std::string_view message,
                 const std::source_location& loc = std::source_location::current());

/**
 * @brief New error with a formatted message and the caller's frame
 *
 * Uses {fmt} syntax. Error arguments are printed by message and become
 * causes of the new error, so is() and as() still find them; their stacks
 * are kept after the new frame.
 */
template<typename... Args>
Error errorf(format_string_t<Args...> format, Args&&... args) {
    auto causes = detail::collect_causes(args...);
    auto message = fmt::format(format.format, std::forward<Args>(args)...);
    return detail::formatted_error(std::move(message), std::move(causes), format.location);
}

/**
 * @brief Record the caller's frame on `err`
 *
 * If the chain already carries a stack the frame is added to it and the
 * same node is returned; otherwise `err` is wrapped. Absent stays absent.
 */
Error with_stack(const Error& err,
                 const std::source_location& loc = std::source_location::current());

/**
 * @brief "message: err", with the caller's frame in front of err's stack
 *
 * Absent stays absent. `err` stays reachable through is() and as().
 */
Error wrap(const Error& err, std::string_view message,
           const std::source_location& loc = std::source_location::current());

/**
 * @brief wrap() with a formatted message
 */
template<typename... Args>
Error wrapf(const Error& err, format_string_t<Args...> format, Args&&... args) {
    if (!err) {
        return {};
    }
    return detail::wrap_message(err, fmt::format(format.format, std::forward<Args>(args)...),
                                format.location);
}

/**
 * @brief Join `err` and `cause` into "err: cause"
 *
 * Both remain reachable through is() and as(). The stack is the caller's
 * frame, then err's stack, then cause's stack. With an absent cause this
 * is with_stack(err); with an absent err the result is absent.
 */
Error wrap_with_cause(const Error& err, const Error& cause,
                      const std::source_location& loc = std::source_location::current());

inline Error with_message(const Error& err, std::string_view message,
                          const std::source_location& loc = std::source_location::current()) {
    return wrap(err, message, loc);
}

template<typename... Args>
Error with_messagef(const Error& err, format_string_t<Args...> format, Args&&... args) {
    if (!err) {
        return {};
    }
    return detail::wrap_message(err, fmt::format(format.format, std::forward<Args>(args)...),
                                format.location);
}

} // namespace stackerr::core::error

#endif // CORE_ERROR_ERRORS_H
