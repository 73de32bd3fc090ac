#pragma once

#ifndef CORE_ERROR_FRAME_H
#define CORE_ERROR_FRAME_H

#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>

#include "trace_config.h"

namespace stackerr::core::error {

/**
 * @brief A single captured program location
 *
 * A frame is either a compile-time call-site record or a raw code address
 * taken from the live call stack. Nothing is resolved at capture time; the
 * function name, file and line are worked out when the frame is rendered.
 * Fields that cannot be resolved render as "unknown" (line 0).
 */
class Frame {
public:
    /**
     * @brief Unresolvable frame
     */
    Frame() = default;

    /**
     * @brief Frame for a call site
     */
    explicit Frame(const std::source_location& loc) noexcept
        : location_(loc)
        , has_location_(true) {
    }

    /**
     * @brief Frame for a code address (instruction pointer)
     */
    explicit Frame(const void* address) noexcept
        : address_(address) {
    }

    /**
     * @brief Frame for the caller of here()
     */
    static Frame here(const std::source_location& loc = std::source_location::current()) noexcept {
        return Frame(loc);
    }

    bool has_location() const noexcept { return has_location_; }
    const void* address() const noexcept { return address_; }

    /**
     * @brief Check if anything at all is known about this frame
     */
    bool is_resolvable() const noexcept {
        return has_location_ || address_ != nullptr;
    }

    /**
     * @brief Qualified function name, or "unknown"
     */
    std::string function() const;

    /**
     * @brief Source file as recorded by the compiler, or "unknown"
     */
    std::string file() const;

    /**
     * @brief Source line, 0 when unknown
     */
    std::uint_least32_t line() const noexcept {
        return has_location_ ? location_.line() : 0;
    }

    /**
     * @brief Render as "function(file:line)"
     *
     * The file is shortened against the config's working directory.
     */
    std::string to_string(const TraceConfig& config = TraceConfig::process()) const;

    /**
     * @brief Compact or verbose rendering
     *
     * The verbose form is prefixed with a newline, a tab and "at ".
     */
    std::string format(bool verbose,
                       const TraceConfig& config = TraceConfig::process()) const;

    bool operator==(const Frame& other) const noexcept;

    bool operator!=(const Frame& other) const noexcept {
        return !(*this == other);
    }

    /**
     * @brief Reduce a compiler "pretty" function name to its qualified name
     *
     * "int ns::Foo<T>::bar(int) const [with T = int]" becomes "ns::Foo<T>::bar".
     */
    static std::string qualified_function_name(std::string_view pretty_name);

private:
    std::source_location location_{};
    const void* address_ = nullptr;
    bool has_location_ = false;
};

} // namespace stackerr::core::error

#endif // CORE_ERROR_FRAME_H
