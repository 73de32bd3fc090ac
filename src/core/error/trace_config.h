#pragma once

#ifndef CORE_ERROR_TRACE_CONFIG_H
#define CORE_ERROR_TRACE_CONFIG_H

#include <string>
#include <string_view>

namespace stackerr::core::error {

/**
 * @brief Read-only settings used when rendering frames
 *
 * Holds the working directory that displayed file paths are shortened
 * against. A default-constructed config has no working directory and leaves
 * every path untouched.
 *
 * The process instance is captured once during static initialisation and
 * never changes afterwards; tools and tests that need stable output build
 * their own instance and pass it to the rendering functions explicitly.
 */
class TraceConfig {
public:
    TraceConfig() = default;

    explicit TraceConfig(std::string working_directory);

    /**
     * @brief Config rooted at the current working directory
     *
     * Falls back to an empty working directory if it cannot be queried.
     */
    static TraceConfig from_current_directory();

    /**
     * @brief The instance captured at process start
     */
    static const TraceConfig& process();

    const std::string& working_directory() const noexcept { return working_directory_; }

    bool has_working_directory() const noexcept { return !working_directory_.empty(); }

    /**
     * @brief Strip the working directory prefix from a path
     *
     * Paths outside the working directory are returned unchanged.
     */
    std::string relative_path(std::string_view file) const;

private:
    std::string working_directory_;
};

} // namespace stackerr::core::error

#endif // CORE_ERROR_TRACE_CONFIG_H
