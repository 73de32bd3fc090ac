#pragma once

#ifndef LOGGING_LOGLEVEL_H
#define LOGGING_LOGLEVEL_H

#include <ostream>
#include <string_view>

namespace stackerr::core::logging {

/**
 * @brief Severity of a log entry, ordered from least to most severe
 *
 * OFF is only meaningful as a threshold.
 */
enum class LogLevel : int {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERROR = 3,
    OFF   = 4
};

constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

/**
 * @brief True when an entry at `level` passes `threshold`
 */
constexpr bool passes(LogLevel level, LogLevel threshold) noexcept {
    return threshold != LogLevel::OFF && level != LogLevel::OFF &&
           static_cast<int>(level) >= static_cast<int>(threshold);
}

inline std::ostream& operator<<(std::ostream& os, LogLevel level) {
    return os << to_string(level);
}

} // namespace stackerr::core::logging

#endif // LOGGING_LOGLEVEL_H
