#pragma once

#ifndef LOGGING_LOGMESSAGE_H
#define LOGGING_LOGMESSAGE_H

#include <chrono>
#include <source_location>
#include <string>

#include "loglevel.h"

namespace stackerr::core::logging {

/**
 * @brief One log entry as handed to sinks
 *
 * `where` is the call site of the logging statement.
 */
struct LogMessage {
    using clock = std::chrono::system_clock;

    LogLevel level = LogLevel::INFO;
    std::string logger;
    std::string text;
    clock::time_point time = clock::now();
    std::source_location where;
};

} // namespace stackerr::core::logging

#endif // LOGGING_LOGMESSAGE_H
