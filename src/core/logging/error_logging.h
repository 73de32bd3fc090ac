#pragma once

#ifndef LOGGING_ERROR_LOGGING_H
#define LOGGING_ERROR_LOGGING_H

#include <source_location>

#include <core/error/error.h>
#include <core/error/format.h>

#include "logger.h"

namespace stackerr::core::logging {

/**
 * @brief Log an error with its stack trace
 *
 * The message text is the verbose rendering of `err` (message, then one
 * "\n\tat func(file:line)" line per frame). The log location is the
 * caller of log_error, not the origin of the error. An absent error logs
 * "<nil>".
 */
inline void log_error(Logger& logger, const error::Error& err,
                      LogLevel level = LogLevel::ERROR,
                      const error::TraceConfig& config = error::TraceConfig::process(),
                      const std::source_location& loc = std::source_location::current()) {
    if (!logger.should_log(level)) {
        return;
    }
    logger.log_text(level, error::to_string(err, error::RenderMode::Verbose, config), loc);
}

} // namespace stackerr::core::logging

#define STACKERR_LOG_ERROR_TRACE(logger, err) \
    stackerr::core::logging::log_error(*(logger), (err))

#endif // LOGGING_ERROR_LOGGING_H
