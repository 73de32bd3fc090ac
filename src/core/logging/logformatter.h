#pragma once

#ifndef LOGGING_LOGFORMATTER_H
#define LOGGING_LOGFORMATTER_H

#include <chrono>
#include <ctime>
#include <iterator>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "logmessage.h"

namespace stackerr::core::logging {

/**
 * @brief Turns a log entry into the text a sink writes
 */
class LogFormatter {
public:
    virtual ~LogFormatter() = default;

    [[nodiscard]] virtual std::string format(const LogMessage& message) const = 0;
};

/**
 * @brief Single-line prefix followed by the message text
 *
 * Layout: [TIMESTAMP] [LEVEL] [LOGGER] [FILE:LINE] TEXT
 *
 * The text is written unchanged, so an error logged with its trace keeps
 * one "\tat" line per frame below the prefix.
 */
class BasicLogFormatter : public LogFormatter {
public:
    struct Options {
        bool timestamp = true;
        bool logger_name = true;
        bool location = false;
    };

    BasicLogFormatter() = default;
    explicit BasicLogFormatter(const Options& options)
        : options_(options) {}

    [[nodiscard]] std::string format(const LogMessage& message) const override {
        fmt::memory_buffer out;
        auto it = std::back_inserter(out);

        if (options_.timestamp) {
            it = format_time(it, message.time);
        }
        it = fmt::format_to(it, "[{:<5}] ", to_string(message.level));
        if (options_.logger_name && !message.logger.empty()) {
            it = fmt::format_to(it, "[{}] ", message.logger);
        }
        if (options_.location && message.where.line() != 0) {
            it = fmt::format_to(it, "[{}:{}] ", base_name(message.where.file_name()),
                                message.where.line());
        }
        fmt::format_to(it, "{}", message.text);
        return fmt::to_string(out);
    }

private:
    template<typename OutputIt>
    static OutputIt format_time(OutputIt it, LogMessage::clock::time_point tp) {
        std::time_t seconds = LogMessage::clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&seconds, &local);

        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()).count() % 1000;
        return fmt::format_to(it, "[{:%Y-%m-%d %H:%M:%S}.{:03}] ", local, millis);
    }

    static std::string_view base_name(std::string_view path) {
        auto slash = path.find_last_of("/\\");
        return slash == std::string_view::npos ? path : path.substr(slash + 1);
    }

    Options options_;
};

} // namespace stackerr::core::logging

#endif // LOGGING_LOGFORMATTER_H
