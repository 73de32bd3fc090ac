#pragma once

#ifndef LOGGING_LOGGER_H
#define LOGGING_LOGGER_H

#include <atomic>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <base/format_string.h>
#include <config/config.h>

#include "loglevel.h"
#include "logmessage.h"
#include "logsink.h"

namespace stackerr::core::logging {

using base::format_string_t;

/**
 * @brief Named logger fanning entries out to its sinks
 *
 * The call site recorded with every entry is the logging statement, taken
 * from the format string or from an explicit location.
 */
class Logger {
public:
    explicit Logger(std::string name, LogLevel level = LogLevel::INFO)
        : name_(std::move(name))
        , level_(level) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void log(LogLevel level, format_string_t<Args...> fmt, Args&&... args) {
        if (!should_log(level)) return;
        log_text(level, fmt::format(fmt.format, std::forward<Args>(args)...), fmt.location);
    }

    template<typename... Args>
    void debug(format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::DEBUG, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::INFO, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::WARN, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::ERROR, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Log text that is already formatted
     */
    void log_text(LogLevel level, std::string text,
                  const std::source_location& loc = std::source_location::current()) {
#if STACKERR_ENABLE_LOGGING
        if (!should_log(level)) return;

        LogMessage message{level, name_, std::move(text), LogMessage::clock::now(), loc};
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (auto& sink : sinks_) {
            sink->write(message);
        }
#else
        STACKERR_UNUSED(level);
        STACKERR_UNUSED(text);
        STACKERR_UNUSED(loc);
#endif
    }

    [[nodiscard]] bool should_log(LogLevel level) const {
        return passes(level, this->level());
    }

    void set_level(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

    [[nodiscard]] LogLevel level() const { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]] const std::string& name() const { return name_; }

    void add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.push_back(std::move(sink));
    }

    void flush() {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (auto& sink : sinks_) {
            sink->flush();
        }
    }

private:
    std::string name_;
    std::atomic<LogLevel> level_;
    std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};

} // namespace stackerr::core::logging

#endif // LOGGING_LOGGER_H
