#pragma once

#ifndef LOGGING_LOGSINK_H
#define LOGGING_LOGSINK_H

#include <atomic>
#include <cstddef>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "logformatter.h"
#include "logmessage.h"

namespace stackerr::core::logging {

/**
 * @brief Destination for log entries
 *
 * Each sink has its own threshold and formatter. write() is called with
 * entries that already passed the logger's threshold.
 */
class LogSink {
public:
    virtual ~LogSink() = default;

    void write(const LogMessage& message) {
        if (!passes(message.level, level())) return;

        std::string line;
        {
            std::lock_guard<std::mutex> lock(formatter_mutex_);
            line = formatter_->format(message);
        }
        emit(message, line);
    }

    virtual void flush() {}

    void set_formatter(std::unique_ptr<LogFormatter> formatter) {
        std::lock_guard<std::mutex> lock(formatter_mutex_);
        formatter_ = formatter ? std::move(formatter) : std::make_unique<BasicLogFormatter>();
    }

    void set_level(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

    [[nodiscard]] LogLevel level() const { return level_.load(std::memory_order_relaxed); }

protected:
    /**
     * @brief Output one formatted entry
     */
    virtual void emit(const LogMessage& message, const std::string& line) = 0;

private:
    std::mutex formatter_mutex_;
    std::unique_ptr<LogFormatter> formatter_ = std::make_unique<BasicLogFormatter>();
    std::atomic<LogLevel> level_{LogLevel::DEBUG};
};

/**
 * @brief Writes one line per entry to a stream, std::cerr by default
 *
 * The stream must outlive the sink.
 */
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr)
        : out_(out) {}

    void flush() override {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_.flush();
    }

protected:
    void emit(const LogMessage&, const std::string& line) override {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << line << '\n';
    }

private:
    std::ostream& out_;
    std::mutex out_mutex_;
};

/**
 * @brief Keeps entries and their formatted lines, mainly for tests
 */
class MemorySink : public LogSink {
public:
    [[nodiscard]] std::vector<LogMessage> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    [[nodiscard]] std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

protected:
    void emit(const LogMessage& message, const std::string& line) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(message);
        lines_.push_back(line);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogMessage> messages_;
    std::vector<std::string> lines_;
};

} // namespace stackerr::core::logging

#endif // LOGGING_LOGSINK_H
