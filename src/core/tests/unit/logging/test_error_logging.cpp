#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <core/error/errors.h>

#include "logging/error_logging.h"

using namespace stackerr::core;
using logging::LogLevel;
using ::testing::HasSubstr;
using ::testing::StartsWith;

class ErrorLoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<logging::MemorySink>();
        logger_ = std::make_shared<logging::Logger>("errors");
        logger_->add_sink(sink_);
    }

    error::TraceConfig config_{std::filesystem::path(__FILE__).parent_path().string()};
    std::shared_ptr<logging::MemorySink> sink_;
    std::shared_ptr<logging::Logger> logger_;
};

TEST_F(ErrorLoggingTest, LogsVerboseRendering) {
    error::Error err = error::wrap(error::make_error("disk full"), "save");

    logging::log_error(*logger_, err, LogLevel::ERROR, config_);

    auto messages = sink_->messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].text, error::to_string(err, error::RenderMode::Verbose, config_));
    EXPECT_EQ(messages[0].level, LogLevel::ERROR);
    EXPECT_EQ(messages[0].logger, "errors");
}

TEST_F(ErrorLoggingTest, MessageCarriesTrace) {
    const auto line = __LINE__ + 1;
    error::Error err = error::make_error("disk full");

    logging::log_error(*logger_, err, LogLevel::WARN, config_);

    auto text = sink_->messages().at(0).text;
    EXPECT_THAT(text, StartsWith("disk full\n\tat "));
    EXPECT_THAT(text, HasSubstr("(test_error_logging.cpp:" + std::to_string(line) + ")"));
}

TEST_F(ErrorLoggingTest, LocationIsLoggingStatement) {
    error::Error err = error::make_error("disk full");

    const auto line = __LINE__ + 1;
    logging::log_error(*logger_, err);

    auto messages = sink_->messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].where.line(), static_cast<std::uint_least32_t>(line));
    EXPECT_STREQ(messages[0].where.file_name(), __FILE__);
}

TEST_F(ErrorLoggingTest, RespectsLoggerLevel) {
    logger_->set_level(LogLevel::ERROR);

    logging::log_error(*logger_, error::make_error("minor"), LogLevel::WARN);

    EXPECT_EQ(sink_->size(), 0u);
}

TEST_F(ErrorLoggingTest, AbsentErrorLogsNil) {
    logging::log_error(*logger_, error::Error());

    ASSERT_EQ(sink_->size(), 1u);
    EXPECT_EQ(sink_->messages()[0].text, "<nil>");
}

TEST_F(ErrorLoggingTest, FormattedLineKeepsTraceBelowPrefix) {
    logging::BasicLogFormatter::Options options;
    options.timestamp = false;
    sink_->set_formatter(std::make_unique<logging::BasicLogFormatter>(options));

    logging::log_error(*logger_, error::make_error("disk full"), LogLevel::ERROR, config_);

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_THAT(lines[0], StartsWith("[ERROR] [errors] disk full\n\tat "));
}

TEST_F(ErrorLoggingTest, TraceMacro) {
    error::Error err = error::make_error("disk full");

    const auto line = __LINE__ + 1;
    STACKERR_LOG_ERROR_TRACE(logger_, err);

    auto messages = sink_->messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].where.line(), static_cast<std::uint_least32_t>(line));
    EXPECT_THAT(messages[0].text, StartsWith("disk full\n\tat "));
}
