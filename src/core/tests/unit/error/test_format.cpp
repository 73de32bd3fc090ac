#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <core/error/errors.h>
#include <core/error/format.h>

#include <filesystem>
#include <sstream>
#include <string>

#include <fmt/format.h>

using namespace stackerr::core::error;
using ::testing::HasSubstr;
using ::testing::StartsWith;

class FormatTest : public ::testing::Test {
protected:
    TraceConfig config_{std::filesystem::path(__FILE__).parent_path().string()};
};

TEST_F(FormatTest, CompactSpecsPrintMessageOnly) {
    Error err = wrap(make_error("e"), "w");

    EXPECT_EQ(fmt::format("{}", err), "w: e");
    EXPECT_EQ(fmt::format("{:s}", err), "w: e");
    EXPECT_EQ(fmt::format("{:v}", err), "w: e");
}

TEST_F(FormatTest, VerboseSpecsAppendTrace) {
    const auto line = __LINE__ + 1;
    Error err = make_error("example error");

    std::string text = fmt::format("{:+}", err);

    EXPECT_THAT(text, StartsWith("example error\n\tat FormatTest_VerboseSpecsAppendTrace_Test::TestBody("));
    EXPECT_THAT(text, HasSubstr("test_format.cpp:" + std::to_string(line) + ")"));
    EXPECT_EQ(fmt::format("{:+v}", err), text);
}

TEST_F(FormatTest, VerboseMatchesToString) {
    Error err = wrap(make_error("e"), "w");

    EXPECT_EQ(fmt::format("{:+v}", err), to_string(err, RenderMode::Verbose));
}

TEST_F(FormatTest, ExplicitConfigShortensPaths) {
    const auto line = __LINE__ + 1;
    Error err = make_error("example error");

    EXPECT_EQ(to_string(err, RenderMode::Verbose, config_),
              "example error\n\tat FormatTest_ExplicitConfigShortensPaths_Test::TestBody(test_format.cpp:" +
                  std::to_string(line) + ")");
    EXPECT_EQ(to_string(err, RenderMode::Compact, config_), "example error");
}

TEST_F(FormatTest, VerboseWithoutStackIsMessage) {
    Error plain = Error::make<MessageError>("plain");

    EXPECT_EQ(fmt::format("{:+}", plain), "plain");
}

TEST_F(FormatTest, QuotedEscapesMessage) {
    Error err = make_error("bad \"value\"\n");

    EXPECT_EQ(fmt::format("{:q}", err), "\"bad \\\"value\\\"\\n\"");
    EXPECT_EQ(to_string(err, RenderMode::Quoted), fmt::format("{:q}", err));
}

TEST_F(FormatTest, AbsentErrorPrintsNil) {
    Error none;

    EXPECT_EQ(fmt::format("{}", none), "<nil>");
    EXPECT_EQ(fmt::format("{:+v}", none), "<nil>");
    EXPECT_EQ(fmt::format("{:q}", none), "<nil>");
}

TEST_F(FormatTest, StreamOperatorIsCompact) {
    Error err = wrap(make_error("e"), "w");

    std::ostringstream oss;
    oss << err;
    EXPECT_EQ(oss.str(), "w: e");

    std::ostringstream none;
    none << Error();
    EXPECT_EQ(none.str(), "<nil>");
}

TEST_F(FormatTest, FrameSpecs) {
    Frame frame = Frame::here();

    EXPECT_EQ(fmt::format("{}", frame), frame.to_string());
    EXPECT_EQ(fmt::format("{:+v}", frame), "\n\tat " + frame.to_string());

    std::ostringstream oss;
    oss << frame;
    EXPECT_EQ(oss.str(), frame.to_string());
}

TEST_F(FormatTest, ErrorInsideLargerFormat) {
    Error err = make_error("e");

    EXPECT_EQ(fmt::format("[{}] [{:q}]", err, err), "[e] [\"e\"]");
}

TEST_F(FormatTest, UnknownSpecIsRejected) {
    Error err = make_error("e");

    EXPECT_THROW(static_cast<void>(fmt::format(fmt::runtime("{:x}"), err)), fmt::format_error);
    EXPECT_THROW(static_cast<void>(fmt::format(fmt::runtime("{:+q}"), err)), fmt::format_error);
}
