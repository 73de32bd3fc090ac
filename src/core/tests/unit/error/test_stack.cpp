#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <core/error/stack.h>
#include <core/error/format.h>

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

using namespace stackerr::core::error;

class StackTest : public ::testing::Test {
protected:
    TraceConfig config_{std::filesystem::path(__FILE__).parent_path().string()};

    static std::string at(const char* function, unsigned line) {
        return "\n\tat " + std::string(function) + "(test_stack.cpp:" + std::to_string(line) + ")";
    }
};

TEST_F(StackTest, EmptyStack) {
    Stack stack;

    EXPECT_TRUE(stack.empty());
    EXPECT_EQ(stack.size(), 0u);
    EXPECT_EQ(stack.format(true, config_), "");
    EXPECT_EQ(stack.format(false, config_), "");
}

TEST_F(StackTest, CallerRecordsOneFrame) {
    const auto line = __LINE__ + 1;
    Stack stack = caller();

    ASSERT_EQ(stack.size(), 1u);
    EXPECT_EQ(stack[0].line(), line);
}

TEST_F(StackTest, IndexOutOfRangeThrows) {
    Stack stack = caller();

    EXPECT_THROW(stack[1], std::out_of_range);
}

TEST_F(StackTest, AppendKeepsNewerFirst) {
    Frame a = Frame::here();
    Frame b = Frame::here();
    Frame c = Frame::here();

    Stack appended = append_stack_trace(Stack{a}, Stack{b, c});

    ASSERT_EQ(appended.size(), 3u);
    EXPECT_EQ(appended[0], a);
    EXPECT_EQ(appended[1], b);
    EXPECT_EQ(appended[2], c);
}

TEST_F(StackTest, AppendWithEmptySides) {
    Stack one{Frame::here()};

    EXPECT_EQ(append_stack_trace(Stack(), one), one);
    EXPECT_EQ(append_stack_trace(one, Stack()), one);
    EXPECT_TRUE(append_stack_trace(Stack(), Stack()).empty());
}

TEST_F(StackTest, AppendDoesNotDeduplicate) {
    Stack one{Frame::here()};

    Stack twice = append_stack_trace(one, one);

    ASSERT_EQ(twice.size(), 2u);
    EXPECT_EQ(twice[0], twice[1]);
}

TEST_F(StackTest, AppendLeavesInputsUntouched) {
    Stack newer{Frame::here()};
    Stack older{Frame::here()};

    Stack appended = append_stack_trace(newer, older);

    EXPECT_EQ(appended.size(), 2u);
    EXPECT_EQ(newer.size(), 1u);
    EXPECT_EQ(older.size(), 1u);
}

TEST_F(StackTest, VerboseFormatListsFramesInOrder) {
    const auto first = __LINE__ + 1;
    Frame a = Frame::here();
    const auto second = __LINE__ + 1;
    Frame b = Frame::here();
    Stack stack{a, b};

    const char* function = "StackTest_VerboseFormatListsFramesInOrder_Test::TestBody";
    EXPECT_EQ(stack.format(true, config_), at(function, first) + at(function, second));
}

TEST_F(StackTest, CompactFormatIsEmpty) {
    Stack stack{Frame::here(), Frame::here()};

    EXPECT_EQ(stack.format(false, config_), "");

    std::ostringstream oss;
    oss << stack;
    EXPECT_EQ(oss.str(), "");
    EXPECT_EQ(fmt::format("{}", stack), "");
}

TEST_F(StackTest, FmtVerboseSpec) {
    Stack stack{Frame::here()};

    EXPECT_EQ(fmt::format("{:+v}", stack), stack.format(true));
    EXPECT_EQ(fmt::format("{:+}", stack), stack.format(true));
}

#if STACKERR_ENABLE_STACK_CAPTURE
namespace fixture {

STACKERR_NOINLINE std::string first_captured_name() {
    return "[" + Stack::capture()[0].function() + "]";
}

} // namespace fixture

TEST_F(StackTest, CaptureLiveStack) {
    Stack stack = Stack::capture();

    EXPECT_FALSE(stack.empty());
    EXPECT_LE(stack.size(), stackerr::config::DEFAULT_MAX_CAPTURED_FRAMES);
    for (const auto& frame : stack) {
        EXPECT_NE(frame.address(), nullptr);
    }
}

TEST_F(StackTest, CaptureRespectsMaxFrames) {
    EXPECT_LE(Stack::capture(0, 2).size(), 2u);
    EXPECT_LE(Stack::capture(0, 5).size(), 5u);
}

TEST_F(StackTest, CaptureSkipDropsFrames) {
    Stack full = Stack::capture(0, 1000);
    Stack skipped = Stack::capture(1, 1000);

    ASSERT_GT(full.size(), 1u);
    EXPECT_EQ(skipped.size() + 1, full.size());
}

TEST_F(StackTest, CaptureStartsAtCaller) {
    EXPECT_EQ(fixture::first_captured_name(), "[fixture::first_captured_name]");
}

TEST_F(StackTest, CaptureOmitsItsOwnFrames) {
    Stack stack = Stack::capture();

    for (const auto& frame : stack) {
        EXPECT_THAT(frame.function(), ::testing::Not(::testing::HasSubstr("Stack::capture")));
        EXPECT_THAT(frame.function(), ::testing::Not(::testing::HasSubstr("backtrace")));
    }
}
#endif
