#include "gtest/gtest.h"
#include "cli/cli.hpp"
#include <sstream>
#include <iostream>

using namespace aka::cli;

namespace {

// Redirects std::cout into a string for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }

private:
    std::stringstream buffer_;
    std::streambuf* old_;
};

} // namespace

TEST(ExpandShortFlagsFunction, EmptyInput) {
    std::vector<std::string> input;
    auto result = expandShortFlags(input);
    ASSERT_TRUE(result.empty());
}

TEST(ExpandShortFlagsFunction, NoShortFlags) {
    std::vector<std::string> input = {"add", "gs", "git status", "--scope", "/tmp"};
    ASSERT_EQ(expandShortFlags(input), input);
}

TEST(ExpandShortFlagsFunction, SingleShortFlag) {
    auto result = expandShortFlags({"-s"});
    ASSERT_EQ(result.size(), 1u);
    ASSERT_EQ(result[0], "--scope");
}

TEST(ExpandShortFlagsFunction, EveryKnownFlag) {
    auto result = expandShortFlags({"-s", "-r", "-a", "-f", "-n", "-h", "-v"});
    std::vector<std::string> expected = {
        "--scope", "--recursive", "--all", "--force", "--limit", "--help", "--version"};
    ASSERT_EQ(result, expected);
}

TEST(ExpandShortFlagsFunction, ClusteredFlags) {
    auto result = expandShortFlags({"-rs"});
    ASSERT_EQ(result.size(), 2u);
    ASSERT_EQ(result[0], "--recursive");
    ASSERT_EQ(result[1], "--scope");
}

TEST(ExpandShortFlagsFunction, MixedWithPositionals) {
    auto result = expandShortFlags({"remove", "-af", "-s", "/srv"});
    std::vector<std::string> expected = {"remove", "--all", "--force", "--scope", "/srv"};
    ASSERT_EQ(result, expected);
}

TEST(ExpandShortFlagsFunction, UnknownShortFlagIsKept) {
    auto result = expandShortFlags({"-x"});
    ASSERT_EQ(result.size(), 1u);
    ASSERT_EQ(result[0], "-x");
}

TEST(ExpandShortFlagsFunction, NothingAfterSeparatorIsExpanded) {
    auto result = expandShortFlags({"add", "--", "la", "ls -a"});
    std::vector<std::string> expected = {"add", "--", "la", "ls -a"};
    ASSERT_EQ(result, expected);

    result = expandShortFlags({"-s", "--", "-r"});
    expected = {"--scope", "--", "-r"};
    ASSERT_EQ(result, expected);
}

TEST(ExpandShortFlagsFunction, NegativeNumbersAndDashPassThrough) {
    std::vector<std::string> input = {"-1", "-", "--limit"};
    ASSERT_EQ(expandShortFlags(input), input);
}

TEST(HelpOutput, ListsCommands) {
    CoutCapture capture;
    cmd_help();
    std::string out = capture.str();

    ASSERT_NE(out.find("add"), std::string::npos);
    ASSERT_NE(out.find("remove"), std::string::npos);
    ASSERT_NE(out.find("list"), std::string::npos);
    ASSERT_NE(out.find("init"), std::string::npos);
    ASSERT_NE(out.find("install"), std::string::npos);
    ASSERT_NE(out.find("--scope"), std::string::npos);
}

TEST(HelpOutput, WelcomeIncludesTips) {
    CoutCapture capture;
    showWelcome();
    ASSERT_NE(capture.str().find("aka install"), std::string::npos);
}

TEST(CompletionOutput, BashRegistersCompletionFunction) {
    CoutCapture capture;
    generateBashCompletion();
    std::string out = capture.str();
    ASSERT_NE(out.find("complete -F _aka_completion aka"), std::string::npos);
    ASSERT_NE(out.find("aka list --all"), std::string::npos);
}

TEST(CompletionOutput, ZshStartsWithCompdef) {
    CoutCapture capture;
    generateZshCompletion();
    ASSERT_EQ(capture.str().rfind("#compdef aka", 0), 0u);
}
