#include <gtest/gtest.h>
#include "chunkrelay/core/cli.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace chunkrelay::core;

class CommandLineParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "chunkrelay");
        storage_ = std::move(args);
        argv_.clear();
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
        return parser_.parse(static_cast<int>(argv_.size()), argv_.data());
    }

    CommandLineParser parser_{"chunkrelay"};
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

TEST_F(CommandLineParserTest, CommandAndArguments) {
    ASSERT_TRUE(parse({"get", "https://files.example.test/a.bin", "file:///tmp/a.bin"}));

    const auto& args = parser_.get_positional_args();
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0], "get");
    EXPECT_EQ(args[2], "file:///tmp/a.bin");
}

TEST_F(CommandLineParserTest, OptionsAnywhere) {
    ASSERT_TRUE(parse({"-q", "get", "--chunk-size", "512K", "src", "--timeout=30", "dest"}));

    EXPECT_TRUE(parser_.has_option("quiet"));
    EXPECT_EQ(parser_.get_number_option("chunk-size"), 512u * 1024);
    EXPECT_EQ(parser_.get_number_option("timeout"), 30u);
    EXPECT_EQ(parser_.get_positional_args(), (std::vector<std::string>{"get", "src", "dest"}));
}

TEST_F(CommandLineParserTest, Defaults) {
    ASSERT_TRUE(parse({"history"}));

    EXPECT_FALSE(parser_.has_option("rows"));
    EXPECT_EQ(parser_.get_number_option("rows"), 20u);
    EXPECT_EQ(parser_.get_option("config"), "~/.chunkrelay.conf");
    EXPECT_FALSE(parser_.get_number_option("chunk-size").has_value());
}

TEST_F(CommandLineParserTest, BundledShortOptions) {
    ASSERT_TRUE(parse({"-qn5", "history"}));
    EXPECT_TRUE(parser_.has_option("quiet"));
    EXPECT_EQ(parser_.get_number_option("rows"), 5u);

    ASSERT_TRUE(parse({"-c", "/etc/chunkrelay.conf", "history"}));
    EXPECT_EQ(parser_.get_option("config"), "/etc/chunkrelay.conf");
}

TEST_F(CommandLineParserTest, DoubleDashEndsOptions) {
    ASSERT_TRUE(parse({"get", "--", "--not-an-option", "-"}));
    EXPECT_EQ(parser_.get_positional_args(),
              (std::vector<std::string>{"get", "--not-an-option", "-"}));
}

TEST_F(CommandLineParserTest, RejectsUnknownOptions) {
    EXPECT_FALSE(parse({"--bogus"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: --bogus");

    EXPECT_FALSE(parse({"-x"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: -x");
}

TEST_F(CommandLineParserTest, RejectsBadValues) {
    EXPECT_FALSE(parse({"--chunk-size", "lots"}));
    EXPECT_NE(parser_.get_error().find("--chunk-size"), std::string::npos);

    EXPECT_FALSE(parse({"--timeout", "-5"}));
    EXPECT_FALSE(parse({"--buffer-chunks"}));
    EXPECT_NE(parser_.get_error().find("requires a value"), std::string::npos);

    EXPECT_FALSE(parse({"--quiet=yes"}));
}

TEST_F(CommandLineParserTest, ParseSize) {
    EXPECT_EQ(CommandLineParser::parse_size("4096"), 4096u);
    EXPECT_EQ(CommandLineParser::parse_size("64k"), 65536u);
    EXPECT_EQ(CommandLineParser::parse_size("8M"), 8u * 1024 * 1024);
    EXPECT_EQ(CommandLineParser::parse_size("2G"), 2ULL << 30);

    EXPECT_FALSE(CommandLineParser::parse_size("").has_value());
    EXPECT_FALSE(CommandLineParser::parse_size("M").has_value());
    EXPECT_FALSE(CommandLineParser::parse_size("1.5M").has_value());
    EXPECT_FALSE(CommandLineParser::parse_size("99999999999999999G").has_value());
}

TEST_F(CommandLineParserTest, HelpListsOptions) {
    std::ostringstream out;
    parser_.print_help(out);

    EXPECT_NE(out.str().find("Usage: chunkrelay"), std::string::npos);
    EXPECT_NE(out.str().find("--chunk-size <n>"), std::string::npos);
    EXPECT_NE(out.str().find("-n, --rows"), std::string::npos);
}
