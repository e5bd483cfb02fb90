#include <gtest/gtest.h>
#include "chunkstream/core/utils.hpp"
#include "chunkstream/core/cli.hpp"
#include "chunkstream/core/command_registry.hpp"
#include <vector>

using namespace chunkstream::core;
using namespace chunkstream::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(512), "512.00 B");
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(1048576), "1.00 MB");
    EXPECT_EQ(StringUtils::format_bytes(1536ULL * 1024 * 1024), "1.50 GB");
}

TEST_F(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(250)), "250ms");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(42000)), "42s");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(125000)), "2m 5s");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::hours(3) + std::chrono::minutes(7)), "3h 7m");
}

TEST_F(StringUtilsTest, ParseInt) {
    EXPECT_EQ(StringUtils::parse_int("9440", 1, 65535), 9440);
    EXPECT_FALSE(StringUtils::parse_int("0", 1, 65535).has_value());
    EXPECT_FALSE(StringUtils::parse_int("70000", 1, 65535).has_value());
    EXPECT_FALSE(StringUtils::parse_int("80a", 1, 65535).has_value());
    EXPECT_FALSE(StringUtils::parse_int("", 1, 65535).has_value());
}

class CommandLineParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "chunkstream");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        storage_ = std::move(args);
        return parser_.parse(static_cast<int>(argv.size()), argv.data());
    }

    CommandLineParser parser_{"chunkstream"};
    std::vector<std::string> storage_;
};

TEST_F(CommandLineParserTest, PositionalArgsAndFlags) {
    ASSERT_TRUE(parse({"--verbose", "send", "localhost", "9440", "file.bin"}));

    EXPECT_TRUE(parser_.has_option("verbose"));
    auto& args = parser_.get_positional_args();
    ASSERT_EQ(args.size(), 4u);
    EXPECT_EQ(args[0], "send");
    EXPECT_EQ(args[3], "file.bin");
}

TEST_F(CommandLineParserTest, OptionValues) {
    ASSERT_TRUE(parse({"--config=/etc/chunkstream.conf", "resumable"}));
    EXPECT_EQ(parser_.get_option("config"), "/etc/chunkstream.conf");

    ASSERT_TRUE(parse({"-c", "other.conf", "resumable"}));
    EXPECT_EQ(parser_.get_option("c"), "other.conf");
}

TEST_F(CommandLineParserTest, UnknownOptionFails) {
    EXPECT_FALSE(parse({"--bogus"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: --bogus");
}

TEST_F(CommandLineParserTest, MissingValueFails) {
    EXPECT_FALSE(parse({"--config"}));
    EXPECT_FALSE(parser_.get_error().empty());
}

TEST(CommandRegistryTest, KnownCommands) {
    CommandRegistry registry;

    EXPECT_TRUE(registry.has_command("manifest"));
    EXPECT_TRUE(registry.has_command("send"));
    EXPECT_TRUE(registry.has_command("receive"));
    EXPECT_TRUE(registry.has_command("resumable"));
    EXPECT_FALSE(registry.has_command("share"));

    auto result = registry.execute_command("share", {"share"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
}

TEST(CommandRegistryTest, MissingArgumentsReportUsage) {
    CommandRegistry registry;

    auto result = registry.execute_command("send", {"send", "localhost"});
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("Usage:"), std::string::npos);

    result = registry.execute_command("receive", {"receive", "not-a-port"});
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("Invalid port"), std::string::npos);
}
