#include "expensescan/application/command_line.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>

namespace expensescan {

class CommandLineTest : public ::testing::Test {
protected:
    void SetUp() override { original_cerr_ = std::cerr.rdbuf(errors_.rdbuf()); }
    void TearDown() override { std::cerr.rdbuf(original_cerr_); }

    std::ostringstream errors_;
    std::streambuf* original_cerr_ = nullptr;
};

TEST_F(CommandLineTest, ConfidenceAcceptsPercentRange)
{
    EXPECT_EQ(parse_confidence("0"), 0.0);
    EXPECT_EQ(parse_confidence("91.2"), 91.2);
    EXPECT_EQ(parse_confidence("100"), 100.0);
}

TEST_F(CommandLineTest, ConfidenceRejectsNanAndOutOfRange)
{
    EXPECT_FALSE(parse_confidence("nan").has_value());
    EXPECT_FALSE(parse_confidence("NaN").has_value());
    EXPECT_FALSE(parse_confidence("inf").has_value());
    EXPECT_FALSE(parse_confidence("-1").has_value());
    EXPECT_FALSE(parse_confidence("101").has_value());
    EXPECT_FALSE(parse_confidence("12x").has_value());
    EXPECT_FALSE(parse_confidence("").has_value());
}

TEST_F(CommandLineTest, DefaultsReadStdin)
{
    auto config = parse_args({});

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->input_files, std::vector<std::string>{"-"});
    EXPECT_EQ(config->confidence_percentage, 100.0);
    EXPECT_EQ(config->format, ReportFormat::SUMMARY);
    EXPECT_TRUE(config->output_file.empty());
    EXPECT_FALSE(config->quiet);
    EXPECT_FALSE(config->show_help);
}

TEST_F(CommandLineTest, ParsesOptionsAndInputs)
{
    auto config = parse_args({"-c", "87.3", "--format", "fields", "-o", "out.txt", "--quiet", "a.txt", "-"});

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->confidence_percentage, 87.3);
    EXPECT_EQ(config->format, ReportFormat::FIELDS);
    EXPECT_EQ(config->output_file, "out.txt");
    EXPECT_TRUE(config->quiet);
    EXPECT_EQ(config->input_files, (std::vector<std::string>{"a.txt", "-"}));
}

TEST_F(CommandLineTest, RejectsNanConfidence)
{
    EXPECT_FALSE(parse_args({"-c", "nan", "a.txt"}).has_value());
    EXPECT_THAT(errors_.str(), testing::HasSubstr("Error: Confidence must be a number between 0 and 100"));
}

TEST_F(CommandLineTest, RejectsBadConfidenceValues)
{
    EXPECT_FALSE(parse_args({"-c", "-1"}).has_value());
    EXPECT_FALSE(parse_args({"--confidence", "101"}).has_value());
    EXPECT_FALSE(parse_args({"-c", "12x"}).has_value());
}

TEST_F(CommandLineTest, TrailingOptionWithoutValueIsAnError)
{
    EXPECT_FALSE(parse_args({"a.txt", "-c"}).has_value());
    EXPECT_THAT(errors_.str(), testing::HasSubstr("Error: Missing value for -c"));

    EXPECT_FALSE(parse_args({"-o"}).has_value());
    EXPECT_FALSE(parse_args({"--format"}).has_value());
}

TEST_F(CommandLineTest, RejectsUnknownFormatAndOption)
{
    EXPECT_FALSE(parse_args({"-f", "json"}).has_value());
    EXPECT_THAT(errors_.str(), testing::HasSubstr("Unknown format 'json'"));

    EXPECT_FALSE(parse_args({"--verbose"}).has_value());
    EXPECT_THAT(errors_.str(), testing::HasSubstr("Error: Unknown option --verbose"));
}

TEST_F(CommandLineTest, HelpStopsParsing)
{
    auto config = parse_args({"--help", "--bogus"});

    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->show_help);
    EXPECT_THAT(usage_text(), testing::HasSubstr("Usage: expensescan [options] [file...]"));
}

} // namespace expensescan
