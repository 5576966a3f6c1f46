#include <string>
#include <gtest/gtest.h>
#include "prompt/prompt_composer.hpp"
#include "supervisor/status_parser.hpp"

namespace {

using orch::core::errors::ErrorCategory;
using orch::core::errors::get_error;
using orch::core::errors::get_value;
using orch::core::errors::is_error;
using orch::supervisor::find_last_status_block;
using orch::supervisor::parse_bool_value;
using orch::supervisor::parse_status_block;

TEST(StatusParserTest, ParsesFullBlock) {
    const std::string output =
        "Running tests...\n"
        "---OPERATOR_STATUS---\n"
        "status: complete\n"
        "exit_signal: true\n"
        "confidence: 95\n"
        "files_modified: 3\n"
        "tests_status: passing\n"
        "error_count: 0\n"
        "tasks_completed: 4\n"
        "tasks_remaining: 0\n"
        "summary: Implemented the parser\n"
        "recommendation: Ready for review\n"
        "blockers: none yet, , waiting on CI\n"
        "mood: great\n"
        "---END_OPERATOR_STATUS---\n"
        "$ ";
    auto parsed = find_last_status_block(output);
    ASSERT_FALSE(is_error(parsed));
    const auto& block = get_value(parsed);
    EXPECT_EQ(block.status, "complete");
    EXPECT_TRUE(block.exit_signal);
    EXPECT_EQ(block.confidence.value_or(-1), 95);
    EXPECT_EQ(block.files_modified.value_or(-1), 3);
    EXPECT_EQ(block.tests_status.value_or(""), "passing");
    EXPECT_EQ(block.error_count.value_or(-1), 0);
    EXPECT_EQ(block.tasks_completed.value_or(-1), 4);
    EXPECT_EQ(block.summary.value_or(""), "Implemented the parser");
    EXPECT_EQ(block.recommendation.value_or(""), "Ready for review");
    ASSERT_EQ(block.blockers.size(), 2u);
    EXPECT_EQ(block.blockers[1], "waiting on CI");
}

TEST(StatusParserTest, CollapsedSingleLineBlock) {
    auto parsed = find_last_status_block(
        "---OPERATOR_STATUS--- status: complete exit_signal: true ---END_OPERATOR_STATUS---");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).status, "complete");
    EXPECT_TRUE(get_value(parsed).exit_signal);
}

TEST(StatusParserTest, MissingStatusIsMalformed) {
    auto parsed =
        find_last_status_block("---OPERATOR_STATUS--- exit_signal: true ---END_OPERATOR_STATUS---");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).category, ErrorCategory::Malformed);
    EXPECT_EQ(get_error(parsed).code, "status_block_malformed");
}

TEST(StatusParserTest, MissingExitSignalIsMalformed) {
    auto parsed = parse_status_block("status: in_progress\n");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "status_block_malformed");
}

TEST(StatusParserTest, NoMarkersIsMissing) {
    auto parsed = find_last_status_block("agent exited without reporting\n");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "status_block_missing");
}

TEST(StatusParserTest, LastWellFormedBlockWins) {
    // The echoed instructions carry a placeholder status and must be skipped.
    const std::string output = orch::prompt::status_instructions() +
                               "\n...work...\n"
                               "---OPERATOR_STATUS---\n"
                               "status: in_progress\n"
                               "exit_signal: false\n"
                               "---END_OPERATOR_STATUS---\n"
                               "---OPERATOR_STATUS---\n"
                               "STATUS: Blocked\n"
                               "Exit-Signal: no\n"
                               "---END_OPERATOR_STATUS---\n";
    auto parsed = find_last_status_block(output);
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).status, "blocked");
    EXPECT_FALSE(get_value(parsed).exit_signal);
}

TEST(StatusParserTest, LongFieldsAreTruncatedAtWordBoundary) {
    std::string summary;
    while (summary.size() < 600) {
        summary += "word ";
    }
    auto parsed = parse_status_block("status: complete\nexit_signal: yes\nsummary: " + summary);
    ASSERT_FALSE(is_error(parsed));
    const auto& text = get_value(parsed).summary.value_or("");
    EXPECT_LE(text.size(), 500u);
    EXPECT_EQ(text.substr(text.size() - 3), "...");
    EXPECT_NE(text.substr(text.size() - 4, 1), " ");
}

TEST(StatusParserTest, BooleanSpellings) {
    for (const auto* truthy : {"true", "YES", "1", "on", "y"}) {
        EXPECT_TRUE(parse_bool_value(truthy)) << truthy;
    }
    for (const auto* falsy : {"false", "no", "0", "off", ""}) {
        EXPECT_FALSE(parse_bool_value(falsy)) << falsy;
    }
}

}  // namespace
