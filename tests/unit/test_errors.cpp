#include <string>
#include <gtest/gtest.h>
#include "core/errors/orch_errors.hpp"

using namespace orch::core::errors;

// A dummy lookup that fails for unknown tickets
Result<std::string> simulate_find_ticket(bool should_fail) {
    if (should_fail) {
        return OrchError{ErrorCategory::NotFound, "Ticket not found: FEAT-9",
                         "ticket_not_found"};
    }
    return std::string("FEAT-1");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_find_ticket(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "FEAT-1");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_find_ticket(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::NotFound);
    EXPECT_EQ(error.message, "Ticket not found: FEAT-9");
    EXPECT_EQ(error.code, "ticket_not_found");
}

TEST(ErrorModelTest, StatusOkIsNotAnError) {
    Status status = ok();
    EXPECT_FALSE(is_error(status));
}

TEST(ErrorModelTest, DescribeIncludesHint) {
    OrchError error{ErrorCategory::Precondition, "tmux is not installed",
                    "tmux_missing", "Install tmux 2.1 or newer."};
    const std::string text = describe(error);
    EXPECT_NE(text.find("[tmux_missing] tmux is not installed"), std::string::npos);
    EXPECT_NE(text.find("hint: Install tmux 2.1 or newer."), std::string::npos);
    EXPECT_EQ(to_string(ErrorCategory::Permission), "permission");
}
