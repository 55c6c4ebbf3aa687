#include <gtest/gtest.h>
#include "core/errors/exit_codes.hpp"
#include "core/errors/loop_errors.hpp"
#include "protocol/loop_outcome.hpp"

using namespace ralph::core::errors;

// Simulates reading a state file
Result<std::string> simulate_read_state(bool should_fail) {
    if (should_fail) {
        return LoopError{ErrorCategory::Workspace, "State file unreadable", "state_read_failed"};
    }
    return std::string("{\"iteration_count\": 3}");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_state(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "{\"iteration_count\": 3}");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_state(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Workspace);
    EXPECT_EQ(error.message, "State file unreadable");
    EXPECT_EQ(error.code, "state_read_failed");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeWhenOmitted) {
    LoopError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
    EXPECT_EQ(to_string(error.category), "internal");
}

TEST(ExitCodeTest, OutcomesMapToDistinctCodes) {
    using ralph::protocol::LoopStatus;
    using ralph::protocol::exit_code_for;

    EXPECT_EQ(to_int(exit_code_for(LoopStatus::Completed)), 0);
    EXPECT_EQ(to_int(exit_code_for(LoopStatus::MaxIterationsReached)), 0);
    EXPECT_EQ(to_int(exit_code_for(LoopStatus::Aborted)), 1);
    EXPECT_EQ(to_int(exit_code_for(LoopStatus::Blocked)), 3);
    EXPECT_EQ(to_int(exit_code_for(LoopStatus::Cancelled)), 4);
    EXPECT_EQ(to_int(ExitCode::Usage), 2);
    EXPECT_EQ(to_int(ExitCode::Fatal), 5);
}
