#include <string>
#include <gtest/gtest.h>
#include "session/loop_session.hpp"

namespace {

using ralph::core::errors::get_error;
using ralph::core::errors::get_value;
using ralph::core::errors::is_error;
using ralph::protocol::LoopStatus;
using ralph::session::LoopSession;
using ralph::session::SessionState;

TEST(LoopSessionTest, StartMovesToRunning) {
    LoopSession session;
    EXPECT_EQ(session.state(), SessionState::Created);
    EXPECT_FALSE(session.run_id().empty());

    auto start = session.start();
    ASSERT_FALSE(is_error(start));
    EXPECT_EQ(get_value(start), SessionState::Running);
    EXPECT_EQ(session.state(), SessionState::Running);
}

TEST(LoopSessionTest, StartTwiceFails) {
    LoopSession session;
    ASSERT_FALSE(is_error(session.start()));
    auto again = session.start();
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "invalid_state_transition");
}

TEST(LoopSessionTest, OutcomesMapToTerminalStates) {
    struct Case {
        LoopStatus status;
        SessionState expected;
    };
    const Case cases[] = {
        {LoopStatus::Completed, SessionState::Completed},
        {LoopStatus::MaxIterationsReached, SessionState::Completed},
        {LoopStatus::Blocked, SessionState::Blocked},
        {LoopStatus::Aborted, SessionState::Aborted},
        {LoopStatus::Cancelled, SessionState::Cancelled},
    };
    for (const auto& c : cases) {
        LoopSession session;
        ASSERT_FALSE(is_error(session.start()));
        auto finished = session.finish(c.status, "done");
        ASSERT_FALSE(is_error(finished));
        EXPECT_EQ(get_value(finished), c.expected);
        EXPECT_TRUE(LoopSession::is_terminal(session.state()));
    }
}

TEST(LoopSessionTest, FailRecordsReason) {
    LoopSession session;
    ASSERT_FALSE(is_error(session.start()));
    auto failed = session.fail("spawn failed");
    ASSERT_FALSE(is_error(failed));
    EXPECT_EQ(session.state(), SessionState::Failed);
    EXPECT_EQ(session.failure_reason().value_or(""), "spawn failed");
}

TEST(LoopSessionTest, TerminalStateIsFinal) {
    LoopSession session;
    ASSERT_FALSE(is_error(session.start()));
    ASSERT_FALSE(is_error(session.finish(LoopStatus::Completed, "ok")));

    auto cancel = session.finish(LoopStatus::Cancelled, "late");
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "invalid_state_transition");
    EXPECT_EQ(session.state(), SessionState::Completed);
}

TEST(LoopSessionTest, RequestCancelTripsSharedToken) {
    LoopSession session;
    auto token = session.cancel_token();
    ASSERT_TRUE(token != nullptr);
    EXPECT_FALSE(token->load());

    session.request_cancel();
    EXPECT_TRUE(token->load());
}

}  // namespace
