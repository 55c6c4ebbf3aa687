#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/loop_errors.hpp"
#include "protocol/loop_outcome.hpp"

namespace ralph::session {

enum class SessionState {
    Created,
    Running,
    Completed,
    Blocked,
    Aborted,
    Cancelled,
    Failed
};

// Lifecycle of one CLI invocation. Owns the cancel token that the signal
// handler trips and the process runner polls.
class LoopSession {
public:
    LoopSession();

    core::errors::Result<SessionState> start();
    core::errors::Result<SessionState> finish(protocol::LoopStatus status,
                                              const std::string& message);
    core::errors::Result<SessionState> fail(const std::string& reason);
    void request_cancel();

    SessionState state() const;
    const std::string& run_id() const { return run_id_; }
    std::shared_ptr<std::atomic_bool> cancel_token() const { return cancel_token_; }
    std::optional<std::string> failure_reason() const;

    static bool is_terminal(SessionState state);
    static std::string to_string(SessionState state);

private:
    core::errors::Result<SessionState> transition_to_terminal(
        SessionState next_state, const std::optional<std::string>& reason);

    std::string run_id_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Created;
    std::optional<std::string> failure_reason_;
};

}  // namespace ralph::session
