#include "session/loop_session.hpp"

#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"

namespace ralph::session {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using protocol::LoopStatus;

LoopSession::LoopSession()
    : run_id_(core::config::generate_run_id()),
      cancel_token_(std::make_shared<std::atomic_bool>(false)) {}

bool LoopSession::is_terminal(const SessionState state) {
    return state != SessionState::Created && state != SessionState::Running;
}

std::string LoopSession::to_string(const SessionState state) {
    switch (state) {
        case SessionState::Created:
            return "created";
        case SessionState::Running:
            return "running";
        case SessionState::Completed:
            return "completed";
        case SessionState::Blocked:
            return "blocked";
        case SessionState::Aborted:
            return "aborted";
        case SessionState::Cancelled:
            return "cancelled";
        case SessionState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

core::errors::Result<SessionState> LoopSession::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Created) {
        return LoopError{ErrorCategory::Internal,
                         "Session already started: " + to_string(state_),
                         "invalid_state_transition"};
    }
    state_ = SessionState::Running;
    LOG_INFO("LoopSession: " + run_id_ + " transition created -> running");
    return state_;
}

core::errors::Result<SessionState> LoopSession::finish(const LoopStatus status,
                                                       const std::string& message) {
    switch (status) {
        case LoopStatus::Completed:
        case LoopStatus::MaxIterationsReached:
            return transition_to_terminal(SessionState::Completed, std::nullopt);
        case LoopStatus::Blocked:
            return transition_to_terminal(SessionState::Blocked, message);
        case LoopStatus::Aborted:
            return transition_to_terminal(SessionState::Aborted, message);
        case LoopStatus::Cancelled:
            return transition_to_terminal(SessionState::Cancelled, message);
    }
    return transition_to_terminal(SessionState::Failed, message);
}

core::errors::Result<SessionState> LoopSession::fail(const std::string& reason) {
    return transition_to_terminal(SessionState::Failed, reason);
}

void LoopSession::request_cancel() { cancel_token_->store(true); }

core::errors::Result<SessionState> LoopSession::transition_to_terminal(
    const SessionState next_state, const std::optional<std::string>& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(state_)) {
        return LoopError{ErrorCategory::Internal,
                         "Session is already terminal: " + to_string(state_),
                         "invalid_state_transition"};
    }

    const std::string prev = to_string(state_);
    state_ = next_state;
    failure_reason_ = reason;
    LOG_INFO("LoopSession: " + run_id_ + " transition " + prev + " -> " +
             to_string(next_state));
    return state_;
}

SessionState LoopSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<std::string> LoopSession::failure_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_reason_;
}

}  // namespace ralph::session
