#include "loop/exit_classifier.hpp"

namespace ralph::loop {

bool is_retriable_exit_code(const int exit_code) {
    return exit_code >= kFirstRetriableExitCode && exit_code <= kLastRetriableExitCode;
}

bool is_retriable(const protocol::HarnessRunResult& result) {
    return !result.cancelled && is_retriable_exit_code(result.exit_code);
}

ExitAction apply_exit_policy(LoopState& state, const protocol::HarnessRunResult& result,
                             const ExitPolicy& policy) {
    if (is_retriable(result)) {
        // exit_on_error does not apply here: a crash says nothing about the work.
        ++state.consecutive_retriable_retries;
        if (state.consecutive_retriable_retries > kMaxRetriableRetries) {
            return ExitAction::AbortCrashLoop;
        }
        return ExitAction::Retry;
    }

    state.consecutive_retriable_retries = 0;
    if (result.exit_code == 0) {
        return ExitAction::Proceed;
    }

    ++state.error_count;
    if (policy.exit_on_error) {
        return ExitAction::AbortOnError;
    }
    if (state.error_count >= policy.error_threshold) {
        return ExitAction::AbortErrorThreshold;
    }
    return ExitAction::ProceedAfterFailure;
}

std::string to_string(const ExitAction action) {
    switch (action) {
        case ExitAction::Proceed:
            return "proceed";
        case ExitAction::ProceedAfterFailure:
            return "proceed_after_failure";
        case ExitAction::Retry:
            return "retry";
        case ExitAction::AbortCrashLoop:
            return "abort_crash_loop";
        case ExitAction::AbortOnError:
            return "abort_on_error";
        case ExitAction::AbortErrorThreshold:
            return "abort_error_threshold";
        default:
            return "unknown";
    }
}

}  // namespace ralph::loop
