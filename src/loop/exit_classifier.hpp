#pragma once

#include <cstdint>
#include <string>
#include "loop/loop_state.hpp"
#include "protocol/harness_contract.hpp"

namespace ralph::loop {

// POSIX shells and our process layer report signal termination as 128 + N.
// The retriable range covers the generic 128 and SIGHUP (1) through SIGTERM (15).
constexpr int kFirstRetriableExitCode = 128;
constexpr int kLastRetriableExitCode = 143;

// Consecutive crashes tolerated before the loop gives up.
constexpr std::uint32_t kMaxRetriableRetries = 3;

bool is_retriable_exit_code(int exit_code);

// A cancelled run is never retriable, whatever signal ended it.
bool is_retriable(const protocol::HarnessRunResult& result);

enum class ExitAction {
    Proceed,              // clean exit
    ProceedAfterFailure,  // counted failure below the threshold
    Retry,                // crash, rerun the same iteration
    AbortCrashLoop,
    AbortOnError,
    AbortErrorThreshold
};

struct ExitPolicy {
    bool exit_on_error = false;
    std::uint32_t error_threshold = 10;
};

// Applies the exit to the counters on `state` and says what happens next.
ExitAction apply_exit_policy(LoopState& state, const protocol::HarnessRunResult& result,
                             const ExitPolicy& policy);

std::string to_string(ExitAction action);

}  // namespace ralph::loop
