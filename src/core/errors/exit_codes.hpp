#pragma once

namespace ralph::core::errors {

// Process exit codes. Scripts driving the loop rely on these staying stable.
enum class ExitCode : int {
    Success = 0,    // completion accepted, nothing eligible, or iteration cap reached
    Aborted = 1,    // retry cap or error threshold exhausted
    Usage = 2,      // invalid flags or configuration
    Blocked = 3,    // nothing eligible but work remains unfinished
    Cancelled = 4,  // SIGINT/SIGTERM
    Fatal = 5       // spawn failure or unrecoverable I/O
};

constexpr int to_int(const ExitCode code) { return static_cast<int>(code); }

}  // namespace ralph::core::errors
