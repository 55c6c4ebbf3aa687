#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <sys/types.h>
#include <thread>

namespace ralph::process {

// Kills a child process group once no output has been observed for longer
// than the configured timeout. The owning thread must call mark_finished()
// as soon as the child's exit is observed and join() before reaping it.
class InactivityWatchdog {
public:
    static constexpr std::chrono::milliseconds kDefaultPollInterval{100};

    InactivityWatchdog(pid_t pid, std::chrono::milliseconds timeout,
                       std::chrono::milliseconds poll_interval = kDefaultPollInterval);
    ~InactivityWatchdog();

    InactivityWatchdog(const InactivityWatchdog&) = delete;
    InactivityWatchdog& operator=(const InactivityWatchdog&) = delete;

    void start();
    void touch();
    void mark_finished();
    void join();

    bool fired() const { return fired_.load(); }

private:
    void watch();
    static std::int64_t now_ms();

    pid_t pid_;
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds poll_interval_;
    std::atomic_bool finished_{false};
    std::atomic_bool fired_{false};
    std::atomic<std::int64_t> last_activity_ms_;
    std::thread thread_;
};

}  // namespace ralph::process
