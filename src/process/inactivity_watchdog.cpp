#include "process/inactivity_watchdog.hpp"

#include <signal.h>
#include <string>
#include "core/logging/logger.hpp"

namespace ralph::process {

InactivityWatchdog::InactivityWatchdog(const pid_t pid,
                                       const std::chrono::milliseconds timeout,
                                       const std::chrono::milliseconds poll_interval)
    : pid_(pid),
      timeout_(timeout),
      poll_interval_(poll_interval),
      last_activity_ms_(now_ms()) {}

InactivityWatchdog::~InactivityWatchdog() {
    mark_finished();
    join();
}

std::int64_t InactivityWatchdog::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

void InactivityWatchdog::start() {
    if (timeout_.count() <= 0 || thread_.joinable()) {
        return;
    }
    last_activity_ms_.store(now_ms());
    thread_ = std::thread([this]() { watch(); });
}

void InactivityWatchdog::touch() { last_activity_ms_.store(now_ms()); }

void InactivityWatchdog::mark_finished() { finished_.store(true); }

void InactivityWatchdog::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void InactivityWatchdog::watch() {
    while (true) {
        std::this_thread::sleep_for(poll_interval_);
        if (finished_.load()) {
            return;
        }

        const std::int64_t idle_ms = now_ms() - last_activity_ms_.load();
        if (idle_ms < timeout_.count()) {
            continue;
        }

        // The child is not reaped until after join(), so pid_ cannot have been recycled.
        fired_.store(true);
        LOG_WARN("=== Inactivity timeout (" + std::to_string(timeout_.count() / 1000) +
                 "s) reached, killing process " + std::to_string(pid_) + " ===");
        static_cast<void>(kill(-pid_, SIGKILL));
        static_cast<void>(kill(pid_, SIGKILL));
        return;
    }
}

}  // namespace ralph::process
