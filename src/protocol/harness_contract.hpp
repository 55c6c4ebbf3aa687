#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace ralph::protocol {

enum class HarnessName {
    Opencode,
    Claude,
    Codex,
    GithubCopilot,
    Stub
};

struct HarnessRunConfig {
    std::string prompt;
    std::optional<std::string> model;
    std::filesystem::path working_directory = ".";
    // Zero disables the inactivity watchdog.
    std::chrono::milliseconds inactivity_timeout{0};
    bool allow_all = false;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct HarnessRunResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
    bool timed_out = false;
    bool cancelled = false;

    bool success() const { return exit_code == 0 && !timed_out && !cancelled; }
};

inline std::string to_string(const HarnessName name) {
    switch (name) {
        case HarnessName::Opencode:
            return "opencode";
        case HarnessName::Claude:
            return "claude";
        case HarnessName::Codex:
            return "codex";
        case HarnessName::GithubCopilot:
            return "copilot";
        case HarnessName::Stub:
            return "stub";
        default:
            return "unknown";
    }
}

inline std::optional<HarnessName> harness_name_from_string(const std::string& value) {
    if (value == "opencode") {
        return HarnessName::Opencode;
    }
    if (value == "claude") {
        return HarnessName::Claude;
    }
    if (value == "codex") {
        return HarnessName::Codex;
    }
    if (value == "copilot" || value == "github-copilot") {
        return HarnessName::GithubCopilot;
    }
    if (value == "stub") {
        return HarnessName::Stub;
    }
    return std::nullopt;
}

}  // namespace ralph::protocol
