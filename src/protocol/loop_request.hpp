#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ralph::protocol {

    // Validated user input required to start the loop.
    // Optional fields fall back to project config, then to built-in defaults.
    struct LoopRequest {
        std::optional<std::string> change_id;
        std::optional<std::string> module_id;
        bool continue_module = false;
        bool continue_ready = false;

        std::optional<std::string> prompt;
        std::optional<std::string> harness;
        std::optional<std::string> model;
        std::string completion_promise = "COMPLETE";

        std::optional<std::uint32_t> max_iterations;
        std::uint32_t min_iterations = 1;
        std::optional<std::uint32_t> error_threshold;
        bool exit_on_error = false;
        std::optional<std::chrono::seconds> inactivity_timeout;

        bool allow_all = false;
        bool no_commit = false;
        bool skip_validation = false;
        std::optional<std::string> validation_command;
        std::optional<std::filesystem::path> stub_script;

        std::filesystem::path working_directory = std::filesystem::current_path();
        bool verbose = false;
    };

    constexpr std::uint32_t kDefaultErrorThreshold = 10;
    constexpr std::chrono::seconds kDefaultInactivityTimeout{15 * 60};

} // namespace ralph::protocol
