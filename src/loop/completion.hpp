#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "process/process_runner.hpp"
#include "work/work_repository.hpp"

namespace ralph::loop {

struct CompletionPromise {
    bool detected = false;
    std::string token;
};

// Looks for <promise>TOKEN</promise>; whitespace around TOKEN inside the tags
// is ignored and any of several marker pairs may match.
CompletionPromise detect_completion_promise(const std::string& output,
                                            const std::string& token);

constexpr std::size_t kMaxValidationOutputBytes = 12000;

// Cuts at a UTF-8 character boundary and appends a truncation notice.
std::string truncate_output(const std::string& text,
                            std::size_t max_bytes = kMaxValidationOutputBytes);

struct ValidationStep {
    std::string title;
    bool passed = false;
    std::string summary;
    std::string output;
};

struct GateReport {
    bool passed = true;
    std::vector<ValidationStep> steps;

    // Markdown for the failing steps, suitable for the next prompt.
    std::string failure_context() const;
};

std::string render_validation_step(const ValidationStep& step);

// Checks run in order and stop at the first failure: tasks, project
// validation commands, then the extra command.
class ValidationGate {
public:
    ValidationGate(const work::TaskQuery& tasks, const process::ProcessRunner& runner,
                   std::vector<std::string> project_commands,
                   std::optional<std::string> extra_command,
                   std::chrono::milliseconds command_timeout,
                   std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

    GateReport evaluate(const std::optional<std::string>& change_id,
                        const std::filesystem::path& working_directory) const;

    ValidationStep check_tasks(const std::string& change_id) const;
    ValidationStep run_command(const std::string& title, const std::string& command,
                               const std::filesystem::path& working_directory) const;

private:
    const work::TaskQuery& tasks_;
    const process::ProcessRunner& runner_;
    std::vector<std::string> project_commands_;
    std::optional<std::string> extra_command_;
    std::chrono::milliseconds command_timeout_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
};

}  // namespace ralph::loop
