#include "loop/completion.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace ralph::loop {

namespace {

const std::string kOpenTag = "<promise>";
const std::string kCloseTag = "</promise>";

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string join_output(const process::ProcessCapture& capture) {
    std::string out = capture.stdout_text;
    if (!capture.stderr_text.empty()) {
        if (!out.empty() && out.back() != '\n') {
            out += "\n";
        }
        out += capture.stderr_text;
    }
    return out;
}

}  // namespace

CompletionPromise detect_completion_promise(const std::string& output,
                                            const std::string& token) {
    const std::string wanted = trim(token);
    std::size_t pos = 0;
    while (true) {
        const auto open = output.find(kOpenTag, pos);
        if (open == std::string::npos) {
            break;
        }
        const auto inner_start = open + kOpenTag.size();
        const auto close = output.find(kCloseTag, inner_start);
        if (close == std::string::npos) {
            break;
        }
        if (trim(output.substr(inner_start, close - inner_start)) == wanted) {
            return CompletionPromise{true, wanted};
        }
        pos = close + kCloseTag.size();
    }
    return CompletionPromise{false, wanted};
}

std::string truncate_output(const std::string& text, const std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t cut = max_bytes;
    // Step back over UTF-8 continuation bytes (10xxxxxx).
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "\n... (truncated) ...";
}

std::string render_validation_step(const ValidationStep& step) {
    std::string out = "### " + step.title + "\n\n";
    out += "- Result: " + std::string(step.passed ? "PASS" : "FAIL") + "\n";
    out += "- Summary: " + step.summary + "\n";
    if (!step.output.empty()) {
        out += "\nOutput:\n\n```text\n" + truncate_output(step.output) + "\n```\n";
    }
    return out;
}

std::string GateReport::failure_context() const {
    std::string out = "Your completion promise was rejected because validation failed.\n\n";
    for (const auto& step : steps) {
        if (!step.passed) {
            out += render_validation_step(step) + "\n";
        }
    }
    return out;
}

ValidationGate::ValidationGate(const work::TaskQuery& tasks,
                               const process::ProcessRunner& runner,
                               std::vector<std::string> project_commands,
                               std::optional<std::string> extra_command,
                               const std::chrono::milliseconds command_timeout,
                               std::shared_ptr<std::atomic_bool> cancel_token)
    : tasks_(tasks),
      runner_(runner),
      project_commands_(std::move(project_commands)),
      extra_command_(std::move(extra_command)),
      command_timeout_(command_timeout),
      cancel_token_(std::move(cancel_token)) {}

GateReport ValidationGate::evaluate(const std::optional<std::string>& change_id,
                                    const std::filesystem::path& working_directory) const {
    GateReport report;
    auto record = [&report](ValidationStep step) {
        LOG_INFO("Validation: " + step.title + " -> " + (step.passed ? "PASS" : "FAIL") +
                 " (" + step.summary + ")");
        report.passed = report.passed && step.passed;
        report.steps.push_back(std::move(step));
        return report.passed;
    };

    // 1. Task completion; unscoped runs have no task list.
    if (change_id.has_value()) {
        if (!record(check_tasks(change_id.value()))) {
            return report;
        }
    }

    // 2. Project validation
    if (project_commands_.empty()) {
        LOG_WARN("No project validation configured; add validationCommands to ralph.json.");
    }
    for (const auto& command : project_commands_) {
        if (!record(run_command("Project validation", command, working_directory))) {
            return report;
        }
    }

    // 3. Extra validation command
    if (extra_command_.has_value()) {
        record(run_command("Extra validation", extra_command_.value(), working_directory));
    }
    return report;
}

ValidationStep ValidationGate::check_tasks(const std::string& change_id) const {
    ValidationStep step;
    step.title = "Task status";

    auto progress_result = tasks_.task_progress(change_id);
    if (core::errors::is_error(progress_result)) {
        step.passed = false;
        step.summary = "Unable to read tasks: " +
                       core::errors::get_error(progress_result).message;
        return step;
    }
    const auto& progress = core::errors::get_value(progress_result);
    if (progress.tasks.empty()) {
        step.passed = true;
        step.summary = "No tasks found for " + change_id;
        return step;
    }

    const auto incomplete = progress.incomplete();
    if (incomplete.empty()) {
        step.passed = true;
        step.summary = "All " + std::to_string(progress.tasks.size()) +
                       " task(s) complete or shelved";
        return step;
    }

    step.passed = false;
    step.summary = std::to_string(incomplete.size()) + " task(s) still incomplete";
    for (const auto& task : incomplete) {
        step.output += "- " + task.id + (task.name.empty() ? "" : " " + task.name) + " (" +
                       protocol::to_string(task.status) + ")\n";
    }
    return step;
}

ValidationStep ValidationGate::run_command(const std::string& title,
                                           const std::string& command,
                                           const std::filesystem::path& working_directory) const {
    ValidationStep step;
    step.title = title;

    LOG_DEBUG("Running validation command in " + working_directory.string() + ": " + command);
    auto capture_result =
        runner_.run(process::shell_request(command, working_directory, command_timeout_,
                                           cancel_token_));
    if (core::errors::is_error(capture_result)) {
        step.passed = false;
        step.summary = "Command `" + command + "` could not start: " +
                       core::errors::get_error(capture_result).message;
        return step;
    }

    const auto& capture = core::errors::get_value(capture_result);
    step.output = join_output(capture);
    if (capture.cancelled) {
        step.passed = false;
        step.summary = "Command `" + command + "` was cancelled";
    } else if (capture.timed_out) {
        step.passed = false;
        step.summary = "Command `" + command + "` timed out after " +
                       std::to_string(command_timeout_.count() / 1000) + "s";
    } else if (capture.exit_code != 0) {
        step.passed = false;
        step.summary = "Command `" + command + "` failed with exit code " +
                       std::to_string(capture.exit_code);
    } else {
        step.passed = true;
        step.summary = "Command `" + command + "` passed";
    }
    return step;
}

}  // namespace ralph::loop
