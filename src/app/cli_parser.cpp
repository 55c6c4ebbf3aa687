#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <optional>
#include <system_error>
#include <vector>
#include "harness/harness_factory.hpp"
#include "work/target_selector.hpp"

namespace ralph::app::cli {

    using namespace ralph::core::errors;
    using ralph::protocol::LoopRequest;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> change;
        std::optional<std::string> module;
        std::optional<std::string> prompt;
        std::optional<std::string> prompt_file;
        std::optional<std::string> harness;
        std::optional<std::string> model;
        std::optional<std::string> completion_promise;
        std::optional<std::string> max_iterations;
        std::optional<std::string> min_iterations;
        std::optional<std::string> error_threshold;
        std::optional<std::string> timeout;
        std::optional<std::string> validation_command;
        std::optional<std::string> stub_script;
        std::optional<std::string> cwd;
        std::optional<std::string> text;
        bool continue_module = false;
        bool continue_ready = false;
        bool exit_on_error = false;
        bool allow_all = false;
        bool no_commit = false;
        bool skip_validation = false;
        bool verbose = false;
    };

    // One week; keeps every timeout representable in milliseconds.
    constexpr std::int64_t kMaxDurationSeconds = 7 * 24 * 3600;

    // Exception-free integer parsing with inclusive bounds
    Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                        std::uint32_t min, std::uint32_t max) {
        std::uint32_t value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            return LoopError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
        }
        if (value < min || value > max) {
            return LoopError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                             "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
        }
        return value;
    }

    Result<std::string> read_prompt_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return LoopError{ErrorCategory::Input, "Failed to read prompt file " + path, "invalid_path"};
        }
        std::ostringstream contents;
        contents << in.rdbuf();
        if (in.bad()) {
            return LoopError{ErrorCategory::Input, "Failed to read prompt file " + path, "invalid_path"};
        }
        return contents.str();
    }

    } // namespace

    std::string usage() {
        return "Usage: ralph_cli <run|status|add-context|clear-context> "
               "[--change ID | --module ID [--continue-module] | --continue-ready] "
               "[--prompt TEXT] [--file PATH] [options]";
    }

    Result<std::chrono::seconds> parse_duration(const std::string& text) {
        if (text.empty()) {
            return LoopError{ErrorCategory::Input, "Duration cannot be empty", "invalid_duration"};
        }
        std::int64_t multiplier = 1;
        std::string digits = text;
        switch (text.back()) {
            case 's': multiplier = 1; digits.pop_back(); break;
            case 'm': multiplier = 60; digits.pop_back(); break;
            case 'h': multiplier = 3600; digits.pop_back(); break;
            default: break;
        }

        std::int64_t value = 0;
        const char* begin = digits.data();
        const char* end = digits.data() + digits.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (digits.empty() || ec != std::errc() || ptr != end) {
            return LoopError{ErrorCategory::Input, "Invalid duration: " + text, "invalid_duration",
                             "Use seconds or a suffixed value such as 90s, 15m or 2h."};
        }
        if (value <= 0) {
            return LoopError{ErrorCategory::Input, "Duration must be positive: " + text, "bounds_error"};
        }
        if (value > kMaxDurationSeconds / multiplier) {
            return LoopError{ErrorCategory::Input, "Duration too long: " + text, "bounds_error",
                             "Must be at most " + std::to_string(kMaxDurationSeconds / 3600) + "h."};
        }
        return std::chrono::seconds(value * multiplier);
    }

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return LoopError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        CliCommand cmd;
        std::string command = argv[1];
        if (command == "run") {
            cmd.kind = CommandKind::Run;
        } else if (command == "status") {
            cmd.kind = CommandKind::Status;
        } else if (command == "add-context") {
            cmd.kind = CommandKind::AddContext;
        } else if (command == "clear-context") {
            cmd.kind = CommandKind::ClearContext;
        } else {
            return LoopError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        struct ValueFlag {
            const char* name;
            std::optional<std::string> RawCliOptions::*field;
        };
        const ValueFlag value_flags[] = {
            {"--change", &RawCliOptions::change},
            {"--module", &RawCliOptions::module},
            {"--prompt", &RawCliOptions::prompt},
            {"--file", &RawCliOptions::prompt_file},
            {"--harness", &RawCliOptions::harness},
            {"--model", &RawCliOptions::model},
            {"--completion-promise", &RawCliOptions::completion_promise},
            {"--max-iterations", &RawCliOptions::max_iterations},
            {"--min-iterations", &RawCliOptions::min_iterations},
            {"--error-threshold", &RawCliOptions::error_threshold},
            {"--timeout", &RawCliOptions::timeout},
            {"--validation-command", &RawCliOptions::validation_command},
            {"--stub-script", &RawCliOptions::stub_script},
            {"--cwd", &RawCliOptions::cwd},
            {"--text", &RawCliOptions::text},
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            bool matched = false;
            for (const auto& flag : value_flags) {
                if (arg != flag.name) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return LoopError{ErrorCategory::Input, "Missing value for " + arg, "missing_value"};
                }
                raw.*(flag.field) = args[++i];
                matched = true;
                break;
            }
            if (matched) {
                continue;
            }

            if (arg == "--continue-module") {
                raw.continue_module = true;
            } else if (arg == "--continue-ready") {
                raw.continue_ready = true;
            } else if (arg == "--exit-on-error") {
                raw.exit_on_error = true;
            } else if (arg == "--allow-all" || arg == "--yolo") {
                raw.allow_all = true;
            } else if (arg == "--no-commit") {
                raw.no_commit = true;
            } else if (arg == "--skip-validation") {
                raw.skip_validation = true;
            } else if (arg == "--verbose") {
                raw.verbose = true;
            } else {
                return LoopError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        LoopRequest& req = cmd.request;
        req.change_id = raw.change;
        req.module_id = raw.module;
        req.continue_module = raw.continue_module;
        req.continue_ready = raw.continue_ready;
        req.prompt = raw.prompt;
        req.model = raw.model;
        req.exit_on_error = raw.exit_on_error;
        req.allow_all = raw.allow_all;
        req.no_commit = raw.no_commit;
        req.skip_validation = raw.skip_validation;
        req.validation_command = raw.validation_command;
        req.verbose = raw.verbose;

        if (raw.change && raw.change->empty()) {
            return LoopError{ErrorCategory::Input, "--change cannot be empty", "missing_value"};
        }
        if (raw.module && raw.module->empty()) {
            return LoopError{ErrorCategory::Input, "--module cannot be empty", "missing_value"};
        }

        // Continuation modes are mutually exclusive
        auto mode = ralph::work::resolve_mode(req);
        if (is_error(mode)) {
            return get_error(mode);
        }

        if (cmd.kind == CommandKind::AddContext) {
            if (!raw.text || raw.text->empty()) {
                return LoopError{ErrorCategory::Input, "add-context requires --text", "missing_required_flag"};
            }
            cmd.context_text = raw.text;
        } else if (raw.text) {
            return LoopError{ErrorCategory::Input, "--text is only valid with add-context", "unknown_argument"};
        }

        if (raw.harness) {
            auto name = ralph::harness::parse_harness_name(raw.harness.value());
            if (is_error(name)) {
                return get_error(name);
            }
            req.harness = raw.harness.value();
        }

        if (raw.completion_promise) {
            if (raw.completion_promise->find_first_not_of(" \t") == std::string::npos) {
                return LoopError{ErrorCategory::Input, "--completion-promise cannot be empty", "missing_value"};
            }
            req.completion_promise = raw.completion_promise.value();
        }

        if (raw.max_iterations) {
            auto value = parse_bounded("--max-iterations", raw.max_iterations.value(), 1, 100000);
            if (is_error(value)) {
                return get_error(value);
            }
            req.max_iterations = get_value(value);
        }
        if (raw.min_iterations) {
            auto value = parse_bounded("--min-iterations", raw.min_iterations.value(), 1, 100000);
            if (is_error(value)) {
                return get_error(value);
            }
            req.min_iterations = get_value(value);
        }
        if (req.max_iterations && req.min_iterations > req.max_iterations.value()) {
            return LoopError{ErrorCategory::Input, "--min-iterations cannot exceed --max-iterations", "conflicting_flags"};
        }
        if (raw.error_threshold) {
            auto value = parse_bounded("--error-threshold", raw.error_threshold.value(), 1, 100000);
            if (is_error(value)) {
                return get_error(value);
            }
            req.error_threshold = get_value(value);
        }
        if (raw.timeout) {
            auto value = parse_duration(raw.timeout.value());
            if (is_error(value)) {
                return get_error(value);
            }
            req.inactivity_timeout = get_value(value);
        }
        // File contents come first; an inline prompt is appended after a blank line
        if (raw.prompt_file) {
            std::error_code dir_ec;
            if (std::filesystem::is_directory(raw.prompt_file.value(), dir_ec)) {
                return LoopError{ErrorCategory::Input, "Failed to read prompt file " + raw.prompt_file.value(), "invalid_path"};
            }
            auto contents = read_prompt_file(raw.prompt_file.value());
            if (is_error(contents)) {
                return get_error(contents);
            }
            std::string combined = get_value(contents);
            if (raw.prompt && !raw.prompt->empty()) {
                combined += "\n\n" + raw.prompt.value();
            }
            req.prompt = std::move(combined);
        }
        if (raw.stub_script) {
            req.stub_script = std::filesystem::path(raw.stub_script.value());
        }

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return LoopError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return LoopError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            req.working_directory = std::move(canonical_path);
        }

        return cmd;
    }

} // namespace ralph::app::cli
