#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/project_config.hpp"
#include "core/config/workspace_paths.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/errors/loop_errors.hpp"
#include "core/logging/logger.hpp"
#include "harness/harness_factory.hpp"
#include "loop/loop_controller.hpp"
#include "loop/loop_state.hpp"
#include "process/process_runner.hpp"
#include "session/audit_writer.hpp"
#include "session/loop_session.hpp"
#include "work/work_repository.hpp"
#include "work/worktree_resolver.hpp"

namespace {

using ralph::core::errors::ExitCode;
using ralph::core::errors::to_int;

// The process runner polls this flag and kills the agent's process group.
std::atomic_bool* g_cancel_flag = nullptr;

extern "C" void handle_termination_signal(int) {
    if (g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = handle_termination_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    static_cast<void>(sigaction(SIGINT, &action, nullptr));
    static_cast<void>(sigaction(SIGTERM, &action, nullptr));
}

int report_error(const std::string& what, const ralph::core::errors::LoopError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    switch (err.category) {
        case ralph::core::errors::ErrorCategory::Input:
            return to_int(ExitCode::Usage);
        default:
            return to_int(ExitCode::Fatal);
    }
}

void print_status(const ralph::loop::LoopState& state,
                  const std::optional<std::string>& user_context) {
    std::cout << "Change: " << state.change_id << "\n"
              << "Iterations: " << state.iteration_count << "\n"
              << "Error count: " << state.error_count << "\n"
              << "Consecutive crash retries: " << state.consecutive_retriable_retries << "\n"
              << "Pending context entries: " << state.pending_context.size() << "\n"
              << "User context: " << (user_context.has_value() ? "yes" : "no") << "\n";
    if (state.history.empty()) {
        return;
    }
    std::cout << "History:\n";
    for (const auto& record : state.history) {
        std::cout << "  #" << record.iteration << " exit=" << record.exit_code
                  << " duration_ms=" << static_cast<long long>(record.duration_ms)
                  << " files=" << record.file_changes
                  << (record.completion_promise_found ? " promise" : "") << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Session (run id + cancel token) and logger
    ralph::session::LoopSession session;
    ralph::core::logging::Logger::get().set_run_id(session.run_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = ralph::app::cli::parse_and_validate(argc, argv);
    if (ralph::core::errors::is_error(parsed)) {
        return report_error("Input error", ralph::core::errors::get_error(parsed));
    }
    const auto& cmd = ralph::core::errors::get_value(parsed);
    const auto& req = cmd.request;
    if (req.verbose) {
        ralph::core::logging::Logger::get().set_min_level(
            ralph::core::logging::LogLevel::DEBUG);
    }

    // 3. Workspace and project config
    const ralph::core::config::WorkspacePaths paths(req.working_directory);
    auto config_result = ralph::core::config::load_project_config(paths);
    if (ralph::core::errors::is_error(config_result)) {
        return report_error("Config error", ralph::core::errors::get_error(config_result));
    }
    const auto& config = ralph::core::errors::get_value(config_result);
    const ralph::loop::StateStore state_store(paths);
    const std::string state_id = req.change_id.value_or(ralph::loop::kUnscopedStateId);

    // 4. Commands that do not drive the loop
    switch (cmd.kind) {
        case ralph::app::cli::CommandKind::Status: {
            auto state = state_store.load(state_id);
            if (ralph::core::errors::is_error(state)) {
                return report_error("Status failed", ralph::core::errors::get_error(state));
            }
            print_status(ralph::core::errors::get_value(state),
                         state_store.load_user_context(state_id));
            return to_int(ExitCode::Success);
        }
        case ralph::app::cli::CommandKind::AddContext: {
            auto written = state_store.append_user_context(state_id, cmd.context_text.value_or(""));
            if (ralph::core::errors::is_error(written)) {
                return report_error("Add context failed", ralph::core::errors::get_error(written));
            }
            LOG_INFO("Context added: " + ralph::core::errors::get_value(written).string());
            return to_int(ExitCode::Success);
        }
        case ralph::app::cli::CommandKind::ClearContext: {
            auto cleared = state_store.clear_user_context(state_id);
            if (ralph::core::errors::is_error(cleared)) {
                return report_error("Clear context failed", ralph::core::errors::get_error(cleared));
            }
            LOG_INFO("Context cleared for " + state_id);
            return to_int(ExitCode::Success);
        }
        case ralph::app::cli::CommandKind::Run:
            break;
    }

    // 5. Harness
    const std::string harness_text = req.harness.value_or(config.harness.value_or("opencode"));
    auto harness_name = ralph::harness::parse_harness_name(harness_text);
    if (ralph::core::errors::is_error(harness_name)) {
        return report_error("Input error", ralph::core::errors::get_error(harness_name));
    }
    auto runner = std::make_shared<ralph::process::SystemProcessRunner>();
    auto harness_result = ralph::harness::make_harness(
        ralph::core::errors::get_value(harness_name), runner, req.stub_script);
    if (ralph::core::errors::is_error(harness_result)) {
        return report_error("Harness error", ralph::core::errors::get_error(harness_result));
    }
    auto& harness = *std::get<std::unique_ptr<ralph::harness::Harness>>(harness_result);

    // 6. Collaborators
    ralph::work::FsWorkRepository repository(paths);
    ralph::work::GitWorktreeSource worktrees(runner, req.working_directory);
    ralph::session::JsonlAuditWriter audit(paths.root(), session.run_id());

    // 7. Cancellation: SIGINT/SIGTERM trip the session token
    auto cancel_token = session.cancel_token();
    g_cancel_flag = cancel_token.get();
    install_signal_handlers();

    auto started = session.start();
    if (ralph::core::errors::is_error(started)) {
        return report_error("Failed to start session", ralph::core::errors::get_error(started));
    }

    // 8. Drive the loop
    ralph::loop::LoopController controller(
        ralph::loop::LoopDependencies{repository, repository, repository, worktrees, harness,
                                      *runner, audit, state_store},
        config);
    auto outcome_result = controller.run(req, cancel_token);
    if (ralph::core::errors::is_error(outcome_result)) {
        const auto& err = ralph::core::errors::get_error(outcome_result);
        auto failed = session.fail(err.message);
        if (ralph::core::errors::is_error(failed)) {
            LOG_ERROR("Failed to mark session as failed: " +
                      ralph::core::errors::get_error(failed).message);
        }
        g_cancel_flag = nullptr;
        return report_error("Loop failed", err);
    }

    // 9. Map the outcome to an exit code
    const auto& outcome = ralph::core::errors::get_value(outcome_result);
    auto finished = session.finish(outcome.status, outcome.message);
    if (ralph::core::errors::is_error(finished)) {
        LOG_ERROR("Failed to finish session: " + ralph::core::errors::get_error(finished).message);
    }
    for (const auto& item : outcome.blocking) {
        LOG_ERROR("  blocked: " + item.change_id + " (" +
                  ralph::protocol::to_string(item.status) + ")");
    }
    LOG_INFO("Final state: " + ralph::session::LoopSession::to_string(session.state()) +
             " after " + std::to_string(outcome.iterations_run) + " iteration(s)");
    g_cancel_flag = nullptr;
    return to_int(ralph::protocol::exit_code_for(outcome.status));
}
