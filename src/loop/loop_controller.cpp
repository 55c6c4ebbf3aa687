#include "loop/loop_controller.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <set>
#include <utility>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"
#include "loop/completion.hpp"
#include "loop/exit_classifier.hpp"
#include "loop/iteration_committer.hpp"
#include "loop/prompt_builder.hpp"
#include "work/target_selector.hpp"

namespace ralph::loop {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using protocol::AuditEventType;
using protocol::HarnessRunConfig;
using protocol::HarnessRunResult;
using protocol::LoopOutcome;
using protocol::LoopStatus;

namespace {

constexpr std::size_t kMaxFailureOutputBytes = 4000;

bool is_cancelled(const std::shared_ptr<std::atomic_bool>& token) {
    return token && token->load();
}

std::string tail(const std::string& text, const std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t start = text.size() - max_bytes;
    while (start < text.size() && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
        ++start;
    }
    return "... (truncated) ...\n" + text.substr(start);
}

}  // namespace

std::string render_harness_failure(const std::string& harness_name,
                                   const HarnessRunResult& result) {
    std::string out = "### Harness execution\n\n";
    out += "- Result: FAIL\n";
    out += "- Harness: " + harness_name + "\n";
    out += "- Exit code: " + std::to_string(result.exit_code) + "\n";
    if (result.timed_out) {
        out += "- Note: killed after the inactivity timeout\n";
    }
    if (!result.stdout_text.empty()) {
        out += "\nStdout:\n\n```text\n" + tail(result.stdout_text, kMaxFailureOutputBytes) +
               "\n```\n";
    }
    if (!result.stderr_text.empty()) {
        out += "\nStderr:\n\n```text\n" + tail(result.stderr_text, kMaxFailureOutputBytes) +
               "\n```\n";
    }
    return out;
}

LoopController::LoopController(LoopDependencies deps, core::config::ProjectConfig config)
    : deps_(deps), config_(std::move(config)) {}

void LoopController::audit(const AuditEventType type, const std::string& change_id,
                           std::map<std::string, std::string> fields) {
    protocol::AuditEvent event;
    event.type = type;
    event.change_id = change_id;
    event.fields = std::move(fields);
    deps_.audit.append_event(event);
}

core::errors::Result<LoopOutcome> LoopController::finish(LoopOutcome outcome) {
    audit(AuditEventType::LoopFinished, "",
          {{"status", protocol::to_string(outcome.status)},
           {"message", outcome.message},
           {"iterations", std::to_string(outcome.iterations_run)}});
    if (outcome.status == LoopStatus::Completed) {
        LOG_INFO(outcome.message);
    } else if (outcome.status == LoopStatus::MaxIterationsReached) {
        LOG_WARN(outcome.message);
    } else {
        LOG_ERROR(outcome.message);
    }
    return outcome;
}

core::errors::Result<LoopOutcome> LoopController::run(
    const protocol::LoopRequest& request,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    // 1. Validate the request and settle defaults
    auto mode_result = work::resolve_mode(request);
    if (core::errors::is_error(mode_result)) {
        return core::errors::get_error(mode_result);
    }
    const work::ContinuationMode mode = core::errors::get_value(mode_result);

    if (request.max_iterations.has_value() && request.max_iterations.value() == 0) {
        return LoopError{ErrorCategory::Input, "max_iterations must be at least 1",
                         "bounds_error"};
    }
    const std::uint32_t threshold = request.error_threshold.value_or(
        config_.error_threshold.value_or(protocol::kDefaultErrorThreshold));
    if (threshold == 0) {
        return LoopError{ErrorCategory::Input, "error_threshold must be at least 1",
                         "bounds_error"};
    }
    const std::chrono::seconds inactivity_timeout = request.inactivity_timeout.value_or(
        config_.inactivity_timeout.value_or(protocol::kDefaultInactivityTimeout));
    const std::string harness_name = protocol::to_string(deps_.harness.name());
    const bool commits_enabled =
        !request.no_commit && deps_.harness.name() != protocol::HarnessName::Stub;

    const ExitPolicy policy{request.exit_on_error, threshold};
    work::TargetSelector selector(deps_.work_status, mode, request.change_id,
                                  request.module_id);
    const work::WorktreeResolver resolver(deps_.worktrees, config_.worktrees_enabled,
                                          request.working_directory);
    const ValidationGate gate(
        deps_.tasks, deps_.runner, config_.validation_commands, request.validation_command,
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.validation_timeout),
        cancel_token);
    const IterationCommitter committer(deps_.runner, cancel_token);

    LOG_INFO("Starting loop: mode=" + work::to_string(mode) + " harness=" + harness_name +
             " error_threshold=" + std::to_string(threshold));
    audit(AuditEventType::LoopStarted, request.change_id.value_or(""),
          {{"mode", work::to_string(mode)}, {"harness", harness_name}});

    LoopOutcome outcome;
    std::set<std::string> accepted;
    std::optional<std::string> target;
    bool have_target = false;
    LoopState state;
    std::uint32_t iterations_on_target = 0;
    bool retry_pending = false;

    auto persist = [this](const LoopState& to_save) -> std::optional<LoopError> {
        auto saved = deps_.state_store.save(to_save);
        if (core::errors::is_error(saved)) {
            return core::errors::get_error(saved);
        }
        return std::nullopt;
    };

    while (true) {
        if (is_cancelled(cancel_token)) {
            outcome.status = LoopStatus::Cancelled;
            outcome.message = "Loop cancelled; state saved.";
            return finish(std::move(outcome));
        }

        // 2. Select the target; a crash retry keeps the current one
        if (!retry_pending) {
            auto selection_result = selector.select_next(accepted);
            if (core::errors::is_error(selection_result)) {
                return core::errors::get_error(selection_result);
            }
            const auto& selection = core::errors::get_value(selection_result);

            if (selection.kind == work::SelectionKind::AllComplete) {
                outcome.status = LoopStatus::Completed;
                outcome.message = outcome.completed_changes.empty()
                                      ? "No eligible changes; all changes are complete."
                                      : "All changes are complete.";
                return finish(std::move(outcome));
            }
            if (selection.kind == work::SelectionKind::Blocked) {
                outcome.status = LoopStatus::Blocked;
                outcome.blocking = selection.blocking;
                outcome.message = "No eligible changes remain, but work is unfinished: " +
                                  work::describe_blocking(selection.blocking);
                return finish(std::move(outcome));
            }

            if (!have_target || selection.change_id != target) {
                if (have_target) {
                    LOG_INFO("Switching target from " + target.value_or(kUnscopedStateId) +
                             " to " + selection.change_id.value_or(kUnscopedStateId));
                }
                target = selection.change_id;
                have_target = true;
                auto loaded = deps_.state_store.load(target.value_or(kUnscopedStateId));
                if (core::errors::is_error(loaded)) {
                    return core::errors::get_error(loaded);
                }
                state = core::errors::get_value(loaded);
                // Crash and failure budgets belong to this run; only the
                // iteration count and history carry over from earlier runs.
                state.consecutive_retriable_retries = 0;
                state.error_count = 0;
                iterations_on_target = 0;
                LOG_INFO("Target: " + target.value_or(kUnscopedStateId) + " (iteration " +
                         std::to_string(state.iteration_count) + " so far)");
                audit(AuditEventType::TargetSelected, target.value_or(""),
                      {{"iteration_count", std::to_string(state.iteration_count)}});
            }
        }

        if (request.max_iterations.has_value() &&
            iterations_on_target >= request.max_iterations.value()) {
            outcome.status = LoopStatus::MaxIterationsReached;
            outcome.message = "Reached max iterations (" +
                              std::to_string(request.max_iterations.value()) + ") for " +
                              target.value_or(kUnscopedStateId) +
                              " without an accepted completion.";
            return finish(std::move(outcome));
        }

        // 3. Working directory, recomputed every iteration
        const work::EffectiveWorkingDirectory cwd = resolver.resolve(target);

        // 4. Prompt
        const std::uint32_t iteration = state.iteration_count + 1;
        PromptInputs inputs;
        inputs.iteration = iteration;
        inputs.max_iterations = request.max_iterations;
        inputs.min_iterations = request.min_iterations;
        inputs.completion_promise = request.completion_promise;
        inputs.change_id = target;
        inputs.user_prompt = request.prompt;
        inputs.pending_context = state.pending_context;
        inputs.user_context = deps_.state_store.load_user_context(
            target.value_or(kUnscopedStateId));
        if (target.has_value()) {
            inputs.module_id = request.module_id.value_or(work::module_of(target.value()));
            inputs.change_proposal = deps_.documents.change_proposal(target.value());
            inputs.module_overview = deps_.documents.module_overview(inputs.module_id.value());
        }
        const std::string prompt = build_prompt(inputs);

        LOG_INFO("=== Iteration " + std::to_string(iteration) + " (" +
                 target.value_or(kUnscopedStateId) + ", " + harness_name + ", cwd " +
                 cwd.path.string() + ") ===");
        LOG_DEBUG("Prompt:\n" + prompt);

        // 5. Harness
        HarnessRunConfig run_config;
        run_config.prompt = prompt;
        run_config.model = request.model;
        run_config.working_directory = cwd.path;
        run_config.inactivity_timeout =
            std::chrono::duration_cast<std::chrono::milliseconds>(inactivity_timeout);
        run_config.allow_all = request.allow_all;
        run_config.cancel_token = cancel_token;

        auto run_result = deps_.harness.run(run_config);
        if (core::errors::is_error(run_result)) {
            const auto& err = core::errors::get_error(run_result);
            if (auto save_err = persist(state)) {
                LOG_ERROR("Failed to save state: " + save_err->message);
            }
            return err;
        }
        const HarnessRunResult& result = core::errors::get_value(run_result);
        if (!deps_.harness.streams_output()) {
            std::cout << result.stdout_text;
            std::cerr << result.stderr_text;
            std::cout.flush();
        }

        if (result.cancelled || is_cancelled(cancel_token)) {
            if (auto save_err = persist(state)) {
                return save_err.value();
            }
            outcome.status = LoopStatus::Cancelled;
            outcome.message = "Loop cancelled during iteration " + std::to_string(iteration) +
                              "; state saved.";
            return finish(std::move(outcome));
        }

        // 6. Classify the exit
        const ExitAction action = apply_exit_policy(state, result, policy);
        LOG_DEBUG("Harness exit " + std::to_string(result.exit_code) + " -> " +
                  to_string(action));

        if (action == ExitAction::Retry) {
            LOG_WARN("Harness " + harness_name + " crashed with exit code " +
                     std::to_string(result.exit_code) + "; retrying (" +
                     std::to_string(state.consecutive_retriable_retries) + "/" +
                     std::to_string(kMaxRetriableRetries) + ")");
            audit(AuditEventType::HarnessCrashed, target.value_or(""),
                  {{"exit_code", std::to_string(result.exit_code)},
                   {"retry", std::to_string(state.consecutive_retriable_retries)},
                   {"timed_out", result.timed_out ? "true" : "false"}});
            if (auto save_err = persist(state)) {
                return save_err.value();
            }
            retry_pending = true;
            continue;
        }
        retry_pending = false;

        if (action == ExitAction::AbortCrashLoop) {
            audit(AuditEventType::HarnessCrashed, target.value_or(""),
                  {{"exit_code", std::to_string(result.exit_code)},
                   {"retry", std::to_string(state.consecutive_retriable_retries)}});
            if (auto save_err = persist(state)) {
                return save_err.value();
            }
            outcome.status = LoopStatus::Aborted;
            outcome.message = "Harness " + harness_name + " crashed repeatedly (" +
                              std::to_string(state.consecutive_retriable_retries) +
                              " consecutive times, last exit code " +
                              std::to_string(result.exit_code) + "); aborting.";
            return finish(std::move(outcome));
        }

        // A completed iteration: the pending context went into this prompt.
        state.iteration_count = iteration;
        ++iterations_on_target;
        ++outcome.iterations_run;
        state.pending_context.clear();
        if (result.exit_code != 0) {
            LOG_WARN("Harness " + harness_name + " exited with code " +
                     std::to_string(result.exit_code) + " (errors " +
                     std::to_string(state.error_count) + "/" + std::to_string(threshold) +
                     ")");
            state.pending_context.push_back(render_harness_failure(harness_name, result));
        }

        if (action == ExitAction::AbortOnError || action == ExitAction::AbortErrorThreshold) {
            if (auto save_err = persist(state)) {
                return save_err.value();
            }
            outcome.status = LoopStatus::Aborted;
            outcome.message =
                action == ExitAction::AbortOnError
                    ? "Harness " + harness_name + " exited with code " +
                          std::to_string(result.exit_code) + " and exit-on-error is set."
                    : "Error threshold reached (" + std::to_string(state.error_count) + "/" +
                          std::to_string(threshold) + "); aborting.";
            return finish(std::move(outcome));
        }

        // 7. Commit this iteration's changes
        IterationRecord record;
        record.iteration = iteration;
        record.timestamp_ms = core::config::now_unix_ms();
        record.duration_ms = result.duration_ms;
        record.exit_code = result.exit_code;
        if (commits_enabled) {
            auto changes = committer.count_changes(cwd.path);
            if (!core::errors::is_error(changes)) {
                record.file_changes = core::errors::get_value(changes);
            }
            auto committed = committer.commit(cwd.path, iteration);
            if (core::errors::is_error(committed) && !is_cancelled(cancel_token)) {
                if (auto save_err = persist(state)) {
                    LOG_ERROR("Failed to save state: " + save_err->message);
                }
                return core::errors::get_error(committed);
            }
        }
        if (is_cancelled(cancel_token)) {
            state.history.push_back(record);
            if (auto save_err = persist(state)) {
                return save_err.value();
            }
            outcome.status = LoopStatus::Cancelled;
            outcome.message = "Loop cancelled after iteration " + std::to_string(iteration) +
                              "; state saved.";
            return finish(std::move(outcome));
        }

        // 8. Completion promise and validation gate
        const CompletionPromise promise =
            detect_completion_promise(result.stdout_text, request.completion_promise);
        record.completion_promise_found = promise.detected;
        state.history.push_back(record);

        bool completion_accepted = false;
        if (promise.detected) {
            if (iteration < request.min_iterations) {
                LOG_INFO("Completion promise ignored before min iterations (" +
                         std::to_string(iteration) + "/" +
                         std::to_string(request.min_iterations) + ")");
            } else if (request.skip_validation) {
                LOG_WARN("Validation skipped; trusting the completion promise.");
                completion_accepted = true;
            } else {
                const GateReport report = gate.evaluate(target, cwd.path);
                if (is_cancelled(cancel_token)) {
                    LOG_WARN("Validation interrupted by cancellation.");
                } else if (report.passed) {
                    completion_accepted = true;
                } else {
                    state.pending_context.push_back(report.failure_context());
                    audit(AuditEventType::CompletionRejected, target.value_or(""),
                          {{"iteration", std::to_string(iteration)}});
                    LOG_WARN("Completion promise rejected; continuing.");
                }
            }
        }

        if (auto save_err = persist(state)) {
            return save_err.value();
        }
        audit(AuditEventType::IterationCompleted, target.value_or(""),
              {{"iteration", std::to_string(iteration)},
               {"exit_code", std::to_string(result.exit_code)},
               {"completion_promise_found", promise.detected ? "true" : "false"}});

        if (is_cancelled(cancel_token)) {
            outcome.status = LoopStatus::Cancelled;
            outcome.message = "Loop cancelled after iteration " + std::to_string(iteration) +
                              "; completion not evaluated, state saved.";
            return finish(std::move(outcome));
        }
        if (!completion_accepted) {
            continue;
        }

        audit(AuditEventType::CompletionAccepted, target.value_or(""),
              {{"iteration", std::to_string(iteration)}});
        LOG_INFO("Completion accepted for " + target.value_or(kUnscopedStateId) +
                 " after iteration " + std::to_string(iteration));
        if (target.has_value()) {
            outcome.completed_changes.push_back(target.value());
        }
        if (!work::is_continuation(mode)) {
            outcome.status = LoopStatus::Completed;
            outcome.message = "Completion promise accepted for " +
                              target.value_or(kUnscopedStateId) + ".";
            return finish(std::move(outcome));
        }
        if (target.has_value()) {
            accepted.insert(target.value());
        }
    }
}

}  // namespace ralph::loop
