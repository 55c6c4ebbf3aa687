#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include "core/config/project_config.hpp"
#include "core/errors/loop_errors.hpp"
#include "harness/harness.hpp"
#include "loop/loop_state.hpp"
#include "process/process_runner.hpp"
#include "protocol/loop_outcome.hpp"
#include "protocol/loop_request.hpp"
#include "session/audit_writer.hpp"
#include "work/work_repository.hpp"
#include "work/worktree_resolver.hpp"

namespace ralph::loop {

struct LoopDependencies {
    const work::WorkStatusQuery& work_status;
    const work::TaskQuery& tasks;
    const work::ChangeDocuments& documents;
    const work::WorktreeSource& worktrees;
    harness::Harness& harness;
    const process::ProcessRunner& runner;
    session::AuditSink& audit;
    const StateStore& state_store;
};

// Drives the harness until a completion promise passes validation, the
// targets run out, or a stop condition fires. One harness invocation at a time.
//
// Per cycle: select target -> resolve working directory -> build prompt ->
// run harness -> classify exit -> (retry | abort | commit and check completion).
// Errors are reserved for failures outside the loop's control (spawn failure,
// unreadable state, bad input); every designed stop is a LoopOutcome.
class LoopController {
public:
    LoopController(LoopDependencies deps, core::config::ProjectConfig config);

    core::errors::Result<protocol::LoopOutcome> run(
        const protocol::LoopRequest& request,
        const std::shared_ptr<std::atomic_bool>& cancel_token);

private:
    core::errors::Result<protocol::LoopOutcome> finish(protocol::LoopOutcome outcome);
    void audit(protocol::AuditEventType type, const std::string& change_id,
               std::map<std::string, std::string> fields = {});

    LoopDependencies deps_;
    core::config::ProjectConfig config_;
};

// Markdown report of a failed harness invocation for the next prompt.
std::string render_harness_failure(const std::string& harness_name,
                                   const protocol::HarnessRunResult& result);

}  // namespace ralph::loop
