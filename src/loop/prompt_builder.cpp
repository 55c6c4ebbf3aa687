#include "loop/prompt_builder.hpp"

#include <sstream>

namespace ralph::loop {

namespace {

void write_section(std::ostringstream& out, const std::string& title,
                   const std::string& body) {
    out << "## " << title << "\n\n" << body;
    if (body.empty() || body.back() != '\n') {
        out << "\n";
    }
    out << "\n";
}

std::string iteration_line(const PromptInputs& inputs) {
    std::string line = "Current iteration: " + std::to_string(inputs.iteration);
    if (inputs.max_iterations.has_value()) {
        line += " / " + std::to_string(inputs.max_iterations.value());
    } else {
        line += " (unlimited)";
    }
    if (inputs.min_iterations > 1) {
        line += " (min: " + std::to_string(inputs.min_iterations) + ")";
    }
    return line;
}

}  // namespace

std::string build_prompt(const PromptInputs& inputs) {
    std::ostringstream out;
    out << "# Agent Loop - Iteration " << inputs.iteration << "\n\n";
    out << "You are running inside an unattended loop. Each iteration starts a fresh "
           "session; the repository and the files you change are the only memory "
           "carried between iterations.\n\n";
    out << iteration_line(inputs) << "\n\n";

    if (inputs.module_overview.has_value() && inputs.module_id.has_value()) {
        write_section(out, "Module " + inputs.module_id.value(),
                      inputs.module_overview.value());
    }
    if (inputs.change_id.has_value()) {
        std::string body = "Change: " + inputs.change_id.value() + "\n";
        if (inputs.change_proposal.has_value()) {
            body += "\n" + inputs.change_proposal.value();
        }
        write_section(out, "Change Proposal", body);
    }
    if (inputs.user_context.has_value()) {
        write_section(out, "Additional Context", inputs.user_context.value());
    }
    if (!inputs.pending_context.empty()) {
        std::string body;
        for (const auto& item : inputs.pending_context) {
            body += item;
            if (!item.empty() && item.back() != '\n') {
                body += "\n";
            }
            body += "\n";
        }
        write_section(out, "Feedback From The Previous Iteration", body);
    }

    std::string task;
    if (inputs.user_prompt.has_value()) {
        task = inputs.user_prompt.value();
    } else if (inputs.change_id.has_value()) {
        task = "Implement change " + inputs.change_id.value() +
               ". Work through its tasks.md in order and mark each task complete as "
               "you finish it.";
    } else {
        task = "Continue the work in this repository.";
    }
    write_section(out, "Your Task", task);

    const std::string marker = "<promise>" + inputs.completion_promise + "</promise>";
    std::string rules;
    rules += "- Make steady, verifiable progress; run the project's checks before you stop.\n";
    rules += "- Commit-ready state matters more than breadth: leave the tree building.\n";
    rules += "- Do not ask questions. Nobody is watching this session; decide and proceed.\n";
    rules += "- Only when the whole task is done and verified, print exactly: " + marker + "\n";
    rules += "- Never print the marker to describe it or to report partial progress. "
             "It is checked against the task list and the validation commands.\n";
    write_section(out, "Rules", rules);

    return out.str();
}

}  // namespace ralph::loop
