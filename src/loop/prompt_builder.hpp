#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ralph::loop {

struct PromptInputs {
    std::uint32_t iteration = 1;
    std::optional<std::uint32_t> max_iterations;
    std::uint32_t min_iterations = 1;
    std::string completion_promise = "COMPLETE";

    std::optional<std::string> change_id;
    std::optional<std::string> module_id;
    std::optional<std::string> user_prompt;
    std::optional<std::string> change_proposal;
    std::optional<std::string> module_overview;
    std::optional<std::string> user_context;
    std::vector<std::string> pending_context;
};

std::string build_prompt(const PromptInputs& inputs);

}  // namespace ralph::loop
