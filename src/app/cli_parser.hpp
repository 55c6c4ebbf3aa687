#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "core/errors/loop_errors.hpp"
#include "protocol/loop_request.hpp"

namespace ralph::app::cli {

    enum class CommandKind {
        Run,           // drive the loop
        Status,        // print the saved loop state of a change
        AddContext,    // append persistent user context
        ClearContext   // remove persistent user context
    };

    struct CliCommand {
        CommandKind kind = CommandKind::Run;
        ralph::protocol::LoopRequest request;
        std::optional<std::string> context_text;
    };

    ralph::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);

    // "900", "90s", "15m", "2h"
    ralph::core::errors::Result<std::chrono::seconds> parse_duration(const std::string& text);

    std::string usage();
}
