#include "harness/harness_factory.hpp"

#include <utility>
#include "harness/cli_harness.hpp"
#include "harness/stub_harness.hpp"

namespace ralph::harness {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using protocol::HarnessName;

core::errors::Result<HarnessName> parse_harness_name(const std::string& value) {
    const auto name = protocol::harness_name_from_string(value);
    if (!name.has_value()) {
        return LoopError{ErrorCategory::Input, "Unknown harness: " + value,
                         "unknown_harness",
                         "Valid harnesses: opencode, claude, codex, copilot."};
    }
    return name.value();
}

core::errors::Result<std::unique_ptr<Harness>> make_harness(
    const HarnessName name, std::shared_ptr<const process::ProcessRunner> runner,
    const std::optional<std::filesystem::path>& stub_script) {
    std::unique_ptr<Harness> harness;
    switch (name) {
        case HarnessName::Claude:
            harness = std::make_unique<ClaudeCodeHarness>(std::move(runner));
            break;
        case HarnessName::Codex:
            harness = std::make_unique<CodexHarness>(std::move(runner));
            break;
        case HarnessName::GithubCopilot:
            harness = std::make_unique<GithubCopilotHarness>(std::move(runner));
            break;
        case HarnessName::Opencode:
            harness = std::make_unique<OpencodeHarness>(std::move(runner));
            break;
        case HarnessName::Stub: {
            auto stub = StubHarness::from_script(stub_script);
            if (core::errors::is_error(stub)) {
                return core::errors::get_error(stub);
            }
            harness = std::make_unique<StubHarness>(
                std::get<StubHarness>(std::move(stub)));
            break;
        }
    }
    if (!harness) {
        return LoopError{ErrorCategory::Internal, "Unhandled harness kind.",
                         "unknown_harness"};
    }
    return std::move(harness);
}

}  // namespace ralph::harness
