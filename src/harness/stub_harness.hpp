#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "harness/harness.hpp"

namespace ralph::harness {

struct StubStep {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

// Replays scripted steps instead of spawning a process. Once the script is
// exhausted the last step repeats.
class StubHarness final : public Harness {
public:
    static constexpr const char* kScriptEnvVar = "RALPH_STUB_SCRIPT";

    explicit StubHarness(std::vector<StubStep> steps);

    // Script path from the argument, else RALPH_STUB_SCRIPT, else one step
    // that prints <promise>COMPLETE</promise>.
    static core::errors::Result<StubHarness> from_script(
        const std::optional<std::filesystem::path>& script_path);
    static core::errors::Result<std::vector<StubStep>> parse_steps(
        const std::string& script_json);

    protocol::HarnessName name() const override { return protocol::HarnessName::Stub; }
    core::errors::Result<protocol::HarnessRunResult> run(
        const protocol::HarnessRunConfig& config) override;
    void stop() override {}
    bool streams_output() const override { return false; }

    std::size_t invocations() const { return invocations_; }
    const std::vector<std::string>& prompts() const { return prompts_; }

private:
    std::vector<StubStep> steps_;
    std::size_t invocations_ = 0;
    std::vector<std::string> prompts_;
};

}  // namespace ralph::harness
