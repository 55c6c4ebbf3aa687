#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "harness/harness.hpp"
#include "process/process_runner.hpp"

namespace ralph::harness {

// Shared process lifecycle for the agent CLIs: spawn in the effective working
// directory, stream and capture output, inactivity watchdog, cancellation.
// Subclasses supply the binary and its argument list.
class CliHarness : public Harness {
public:
    explicit CliHarness(std::shared_ptr<const process::ProcessRunner> runner);

    core::errors::Result<protocol::HarnessRunResult> run(
        const protocol::HarnessRunConfig& config) final;
    void stop() final;
    bool streams_output() const override { return true; }

    virtual std::string binary() const = 0;
    virtual std::vector<std::string> build_args(
        const protocol::HarnessRunConfig& config) const = 0;

private:
    std::shared_ptr<const process::ProcessRunner> runner_;
    std::mutex mutex_;
    std::shared_ptr<std::atomic_bool> active_cancel_;
};

class ClaudeCodeHarness final : public CliHarness {
public:
    using CliHarness::CliHarness;
    protocol::HarnessName name() const override { return protocol::HarnessName::Claude; }
    std::string binary() const override { return "claude"; }
    std::vector<std::string> build_args(
        const protocol::HarnessRunConfig& config) const override;
};

class CodexHarness final : public CliHarness {
public:
    using CliHarness::CliHarness;
    protocol::HarnessName name() const override { return protocol::HarnessName::Codex; }
    std::string binary() const override { return "codex"; }
    std::vector<std::string> build_args(
        const protocol::HarnessRunConfig& config) const override;
};

class GithubCopilotHarness final : public CliHarness {
public:
    using CliHarness::CliHarness;
    protocol::HarnessName name() const override {
        return protocol::HarnessName::GithubCopilot;
    }
    std::string binary() const override { return "copilot"; }
    std::vector<std::string> build_args(
        const protocol::HarnessRunConfig& config) const override;
};

class OpencodeHarness final : public CliHarness {
public:
    using CliHarness::CliHarness;
    protocol::HarnessName name() const override { return protocol::HarnessName::Opencode; }
    std::string binary() const override { return "opencode"; }
    std::vector<std::string> build_args(
        const protocol::HarnessRunConfig& config) const override;
};

}  // namespace ralph::harness
