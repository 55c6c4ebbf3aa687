#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "harness/cli_harness.hpp"
#include "harness/harness_factory.hpp"
#include "harness/stub_harness.hpp"

namespace {

using ralph::core::errors::get_error;
using ralph::core::errors::get_value;
using ralph::core::errors::is_error;
using ralph::core::errors::Result;
using ralph::harness::StubHarness;
using ralph::harness::StubStep;
using ralph::process::ProcessCapture;
using ralph::process::ProcessRequest;
using ralph::protocol::HarnessName;
using ralph::protocol::HarnessRunConfig;

// Records the request instead of spawning anything.
class RecordingRunner final : public ralph::process::ProcessRunner {
public:
    mutable std::vector<ProcessRequest> requests;
    ProcessCapture reply;

    Result<ProcessCapture> run(const ProcessRequest& request) const override {
        requests.push_back(request);
        return reply;
    }
};

HarnessRunConfig config_with(std::optional<std::string> model, bool allow_all) {
    HarnessRunConfig config;
    config.prompt = "do the thing";
    config.model = std::move(model);
    config.allow_all = allow_all;
    return config;
}

TEST(HarnessArgsTest, ClaudeArguments) {
    ralph::harness::ClaudeCodeHarness harness(std::make_shared<RecordingRunner>());
    EXPECT_EQ(harness.binary(), "claude");
    EXPECT_EQ(harness.build_args(config_with(std::string("opus"), true)),
              (std::vector<std::string>{"--model", "opus", "--dangerously-skip-permissions",
                                        "-p", "do the thing"}));
    EXPECT_EQ(harness.build_args(config_with(std::nullopt, false)),
              (std::vector<std::string>{"-p", "do the thing"}));
}

TEST(HarnessArgsTest, CodexArguments) {
    ralph::harness::CodexHarness harness(std::make_shared<RecordingRunner>());
    EXPECT_EQ(harness.build_args(config_with(std::string("o3"), true)),
              (std::vector<std::string>{"exec", "--model", "o3", "--yolo", "do the thing"}));
}

TEST(HarnessArgsTest, CopilotArguments) {
    ralph::harness::GithubCopilotHarness harness(std::make_shared<RecordingRunner>());
    EXPECT_EQ(harness.binary(), "copilot");
    EXPECT_EQ(harness.build_args(config_with(std::nullopt, true)),
              (std::vector<std::string>{"--yolo", "-p", "do the thing"}));
}

TEST(HarnessArgsTest, OpencodeArguments) {
    ralph::harness::OpencodeHarness harness(std::make_shared<RecordingRunner>());
    EXPECT_EQ(harness.build_args(config_with(std::string("gpt"), true)),
              (std::vector<std::string>{"run", "-m", "gpt", "do the thing"}));
}

TEST(CliHarnessTest, RunForwardsConfigToProcessRunner) {
    auto runner = std::make_shared<RecordingRunner>();
    runner->reply.exit_code = 0;
    runner->reply.stdout_text = "<promise>COMPLETE</promise>";
    ralph::harness::ClaudeCodeHarness harness(runner);

    HarnessRunConfig config = config_with(std::nullopt, false);
    config.working_directory = "/tmp";
    config.inactivity_timeout = std::chrono::milliseconds(1500);
    auto result = harness.run(config);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).success());
    EXPECT_EQ(get_value(result).stdout_text, "<promise>COMPLETE</promise>");

    ASSERT_EQ(runner->requests.size(), 1u);
    const auto& request = runner->requests.front();
    EXPECT_EQ(request.program, "claude");
    EXPECT_EQ(request.working_directory.string(), "/tmp");
    EXPECT_EQ(request.inactivity_timeout.count(), 1500);
    EXPECT_TRUE(request.stream_output);
    ASSERT_TRUE(request.cancel_token);
}

TEST(CliHarnessTest, MissingBinaryIsSpawnFailure) {
    class MissingBinaryHarness final : public ralph::harness::CliHarness {
    public:
        using CliHarness::CliHarness;
        HarnessName name() const override { return HarnessName::Opencode; }
        std::string binary() const override { return "ralph-no-such-agent-binary"; }
        std::vector<std::string> build_args(const HarnessRunConfig&) const override {
            return {};
        }
    };

    MissingBinaryHarness harness(std::make_shared<ralph::process::SystemProcessRunner>());
    auto result = harness.run(config_with(std::nullopt, false));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "spawn_failed");
}

TEST(CliHarnessTest, StopKillsRunningChild) {
    class SleepingHarness final : public ralph::harness::CliHarness {
    public:
        using CliHarness::CliHarness;
        HarnessName name() const override { return HarnessName::Claude; }
        bool streams_output() const override { return false; }
        std::string binary() const override { return "sh"; }
        std::vector<std::string> build_args(const HarnessRunConfig&) const override {
            return {"-c", "sleep 5"};
        }
    };

    SleepingHarness harness(std::make_shared<ralph::process::SystemProcessRunner>());
    HarnessRunConfig config = config_with(std::nullopt, false);
    config.working_directory = std::filesystem::current_path();

    // stop() is a no-op until run() has registered its token, so keep asking.
    std::atomic_bool finished{false};
    std::thread stopper([&harness, &finished] {
        while (!finished.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            harness.stop();
        }
    });

    const auto started = std::chrono::steady_clock::now();
    auto result = harness.run(config);
    finished.store(true);
    stopper.join();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_NE(get_value(result).exit_code, 0);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(HarnessFactoryTest, ParsesNamesAndAlias) {
    auto copilot = ralph::harness::parse_harness_name("github-copilot");
    ASSERT_FALSE(is_error(copilot));
    EXPECT_EQ(get_value(copilot), HarnessName::GithubCopilot);

    auto unknown = ralph::harness::parse_harness_name("cursor");
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_harness");
}

TEST(HarnessFactoryTest, BuildsEachHarness) {
    auto runner = std::make_shared<RecordingRunner>();
    for (const auto name : {HarnessName::Opencode, HarnessName::Claude, HarnessName::Codex,
                            HarnessName::GithubCopilot, HarnessName::Stub}) {
        auto harness = ralph::harness::make_harness(name, runner);
        ASSERT_FALSE(is_error(harness));
        EXPECT_EQ(get_value(harness)->name(), name);
    }
}

TEST(StubHarnessTest, DefaultStepPrintsCompletionPromise) {
    StubHarness stub(std::vector<StubStep>{StubStep{"<promise>COMPLETE</promise>\n", "", 0}});
    auto result = stub.run(HarnessRunConfig{});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "<promise>COMPLETE</promise>\n");
    EXPECT_FALSE(stub.streams_output());
}

TEST(StubHarnessTest, RepeatsLastStepAfterScriptEnds) {
    StubHarness stub(std::vector<StubStep>{StubStep{"first", "", 139}, StubStep{"second", "", 0}});
    EXPECT_EQ(get_value(stub.run(HarnessRunConfig{})).exit_code, 139);
    EXPECT_EQ(get_value(stub.run(HarnessRunConfig{})).stdout_text, "second");
    EXPECT_EQ(get_value(stub.run(HarnessRunConfig{})).stdout_text, "second");
    EXPECT_EQ(stub.invocations(), 3u);
}

TEST(StubHarnessTest, LoadsScriptFile) {
    const auto path = std::filesystem::current_path() /
                      (".tmp_stub_" + ralph::core::config::generate_run_id() + ".json");
    {
        std::ofstream out(path);
        out << R"([{"stdout": "working", "exitCode": 1}, {"stdout": "done", "stderr": "w"}])";
    }

    auto loaded = StubHarness::from_script(path);
    std::filesystem::remove(path);
    ASSERT_FALSE(is_error(loaded));
    auto stub = std::get<StubHarness>(std::move(loaded));
    auto first = stub.run(HarnessRunConfig{});
    EXPECT_EQ(get_value(first).exit_code, 1);
    auto second = stub.run(HarnessRunConfig{});
    EXPECT_EQ(get_value(second).stdout_text, "done");
    EXPECT_EQ(get_value(second).stderr_text, "w");
    EXPECT_EQ(get_value(second).exit_code, 0);
}

TEST(StubHarnessTest, RejectsMalformedScript) {
    auto not_json = StubHarness::parse_steps("not json");
    ASSERT_TRUE(is_error(not_json));
    EXPECT_EQ(get_error(not_json).code, "invalid_stub_script");

    auto empty = StubHarness::parse_steps("[]");
    ASSERT_TRUE(is_error(empty));
}

}  // namespace
