#include "harness/stub_harness.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace ralph::harness {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using nlohmann::json;

StubHarness::StubHarness(std::vector<StubStep> steps) : steps_(std::move(steps)) {}

core::errors::Result<std::vector<StubStep>> StubHarness::parse_steps(
    const std::string& script_json) {
    json doc;
    try {
        doc = json::parse(script_json);
    } catch (const json::parse_error& e) {
        return LoopError{ErrorCategory::Input,
                         std::string("Stub script is not valid JSON: ") + e.what(),
                         "invalid_stub_script"};
    }

    // Accept either a bare array or {"steps": [...]}.
    const json& steps_json = doc.is_object() && doc.contains("steps") ? doc["steps"] : doc;
    if (!steps_json.is_array() || steps_json.empty()) {
        return LoopError{ErrorCategory::Input,
                         "Stub script must contain a non-empty array of steps.",
                         "invalid_stub_script"};
    }

    std::vector<StubStep> steps;
    for (const auto& item : steps_json) {
        if (!item.is_object()) {
            return LoopError{ErrorCategory::Input, "Stub step must be a JSON object.",
                             "invalid_stub_script"};
        }
        StubStep step;
        step.stdout_text = item.value("stdout", std::string());
        step.stderr_text = item.value("stderr", std::string());
        step.exit_code = item.value("exitCode", 0);
        steps.push_back(std::move(step));
    }
    return steps;
}

core::errors::Result<StubHarness> StubHarness::from_script(
    const std::optional<std::filesystem::path>& script_path) {
    std::optional<std::filesystem::path> path = script_path;
    if (!path.has_value()) {
        const char* env_path = std::getenv(kScriptEnvVar);
        if (env_path != nullptr && *env_path != '\0') {
            path = std::filesystem::path(env_path);
        }
    }

    if (!path.has_value()) {
        return StubHarness({StubStep{"<promise>COMPLETE</promise>\n", "", 0}});
    }

    std::ifstream in(path.value());
    if (!in.is_open()) {
        return LoopError{ErrorCategory::Input,
                         "Unable to open stub script: " + path->string(),
                         "invalid_stub_script"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto steps = parse_steps(buffer.str());
    if (core::errors::is_error(steps)) {
        return core::errors::get_error(steps);
    }
    return StubHarness(core::errors::get_value(steps));
}

core::errors::Result<protocol::HarnessRunResult> StubHarness::run(
    const protocol::HarnessRunConfig& config) {
    if (steps_.empty()) {
        return LoopError{ErrorCategory::Internal, "Stub harness has no steps.",
                         "invalid_stub_script"};
    }

    const std::size_t index =
        invocations_ < steps_.size() ? invocations_ : steps_.size() - 1;
    ++invocations_;
    prompts_.push_back(config.prompt);

    const StubStep& step = steps_[index];
    protocol::HarnessRunResult result;
    result.exit_code = step.exit_code;
    result.stdout_text = step.stdout_text;
    result.stderr_text = step.stderr_text;
    result.duration_ms = 0.0;
    result.cancelled = config.cancel_token && config.cancel_token->load();
    return result;
}

}  // namespace ralph::harness
