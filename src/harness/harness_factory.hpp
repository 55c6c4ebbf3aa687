#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "harness/harness.hpp"
#include "process/process_runner.hpp"

namespace ralph::harness {

core::errors::Result<protocol::HarnessName> parse_harness_name(const std::string& value);

core::errors::Result<std::unique_ptr<Harness>> make_harness(
    protocol::HarnessName name,
    std::shared_ptr<const process::ProcessRunner> runner,
    const std::optional<std::filesystem::path>& stub_script = std::nullopt);

}  // namespace ralph::harness
