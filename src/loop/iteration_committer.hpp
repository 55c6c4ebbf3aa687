#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/loop_errors.hpp"
#include "process/process_runner.hpp"

namespace ralph::loop {

class IterationCommitter {
public:
    explicit IterationCommitter(const process::ProcessRunner& runner,
                                std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

    // Entries in `git status --porcelain`; an error outside a git work tree.
    core::errors::Result<std::size_t> count_changes(
        const std::filesystem::path& working_directory) const;

    // Stages everything and commits as "Ralph loop iteration N". Returns false
    // when there was nothing to commit or the directory is not a git work tree.
    core::errors::Result<bool> commit(const std::filesystem::path& working_directory,
                                      std::uint32_t iteration) const;

private:
    core::errors::Result<process::ProcessCapture> git(
        const std::filesystem::path& working_directory,
        std::vector<std::string> args) const;

    const process::ProcessRunner& runner_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
};

}  // namespace ralph::loop
