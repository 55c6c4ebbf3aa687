#pragma once

#include "core/errors/loop_errors.hpp"
#include "protocol/harness_contract.hpp"

namespace ralph::harness {

// One coding-agent backend. Implementations run one invocation at a time.
class Harness {
public:
    virtual ~Harness() = default;

    virtual protocol::HarnessName name() const = 0;

    // Errors are reserved for spawn failures; a non-zero exit is a result.
    virtual core::errors::Result<protocol::HarnessRunResult> run(
        const protocol::HarnessRunConfig& config) = 0;

    // Stops the in-flight invocation, if any. Safe to call from another thread.
    virtual void stop() = 0;

    // True when output is echoed live while running.
    virtual bool streams_output() const = 0;
};

}  // namespace ralph::harness
