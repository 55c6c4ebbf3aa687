#pragma once

#include <filesystem>
#include <string>
#include "core/errors/loop_errors.hpp"
#include "protocol/audit_event.hpp"

namespace ralph::session {

// Best-effort event log. Implementations report failures through the logger
// and never let them reach the loop.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void append_event(const protocol::AuditEvent& event) noexcept = 0;
};

// Appends one JSON object per line to .ralph/audit/events.jsonl.
class JsonlAuditWriter final : public AuditSink {
public:
    JsonlAuditWriter(std::filesystem::path workspace_root, std::string run_id,
                     std::filesystem::path audit_subdir = ".ralph/audit");

    void append_event(const protocol::AuditEvent& event) noexcept override;

    core::errors::Result<std::filesystem::path> write_event(
        const protocol::AuditEvent& event) const;
    core::errors::Result<std::filesystem::path> log_path() const;

private:
    std::filesystem::path workspace_root_;
    std::string run_id_;
    std::filesystem::path audit_subdir_;
};

}  // namespace ralph::session
