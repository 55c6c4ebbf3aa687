#include "session/audit_writer.hpp"

#include <exception>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"

namespace ralph::session {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using nlohmann::json;

JsonlAuditWriter::JsonlAuditWriter(std::filesystem::path workspace_root, std::string run_id,
                                   std::filesystem::path audit_subdir)
    : workspace_root_(std::move(workspace_root)),
      run_id_(std::move(run_id)),
      audit_subdir_(std::move(audit_subdir)) {}

core::errors::Result<std::filesystem::path> JsonlAuditWriter::log_path() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return LoopError{ErrorCategory::Workspace,
                         "Workspace root is not a directory: " + workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    const auto audit_dir = workspace_root_ / audit_subdir_;
    std::filesystem::create_directories(audit_dir, ec);
    if (ec) {
        return LoopError{ErrorCategory::Workspace,
                         "Unable to create audit directory: " + audit_dir.string(),
                         "audit_dir_create_failed"};
    }
    return audit_dir / "events.jsonl";
}

core::errors::Result<std::filesystem::path> JsonlAuditWriter::write_event(
    const protocol::AuditEvent& event) const {
    auto path_result = log_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    json record;
    record["ts_unix_ms"] = core::config::now_unix_ms();
    record["event"] = protocol::to_string(event.type);
    record["run_id"] = run_id_;
    record["change_id"] = event.change_id;
    record["payload"] = event.fields;

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return LoopError{ErrorCategory::Workspace,
                         "Unable to open audit log: " + path.string(), "audit_open_failed"};
    }
    out << record.dump() << "\n";
    if (!out.good()) {
        return LoopError{ErrorCategory::Workspace,
                         "Unable to write audit event: " + path.string(),
                         "audit_write_failed"};
    }
    return path;
}

void JsonlAuditWriter::append_event(const protocol::AuditEvent& event) noexcept {
    try {
        auto written = write_event(event);
        if (core::errors::is_error(written)) {
            LOG_WARN("Audit event " + protocol::to_string(event.type) + " dropped: " +
                     core::errors::get_error(written).message);
        }
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Audit event dropped: ") + e.what());
    }
}

}  // namespace ralph::session
