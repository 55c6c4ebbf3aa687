#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "session/audit_writer.hpp"

namespace {

using ralph::core::errors::get_error;
using ralph::core::errors::get_value;
using ralph::core::errors::is_error;
using ralph::protocol::AuditEvent;
using ralph::protocol::AuditEventType;
using ralph::session::JsonlAuditWriter;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_audit_writer_" + ralph::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<json> read_lines(const std::filesystem::path& path) {
    std::vector<json> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(json::parse(line));
        }
    }
    return lines;
}

TEST(AuditWriterTest, AppendsOneJsonObjectPerEvent) {
    TempWorkspace workspace;
    JsonlAuditWriter writer(workspace.root(), "loop-test");

    AuditEvent started;
    started.type = AuditEventType::LoopStarted;
    started.fields = {{"mode", "continue-ready"}};
    auto first = writer.write_event(started);
    ASSERT_FALSE(is_error(first));

    AuditEvent accepted;
    accepted.type = AuditEventType::CompletionAccepted;
    accepted.change_id = "001-01_alpha";
    accepted.fields = {{"iteration", "3"}};
    writer.append_event(accepted);

    const auto path = get_value(first);
    EXPECT_EQ(path.string(),
              (workspace.root() / ".ralph" / "audit" / "events.jsonl").string());

    const auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["event"].get<std::string>(), "loop_started");
    EXPECT_EQ(lines[0]["run_id"].get<std::string>(), "loop-test");
    EXPECT_EQ(lines[0]["payload"]["mode"].get<std::string>(), "continue-ready");
    EXPECT_EQ(lines[1]["event"].get<std::string>(), "completion_accepted");
    EXPECT_EQ(lines[1]["change_id"].get<std::string>(), "001-01_alpha");
    EXPECT_EQ(lines[1]["payload"]["iteration"].get<std::string>(), "3");
    EXPECT_TRUE(lines[1]["ts_unix_ms"].is_number_integer());
}

TEST(AuditWriterTest, FailsForMissingWorkspaceRoot) {
    const auto missing =
        std::filesystem::current_path() / "__definitely_missing_audit_writer_root__";
    JsonlAuditWriter writer(missing, "loop-test");

    auto written = writer.write_event(AuditEvent{});
    ASSERT_TRUE(is_error(written));
    EXPECT_EQ(get_error(written).code, "invalid_workspace_root");

    // The sink interface swallows the failure into a log line.
    writer.append_event(AuditEvent{});
    EXPECT_FALSE(std::filesystem::exists(missing));
}

}  // namespace
