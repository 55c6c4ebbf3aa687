#include "core/config/project_config.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace ralph::core::config {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using nlohmann::json;

namespace {

// Accepted locations for the validation command list, in priority order.
const char* const kValidationPointers[] = {
    "/ralph/validationCommands",   "/ralph/validationCommand",
    "/ralph/validation/commands",  "/ralph/validation/command",
    "/validationCommands",         "/validationCommand",
    "/project/validationCommands", "/project/validationCommand",
};

const json* find_pointer(const json& doc, const std::string& pointer) {
    const json::json_pointer ptr(pointer);
    if (!doc.contains(ptr)) {
        return nullptr;
    }
    return &doc.at(ptr);
}

// Looks under "ralph" first, then at the top level.
const json* find_setting(const json& doc, const std::string& key) {
    if (const json* scoped = find_pointer(doc, "/ralph/" + key)) {
        return scoped;
    }
    return find_pointer(doc, "/" + key);
}

constexpr std::int64_t kMaxErrorThreshold = 100000;
constexpr std::int64_t kMaxTimeoutSeconds = 7 * 24 * 3600;

// Integer setting within [min, max]; nullopt for anything else.
std::optional<std::int64_t> bounded_setting(const json& value, std::int64_t min,
                                            std::int64_t max) {
    if (value.is_number_unsigned()) {
        const auto unsigned_value = value.get<std::uint64_t>();
        if (unsigned_value > static_cast<std::uint64_t>(max)) {
            return std::nullopt;
        }
    }
    if (!value.is_number_integer()) {
        return std::nullopt;
    }
    const auto parsed = value.get<std::int64_t>();
    if (parsed < min || parsed > max) {
        return std::nullopt;
    }
    return parsed;
}

LoopError out_of_range(const std::string& key, std::int64_t min, std::int64_t max) {
    return LoopError{ErrorCategory::Input,
                     key + " must be an integer between " + std::to_string(min) + " and " +
                         std::to_string(max) + ".",
                     "invalid_config"};
}

std::vector<std::string> commands_from_value(const json& value) {
    std::vector<std::string> commands;
    if (value.is_string()) {
        commands.push_back(value.get<std::string>());
    } else if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_string()) {
                commands.push_back(item.get<std::string>());
            }
        }
    }
    std::vector<std::string> non_empty;
    for (auto& command : commands) {
        if (command.find_first_not_of(" \t") != std::string::npos) {
            non_empty.push_back(command);
        }
    }
    return non_empty;
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

}  // namespace

core::errors::Result<ProjectConfig> parse_project_config(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return LoopError{ErrorCategory::Input,
                         std::string("Project config is not valid JSON: ") + e.what(),
                         "invalid_config"};
    }
    if (!doc.is_object()) {
        return LoopError{ErrorCategory::Input, "Project config must be a JSON object.",
                         "invalid_config"};
    }

    ProjectConfig config;
    for (const char* pointer : kValidationPointers) {
        if (const json* value = find_pointer(doc, pointer)) {
            config.validation_commands = commands_from_value(*value);
            if (!config.validation_commands.empty()) {
                break;
            }
        }
    }

    try {
        if (const json* enabled = find_setting(doc, "worktrees/enabled")) {
            config.worktrees_enabled = enabled->get<bool>();
        }
        if (const json* harness = find_setting(doc, "harness")) {
            config.harness = harness->get<std::string>();
        }
        if (const json* threshold = find_setting(doc, "errorThreshold")) {
            const auto value = bounded_setting(*threshold, 1, kMaxErrorThreshold);
            if (!value.has_value()) {
                return out_of_range("errorThreshold", 1, kMaxErrorThreshold);
            }
            config.error_threshold = static_cast<std::uint32_t>(value.value());
        }
        if (const json* timeout = find_setting(doc, "inactivityTimeoutSeconds")) {
            const auto value = bounded_setting(*timeout, 1, kMaxTimeoutSeconds);
            if (!value.has_value()) {
                return out_of_range("inactivityTimeoutSeconds", 1, kMaxTimeoutSeconds);
            }
            config.inactivity_timeout = std::chrono::seconds(value.value());
        }
        if (const json* timeout = find_setting(doc, "validationTimeoutSeconds")) {
            const auto value = bounded_setting(*timeout, 1, kMaxTimeoutSeconds);
            if (!value.has_value()) {
                return out_of_range("validationTimeoutSeconds", 1, kMaxTimeoutSeconds);
            }
            config.validation_timeout = std::chrono::seconds(value.value());
        }
    } catch (const json::exception& e) {
        return LoopError{ErrorCategory::Input,
                         std::string("Project config has a value of the wrong type: ") +
                             e.what(),
                         "invalid_config"};
    }

    return config;
}

std::vector<std::string> discover_markdown_validation_commands(
    const std::filesystem::path& root) {
    for (const char* name : {"AGENTS.md", "CLAUDE.md"}) {
        const auto contents = read_file(root / name);
        if (!contents.has_value()) {
            continue;
        }
        std::istringstream in(contents.value());
        std::string line;
        while (std::getline(in, line)) {
            const std::string trimmed = trim(line);
            if (trimmed == "make check" || trimmed == "make test") {
                return {trimmed};
            }
        }
    }
    return {};
}

core::errors::Result<ProjectConfig> load_project_config(const WorkspacePaths& paths) {
    ProjectConfig config;
    for (const auto& candidate : {paths.root_config_file(), paths.config_file()}) {
        const auto contents = read_file(candidate);
        if (!contents.has_value()) {
            continue;
        }
        auto parsed = parse_project_config(contents.value());
        if (core::errors::is_error(parsed)) {
            auto err = core::errors::get_error(parsed);
            err.message += " (" + candidate.string() + ")";
            return err;
        }
        config = core::errors::get_value(parsed);
        config.source = candidate;
        LOG_DEBUG("Loaded project config from " + candidate.string());
        break;
    }

    if (config.validation_commands.empty()) {
        config.validation_commands = discover_markdown_validation_commands(paths.root());
    }
    return config;
}

}  // namespace ralph::core::config
