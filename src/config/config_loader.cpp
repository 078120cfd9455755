#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace shellbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyBool(bool& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyStringList(std::vector<std::string>& target, const nlohmann::json& source, const char* key) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    ApplyString(config.log_level, data, "logLevel");

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ApplyString(config.sandbox.workspace_dir, sandbox, "workspaceDir");
        ApplyString(config.sandbox.scratch_dir, sandbox, "scratchDir");
        ApplyInt(config.sandbox.report_slots, sandbox, "reportSlots");
        ApplyBool(config.sandbox.enable_path_restriction, sandbox, "enablePathRestriction");
        ApplyBool(config.sandbox.sandbox_mode, sandbox, "sandboxMode");
        ApplyStringList(config.sandbox.safe_commands, sandbox, "safeCommands");
        ApplyString(config.sandbox.command_match, sandbox, "commandMatch");
    }

    if (data.contains("session") && data["session"].is_object()) {
        const auto& session = data["session"];
        ApplyString(config.session.default_command, session, "defaultCommand");
        ApplyInt(config.session.quiescence_ms, session, "quiescenceMs");
        ApplyInt(config.session.max_step_ms, session, "maxStepMs");
        ApplyInt(config.session.max_output_bytes, session, "maxOutputBytes");
        ApplyInt(config.session.spawn_timeout_s, session, "spawnTimeoutS");
        ApplyString(config.session.term, session, "term");
        ApplyStringList(config.session.interpreter_prefixes, session, "interpreterPrefixes");
        ApplyStringList(config.session.exit_commands, session, "exitCommands");
        ApplyInt(config.session.idle_timeout_s, session, "idleTimeoutS");
    }

    if (data.contains("judge") && data["judge"].is_object()) {
        const auto& judge = data["judge"];
        ApplyInt(config.judge.primary_timeout_ms, judge, "primaryTimeoutMs");
        ApplyInt(config.judge.grace_ms, judge, "graceMs");
        ApplyInt(config.judge.startup_delay_ms, judge, "startupDelayMs");
        ApplyInt(config.judge.inter_line_delay_ms, judge, "interLineDelayMs");
        ApplyBool(config.judge.close_input, judge, "closeInput");
        ApplyString(config.judge.log_path, judge, "logPath");
        ApplyStringList(config.judge.interrupt_markers, judge, "interruptMarkers");
    }

    if (data.contains("exec") && data["exec"].is_object()) {
        ApplyInt(config.exec.timeout_s, data["exec"], "timeoutS");
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto workspace = GetEnvFallback(
        "SHELLBOX_SANDBOX__WORKSPACE_DIR",
        "CODE_AGENT_WORKSPACE_DIR");
    if (!workspace.empty()) {
        config.sandbox.workspace_dir = workspace;
    }

    const auto scratch = GetEnv("SHELLBOX_SANDBOX__SCRATCH_DIR");
    if (!scratch.empty()) {
        config.sandbox.scratch_dir = scratch;
    }

    const auto report_slots = GetEnv("SHELLBOX_SANDBOX__REPORT_SLOTS");
    if (!report_slots.empty()) {
        config.sandbox.report_slots = ParseInt(report_slots, config.sandbox.report_slots);
    }

    const auto path_restriction = GetEnvFallback(
        "SHELLBOX_SANDBOX__ENABLE_PATH_RESTRICTION",
        "ENABLE_PATH_RESTRICTION");
    if (!path_restriction.empty()) {
        config.sandbox.enable_path_restriction = ParseBool(path_restriction);
    }

    const auto sandbox_mode = GetEnv("SHELLBOX_SANDBOX__SANDBOX_MODE");
    if (!sandbox_mode.empty()) {
        config.sandbox.sandbox_mode = ParseBool(sandbox_mode);
    }

    const auto safe_commands = GetEnv("SHELLBOX_SANDBOX__SAFE_COMMANDS");
    if (!safe_commands.empty()) {
        config.sandbox.safe_commands = utils::SplitCsv(safe_commands);
    }

    const auto command_match = GetEnv("SHELLBOX_SANDBOX__COMMAND_MATCH");
    if (!command_match.empty()) {
        config.sandbox.command_match = command_match;
    }

    const auto default_command = GetEnv("SHELLBOX_SESSION__DEFAULT_COMMAND");
    if (!default_command.empty()) {
        config.session.default_command = default_command;
    }

    const auto quiescence = GetEnv("SHELLBOX_SESSION__QUIESCENCE_MS");
    if (!quiescence.empty()) {
        config.session.quiescence_ms = ParseInt(quiescence, config.session.quiescence_ms);
    }

    const auto idle_timeout = GetEnv("SHELLBOX_SESSION__IDLE_TIMEOUT_S");
    if (!idle_timeout.empty()) {
        config.session.idle_timeout_s = ParseInt(idle_timeout, config.session.idle_timeout_s);
    }

    const auto primary_timeout = GetEnv("SHELLBOX_JUDGE__PRIMARY_TIMEOUT_MS");
    if (!primary_timeout.empty()) {
        config.judge.primary_timeout_ms = ParseInt(primary_timeout, config.judge.primary_timeout_ms);
    }

    const auto grace = GetEnv("SHELLBOX_JUDGE__GRACE_MS");
    if (!grace.empty()) {
        config.judge.grace_ms = ParseInt(grace, config.judge.grace_ms);
    }

    const auto judge_log = GetEnv("SHELLBOX_JUDGE__LOG_PATH");
    if (!judge_log.empty()) {
        config.judge.log_path = judge_log;
    }

    const auto exec_timeout = GetEnv("SHELLBOX_EXEC__TIMEOUT_S");
    if (!exec_timeout.empty()) {
        config.exec.timeout_s = ParseInt(exec_timeout, config.exec.timeout_s);
    }

    const auto log_level = GetEnv("SHELLBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".shellbox" / "config.json";
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "ignoring malformed file", {{"path", config_path.string()},
                                                                 {"error", ex.what()}});
        }
    }

    ApplyEnvOverrides(config);

    std::filesystem::path workspace(config.sandbox.workspace_dir);
    if (!workspace.is_absolute()) {
        const auto absolute = std::filesystem::absolute(workspace, ec);
        if (!ec) {
            config.sandbox.workspace_dir = absolute.string();
        }
    }
    return config;
}

}  // namespace shellbox::config
