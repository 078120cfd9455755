#include "agent/tools/shell.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <vector>

#include "judge/judge_harness.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/logging.hpp"

namespace shellbox::agent::tools {
namespace {

constexpr int kInteractiveDefaultTimeoutS = 15;

std::string GetParam(const std::unordered_map<std::string, std::string>& params,
                     const std::string& name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return {};
    }
    return it->second;
}

int ParseTimeout(const std::string& value, int fallback) {
    if (value.empty()) {
        return fallback;
    }
    try {
        const int parsed = std::stoi(value);
        return parsed > 0 ? parsed : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string ErrorJson(const std::string& message) {
    return nlohmann::json{{"error", message}}.dump();
}

std::string Dump(const nlohmann::json& json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Accepts a JSON array of strings; a plain string counts as one line.
std::optional<std::vector<std::string>> ParseInputs(const std::string& value) {
    std::vector<std::string> inputs;
    if (value.empty()) {
        return inputs;
    }
    auto json = nlohmann::json::parse(value, nullptr, false);
    if (json.is_discarded()) {
        inputs.push_back(value);
        return inputs;
    }
    if (json.is_string()) {
        inputs.push_back(json.get<std::string>());
        return inputs;
    }
    if (!json.is_array()) {
        return std::nullopt;
    }
    for (const auto& item : json) {
        if (item.is_string()) {
            inputs.push_back(item.get<std::string>());
        } else {
            inputs.push_back(item.dump());
        }
    }
    return inputs;
}

}  // namespace

RunSystemCommandTool::RunSystemCommandTool(config::Config config,
                                           std::shared_ptr<const sandbox::CommandPolicy> policy)
    : config_(std::move(config))
    , policy_(std::move(policy)) {}

std::string RunSystemCommandTool::ParametersJson() const {
    return R"({"type":"object","properties":{"command":{"type":"string"},"timeout":{"type":"integer","description":"Seconds, default 30"}},"required":["command"]})";
}

std::string RunSystemCommandTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    const auto command = GetParam(params, "command");
    if (command.empty()) {
        return ErrorJson("command is required");
    }
    const auto timeout = ParseTimeout(GetParam(params, "timeout"), config_.exec.timeout_s);
    std::error_code ec;
    std::filesystem::create_directories(config_.sandbox.workspace_dir, ec);
    const auto result = sandbox::SandboxExecutor::Run(
        command,
        config_.sandbox.workspace_dir,
        std::chrono::seconds(timeout),
        config_.sandbox.sandbox_mode ? policy_.get() : nullptr);

    if (result.blocked) {
        return ErrorJson(result.error);
    }
    if (result.timed_out) {
        return ErrorJson("Command execution timeout");
    }
    if (result.exit_code < 0) {
        return ErrorJson("Command execution failed: " + result.error);
    }
    return Dump({{"stdout", result.output}, {"stderr", result.error}, {"return_code", result.exit_code}});
}

InteractiveSystemCommandTool::InteractiveSystemCommandTool(config::Config config,
                                                           std::shared_ptr<const sandbox::CommandPolicy> policy)
    : config_(std::move(config))
    , policy_(std::move(policy)) {}

std::string InteractiveSystemCommandTool::ParametersJson() const {
    return R"({"type":"object","properties":{"command":{"type":"string"},"inputs":{"type":"array","items":{"type":"string"}},"timeout":{"type":"integer","description":"Seconds, default 15"}},"required":["command"]})";
}

std::string InteractiveSystemCommandTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    const auto command = GetParam(params, "command");
    if (command.empty()) {
        return ErrorJson("command is required");
    }
    if (config_.sandbox.sandbox_mode && !policy_->IsAllowed(command)) {
        utils::LogWarn("exec", "interactive command blocked", {{"command", command}});
        return ErrorJson(policy_->Rejection(command));
    }
    const auto inputs = ParseInputs(GetParam(params, "inputs"));
    if (!inputs) {
        return ErrorJson("inputs must be a JSON array of strings");
    }

    config::JudgeConfig judge = config_.judge;
    judge.primary_timeout_ms = ParseTimeout(GetParam(params, "timeout"), kInteractiveDefaultTimeoutS) * 1000;
    judge.grace_ms = 1000;
    judge.close_input = false;
    judge.log_path.clear();
    judge::JudgeHarness harness(judge, config_.session);
    const auto result = harness.Run(command, *inputs, config_.sandbox.workspace_dir);

    if (result.interrupted) {
        return ErrorJson("Command execution timeout");
    }
    if (!result.exit_code) {
        return ErrorJson("Interactive command execution failed: " + result.error);
    }
    return Dump({{"stdout", result.output}, {"stderr", ""}, {"return_code", *result.exit_code}});
}

}  // namespace shellbox::agent::tools
