#include "agent/tools/interactive_shell.hpp"

#include <optional>

#include "judge/judge_harness.hpp"
#include "nlohmann/json.hpp"
#include "session/session_registry.hpp"

namespace shellbox::agent::tools {
namespace {

std::string GetParam(const std::unordered_map<std::string, std::string>& params,
                     const std::string& name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return {};
    }
    return it->second;
}

std::optional<std::string> GetOptionalParam(const std::unordered_map<std::string, std::string>& params,
                                            const std::string& name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Dump(const nlohmann::json& json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

StartInteractiveShellTool::StartInteractiveShellTool(session::SessionRegistry& registry)
    : registry_(registry) {}

std::string StartInteractiveShellTool::ParametersJson() const {
    return R"({"type":"object","properties":{"cmd":{"type":"string","description":"Command to run, default bash"},"session_id":{"type":"string"}}})";
}

std::string StartInteractiveShellTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    return registry_.StartSession(GetParam(params, "cmd"), GetParam(params, "session_id")).ToJson();
}

RunInteractiveShellTool::RunInteractiveShellTool(session::SessionRegistry& registry)
    : registry_(registry) {}

std::string RunInteractiveShellTool::ParametersJson() const {
    return R"({"type":"object","properties":{"session_id":{"type":"string"},"user_input":{"type":"string"}},"required":["session_id"]})";
}

std::string RunInteractiveShellTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    const auto session_id = GetParam(params, "session_id");
    if (session_id.empty()) {
        return Dump({{"error", "session_id is required"}, {"session_id", nullptr}, {"output", ""},
                     {"waiting", false}, {"finished", true}});
    }
    return registry_.Step(session_id, GetOptionalParam(params, "user_input")).ToJson();
}

KillShellSessionTool::KillShellSessionTool(session::SessionRegistry& registry)
    : registry_(registry) {}

std::string KillShellSessionTool::ParametersJson() const {
    return R"({"type":"object","properties":{"session_id":{"type":"string"}},"required":["session_id"]})";
}

std::string KillShellSessionTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    const auto session_id = GetParam(params, "session_id");
    if (session_id.empty()) {
        return Dump({{"error", "session_id is required"}, {"output", ""}});
    }
    registry_.Kill(session_id);
    const auto message = "Session " + session_id + " has been terminated";
    return Dump({{"message", message}, {"output", message}});
}

JudgeTool::JudgeTool(config::JudgeConfig judge, config::SessionConfig session, std::string working_dir)
    : judge_(std::move(judge))
    , session_(std::move(session))
    , working_dir_(std::move(working_dir)) {}

std::string JudgeTool::ParametersJson() const {
    return R"({"type":"object","properties":{"context":{"type":"string","description":"Expected behaviour, for the record only"},"entry_command":{"type":"string","description":"e.g. python main.py"},"input_file":{"type":"string","description":"File with one input line per line"}},"required":["context","entry_command"]})";
}

std::string JudgeTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    const auto entry_command = GetParam(params, "entry_command");
    if (entry_command.empty()) {
        return Dump({{"success", false}, {"log", ""}, {"error", "entry_command is required"}});
    }
    std::optional<std::string> input_file;
    const auto input = GetParam(params, "input_file");
    if (!input.empty()) {
        input_file = input;
    }
    judge::JudgeHarness harness(judge_, session_);
    const auto result = harness.RunWithInputFile(entry_command, input_file, working_dir_);
    nlohmann::json json = {{"success", result.success}, {"log", result.log}};
    if (!result.error.empty()) {
        json["error"] = result.error;
    }
    return Dump(json);
}

}  // namespace shellbox::agent::tools
