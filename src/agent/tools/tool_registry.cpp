#include "agent/tools/tool_registry.hpp"

#include <algorithm>
#include <exception>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace shellbox::agent::tools {
namespace {

std::string ErrorJson(const std::string& message) {
    return nlohmann::json{{"error", message}}.dump();
}

}  // namespace

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    tools_[std::move(name)] = std::move(tool);
}

Tool* ToolRegistry::Get(const std::string& name) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::vector<ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<ToolDefinition> defs;
    for (const auto& [name, tool] : tools_) {
        ToolDefinition def{};
        def.name = name;
        def.description = tool->Description();
        def.parameters_json = tool->ParametersJson();
        defs.push_back(def);
    }
    std::sort(defs.begin(), defs.end(), [](const ToolDefinition& a, const ToolDefinition& b) {
        return a.name < b.name;
    });
    return defs;
}

std::string ToolRegistry::Execute(
    const std::string& name,
    const std::unordered_map<std::string, std::string>& params) {
    auto tool = Get(name);
    if (!tool) {
        return ErrorJson("Tool '" + name + "' not found");
    }
    std::vector<std::pair<std::string, std::string>> fields = {{"name", name}};
    for (const auto& [key, value] : params) {
        fields.emplace_back(key, value);
    }
    utils::LogInfo("tool", "start", std::move(fields));
    std::string result;
    try {
        result = tool->Execute(params);
    } catch (const std::exception& ex) {
        utils::LogError("tool", "failed", {{"name", name}, {"error", ex.what()}});
        result = ErrorJson(ex.what());
    }
    utils::LogInfo("tool", "end", {{"name", name}, {"size", std::to_string(result.size())}});
    return result;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace shellbox::agent::tools
