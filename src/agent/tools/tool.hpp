#pragma once

#include <string>
#include <unordered_map>

namespace shellbox::agent::tools {

struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

// Agent-invocable operation. Parameters arrive as strings; the result is a
// JSON document. Execute reports failures inside the result.
class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual std::string ParametersJson() const = 0;
    virtual std::string Execute(const std::unordered_map<std::string, std::string>& params) = 0;
};

}  // namespace shellbox::agent::tools
