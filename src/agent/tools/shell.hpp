#pragma once

#include <memory>
#include <string>

#include "agent/tools/tool.hpp"
#include "config/config_schema.hpp"
#include "sandbox/safety_policy.hpp"

namespace shellbox::agent::tools {

class RunSystemCommandTool : public Tool {
public:
    RunSystemCommandTool(config::Config config, std::shared_ptr<const sandbox::CommandPolicy> policy);

    std::string Name() const override { return "run_system_command"; }
    std::string Description() const override { return "Run a shell command to completion and capture its output."; }
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    config::Config config_;
    std::shared_ptr<const sandbox::CommandPolicy> policy_;
};

class InteractiveSystemCommandTool : public Tool {
public:
    InteractiveSystemCommandTool(config::Config config, std::shared_ptr<const sandbox::CommandPolicy> policy);

    std::string Name() const override { return "interactive_system_command"; }
    std::string Description() const override {
        return "Run a command on a terminal, typing each element of inputs followed by Enter.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    config::Config config_;
    std::shared_ptr<const sandbox::CommandPolicy> policy_;
};

}  // namespace shellbox::agent::tools
