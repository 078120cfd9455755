#pragma once

#include <string>

#include "agent/tools/tool.hpp"
#include "config/config_schema.hpp"

namespace shellbox::session {
class SessionRegistry;
}

namespace shellbox::agent::tools {

class StartInteractiveShellTool : public Tool {
public:
    explicit StartInteractiveShellTool(session::SessionRegistry& registry);

    std::string Name() const override { return "start_interactive_shell"; }
    std::string Description() const override {
        return "Start an interactive terminal session running cmd (default bash) and return its first output.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    session::SessionRegistry& registry_;
};

class RunInteractiveShellTool : public Tool {
public:
    explicit RunInteractiveShellTool(session::SessionRegistry& registry);

    std::string Name() const override { return "run_interactive_shell"; }
    std::string Description() const override {
        return "Send user_input to a running session (if given) and return the new output. "
               "waiting=true means the program is idle and expects input; finished=true means it has exited.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    session::SessionRegistry& registry_;
};

class KillShellSessionTool : public Tool {
public:
    explicit KillShellSessionTool(session::SessionRegistry& registry);

    std::string Name() const override { return "kill_shell_session"; }
    std::string Description() const override { return "Terminate an interactive session."; }
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    session::SessionRegistry& registry_;
};

class JudgeTool : public Tool {
public:
    JudgeTool(config::JudgeConfig judge, config::SessionConfig session, std::string working_dir);

    std::string Name() const override { return "judge"; }
    std::string Description() const override {
        return "Run entry_command, feed it the lines of input_file, interrupt it with Ctrl+C if it does not "
               "exit, and report whether it ended successfully together with the interaction log.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    config::JudgeConfig judge_;
    config::SessionConfig session_;
    std::string working_dir_;
};

}  // namespace shellbox::agent::tools
