#include "agent/tools/default_tools.hpp"

#include <memory>

#include "agent/tools/interactive_shell.hpp"
#include "agent/tools/shell.hpp"
#include "session/session_registry.hpp"

namespace shellbox::agent::tools {

void RegisterDefaultTools(ToolRegistry& tools,
                          session::SessionRegistry& sessions,
                          const config::Config& config) {
    const auto policy = sandbox::MakeCommandPolicy(config.sandbox);
    tools.Register(std::make_unique<StartInteractiveShellTool>(sessions));
    tools.Register(std::make_unique<RunInteractiveShellTool>(sessions));
    tools.Register(std::make_unique<KillShellSessionTool>(sessions));
    tools.Register(std::make_unique<JudgeTool>(config.judge, config.session, config.sandbox.workspace_dir));
    tools.Register(std::make_unique<RunSystemCommandTool>(config, policy));
    tools.Register(std::make_unique<InteractiveSystemCommandTool>(config, policy));
}

}  // namespace shellbox::agent::tools
