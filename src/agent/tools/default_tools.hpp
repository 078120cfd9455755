#pragma once

#include "agent/tools/tool_registry.hpp"
#include "config/config_schema.hpp"

namespace shellbox::session {
class SessionRegistry;
}

namespace shellbox::agent::tools {

// Registers every agent-facing tool. Session tools keep a reference to
// sessions, which must outlive the registry.
void RegisterDefaultTools(ToolRegistry& tools,
                          session::SessionRegistry& sessions,
                          const config::Config& config);

}  // namespace shellbox::agent::tools
