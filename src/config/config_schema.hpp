#pragma once

#include <string>
#include <vector>

namespace shellbox::config {

struct SandboxConfig {
    std::string workspace_dir = "/tmp/code_agent_workspace";
    std::string scratch_dir = "/tmp";
    int report_slots = 50;
    bool enable_path_restriction = true;
    bool sandbox_mode = true;
    std::vector<std::string> safe_commands = {
        "ls", "pwd", "echo", "cat", "head", "tail", "grep", "find",
        "python", "python3", "chmod", "cd", "pytest", "bash"
    };
    // "substring" or "first_token"
    std::string command_match = "substring";
};

struct SessionConfig {
    std::string default_command = "bash";
    int quiescence_ms = 1000;
    int max_step_ms = 10000;
    int max_output_bytes = 64 * 1024;
    int spawn_timeout_s = 30;
    std::string term = "dumb";
    std::vector<std::string> interpreter_prefixes = {"python"};
    std::vector<std::string> exit_commands = {"exit", "exit()", "quit()"};
    int idle_timeout_s = 0;
};

struct JudgeConfig {
    int primary_timeout_ms = 10000;
    int grace_ms = 3000;
    int startup_delay_ms = 200;
    int inter_line_delay_ms = 200;
    bool close_input = false;
    std::string log_path = "judge_interact.log";
    std::vector<std::string> interrupt_markers = {"KeyboardInterrupt", "keyboardInterrupt"};
};

struct ExecConfig {
    int timeout_s = 30;
};

struct Config {
    SandboxConfig sandbox;
    SessionConfig session;
    JudgeConfig judge;
    ExecConfig exec;
    std::string log_level = "info";
};

}  // namespace shellbox::config
