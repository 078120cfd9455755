#include <chrono>
#include <csignal>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <poll.h>
#include <unistd.h>

#include "agent/tools/default_tools.hpp"
#include "config/config_loader.hpp"
#include "judge/judge_harness.hpp"
#include "nlohmann/json.hpp"
#include "pty/pty_process.hpp"
#include "relay/output_pump.hpp"
#include "session/session_registry.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);
}

shellbox::config::Config LoadAndConfigure() {
    auto config = shellbox::config::LoadConfig();
    shellbox::utils::LogConfig log_config;
    log_config.min_level = shellbox::utils::ParseLogLevel(config.log_level);
    shellbox::utils::ConfigureLogging(log_config);
    return config;
}

// Waits for a line on stdin while keep_waiting() holds. Returns nullopt on
// end of input, on a signal, or once keep_waiting() turns false.
std::optional<std::string> ReadStdinLine(const std::function<bool()>& keep_waiting) {
    while (g_signal == 0 && keep_waiting()) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        if (::poll(&pfd, 1, 200) <= 0) {
            continue;
        }
        std::string line;
        if (!std::getline(std::cin, line)) {
            return std::nullopt;
        }
        return line;
    }
    return std::nullopt;
}

int RunJudge(const std::string& entry, const std::optional<std::string>& input_file) {
    const auto config = LoadAndConfigure();
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    shellbox::judge::JudgeHarness harness(config.judge, config.session);
    const auto result = harness.RunWithInputFile(entry, input_file, cwd.string());
    std::cout << result.log;
    if (!result.error.empty()) {
        std::cout << "error: " << result.error << std::endl;
    }
    std::cout << (result.success ? "PASS" : "FAIL") << std::endl;
    return result.success ? 0 : 1;
}

int RunShell(const std::string& command) {
    const auto config = LoadAndConfigure();
    shellbox::session::SessionRegistry sessions(config.sandbox, config.session);
    InstallSignalHandlers();

    auto step = sessions.StartSession(command);
    const auto session_id = step.session_id;
    while (true) {
        std::cout << step.output << std::flush;
        if (!step.error.empty()) {
            std::cerr << "error: " << step.error << std::endl;
        }
        if (step.finished) {
            return step.error.empty() ? 0 : 1;
        }
        if (!step.waiting) {
            step = sessions.Step(session_id);
            continue;
        }
        std::string line;
        if (!std::getline(std::cin, line) || g_signal != 0) {
            break;
        }
        step = sessions.Step(session_id, line);
    }
    sessions.Kill(session_id);
    return 0;
}

int RunAttach(const std::string& command) {
    const auto config = LoadAndConfigure();
    const auto policy = shellbox::sandbox::MakeCommandPolicy(config.sandbox);
    const auto cmd = command.empty() ? config.session.default_command : command;
    if (config.sandbox.sandbox_mode && !policy->IsAllowed(cmd)) {
        std::cerr << policy->Rejection(cmd) << std::endl;
        return 1;
    }

    std::unique_ptr<shellbox::pty::PtyProcess> process;
    try {
        shellbox::pty::SpawnOptions options;
        options.term = config.session.term;
        process = shellbox::pty::PtyProcess::Spawn(
            cmd, config.sandbox.workspace_dir, std::chrono::seconds(config.session.spawn_timeout_s), options);
    } catch (const shellbox::Error& ex) {
        std::cerr << ex.what() << std::endl;
        return 1;
    }

    shellbox::relay::OutputPump pump(std::move(process), [](const std::string& chunk, bool end_of_stream) {
        if (end_of_stream) {
            std::cout << "\n" << chunk << std::endl;
        } else {
            std::cout << chunk << std::flush;
        }
    });
    InstallSignalHandlers();
    pump.Start();
    while (true) {
        const auto line = ReadStdinLine([&pump]() { return !pump.Finished(); });
        if (!line) {
            break;
        }
        try {
            pump.SendLine(*line);
        } catch (const shellbox::ProcessNotRunningError&) {
            break;
        }
    }
    pump.Stop();
    return 0;
}

int RunTool(const std::string& name, const std::string& params_json) {
    const auto config = LoadAndConfigure();
    shellbox::session::SessionRegistry sessions(config.sandbox, config.session);
    shellbox::agent::tools::ToolRegistry tools;
    shellbox::agent::tools::RegisterDefaultTools(tools, sessions, config);

    std::unordered_map<std::string, std::string> params;
    if (!params_json.empty()) {
        const auto json = nlohmann::json::parse(params_json, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            std::cout << "Parameters must be a JSON object." << std::endl;
            return 1;
        }
        for (const auto& item : json.items()) {
            params[item.key()] = item.value().is_string() ? item.value().get<std::string>()
                                                          : item.value().dump();
        }
    }
    std::cout << tools.Execute(name, params) << std::endl;
    return 0;
}

int ListTools() {
    const auto config = LoadAndConfigure();
    shellbox::session::SessionRegistry sessions(config.sandbox, config.session);
    shellbox::agent::tools::ToolRegistry tools;
    shellbox::agent::tools::RegisterDefaultTools(tools, sessions, config);
    for (const auto& def : tools.GetDefinitions()) {
        std::cout << def.name << "\n  " << def.description << "\n  " << def.parameters_json << std::endl;
    }
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: shellbox_cli judge <entry_command> [input_file]\n"
              << "       shellbox_cli shell [command]\n"
              << "       shellbox_cli attach [command]\n"
              << "       shellbox_cli tools\n"
              << "       shellbox_cli tool <name> ['{\"param\":\"value\"}']" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];

    if (command == "judge" && argc >= 3) {
        std::optional<std::string> input_file;
        if (argc >= 4) {
            input_file = argv[3];
        }
        return RunJudge(argv[2], input_file);
    }
    if (command == "shell") {
        return RunShell(argc >= 3 ? argv[2] : "");
    }
    if (command == "attach") {
        return RunAttach(argc >= 3 ? argv[2] : "");
    }
    if (command == "tools") {
        return ListTools();
    }
    if (command == "tool" && argc >= 3) {
        return RunTool(argv[2], argc >= 4 ? argv[3] : "");
    }

    PrintUsage();
    return 1;
}
