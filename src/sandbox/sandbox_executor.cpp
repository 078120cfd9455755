#include "sandbox/sandbox_executor.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/boost_process.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace shellbox::sandbox {
namespace {

// Leads its own process group so a timeout reaches every descendant.
struct NewProcessGroup : bp::extend::handler {
    template <typename Executor>
    void on_exec_setup(Executor&) const {
        ::setpgid(0, 0);
    }
};

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

bool WaitUntil(bp::child& child, std::chrono::steady_clock::time_point deadline,
               std::chrono::milliseconds interval) {
    std::error_code ec;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!child.running(ec) || ec) {
            return !ec;
        }
        std::this_thread::sleep_for(interval);
    }
    return !child.running(ec) && !ec;
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

}  // namespace

ExecResult SandboxExecutor::Run(const std::string& command,
                                const std::string& working_dir,
                                std::chrono::seconds timeout,
                                const CommandPolicy* policy) {
    ExecResult result{};
    if (policy && !policy->IsAllowed(command)) {
        utils::LogWarn("exec", "command blocked", {{"command", command}, {"policy", policy->Name()}});
        result.blocked = true;
        result.error = policy->Rejection(command);
        return result;
    }
    utils::LogInfo("exec", "run", {{"command", command}, {"cwd", working_dir}});

    const auto stamp = utils::GenerateId();
    std::error_code ec;
    const auto temp_dir = std::filesystem::temp_directory_path(ec);
    const auto stdout_path = temp_dir / ("shellbox_stdout_" + stamp + ".log");
    const auto stderr_path = temp_dir / ("shellbox_stderr_" + stamp + ".log");

    bp::environment env = boost::this_process::environment();
    const char* kProxyVars[] = {
        "HTTP_PROXY",
        "HTTPS_PROXY",
        "ALL_PROXY",
        "http_proxy",
        "https_proxy",
        "all_proxy",
        "NO_PROXY",
        "no_proxy"
    };
    for (const auto* key : kProxyVars) {
        if (const char* value = std::getenv(key)) {
            env[key] = value;
        }
    }

    bool launched = false;
    try {
        bp::child child_process(
            "/bin/sh",
            "-c",
            command,
            env,
            bp::start_dir=working_dir,
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            NewProcessGroup{});
        launched = true;

        const pid_t pid = child_process.id();
        bool finished = WaitUntil(child_process, std::chrono::steady_clock::now() + timeout,
                                  std::chrono::milliseconds(50));
        if (!finished) {
            result.timed_out = true;
            utils::LogWarn("exec", "timeout, sending SIGTERM", {{"pid", std::to_string(pid)},
                                                                {"timeout_s", std::to_string(timeout.count())}});
            ::kill(-pid, SIGTERM);
            finished = WaitUntil(child_process, std::chrono::steady_clock::now() + std::chrono::seconds(2),
                                 std::chrono::milliseconds(100));
            if (!finished) {
                ::kill(-pid, SIGKILL);
                child_process.wait(ec);
            }
            // descendants that outlived the shell
            ::kill(-pid, SIGKILL);
        }

        if (finished) {
            result.exit_code = DecodeStatus(child_process.native_exit_code());
        } else {
            result.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        result.exit_code = -1;
        result.error = std::string("exec failed: ") + ex.what();
        utils::LogError("exec", "launch failed", {{"command", command}, {"error", ex.what()}});
    }

    if (launched) {
        result.output = ReadFile(stdout_path);
        result.error = ReadFile(stderr_path);
    }
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    utils::LogInfo("exec", "done", {{"exit_code", std::to_string(result.exit_code)},
                                    {"timed_out", result.timed_out ? "true" : "false"}});
    return result;
}

}  // namespace shellbox::sandbox
