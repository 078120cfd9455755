#include "pty/pty_process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include "utils/boost_process.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace shellbox::pty {
namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr char kDefaultIntr = 0x03;
constexpr char kDefaultEof = 0x04;

// Runs in the child between fork and exec, after stdio has been bound to the
// terminal slave.
struct ControllingTerminal : bp::extend::handler {
    template <typename Executor>
    void on_exec_setup(Executor&) const {
        ::setsid();
        ::ioctl(STDIN_FILENO, TIOCSCTTY, 0);
    }
};

class ScopedFd {
public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int Get() const { return fd_; }
    int Release() {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

std::string ErrnoMessage(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

bool IsExecutableFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::string LocateExecutable(const std::string& program, const std::filesystem::path& working_dir) {
    if (program.empty()) {
        return {};
    }
    if (program.find('/') != std::string::npos) {
        std::filesystem::path candidate(program);
        if (candidate.is_relative()) {
            candidate = working_dir / candidate;
        }
        return IsExecutableFile(candidate) ? candidate.string() : std::string();
    }
    return bp::search_path(program).string();
}

// Plain commands are exec'd so the child pid is the program itself; anything
// with shell syntax keeps the shell as the group leader.
std::string BuildShellCommand(const std::string& command) {
    if (command.find_first_of(";&|<>()`$\n") != std::string::npos) {
        return command;
    }
    const auto first = command.find_first_not_of(" \t");
    if (first == std::string::npos || command.compare(first, utils::ProgramToken(command).size(),
                                                      utils::ProgramToken(command)) != 0) {
        return command;
    }
    return "exec " + command;
}

char ControlChar(int master_fd, int index, char fallback) {
    termios attrs{};
    if (::tcgetattr(master_fd, &attrs) != 0) {
        return fallback;
    }
    const auto value = attrs.c_cc[index];
    return value == _POSIX_VDISABLE ? fallback : static_cast<char>(value);
}

}  // namespace

struct PtyProcess::Impl {
    explicit Impl(bp::child process) : child(std::move(process)) {}
    bp::child child;
};

PtyProcess::PtyProcess(std::string command, std::chrono::milliseconds timeout,
                       std::chrono::milliseconds terminate_grace)
    : command_(std::move(command))
    , timeout_(timeout)
    , terminate_grace_(terminate_grace) {}

PtyProcess::~PtyProcess() {
    if (impl_ && IsRunning()) {
        Terminate(true);
    }
    // background jobs the program left behind in its group
    if (pid_ > 0) {
        ::kill(-pid_, SIGKILL);
    }
    CloseMaster();
}

std::unique_ptr<PtyProcess> PtyProcess::Spawn(const std::string& command,
                                              const std::string& working_dir,
                                              std::chrono::milliseconds timeout,
                                              const SpawnOptions& options) {
    std::error_code ec;
    const std::filesystem::path dir = working_dir.empty()
        ? std::filesystem::current_path(ec)
        : std::filesystem::path(working_dir);
    if (ec || !std::filesystem::is_directory(dir, ec)) {
        throw SpawnError("Working directory is invalid: " + dir.string());
    }

    const auto program = utils::ProgramToken(command);
    if (LocateExecutable(program, dir).empty()) {
        throw SpawnError("The command was not found or was not executable: " +
                         (program.empty() ? command : program));
    }

    ScopedFd master(::posix_openpt(O_RDWR | O_NOCTTY));
    if (master.Get() < 0) {
        throw SpawnError(ErrnoMessage("posix_openpt failed"));
    }
    if (::grantpt(master.Get()) != 0 || ::unlockpt(master.Get()) != 0) {
        throw SpawnError(ErrnoMessage("unlocking pseudo-terminal failed"));
    }
    char slave_name[128] = {};
    if (::ptsname_r(master.Get(), slave_name, sizeof(slave_name)) != 0) {
        throw SpawnError(ErrnoMessage("ptsname failed"));
    }
    ScopedFd slave(::open(slave_name, O_RDWR | O_NOCTTY));
    if (slave.Get() < 0) {
        throw SpawnError(ErrnoMessage("opening pseudo-terminal slave failed"));
    }
    ::fcntl(master.Get(), F_SETFD, FD_CLOEXEC);
    ::fcntl(slave.Get(), F_SETFD, FD_CLOEXEC);
    ::fcntl(master.Get(), F_SETFL, ::fcntl(master.Get(), F_GETFL) | O_NONBLOCK);

    winsize size{};
    size.ws_row = options.rows;
    size.ws_col = options.cols;
    ::ioctl(master.Get(), TIOCSWINSZ, &size);

    bp::environment env = boost::this_process::environment();
    env["TERM"] = options.term;

    std::unique_ptr<PtyProcess> process(new PtyProcess(command, timeout, options.terminate_grace));
    try {
        bp::child child_process(
            "/bin/sh",
            "-c",
            BuildShellCommand(command),
            env,
            bp::start_dir = dir.string(),
            bp::posix::fd.bind(STDIN_FILENO, slave.Get()),
            bp::posix::fd.bind(STDOUT_FILENO, slave.Get()),
            bp::posix::fd.bind(STDERR_FILENO, slave.Get()),
            ControllingTerminal{});
        process->pid_ = child_process.id();
        process->impl_ = std::make_unique<Impl>(std::move(child_process));
    } catch (const bp::process_error& ex) {
        throw SpawnError(std::string("Failed to spawn '") + command + "': " + ex.what());
    }
    process->master_fd_ = master.Release();

    utils::LogDebug("pty", "spawned", {{"pid", std::to_string(process->pid_)},
                                       {"command", command},
                                       {"cwd", dir.string()}});
    return process;
}

void PtyProcess::SendLine(const std::string& text) {
    if (!IsRunning()) {
        throw ProcessNotRunningError("Process " + std::to_string(pid_) + " has already exited");
    }
    WriteAll(text + "\n");
}

void PtyProcess::SendEof() {
    if (!IsRunning()) {
        throw ProcessNotRunningError("Process " + std::to_string(pid_) + " has already exited");
    }
    WriteAll(std::string(1, ControlChar(master_fd_, VEOF, kDefaultEof)));
}

void PtyProcess::WriteAll(const std::string& bytes) {
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    std::size_t offset = 0;
    while (offset < bytes.size()) {
        const auto written = ::write(master_fd_, bytes.data() + offset, bytes.size() - offset);
        if (written > 0) {
            offset += static_cast<std::size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && errno == EAGAIN) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                throw Error("Timed out writing to process " + std::to_string(pid_));
            }
            pollfd pfd{master_fd_, POLLOUT, 0};
            ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            continue;
        }
        throw ProcessNotRunningError(ErrnoMessage("write to terminal failed"));
    }
}

ReadResult PtyProcess::ReadAvailable(std::chrono::milliseconds max_wait, std::size_t max_bytes) {
    ReadResult result;
    if (max_bytes == 0) {
        max_bytes = kDefaultMaxRead;
    }
    if (pending_.empty() && !terminal_closed_) {
        const auto deadline = std::chrono::steady_clock::now() + max_wait;
        bool first = true;
        while (pending_.size() < max_bytes) {
            int wait_ms = 0;
            if (first) {
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                wait_ms = static_cast<int>(std::max<long long>(0, remaining.count()));
            }
            pollfd pfd{master_fd_, POLLIN, 0};
            const int rc = ::poll(&pfd, 1, wait_ms);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "poll on terminal failed");
            }
            if (rc == 0) {
                // Silent terminal and a dead child: anything still holding the
                // slave open is an orphan, not the program.
                if (first && !IsRunning()) {
                    terminal_closed_ = true;
                }
                break;
            }
            char buffer[kReadChunk];
            const auto count = ::read(master_fd_, buffer, sizeof(buffer));
            if (count > 0) {
                pending_.append(buffer, static_cast<std::size_t>(count));
                first = false;
                // a program that never pauses must not pin the reader
                if (std::chrono::steady_clock::now() >= deadline) {
                    break;
                }
                continue;
            }
            if (count < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            // EIO once every slave descriptor is closed
            terminal_closed_ = true;
            WaitExit(terminate_grace_);
            break;
        }
    }

    if (pending_.size() <= max_bytes) {
        result.data.swap(pending_);
    } else {
        result.data = pending_.substr(0, max_bytes);
        pending_.erase(0, max_bytes);
    }
    result.end_of_stream = terminal_closed_ && pending_.empty() && result.data.empty();
    return result;
}

void PtyProcess::SignalInterrupt() {
    if (!IsRunning()) {
        return;
    }
    termios attrs{};
    if (::tcgetattr(master_fd_, &attrs) == 0 && (attrs.c_lflag & ISIG) == 0) {
        SignalGroup(SIGINT);
        return;
    }
    try {
        WriteAll(std::string(1, ControlChar(master_fd_, VINTR, kDefaultIntr)));
    } catch (const Error& ex) {
        utils::LogWarn("pty", "interrupt character not delivered, signalling group",
                       {{"pid", std::to_string(pid_)}, {"error", ex.what()}});
        SignalGroup(SIGINT);
    }
}

bool PtyProcess::Terminate(bool force) {
    if (!impl_ || !IsRunning()) {
        return true;
    }
    if (!force) {
        SignalGroup(SIGHUP);
        SignalGroup(SIGCONT);
        SignalGroup(SIGTERM);
        if (WaitExit(terminate_grace_)) {
            return true;
        }
    }
    SignalGroup(SIGKILL);
    const bool exited = WaitExit(std::max(terminate_grace_, std::chrono::milliseconds(1000)));
    if (!exited) {
        utils::LogError("pty", "process survived SIGKILL", {{"pid", std::to_string(pid_)}});
    }
    return exited;
}

bool PtyProcess::IsRunning() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return RefreshLocked();
}

std::optional<int> PtyProcess::ExitStatus() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    RefreshLocked();
    return exit_status_;
}

bool PtyProcess::RefreshLocked() {
    if (exit_status_.has_value() || !impl_) {
        return false;
    }
    std::error_code ec;
    const bool running = impl_->child.running(ec);
    if (ec) {
        utils::LogWarn("pty", "lost track of child", {{"pid", std::to_string(pid_)}, {"error", ec.message()}});
        exit_status_ = -1;
        return false;
    }
    if (!running) {
        exit_status_ = DecodeStatus(impl_->child.native_exit_code());
    }
    return running;
}

void PtyProcess::SignalGroup(int signal) {
    if (pid_ <= 0) {
        return;
    }
    if (::kill(-pid_, signal) != 0) {
        ::kill(pid_, signal);
    }
}

bool PtyProcess::WaitExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (IsRunning()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

void PtyProcess::CloseMaster() {
    if (master_fd_ >= 0) {
        ::close(master_fd_);
        master_fd_ = -1;
    }
}

}  // namespace shellbox::pty
