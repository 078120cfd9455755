#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace shellbox::pty {

struct SpawnOptions {
    std::string term = "dumb";
    unsigned short rows = 24;
    unsigned short cols = 80;
    std::chrono::milliseconds terminate_grace{500};
};

struct ReadResult {
    std::string data;
    bool end_of_stream = false;
};

// One child process attached to a pseudo-terminal. The child runs in its own
// session with the terminal as controlling tty, so interrupt characters and
// group signals reach everything it starts.
//
// Not safe for concurrent reads; one reader and one writer may run in
// parallel.
class PtyProcess {
public:
    // Throws SpawnError when the working directory or executable is invalid.
    static std::unique_ptr<PtyProcess> Spawn(const std::string& command,
                                             const std::string& working_dir,
                                             std::chrono::milliseconds timeout,
                                             const SpawnOptions& options = {});
    ~PtyProcess();

    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;

    // Throws ProcessNotRunningError once the process has exited.
    void SendLine(const std::string& text);
    void SendEof();

    ReadResult ReadAvailable(std::chrono::milliseconds max_wait,
                             std::size_t max_bytes = kDefaultMaxRead);
    ReadResult ReadAvailable() { return ReadAvailable(timeout_); }

    void SignalInterrupt();
    // Returns true when the process is gone afterwards.
    bool Terminate(bool force);

    bool IsRunning();
    std::optional<int> ExitStatus();
    int Pid() const { return pid_; }
    const std::string& Command() const { return command_; }
    std::chrono::milliseconds DefaultTimeout() const { return timeout_; }

    static constexpr std::size_t kDefaultMaxRead = 64 * 1024;

private:
    struct Impl;

    PtyProcess(std::string command, std::chrono::milliseconds timeout,
               std::chrono::milliseconds terminate_grace);

    void WriteAll(const std::string& bytes);
    void SignalGroup(int signal);
    bool WaitExit(std::chrono::milliseconds timeout);
    bool RefreshLocked();
    void CloseMaster();

    std::string command_;
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds terminate_grace_;
    int master_fd_ = -1;
    int pid_ = -1;
    bool terminal_closed_ = false;
    std::string pending_;
    std::unique_ptr<Impl> impl_;
    std::mutex state_mutex_;
    std::optional<int> exit_status_;
};

}  // namespace shellbox::pty
