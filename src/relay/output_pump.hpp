#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace shellbox::pty {
class PtyProcess;
}

namespace shellbox::relay {

// Push-style relay: a background thread forwards every chunk the process
// prints to the sink as soon as it arrives. The sink runs on that thread.
class OutputPump {
public:
    using Sink = std::function<void(const std::string& chunk, bool end_of_stream)>;

    static constexpr const char* kEndSentinel = "[process ended]";

    OutputPump(std::unique_ptr<pty::PtyProcess> process,
               Sink sink,
               std::chrono::milliseconds read_interval = std::chrono::milliseconds(100));
    ~OutputPump();

    OutputPump(const OutputPump&) = delete;
    OutputPump& operator=(const OutputPump&) = delete;

    void Start();
    // Joins the reader and force terminates the process. Safe to call twice.
    void Stop();

    // Throws ProcessNotRunningError once the process has exited.
    void SendLine(const std::string& text);
    void Interrupt();

    bool Finished() const { return finished_.load(); }
    pty::PtyProcess& Process() { return *process_; }

private:
    void RunLoop();
    void Deliver(const std::string& chunk, bool end_of_stream);

    std::unique_ptr<pty::PtyProcess> process_;
    Sink sink_;
    std::chrono::milliseconds read_interval_;
    std::atomic<bool> running_{false};
    std::atomic<bool> finished_{false};
    std::thread worker_;
};

}  // namespace shellbox::relay
