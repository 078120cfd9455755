#include "relay/output_pump.hpp"

#include <exception>

#include "pty/pty_process.hpp"
#include "utils/logging.hpp"

namespace shellbox::relay {

OutputPump::OutputPump(std::unique_ptr<pty::PtyProcess> process,
                       Sink sink,
                       std::chrono::milliseconds read_interval)
    : process_(std::move(process))
    , sink_(std::move(sink))
    , read_interval_(read_interval) {}

OutputPump::~OutputPump() {
    Stop();
}

void OutputPump::Start() {
    if (!process_ || finished_.load() || running_.exchange(true)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_ = std::thread([this]() { RunLoop(); });
}

void OutputPump::Stop() {
    running_.store(false);
    if (worker_.joinable()) {
        worker_.join();
    }
    if (process_ && process_->IsRunning()) {
        utils::LogInfo("pump", "stopping live process", {{"pid", std::to_string(process_->Pid())}});
        process_->Terminate(true);
    }
}

void OutputPump::SendLine(const std::string& text) {
    process_->SendLine(text);
}

void OutputPump::Interrupt() {
    process_->SignalInterrupt();
}

void OutputPump::RunLoop() {
    while (running_.load()) {
        pty::ReadResult chunk;
        try {
            chunk = process_->ReadAvailable(read_interval_);
        } catch (const std::exception& ex) {
            utils::LogError("pump", "read failed", {{"pid", std::to_string(process_->Pid())},
                                                    {"error", ex.what()}});
            chunk.end_of_stream = true;
        }
        if (!chunk.data.empty()) {
            Deliver(chunk.data, false);
        }
        if (chunk.end_of_stream) {
            finished_.store(true);
            Deliver(kEndSentinel, true);
            break;
        }
    }
    running_.store(false);
}

void OutputPump::Deliver(const std::string& chunk, bool end_of_stream) {
    if (!sink_) {
        return;
    }
    try {
        sink_(chunk, end_of_stream);
    } catch (const std::exception& ex) {
        utils::LogError("pump", "sink failed", {{"pid", std::to_string(process_->Pid())},
                                                {"error", ex.what()}});
    }
}

}  // namespace shellbox::relay
