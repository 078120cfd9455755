#include "relay/output_relay.hpp"

#include <algorithm>

#include "pty/pty_process.hpp"
#include "utils/logging.hpp"

namespace shellbox::relay {

RelayOptions RelayOptions::FromConfig(const config::SessionConfig& config) {
    RelayOptions options;
    options.quiescence = std::chrono::milliseconds(std::max(0, config.quiescence_ms));
    options.max_step = std::chrono::milliseconds(std::max(0, config.max_step_ms));
    options.max_output_bytes = static_cast<std::size_t>(std::max(1, config.max_output_bytes));
    return options;
}

OutputRelay::OutputRelay(RelayOptions options)
    : options_(options) {}

DrainResult OutputRelay::Drain(pty::PtyProcess& process) const {
    DrainResult result;
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + options_.max_step;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            utils::LogDebug("relay", "step cap reached", {{"pid", std::to_string(process.Pid())}});
            result.waiting = process.IsRunning();
            break;
        }
        const auto room = options_.max_output_bytes - result.output.size();
        auto chunk = process.ReadAvailable(std::min(options_.quiescence, remaining), room);
        if (chunk.end_of_stream) {
            result.ended = true;
            break;
        }
        if (chunk.data.empty()) {
            result.waiting = process.IsRunning();
            break;
        }
        result.output += chunk.data;
        if (result.output.size() >= options_.max_output_bytes) {
            utils::LogDebug("relay", "output cap reached", {{"pid", std::to_string(process.Pid())},
                                                            {"bytes", std::to_string(result.output.size())}});
            result.waiting = process.IsRunning();
            break;
        }
    }
    return result;
}

}  // namespace shellbox::relay
