#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace shellbox::pty {
class PtyProcess;
}

namespace shellbox::judge {

enum class EscalationState {
    kRunning,
    kInterrupting,
    kFinished,
    kKilled
};

const char* ToString(EscalationState state);

struct EscalationOutcome {
    EscalationState state = EscalationState::kRunning;
    std::optional<int> exit_code;
    bool interrupted = false;
    // everything read while waiting
    std::string output;
};

struct EscalationHooks {
    std::function<void(const std::string&)> on_output;
    std::function<void()> on_interrupt;
};

class EscalationPolicy {
public:
    EscalationPolicy(std::chrono::milliseconds primary_timeout,
                     std::chrono::milliseconds grace_period,
                     std::vector<std::string> accepted_markers = {"KeyboardInterrupt", "keyboardInterrupt"});

    static EscalationPolicy FromConfig(const config::JudgeConfig& config);

    // Waits for the process to end on its own, then interrupts it, then kills
    // it. Output keeps being drained during every wait.
    EscalationOutcome Await(pty::PtyProcess& process, const EscalationHooks& hooks = {}) const;

    // Call only once output capture is complete.
    bool IsSuccess(const EscalationOutcome& outcome) const;

    std::chrono::milliseconds PrimaryTimeout() const { return primary_timeout_; }
    std::chrono::milliseconds GracePeriod() const { return grace_period_; }

private:
    bool WaitForEnd(pty::PtyProcess& process,
                    std::chrono::milliseconds limit,
                    EscalationOutcome& outcome,
                    const EscalationHooks& hooks) const;

    std::chrono::milliseconds primary_timeout_;
    std::chrono::milliseconds grace_period_;
    std::vector<std::string> accepted_markers_;
};

}  // namespace shellbox::judge
