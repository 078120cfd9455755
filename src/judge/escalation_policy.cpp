#include "judge/escalation_policy.hpp"

#include <algorithm>
#include <thread>

#include "pty/pty_process.hpp"
#include "utils/logging.hpp"

namespace shellbox::judge {
namespace {

constexpr std::chrono::milliseconds kReadSlice{100};
constexpr int kInterruptExitCode = 130;

}  // namespace

const char* ToString(EscalationState state) {
    switch (state) {
        case EscalationState::kRunning: return "running";
        case EscalationState::kInterrupting: return "interrupting";
        case EscalationState::kFinished: return "finished";
        case EscalationState::kKilled: return "killed";
    }
    return "unknown";
}

EscalationPolicy::EscalationPolicy(std::chrono::milliseconds primary_timeout,
                                   std::chrono::milliseconds grace_period,
                                   std::vector<std::string> accepted_markers)
    : primary_timeout_(primary_timeout)
    , grace_period_(grace_period)
    , accepted_markers_(std::move(accepted_markers)) {}

EscalationPolicy EscalationPolicy::FromConfig(const config::JudgeConfig& config) {
    return EscalationPolicy(std::chrono::milliseconds(std::max(0, config.primary_timeout_ms)),
                            std::chrono::milliseconds(std::max(0, config.grace_ms)),
                            config.interrupt_markers);
}

bool EscalationPolicy::WaitForEnd(pty::PtyProcess& process,
                                  std::chrono::milliseconds limit,
                                  EscalationOutcome& outcome,
                                  const EscalationHooks& hooks) const {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }
        const auto chunk = process.ReadAvailable(std::min(kReadSlice, remaining));
        if (!chunk.data.empty()) {
            outcome.output += chunk.data;
            if (hooks.on_output) {
                hooks.on_output(chunk.data);
            }
        }
        if (chunk.end_of_stream) {
            break;
        }
    }
    // The terminal can close before the child is reaped.
    while (process.IsRunning()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

EscalationOutcome EscalationPolicy::Await(pty::PtyProcess& process, const EscalationHooks& hooks) const {
    EscalationOutcome outcome;
    const auto pid = std::to_string(process.Pid());

    if (WaitForEnd(process, primary_timeout_, outcome, hooks)) {
        outcome.state = EscalationState::kFinished;
        outcome.exit_code = process.ExitStatus();
        return outcome;
    }

    outcome.state = EscalationState::kInterrupting;
    outcome.interrupted = true;
    utils::LogWarn("escalation", "primary timeout elapsed, interrupting",
                   {{"pid", pid}, {"timeout_ms", std::to_string(primary_timeout_.count())}});
    if (hooks.on_interrupt) {
        hooks.on_interrupt();
    }
    process.SignalInterrupt();

    if (WaitForEnd(process, grace_period_, outcome, hooks)) {
        outcome.state = EscalationState::kFinished;
        outcome.exit_code = process.ExitStatus();
        utils::LogInfo("escalation", "process ended after interrupt",
                       {{"pid", pid}, {"exit_code", std::to_string(outcome.exit_code.value_or(-1))}});
        return outcome;
    }

    utils::LogWarn("escalation", "grace period elapsed, killing", {{"pid", pid}});
    process.Terminate(true);
    outcome.state = EscalationState::kKilled;
    outcome.exit_code = process.ExitStatus();
    return outcome;
}

bool EscalationPolicy::IsSuccess(const EscalationOutcome& outcome) const {
    if (outcome.state == EscalationState::kFinished && outcome.exit_code &&
        (*outcome.exit_code == 0 || *outcome.exit_code == kInterruptExitCode)) {
        return true;
    }
    return std::any_of(accepted_markers_.begin(), accepted_markers_.end(), [&](const std::string& marker) {
        return !marker.empty() && outcome.output.find(marker) != std::string::npos;
    });
}

}  // namespace shellbox::judge
