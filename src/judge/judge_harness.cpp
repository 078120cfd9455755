#include "judge/judge_harness.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>

#include "judge/transcript_log.hpp"
#include "pty/pty_process.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace shellbox::judge {
namespace {

constexpr std::size_t kTailBytes = 2000;

// Reads until `period` has elapsed, whatever the program does.
void CaptureFor(pty::PtyProcess& process,
                std::chrono::milliseconds period,
                TranscriptLog& transcript,
                std::string& output) {
    const auto deadline = std::chrono::steady_clock::now() + period;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return;
        }
        const auto chunk = process.ReadAvailable(remaining);
        if (!chunk.data.empty()) {
            transcript.AddProgramOutput(chunk.data);
            output += chunk.data;
        }
        if (chunk.end_of_stream) {
            return;
        }
    }
}

std::string Tail(const std::string& text) {
    if (text.size() <= kTailBytes) {
        return text;
    }
    return text.substr(text.size() - kTailBytes);
}

struct SentLine {
    std::size_t offset = 0;
    std::string text;
};

// Drops the terminal's echo of each sent line, searching from where the line
// was sent, so only what the program printed itself remains.
std::string WithoutEchoes(const std::string& output, const std::vector<SentLine>& sent) {
    std::string own;
    std::size_t cursor = 0;
    for (const auto& line : sent) {
        if (line.text.empty()) {
            continue;
        }
        const auto pos = output.find(line.text, std::max(cursor, line.offset));
        if (pos == std::string::npos) {
            continue;
        }
        auto end = pos + line.text.size();
        if (output.compare(end, 2, "\r\n") == 0) {
            end += 2;
        }
        own.append(output, cursor, pos - cursor);
        cursor = end;
    }
    own.append(output, cursor, std::string::npos);
    return own;
}

std::filesystem::path ResolveAgainst(const std::string& path, const std::string& working_dir) {
    std::filesystem::path resolved(path);
    if (resolved.is_relative() && !working_dir.empty()) {
        resolved = std::filesystem::path(working_dir) / resolved;
    }
    return resolved;
}

}  // namespace

std::vector<std::string> ReadInputLines(const std::string& input_file) {
    std::ifstream input(input_file);
    if (!input.is_open()) {
        throw JudgeInputFileMissing(input_file);
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

JudgeHarness::JudgeHarness(config::JudgeConfig config, config::SessionConfig session)
    : config_(std::move(config))
    , session_(std::move(session))
    , escalation_(EscalationPolicy::FromConfig(config_)) {}

JudgeResult JudgeHarness::RunWithInputFile(const std::string& entry_command,
                                           const std::optional<std::string>& input_file,
                                           const std::string& working_dir) const {
    std::vector<std::string> lines;
    if (input_file && !input_file->empty()) {
        const auto path = ResolveAgainst(*input_file, working_dir);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            JudgeResult result;
            result.error = JudgeInputFileMissing(*input_file).what();
            utils::LogWarn("judge", "input file missing", {{"path", path.string()}});
            return result;
        }
        try {
            lines = ReadInputLines(path.string());
        } catch (const Error& ex) {
            JudgeResult result;
            result.error = ex.what();
            return result;
        }
    }
    return Run(entry_command, lines, working_dir);
}

JudgeResult JudgeHarness::Run(const std::string& entry_command,
                              const std::vector<std::string>& input_lines,
                              const std::string& working_dir) const {
    JudgeResult result;
    TranscriptLog transcript;
    utils::LogInfo("judge", "run", {{"command", entry_command},
                                    {"cwd", working_dir},
                                    {"lines", std::to_string(input_lines.size())}});

    std::unique_ptr<pty::PtyProcess> process;
    try {
        pty::SpawnOptions options;
        options.term = session_.term;
        process = pty::PtyProcess::Spawn(entry_command, working_dir,
                                         std::chrono::seconds(std::max(1, session_.spawn_timeout_s)),
                                         options);
    } catch (const Error& ex) {
        result.error = ex.what();
        utils::LogWarn("judge", "spawn failed", {{"command", entry_command}, {"error", ex.what()}});
        return result;
    }

    std::vector<SentLine> sent;
    try {
        CaptureFor(*process, std::chrono::milliseconds(config_.startup_delay_ms), transcript, result.output);
        for (const auto& line : input_lines) {
            transcript.AddUserLine(line);
            try {
                process->SendLine(line);
            } catch (const ProcessNotRunningError&) {
                utils::LogInfo("judge", "program exited before all input was sent",
                               {{"command", entry_command}});
                break;
            }
            sent.push_back({result.output.size(), line});
            CaptureFor(*process, std::chrono::milliseconds(config_.inter_line_delay_ms),
                       transcript, result.output);
        }
        if (config_.close_input && process->IsRunning()) {
            process->SendEof();
        }

        EscalationHooks hooks;
        hooks.on_output = [&](const std::string& chunk) {
            transcript.AddProgramOutput(chunk);
            result.output += chunk;
        };
        hooks.on_interrupt = [&]() { transcript.AddInterrupt(); };
        const auto outcome = escalation_.Await(*process, hooks);
        result.exit_code = outcome.exit_code;
        result.interrupted = outcome.interrupted;

        // classification sees the complete capture minus echoed input
        EscalationOutcome captured = outcome;
        captured.output = WithoutEchoes(result.output, sent);
        result.success = escalation_.IsSuccess(captured);
        if (!result.success) {
            if (outcome.state == EscalationState::kKilled) {
                result.error = "The program did not end normally, Ctrl+C was sent to force interrupt.";
            } else {
                result.error = "Program exit status code: " + std::to_string(outcome.exit_code.value_or(-1)) +
                               "\nLast output: " + Tail(result.output);
            }
        }
        utils::LogInfo("judge", "verdict", {{"command", entry_command},
                                            {"state", ToString(outcome.state)},
                                            {"exit_code", std::to_string(outcome.exit_code.value_or(-1))},
                                            {"success", result.success ? "true" : "false"}});
    } catch (const std::exception& ex) {
        result.success = false;
        result.error = std::string("Judge run failed: ") + ex.what();
        utils::LogError("judge", "run failed", {{"command", entry_command}, {"error", ex.what()}});
        process->Terminate(true);
    }

    transcript.Close();
    result.log = transcript.Render();
    if (!config_.log_path.empty()) {
        transcript.WriteTo(ResolveAgainst(config_.log_path, working_dir));
    }
    return result;
}

}  // namespace shellbox::judge
