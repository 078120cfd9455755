#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "judge/escalation_policy.hpp"

namespace shellbox::judge {

struct JudgeResult {
    bool success = false;
    std::string log;
    std::string error;
    std::string output;
    std::optional<int> exit_code;
    // the primary timeout elapsed and an interrupt was sent
    bool interrupted = false;
};

// Feeds a fixed list of input lines to a program on a terminal and decides
// whether the run passed. Never throws.
class JudgeHarness {
public:
    explicit JudgeHarness(config::JudgeConfig config, config::SessionConfig session = {});

    JudgeResult Run(const std::string& entry_command,
                    const std::vector<std::string>& input_lines,
                    const std::string& working_dir) const;

    // Input lines come from input_file, one per line. A relative input_file is
    // looked up in working_dir.
    JudgeResult RunWithInputFile(const std::string& entry_command,
                                 const std::optional<std::string>& input_file,
                                 const std::string& working_dir) const;

    const EscalationPolicy& Escalation() const { return escalation_; }

private:
    config::JudgeConfig config_;
    config::SessionConfig session_;
    EscalationPolicy escalation_;
};

// Reads input_file into lines with terminators removed.
std::vector<std::string> ReadInputLines(const std::string& input_file);

}  // namespace shellbox::judge
