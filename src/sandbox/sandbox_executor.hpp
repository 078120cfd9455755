#pragma once

#include <chrono>
#include <string>

#include "sandbox/safety_policy.hpp"

namespace shellbox::sandbox {

struct ExecResult {
    int exit_code = -1;
    bool timed_out = false;
    bool blocked = false;
    std::string output;
    std::string error;
};

class SandboxExecutor {
public:
    // A null policy runs anything.
    static ExecResult Run(const std::string& command,
                          const std::string& working_dir,
                          std::chrono::seconds timeout,
                          const CommandPolicy* policy = nullptr);
};

}  // namespace shellbox::sandbox
