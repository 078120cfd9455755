#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "config/config_schema.hpp"

namespace shellbox::pty {
class PtyProcess;
}

namespace shellbox::relay {

struct RelayOptions {
    std::chrono::milliseconds quiescence{1000};
    std::chrono::milliseconds max_step{10000};
    std::size_t max_output_bytes = 64 * 1024;

    static RelayOptions FromConfig(const config::SessionConfig& config);
};

struct DrainResult {
    std::string output;
    // quiescent and the process is still alive
    bool waiting = false;
    // terminal closed and every byte delivered
    bool ended = false;
};

// Collects whatever a process prints until it goes quiet, ends, or one of the
// step limits is hit. Bytes beyond max_output_bytes stay buffered in the
// process for the next call.
class OutputRelay {
public:
    explicit OutputRelay(RelayOptions options = {});

    DrainResult Drain(pty::PtyProcess& process) const;

    const RelayOptions& Options() const { return options_; }

private:
    RelayOptions options_;
};

}  // namespace shellbox::relay
