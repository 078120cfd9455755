#pragma once

#include <stdexcept>
#include <string>

namespace shellbox {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The executable could not be located or the working directory is invalid.
class SpawnError : public Error {
public:
    using Error::Error;
};

// Input was sent to a process that has already exited.
class ProcessNotRunningError : public Error {
public:
    using Error::Error;
};

class SessionNotFoundError : public Error {
public:
    explicit SessionNotFoundError(const std::string& session_id)
        : Error("Session " + session_id + " not found") {}
};

class SessionExistsError : public Error {
public:
    explicit SessionExistsError(const std::string& session_id)
        : Error("Session " + session_id + " already exists") {}
};

// A command or path was rejected by the sandbox policy.
class SafetyViolationError : public Error {
public:
    using Error::Error;
};

class JudgeInputFileMissing : public Error {
public:
    explicit JudgeInputFileMissing(const std::string& path)
        : Error("Input file " + path + " does not exist, please check the path and call again.") {}
};

}  // namespace shellbox
