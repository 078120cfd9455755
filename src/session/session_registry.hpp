#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "relay/output_relay.hpp"
#include "sandbox/safety_policy.hpp"

namespace shellbox::pty {
class PtyProcess;
}

namespace shellbox::session {

struct StepResult {
    std::string session_id;
    std::string output;
    bool waiting = false;
    bool finished = false;
    std::string error;

    std::string ToJson() const;
};

struct SessionInfo {
    std::string id;
    std::string command;
    std::string created_at;
    std::string last_activity;
    bool interpreter_mode = false;
};

class Session {
public:
    Session(std::string id, std::string command, std::unique_ptr<pty::PtyProcess> process);
    ~Session();

    const std::string& Id() const { return id_; }
    const std::string& Command() const { return command_; }
    std::chrono::system_clock::time_point CreatedAt() const { return created_at_; }
    std::chrono::system_clock::time_point LastActivity() const { return last_activity_; }
    bool InterpreterMode() const { return interpreter_mode_; }

    void Touch();
    void SetInterpreterMode(bool value) { interpreter_mode_ = value; }
    pty::PtyProcess& Process() { return *process_; }
    bool Disposed() const { return disposed_; }
    void Dispose();

    SessionInfo Info() const;

    // Serializes steps and disposal on this session.
    std::mutex& Mutex() { return mutex_; }

private:
    std::string id_;
    std::string command_;
    std::chrono::system_clock::time_point created_at_;
    std::chrono::system_clock::time_point last_activity_;
    bool interpreter_mode_ = false;
    bool disposed_ = false;
    std::unique_ptr<pty::PtyProcess> process_;
    std::mutex mutex_;
};

// Live interactive sessions keyed by id. The map lock is held only for
// lookups and updates; draining happens under the session's own lock.
class SessionRegistry {
public:
    SessionRegistry(config::SandboxConfig sandbox, config::SessionConfig session);
    SessionRegistry(config::SandboxConfig sandbox,
                    config::SessionConfig session,
                    std::shared_ptr<const sandbox::CommandPolicy> policy);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Throws SafetyViolationError, SessionExistsError or SpawnError.
    std::string Start(const std::string& command, const std::string& session_id = {});
    // Start() plus the first output; errors are reported in the result.
    StepResult StartSession(const std::string& command, const std::string& session_id = {});
    StepResult Step(const std::string& session_id, const std::optional<std::string>& input = std::nullopt);
    // Returns whether a live session was found.
    bool Kill(const std::string& session_id);
    std::size_t ReapIdle(std::chrono::seconds max_idle);
    std::vector<SessionInfo> ListSessions() const;
    bool Has(const std::string& session_id) const;
    std::size_t Size() const;

    const sandbox::CommandPolicy& Policy() const { return *policy_; }

private:
    std::shared_ptr<Session> Find(const std::string& session_id) const;
    std::shared_ptr<Session> Remove(const std::string& session_id);
    bool Remove(const std::string& session_id, const std::shared_ptr<Session>& session);
    bool Kill(const std::string& session_id, const std::shared_ptr<Session>& session);
    void UpdateInterpreterMode(Session& session, const std::string& input) const;

    config::SandboxConfig sandbox_;
    config::SessionConfig config_;
    std::shared_ptr<const sandbox::CommandPolicy> policy_;
    relay::OutputRelay relay_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    mutable std::mutex mutex_;
};

}  // namespace shellbox::session
