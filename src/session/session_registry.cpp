#include "session/session_registry.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <utility>

#include "nlohmann/json.hpp"
#include "pty/pty_process.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace shellbox::session {
namespace {

StepResult ErrorResult(const std::string& session_id, const std::string& error, bool finished) {
    StepResult result;
    result.session_id = session_id;
    result.error = error;
    result.finished = finished;
    return result;
}

bool StartsWith(const std::string& value, const std::string& prefix) {
    return !prefix.empty() && value.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

std::string StepResult::ToJson() const {
    nlohmann::json json = {
        {"session_id", session_id},
        {"output", output},
        {"waiting", waiting},
        {"finished", finished}
    };
    if (!error.empty()) {
        json["error"] = error;
    }
    // terminal output is not guaranteed to be valid UTF-8
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Session::Session(std::string id, std::string command, std::unique_ptr<pty::PtyProcess> process)
    : id_(std::move(id))
    , command_(std::move(command))
    , created_at_(utils::Now())
    , last_activity_(created_at_)
    , process_(std::move(process)) {}

Session::~Session() {
    Dispose();
}

void Session::Touch() {
    last_activity_ = utils::Now();
}

void Session::Dispose() {
    if (disposed_) {
        return;
    }
    disposed_ = true;
    if (process_) {
        process_->Terminate(true);
    }
}

SessionInfo Session::Info() const {
    SessionInfo info;
    info.id = id_;
    info.command = command_;
    info.created_at = utils::ToIso(created_at_);
    info.last_activity = utils::ToIso(last_activity_);
    info.interpreter_mode = interpreter_mode_;
    return info;
}

SessionRegistry::SessionRegistry(config::SandboxConfig sandbox, config::SessionConfig session)
    : SessionRegistry(sandbox, session, sandbox::MakeCommandPolicy(sandbox)) {}

SessionRegistry::SessionRegistry(config::SandboxConfig sandbox,
                                 config::SessionConfig session,
                                 std::shared_ptr<const sandbox::CommandPolicy> policy)
    : sandbox_(std::move(sandbox))
    , config_(std::move(session))
    , policy_(std::move(policy))
    , relay_(relay::RelayOptions::FromConfig(config_)) {}

SessionRegistry::~SessionRegistry() {
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [id, session] : sessions) {
        std::lock_guard<std::mutex> session_lock(session->Mutex());
        session->Dispose();
    }
}

std::string SessionRegistry::Start(const std::string& command, const std::string& session_id) {
    const auto cmd = utils::Trim(command).empty() ? config_.default_command : command;
    if (sandbox_.sandbox_mode && !policy_->IsAllowed(cmd)) {
        utils::LogWarn("session", "start rejected", {{"command", cmd}, {"policy", policy_->Name()}});
        throw SafetyViolationError(policy_->Rejection(cmd));
    }

    std::string id = session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (id.empty()) {
            do {
                id = utils::GenerateId();
            } while (sessions_.count(id) > 0);
        } else if (sessions_.count(id) > 0) {
            throw SessionExistsError(id);
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(sandbox_.workspace_dir, ec);
    if (ec) {
        utils::LogWarn("session", "cannot create workspace", {{"path", sandbox_.workspace_dir},
                                                              {"error", ec.message()}});
    }

    pty::SpawnOptions options;
    options.term = config_.term;
    auto process = pty::PtyProcess::Spawn(cmd, sandbox_.workspace_dir,
                                          std::chrono::seconds(std::max(1, config_.spawn_timeout_s)),
                                          options);
    auto session = std::make_shared<Session>(id, cmd, std::move(process));

    std::lock_guard<std::mutex> lock(mutex_);
    // the id may have been claimed while spawning
    if (!sessions_.emplace(id, session).second) {
        throw SessionExistsError(id);
    }
    utils::LogInfo("session", "started", {{"id", id},
                                          {"command", cmd},
                                          {"pid", std::to_string(session->Process().Pid())}});
    return id;
}

StepResult SessionRegistry::StartSession(const std::string& command, const std::string& session_id) {
    std::string id;
    try {
        id = Start(command, session_id);
    } catch (const std::exception& ex) {
        utils::LogWarn("session", "start failed", {{"command", command}, {"error", ex.what()}});
        return ErrorResult(session_id, ex.what(), true);
    }
    return Step(id);
}

StepResult SessionRegistry::Step(const std::string& session_id, const std::optional<std::string>& input) {
    auto session = Find(session_id);
    if (!session) {
        return ErrorResult(session_id, SessionNotFoundError(session_id).what(), true);
    }

    std::unique_lock<std::mutex> session_lock(session->Mutex());
    if (session->Disposed()) {
        return ErrorResult(session_id, SessionNotFoundError(session_id).what(), true);
    }
    session->Touch();

    StepResult result;
    result.session_id = session_id;
    try {
        if (input) {
            const bool exit_command = std::find(config_.exit_commands.begin(), config_.exit_commands.end(),
                                                *input) != config_.exit_commands.end();
            if (session->InterpreterMode() && !exit_command && !policy_->IsAllowed(*input)) {
                utils::LogWarn("session", "input rejected", {{"id", session_id}, {"policy", policy_->Name()}});
                return ErrorResult(session_id, policy_->Rejection(*input), false);
            }
            UpdateInterpreterMode(*session, *input);
            try {
                session->Process().SendLine(*input);
            } catch (const ProcessNotRunningError& ex) {
                // still hand back whatever the program printed before exiting
                utils::LogInfo("session", "input after exit", {{"id", session_id}});
                result.error = ex.what();
            }
        }
        auto drained = relay_.Drain(session->Process());
        result.output = std::move(drained.output);
        result.waiting = drained.waiting;
        result.finished = drained.ended;
    } catch (const std::exception& ex) {
        utils::LogWarn("session", "step failed", {{"id", session_id}, {"error", ex.what()}});
        session->Dispose();
        session_lock.unlock();
        Remove(session_id, session);
        return ErrorResult(session_id, ex.what(), true);
    }

    if (result.finished) {
        const auto status = session->Process().ExitStatus();
        utils::LogInfo("session", "finished", {{"id", session_id},
                                               {"exit_code", std::to_string(status.value_or(-1))}});
        session->Dispose();
        session_lock.unlock();
        Remove(session_id, session);
    }
    return result;
}

void SessionRegistry::UpdateInterpreterMode(Session& session, const std::string& input) const {
    const auto& exits = config_.exit_commands;
    if (std::find(exits.begin(), exits.end(), input) != exits.end()) {
        session.SetInterpreterMode(false);
        return;
    }
    const auto& prefixes = config_.interpreter_prefixes;
    if (std::any_of(prefixes.begin(), prefixes.end(), [&](const std::string& prefix) {
            return StartsWith(input, prefix);
        })) {
        session.SetInterpreterMode(true);
    }
}

bool SessionRegistry::Kill(const std::string& session_id) {
    auto session = Remove(session_id);
    if (!session) {
        utils::LogDebug("session", "kill of unknown session", {{"id", session_id}});
        return false;
    }
    return Kill(session_id, session);
}

bool SessionRegistry::Kill(const std::string& session_id, const std::shared_ptr<Session>& session) {
    // waits for an in-flight step
    std::lock_guard<std::mutex> session_lock(session->Mutex());
    const bool was_live = !session->Disposed();
    session->Dispose();
    utils::LogInfo("session", "killed", {{"id", session_id}});
    return was_live;
}

std::size_t SessionRegistry::ReapIdle(std::chrono::seconds max_idle) {
    std::vector<std::pair<std::string, std::shared_ptr<Session>>> idle;
    const auto cutoff = utils::Now() - max_idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            // a session busy with a step is not idle
            std::unique_lock<std::mutex> session_lock(session->Mutex(), std::try_to_lock);
            if (session_lock.owns_lock() && session->LastActivity() < cutoff) {
                idle.emplace_back(id, session);
            }
        }
    }
    std::size_t reaped = 0;
    for (const auto& [id, session] : idle) {
        if (Remove(id, session) && Kill(id, session)) {
            ++reaped;
        }
    }
    if (reaped > 0) {
        utils::LogInfo("session", "reaped idle sessions", {{"count", std::to_string(reaped)}});
    }
    return reaped;
}

std::vector<SessionInfo> SessionRegistry::ListSessions() const {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            sessions.push_back(session);
        }
    }
    std::vector<SessionInfo> infos;
    for (const auto& session : sessions) {
        std::lock_guard<std::mutex> session_lock(session->Mutex());
        infos.push_back(session->Info());
    }
    std::sort(infos.begin(), infos.end(), [](const SessionInfo& a, const SessionInfo& b) {
        return a.created_at < b.created_at || (a.created_at == b.created_at && a.id < b.id);
    });
    return infos;
}

bool SessionRegistry::Has(const std::string& session_id) const {
    return Find(session_id) != nullptr;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::shared_ptr<Session> SessionRegistry::Find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<Session> SessionRegistry::Remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    auto session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

bool SessionRegistry::Remove(const std::string& session_id, const std::shared_ptr<Session>& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    // the id may already belong to a newer session
    if (it == sessions_.end() || it->second != session) {
        return false;
    }
    sessions_.erase(it);
    return true;
}

}  // namespace shellbox::session
