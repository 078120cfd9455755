#include "sandbox/safety_policy.hpp"

#include <algorithm>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace shellbox::sandbox {

std::string CommandPolicy::Rejection(const std::string& command) const {
    std::ostringstream oss;
    oss << "The command you executed is not allowed in sandbox mode (" << Name()
        << " policy): '" << command << "'; Safe command list: ["
        << utils::Join(AllowList(), ", ") << "]";
    return oss.str();
}

SubstringCommandPolicy::SubstringCommandPolicy(std::vector<std::string> fragments)
    : fragments_(std::move(fragments)) {}

bool SubstringCommandPolicy::IsAllowed(const std::string& command) const {
    const bool allowed = std::any_of(fragments_.begin(), fragments_.end(), [&](const std::string& fragment) {
        return !fragment.empty() && command.find(fragment) != std::string::npos;
    });
    utils::LogDebug("sandbox", "command check", {{"policy", Name()}, {"command", command},
                                                 {"allowed", allowed ? "true" : "false"}});
    return allowed;
}

FirstTokenCommandPolicy::FirstTokenCommandPolicy(std::vector<std::string> names)
    : names_(std::move(names)) {}

bool FirstTokenCommandPolicy::IsAllowed(const std::string& command) const {
    auto program = utils::ProgramToken(command);
    const auto slash = program.rfind('/');
    if (slash != std::string::npos) {
        program = program.substr(slash + 1);
    }
    const bool allowed = !program.empty() &&
        std::find(names_.begin(), names_.end(), program) != names_.end();
    utils::LogDebug("sandbox", "command check", {{"policy", Name()}, {"command", command},
                                                 {"allowed", allowed ? "true" : "false"}});
    return allowed;
}

std::shared_ptr<const CommandPolicy> MakeCommandPolicy(const config::SandboxConfig& config) {
    if (config.command_match == "first_token") {
        return std::make_shared<FirstTokenCommandPolicy>(config.safe_commands);
    }
    if (config.command_match != "substring") {
        utils::LogWarn("sandbox", "unknown command matcher, using substring",
                       {{"commandMatch", config.command_match}});
    }
    return std::make_shared<SubstringCommandPolicy>(config.safe_commands);
}

std::filesystem::path ResolvePath(const std::string& path) {
    if (path.empty()) {
        return {};
    }
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return {};
    }
    auto resolved = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return {};
    }
    return resolved.lexically_normal();
}

bool IsWithin(const std::filesystem::path& path, const std::filesystem::path& root) {
    if (path.empty() || root.empty()) {
        return false;
    }
    auto path_it = path.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it) {
        // a trailing separator yields an empty final element
        if (root_it->empty()) {
            continue;
        }
        if (path_it == path.end() || *path_it != *root_it) {
            return false;
        }
        ++path_it;
    }
    return true;
}

PathPolicy::PathPolicy(const config::SandboxConfig& config)
    : workspace_root_(ResolvePath(config.workspace_dir))
    , scratch_root_(ResolvePath(config.scratch_dir))
    , enable_path_restriction_(config.enable_path_restriction)
    , sandbox_mode_(config.sandbox_mode) {
    for (int i = 1; i <= config.report_slots; ++i) {
        write_roots_.push_back(workspace_root_ / std::to_string(i) / "reports");
    }
}

bool PathPolicy::IsPathAllowedForWrite(const std::string& path) const {
    if (!enable_path_restriction_) {
        return true;
    }
    const auto resolved = ResolvePath(path);
    bool allowed = false;
    if (!resolved.empty() && !workspace_root_.empty()) {
        allowed = std::any_of(write_roots_.begin(), write_roots_.end(), [&](const std::filesystem::path& root) {
            return IsWithin(resolved, root);
        });
    }
    utils::LogDebug("sandbox", "write path check", {{"path", path},
                                                    {"allowed_paths", (workspace_root_ / "*" / "reports").string()},
                                                    {"allowed", allowed ? "true" : "false"}});
    return allowed;
}

bool PathPolicy::IsPathAllowedForRead(const std::string& path) const {
    if (path.empty()) {
        return false;
    }
    if (!std::filesystem::path(path).is_absolute()) {
        return true;
    }
    const auto resolved = ResolvePath(path);
    bool allowed = false;
    if (resolved.empty()) {
        allowed = false;
    } else if (IsWithin(resolved, scratch_root_)) {
        allowed = true;
    } else if (!sandbox_mode_) {
        allowed = true;
    } else {
        allowed = IsWithin(resolved, workspace_root_);
    }
    utils::LogDebug("sandbox", "read path check", {{"path", path},
                                                   {"allowed_paths", workspace_root_.string()},
                                                   {"allowed", allowed ? "true" : "false"}});
    return allowed;
}

}  // namespace shellbox::sandbox
