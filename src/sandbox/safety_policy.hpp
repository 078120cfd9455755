#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace shellbox::sandbox {

// Decides whether a command may be issued. Implementations must be stateless
// so one instance can be shared across sessions.
class CommandPolicy {
public:
    virtual ~CommandPolicy() = default;
    virtual std::string Name() const = 0;
    virtual bool IsAllowed(const std::string& command) const = 0;
    virtual const std::vector<std::string>& AllowList() const = 0;

    // Explanation returned to the caller when IsAllowed() is false.
    std::string Rejection(const std::string& command) const;
};

// Allows a command when any allow-listed fragment occurs anywhere in it.
// "rm -rf ./cache && ls" passes because it contains "ls".
class SubstringCommandPolicy : public CommandPolicy {
public:
    explicit SubstringCommandPolicy(std::vector<std::string> fragments);

    std::string Name() const override { return "substring"; }
    bool IsAllowed(const std::string& command) const override;
    const std::vector<std::string>& AllowList() const override { return fragments_; }

private:
    std::vector<std::string> fragments_;
};

// Allows a command only when its program name equals an allow-listed entry.
// Leading VAR=value assignments and directory prefixes are skipped.
class FirstTokenCommandPolicy : public CommandPolicy {
public:
    explicit FirstTokenCommandPolicy(std::vector<std::string> names);

    std::string Name() const override { return "first_token"; }
    bool IsAllowed(const std::string& command) const override;
    const std::vector<std::string>& AllowList() const override { return names_; }

private:
    std::vector<std::string> names_;
};

std::shared_ptr<const CommandPolicy> MakeCommandPolicy(const config::SandboxConfig& config);

class PathPolicy {
public:
    explicit PathPolicy(const config::SandboxConfig& config);

    bool IsPathAllowedForWrite(const std::string& path) const;
    bool IsPathAllowedForRead(const std::string& path) const;

    const std::filesystem::path& WorkspaceRoot() const { return workspace_root_; }
    const std::vector<std::filesystem::path>& WriteRoots() const { return write_roots_; }

private:
    std::filesystem::path workspace_root_;
    std::filesystem::path scratch_root_;
    std::vector<std::filesystem::path> write_roots_;
    bool enable_path_restriction_ = true;
    bool sandbox_mode_ = true;
};

// Canonical absolute form of path; symlinks in the existing prefix are
// resolved. Returns an empty path when the path cannot be resolved.
std::filesystem::path ResolvePath(const std::string& path);

// Component-wise containment; a path equal to root is inside it.
bool IsWithin(const std::filesystem::path& path, const std::filesystem::path& root);

}  // namespace shellbox::sandbox
