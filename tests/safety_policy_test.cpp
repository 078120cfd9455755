#include <gtest/gtest.h>

#include "sandbox/safety_policy.hpp"
#include "test_support.hpp"

using shellbox::config::SandboxConfig;
using shellbox::sandbox::FirstTokenCommandPolicy;
using shellbox::sandbox::IsWithin;
using shellbox::sandbox::MakeCommandPolicy;
using shellbox::sandbox::PathPolicy;
using shellbox::sandbox::SubstringCommandPolicy;
using shellbox::testing::TempDir;

namespace {

SandboxConfig ConfigFor(const TempDir& dir) {
    SandboxConfig config;
    config.workspace_dir = (dir.Path() / "work").string();
    config.scratch_dir = (dir.Path() / "scratch").string();
    return config;
}

}  // namespace

TEST(PathPolicy, WriteAllowedOnlyUnderReportSlots) {
    TempDir dir;
    const PathPolicy policy(ConfigFor(dir));
    const auto ws = dir.Path() / "work";
    EXPECT_TRUE(policy.IsPathAllowedForWrite((ws / "7" / "reports" / "round1.jsonl").string()));
    EXPECT_TRUE(policy.IsPathAllowedForWrite((ws / "1" / "reports").string()));
    EXPECT_TRUE(policy.IsPathAllowedForWrite((ws / "50" / "reports" / "a" / "b.txt").string()));
    EXPECT_FALSE(policy.IsPathAllowedForWrite((ws / "7" / "src" / "main.py").string()));
    EXPECT_FALSE(policy.IsPathAllowedForWrite((ws / "51" / "reports" / "x").string()));
    EXPECT_FALSE(policy.IsPathAllowedForWrite((ws / "0" / "reports" / "x").string()));
    EXPECT_FALSE(policy.IsPathAllowedForWrite((ws / "1" / "reportsX" / "x").string()));
    EXPECT_FALSE(policy.IsPathAllowedForWrite("/etc/passwd"));
}

TEST(PathPolicy, WriteRejectsTraversalOutOfReports) {
    TempDir dir;
    const PathPolicy policy(ConfigFor(dir));
    const auto escaped = dir.Path() / "work" / "7" / "reports" / ".." / "src" / "main.py";
    EXPECT_FALSE(policy.IsPathAllowedForWrite(escaped.string()));
}

TEST(PathPolicy, WriteRespectsSlotCount) {
    TempDir dir;
    auto config = ConfigFor(dir);
    config.report_slots = 3;
    const PathPolicy policy(config);
    EXPECT_EQ(policy.WriteRoots().size(), 3u);
    EXPECT_TRUE(policy.IsPathAllowedForWrite((dir.Path() / "work" / "3" / "reports" / "r").string()));
    EXPECT_FALSE(policy.IsPathAllowedForWrite((dir.Path() / "work" / "4" / "reports" / "r").string()));
}

TEST(PathPolicy, WriteUnrestrictedWhenDisabled) {
    TempDir dir;
    auto config = ConfigFor(dir);
    config.enable_path_restriction = false;
    const PathPolicy policy(config);
    EXPECT_TRUE(policy.IsPathAllowedForWrite("/etc/passwd"));
    EXPECT_TRUE(policy.IsPathAllowedForWrite((dir.Path() / "work" / "7" / "src" / "main.py").string()));
}

TEST(PathPolicy, ReadRules) {
    TempDir dir;
    const PathPolicy policy(ConfigFor(dir));
    EXPECT_TRUE(policy.IsPathAllowedForRead("notes/today.txt"));
    EXPECT_TRUE(policy.IsPathAllowedForRead((dir.Path() / "work" / "3" / "src" / "a.py").string()));
    EXPECT_TRUE(policy.IsPathAllowedForRead((dir.Path() / "scratch" / "tmp.txt").string()));
    EXPECT_FALSE(policy.IsPathAllowedForRead("/etc/passwd"));
    EXPECT_FALSE(policy.IsPathAllowedForRead(""));
}

TEST(PathPolicy, ReadUnrestrictedOutsideSandboxMode) {
    TempDir dir;
    auto config = ConfigFor(dir);
    config.sandbox_mode = false;
    const PathPolicy policy(config);
    EXPECT_TRUE(policy.IsPathAllowedForRead("/etc/passwd"));
}

TEST(PathPolicy, ContainmentIsComponentWise) {
    EXPECT_TRUE(IsWithin("/work/1/reports", "/work/1/reports"));
    EXPECT_TRUE(IsWithin("/work/1/reports/x", "/work/1/reports/"));
    EXPECT_FALSE(IsWithin("/work/10/reports", "/work/1/reports"));
    EXPECT_FALSE(IsWithin("/work/1/reportsX", "/work/1/reports"));
    EXPECT_FALSE(IsWithin("/work", "/work/1/reports"));
    EXPECT_FALSE(IsWithin("", "/work"));
}

TEST(CommandPolicy, SubstringMatching) {
    const SubstringCommandPolicy policy(SandboxConfig{}.safe_commands);
    EXPECT_TRUE(policy.IsAllowed("ls -la"));
    EXPECT_TRUE(policy.IsAllowed("python3 main.py"));
    EXPECT_TRUE(policy.IsAllowed("bash"));
    EXPECT_FALSE(policy.IsAllowed("rm -rf /"));
    EXPECT_FALSE(policy.IsAllowed("shutdown now"));
    // any allowed fragment anywhere lets the whole command through
    EXPECT_TRUE(policy.IsAllowed("rm -rf ./cache && ls"));
}

TEST(CommandPolicy, FirstTokenMatching) {
    const FirstTokenCommandPolicy policy(SandboxConfig{}.safe_commands);
    EXPECT_TRUE(policy.IsAllowed("ls -la"));
    EXPECT_TRUE(policy.IsAllowed("/usr/bin/python3 main.py"));
    EXPECT_TRUE(policy.IsAllowed("PYTHONPATH=src python3 -m app"));
    EXPECT_FALSE(policy.IsAllowed("rm -rf ./cache && ls"));
    EXPECT_FALSE(policy.IsAllowed("lsblk"));
    EXPECT_FALSE(policy.IsAllowed(""));
}

TEST(CommandPolicy, RejectionNamesPolicyAndAllowList) {
    const SubstringCommandPolicy policy({"ls", "cat"});
    const auto message = policy.Rejection("rm -rf /");
    EXPECT_NE(message.find("not allowed in sandbox mode"), std::string::npos);
    EXPECT_NE(message.find("substring"), std::string::npos);
    EXPECT_NE(message.find("rm -rf /"), std::string::npos);
    EXPECT_NE(message.find("[ls, cat]"), std::string::npos);
}

TEST(CommandPolicy, FactorySelectsMatcher) {
    SandboxConfig config;
    EXPECT_EQ(MakeCommandPolicy(config)->Name(), "substring");
    config.command_match = "first_token";
    EXPECT_EQ(MakeCommandPolicy(config)->Name(), "first_token");
    config.command_match = "bogus";
    EXPECT_EQ(MakeCommandPolicy(config)->Name(), "substring");
}
