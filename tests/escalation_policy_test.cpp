#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>

#include "judge/escalation_policy.hpp"
#include "pty/pty_process.hpp"
#include "test_support.hpp"

using shellbox::judge::EscalationHooks;
using shellbox::judge::EscalationOutcome;
using shellbox::judge::EscalationPolicy;
using shellbox::judge::EscalationState;
using shellbox::pty::PtyProcess;
using shellbox::testing::TempDir;

namespace {

constexpr std::chrono::seconds kTimeout{5};

EscalationPolicy ShortPolicy() {
    return EscalationPolicy(std::chrono::milliseconds(400), std::chrono::milliseconds(800));
}

}  // namespace

TEST(EscalationPolicy, NaturalExitFinishes) {
    TempDir dir;
    auto process = PtyProcess::Spawn("echo bye", dir.Str(), kTimeout);
    const auto policy = ShortPolicy();
    const auto outcome = policy.Await(*process);
    EXPECT_EQ(outcome.state, EscalationState::kFinished);
    EXPECT_FALSE(outcome.interrupted);
    ASSERT_TRUE(outcome.exit_code.has_value());
    EXPECT_EQ(*outcome.exit_code, 0);
    EXPECT_NE(outcome.output.find("bye"), std::string::npos);
    EXPECT_TRUE(policy.IsSuccess(outcome));
}

TEST(EscalationPolicy, NonZeroExitFails) {
    TempDir dir;
    auto process = PtyProcess::Spawn("sh -c 'exit 3'", dir.Str(), kTimeout);
    const auto policy = ShortPolicy();
    const auto outcome = policy.Await(*process);
    EXPECT_EQ(outcome.state, EscalationState::kFinished);
    EXPECT_EQ(outcome.exit_code.value_or(-1), 3);
    EXPECT_FALSE(policy.IsSuccess(outcome));
}

TEST(EscalationPolicy, InterruptsProgramThatKeepsWaiting) {
    TempDir dir;
    auto process = PtyProcess::Spawn("cat", dir.Str(), kTimeout);
    const auto policy = ShortPolicy();
    int interrupts = 0;
    EscalationHooks hooks;
    hooks.on_interrupt = [&]() { ++interrupts; };
    const auto outcome = policy.Await(*process, hooks);
    EXPECT_EQ(interrupts, 1);
    EXPECT_TRUE(outcome.interrupted);
    EXPECT_EQ(outcome.state, EscalationState::kFinished);
    EXPECT_EQ(outcome.exit_code.value_or(-1), 130);
    EXPECT_TRUE(policy.IsSuccess(outcome));
}

TEST(EscalationPolicy, KillsProgramIgnoringInterrupt) {
    TempDir dir;
    const auto script = dir.Write("stubborn.sh", "#!/bin/sh\ntrap '' INT\nexec sleep 30\n");
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);
    auto process = PtyProcess::Spawn("./stubborn.sh", dir.Str(), kTimeout);
    const auto policy = EscalationPolicy(std::chrono::milliseconds(300), std::chrono::milliseconds(300));
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = policy.Await(*process);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(4));
    EXPECT_EQ(outcome.state, EscalationState::kKilled);
    EXPECT_TRUE(outcome.interrupted);
    EXPECT_FALSE(process->IsRunning());
    EXPECT_FALSE(policy.IsSuccess(outcome));
}

TEST(EscalationPolicy, ForwardsOutputWhileWaiting) {
    TempDir dir;
    auto process = PtyProcess::Spawn("sh -c 'echo first; sleep 0.2; echo second'", dir.Str(), kTimeout);
    std::string forwarded;
    EscalationHooks hooks;
    hooks.on_output = [&](const std::string& chunk) { forwarded += chunk; };
    const auto outcome = ShortPolicy().Await(*process, hooks);
    EXPECT_EQ(forwarded, outcome.output);
    EXPECT_NE(forwarded.find("first"), std::string::npos);
    EXPECT_NE(forwarded.find("second"), std::string::npos);
}

TEST(EscalationPolicy, MarkerInOutputCountsAsSuccess) {
    TempDir dir;
    auto process = PtyProcess::Spawn("sh -c 'echo KeyboardInterrupt; exit 1'", dir.Str(), kTimeout);
    const auto policy = ShortPolicy();
    const auto outcome = policy.Await(*process);
    EXPECT_EQ(outcome.exit_code.value_or(-1), 1);
    EXPECT_TRUE(policy.IsSuccess(outcome));
}

TEST(EscalationPolicy, Classification) {
    const auto policy = ShortPolicy();
    EscalationOutcome outcome;
    outcome.state = EscalationState::kFinished;
    outcome.exit_code = 0;
    EXPECT_TRUE(policy.IsSuccess(outcome));
    outcome.exit_code = 130;
    EXPECT_TRUE(policy.IsSuccess(outcome));
    outcome.exit_code = 1;
    EXPECT_FALSE(policy.IsSuccess(outcome));
    outcome.output = "Traceback ...\nkeyboardInterrupt\n";
    EXPECT_TRUE(policy.IsSuccess(outcome));

    EscalationOutcome killed;
    killed.state = EscalationState::kKilled;
    killed.exit_code = 137;
    EXPECT_FALSE(policy.IsSuccess(killed));
    killed.exit_code = 0;
    EXPECT_FALSE(policy.IsSuccess(killed));
}

TEST(EscalationPolicy, FromConfig) {
    shellbox::config::JudgeConfig config;
    config.primary_timeout_ms = 1500;
    config.grace_ms = 250;
    const auto policy = EscalationPolicy::FromConfig(config);
    EXPECT_EQ(policy.PrimaryTimeout(), std::chrono::milliseconds(1500));
    EXPECT_EQ(policy.GracePeriod(), std::chrono::milliseconds(250));
}
