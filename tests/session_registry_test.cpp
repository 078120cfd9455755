#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "nlohmann/json.hpp"
#include "session/session_registry.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"

using shellbox::SafetyViolationError;
using shellbox::SessionExistsError;
using shellbox::SpawnError;
using shellbox::config::SandboxConfig;
using shellbox::config::SessionConfig;
using shellbox::session::SessionRegistry;
using shellbox::session::StepResult;
using shellbox::testing::HasProgram;
using shellbox::testing::TempDir;

namespace {

SandboxConfig SandboxFor(const TempDir& dir) {
    SandboxConfig config;
    config.workspace_dir = (dir.Path() / "work").string();
    return config;
}

SessionConfig FastSession() {
    SessionConfig config;
    config.quiescence_ms = 400;
    config.max_step_ms = 5000;
    return config;
}

// Steps without input until the program goes quiet or ends.
StepResult StepUntilSettled(SessionRegistry& registry, const std::string& id, StepResult result) {
    std::string output = result.output;
    for (int i = 0; i < 20 && !result.waiting && !result.finished; ++i) {
        result = registry.Step(id);
        output += result.output;
    }
    result.output = output;
    return result;
}

}  // namespace

TEST(SessionRegistry, BashSessionRoundTrip) {
    if (!HasProgram("bash")) {
        GTEST_SKIP() << "bash not available";
    }
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    const auto started = registry.StartSession("");
    ASSERT_TRUE(started.error.empty()) << started.error;
    EXPECT_FALSE(started.session_id.empty());
    EXPECT_FALSE(started.finished);
    EXPECT_TRUE(registry.Has(started.session_id));

    const auto step = registry.Step(started.session_id, std::string("echo $((6 * 7))"));
    EXPECT_TRUE(step.error.empty()) << step.error;
    EXPECT_NE(step.output.find("42"), std::string::npos);
    EXPECT_TRUE(step.waiting);
    EXPECT_FALSE(step.finished);

    const auto exited = StepUntilSettled(registry, started.session_id,
                                         registry.Step(started.session_id, std::string("exit")));
    EXPECT_TRUE(exited.finished);
    EXPECT_FALSE(exited.waiting);
    EXPECT_FALSE(registry.Has(started.session_id));
}

TEST(SessionRegistry, SessionsStartInWorkspace) {
    if (!HasProgram("bash")) {
        GTEST_SKIP() << "bash not available";
    }
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    const auto started = registry.StartSession("bash");
    ASSERT_TRUE(started.error.empty()) << started.error;
    const auto step = registry.Step(started.session_id, std::string("pwd"));
    EXPECT_NE(step.output.find((dir.Path() / "work").string()), std::string::npos);
}

TEST(SessionRegistry, PythonSessionKeepsState) {
    if (!HasProgram("python3")) {
        GTEST_SKIP() << "python3 not available";
    }
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    const auto started = registry.StartSession("python3 -q");
    ASSERT_TRUE(started.error.empty()) << started.error;
    const auto id = started.session_id;

    auto step = StepUntilSettled(registry, id, registry.Step(id, std::string("x = 10")));
    EXPECT_TRUE(step.error.empty()) << step.error;
    step = StepUntilSettled(registry, id, registry.Step(id, std::string("print(x * 2)")));
    EXPECT_NE(step.output.find("20"), std::string::npos);
    EXPECT_TRUE(step.waiting);

    step = StepUntilSettled(registry, id, registry.Step(id, std::string("exit()")));
    EXPECT_TRUE(step.finished);
    EXPECT_FALSE(registry.Has(id));
}

TEST(SessionRegistry, DisallowedStartIsRejected) {
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    EXPECT_THROW(registry.Start("rm -rf /"), SafetyViolationError);

    const auto result = registry.StartSession("rm -rf /");
    EXPECT_TRUE(result.finished);
    EXPECT_NE(result.error.find("not allowed in sandbox mode"), std::string::npos);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(SessionRegistry, SandboxOffAllowsAnyCommand) {
    TempDir dir;
    auto sandbox = SandboxFor(dir);
    sandbox.sandbox_mode = false;
    SessionRegistry registry(sandbox, FastSession());
    const auto id = registry.Start("sleep 30");
    EXPECT_TRUE(registry.Has(id));
    EXPECT_TRUE(registry.Kill(id));
}

TEST(SessionRegistry, InterpreterModeGatesInput) {
    if (!HasProgram("bash") || !HasProgram("python3")) {
        GTEST_SKIP() << "bash and python3 required";
    }
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    const auto id = registry.StartSession("bash").session_id;
    ASSERT_FALSE(id.empty());

    StepUntilSettled(registry, id, registry.Step(id, std::string("python3 -q")));
    const auto rejected = registry.Step(id, std::string("import os"));
    EXPECT_FALSE(rejected.finished);
    EXPECT_NE(rejected.error.find("not allowed in sandbox mode"), std::string::npos);
    EXPECT_TRUE(registry.Has(id));

    StepUntilSettled(registry, id, registry.Step(id, std::string("exit()")));
    const auto back = StepUntilSettled(registry, id, registry.Step(id, std::string("echo back-in-shell")));
    EXPECT_TRUE(back.error.empty()) << back.error;
    EXPECT_NE(back.output.find("back-in-shell"), std::string::npos);
    EXPECT_TRUE(registry.Kill(id));
}

TEST(SessionRegistry, UnknownSessionIsFinishedError) {
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    const auto result = registry.Step("nope", std::string("ls"));
    EXPECT_TRUE(result.finished);
    EXPECT_FALSE(result.waiting);
    EXPECT_EQ(result.error, "Session nope not found");
    EXPECT_EQ(result.session_id, "nope");
}

TEST(SessionRegistry, DuplicateIdIsRejected) {
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    EXPECT_EQ(registry.Start("cat", "dup"), "dup");
    EXPECT_THROW(registry.Start("cat", "dup"), SessionExistsError);
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(SessionRegistry, SpawnFailurePropagates) {
    TempDir dir;
    auto sandbox = SandboxFor(dir);
    sandbox.sandbox_mode = false;
    SessionRegistry registry(sandbox, FastSession());
    EXPECT_THROW(registry.Start("definitely-not-a-program-4711"), SpawnError);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(SessionRegistry, KillIsIdempotent) {
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    const auto id = registry.Start("cat");
    EXPECT_TRUE(registry.Kill(id));
    EXPECT_FALSE(registry.Kill(id));
    EXPECT_FALSE(registry.Kill("never-existed"));
    EXPECT_TRUE(registry.Step(id).finished);
}

TEST(SessionRegistry, FinishedProgramIsRemoved) {
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    const auto started = registry.StartSession("echo finished-now");
    const auto settled = StepUntilSettled(registry, started.session_id, started);
    EXPECT_TRUE(settled.finished);
    EXPECT_NE(settled.output.find("finished-now"), std::string::npos);
    EXPECT_FALSE(registry.Has(started.session_id));
}

TEST(SessionRegistry, InputAfterExitStillReturnsOutput) {
    TempDir dir;
    auto session = FastSession();
    session.quiescence_ms = 300;
    SessionRegistry registry(SandboxFor(dir), session);
    const auto id = registry.Start("sh -c 'sleep 1; echo RESULT42'");
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));

    auto result = registry.Step(id, std::string("hello"));
    EXPECT_NE(result.error.find("has already exited"), std::string::npos) << result.error;
    std::string all = result.output;
    for (int i = 0; i < 10 && !result.finished; ++i) {
        result = registry.Step(id);
        all += result.output;
    }
    EXPECT_TRUE(result.finished);
    EXPECT_NE(all.find("RESULT42"), std::string::npos) << all;
    EXPECT_FALSE(registry.Has(id));
}

TEST(SessionRegistry, FinishingStepKeepsReplacementSession) {
    TempDir dir;
    auto session = FastSession();
    session.quiescence_ms = 3000;
    SessionRegistry registry(SandboxFor(dir), session);
    registry.Start("sh -c 'sleep 1; echo first-done'", "shared");

    StepResult first;
    std::thread stepper([&] { first = registry.Step("shared"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    // blocks until the in-flight step releases the session
    std::thread killer([&] { registry.Kill("shared"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(registry.Start("cat", "shared"), "shared");
    stepper.join();
    killer.join();

    EXPECT_TRUE(registry.Has("shared"));
    const auto second = registry.Step("shared", std::string("still-alive"));
    EXPECT_TRUE(second.error.empty()) << second.error;
    EXPECT_NE(second.output.find("still-alive"), std::string::npos);
    EXPECT_FALSE(second.finished);
}

TEST(SessionRegistry, StepWithoutInputOnlyDrains) {
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    const auto id = registry.Start("cat");
    const auto result = registry.Step(id);
    EXPECT_TRUE(result.output.empty());
    EXPECT_TRUE(result.waiting);
}

TEST(SessionRegistry, ConcurrentStepsAreSerialized) {
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    const auto id = registry.Start("cat");
    StepResult first;
    StepResult second;
    std::thread a([&] { first = registry.Step(id, std::string("alpha")); });
    std::thread b([&] { second = registry.Step(id, std::string("bravo")); });
    a.join();
    b.join();
    const auto combined = first.output + second.output;
    EXPECT_NE(combined.find("alpha"), std::string::npos);
    EXPECT_NE(combined.find("bravo"), std::string::npos);
    EXPECT_TRUE(first.error.empty());
    EXPECT_TRUE(second.error.empty());
}

TEST(SessionRegistry, ReapIdleAndList) {
    TempDir dir;
    SessionRegistry registry(SandboxFor(dir), FastSession());
    const auto id = registry.Start("cat", "idle");
    const auto sessions = registry.ListSessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].id, "idle");
    EXPECT_EQ(sessions[0].command, "cat");
    EXPECT_FALSE(sessions[0].interpreter_mode);
    EXPECT_FALSE(sessions[0].created_at.empty());

    EXPECT_EQ(registry.ReapIdle(std::chrono::hours(1)), 0u);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(registry.ReapIdle(std::chrono::seconds(0)), 1u);
    EXPECT_FALSE(registry.Has(id));
}

TEST(StepResult, JsonShape) {
    StepResult result;
    result.session_id = "abc";
    result.output = "hi\xff";
    result.waiting = true;
    auto json = nlohmann::json::parse(result.ToJson());
    EXPECT_EQ(json["session_id"], "abc");
    EXPECT_EQ(json["waiting"], true);
    EXPECT_EQ(json["finished"], false);
    EXPECT_FALSE(json.contains("error"));

    result.error = "boom";
    json = nlohmann::json::parse(result.ToJson());
    EXPECT_EQ(json["error"], "boom");
}
