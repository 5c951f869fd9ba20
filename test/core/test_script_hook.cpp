#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <string>
#include "test_utils.hpp"
#include "core/ScriptHook.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

using namespace githooker;
using namespace githooker::test::utils;

class ScriptHookTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        Logger::instance().setStreams(logOut, logErr);
    }

    void TearDown() override {
        Logger::instance().resetStreams();
        removeDir(tempDir);
    }

    std::unique_ptr<ScriptHook> load(const std::string& text) {
        fs::path file = createFile(tempDir, "githooks/test.json", text);
        auto res = ScriptHook::fromFile(file);
        EXPECT_TRUE(res.has_value()) << res.error().message;
        return res.has_value() ? std::move(res.value()) : nullptr;
    }

    HookContext context(const std::string& name, const std::string& stdinText = "",
                        const std::vector<std::string>& args = {}) {
        return HookContext::fromRawStdin(name, stdinText, tempDir, args);
    }

    fs::path tempDir;
    std::ostringstream logOut;
    std::ostringstream logErr;
};

TEST_F(ScriptHookTest, FromFileWithoutHookKey) {
    fs::path file = createFile(tempDir, "githooks/package.json", R"({"name": "tooling", "private": true})");
    auto res = ScriptHook::fromFile(file);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), nullptr);
}

TEST_F(ScriptHookTest, FromFileMissingIsIoError) {
    auto res = ScriptHook::fromFile(tempDir / "missing.json");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::IoError);
}

TEST_F(ScriptHookTest, AllStepsPassReturnsSuccessMessage) {
    auto hook = load(R"({"hook": "pre-commit", "description": "checks",
                      "steps": [["true"], ["true"]], "success_message": "All good"})");
    ASSERT_NE(hook, nullptr);
    EXPECT_EQ(hook->name(), "pre-commit");
    EXPECT_EQ(hook->description(), "checks");
    EXPECT_EQ(hook->source(), tempDir / "githooks/test.json");

    HookResult res = hook->execute(context("pre-commit"));
    EXPECT_TRUE(res.success);
    ASSERT_TRUE(res.message.has_value());
    EXPECT_EQ(*res.message, "All good");
    EXPECT_EQ(res.effectiveExitCode(), 0);
}

TEST_F(ScriptHookTest, StopsAtFirstFailingStep) {
    auto hook = load(R"({"hook": "pre-commit", "steps": [["false"], ["touch", "second-ran"]]})");
    ASSERT_NE(hook, nullptr);

    HookResult res = hook->execute(context("pre-commit"));
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.effectiveExitCode(), 1);
    ASSERT_TRUE(res.message.has_value());
    EXPECT_NE(res.message->find("Step failed: false (exit 1)"), std::string::npos);
    EXPECT_FALSE(fs::exists(tempDir / "second-ran"));
    // The reason travels in the result; the hook itself does not print it
    EXPECT_EQ(logErr.str().find("Step failed"), std::string::npos);
}

TEST_F(ScriptHookTest, ContinueOnErrorRunsRemainingSteps) {
    auto hook = load(R"({"hook": "pre-commit", "steps": [["false"], ["touch", "second-ran"]],
                      "continue_on_error": true, "failure_message": "Checks failed"})");
    ASSERT_NE(hook, nullptr);

    HookResult res = hook->execute(context("pre-commit"));
    EXPECT_FALSE(res.success);
    ASSERT_TRUE(res.message.has_value());
    EXPECT_EQ(*res.message, "Checks failed");
    EXPECT_TRUE(fs::exists(tempDir / "second-ran"));
}

TEST_F(ScriptHookTest, FailingStepOutputIsLogged) {
    auto hook = load(R"({"hook": "pre-commit", "steps": [["sh", "-c", "echo broken-output >&2; exit 4"]]})");
    ASSERT_NE(hook, nullptr);

    HookResult res = hook->execute(context("pre-commit"));
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.effectiveExitCode(), 1);
    ASSERT_TRUE(res.message.has_value());
    EXPECT_NE(res.message->find("(exit 4)"), std::string::npos);
    EXPECT_NE(logErr.str().find("[pre-commit] broken-output"), std::string::npos);
    EXPECT_EQ(logErr.str().find("(exit 4)"), std::string::npos);
}

TEST_F(ScriptHookTest, MissingProgramFailsTheHook) {
    auto hook = load(R"({"hook": "pre-commit", "steps": [["githooker-no-such-program-xyz", "--check"]]})");
    ASSERT_NE(hook, nullptr);

    HookResult res = hook->execute(context("pre-commit"));
    EXPECT_FALSE(res.success);
    ASSERT_TRUE(res.message.has_value());
    EXPECT_NE(res.message->find("command not found"), std::string::npos);
}

TEST_F(ScriptHookTest, StepsRunInProjectRootWithStdin) {
    auto hook = load(R"({"hook": "pre-push", "steps": [["sh", "-c", "cat > pushed.txt"]]})");
    ASSERT_NE(hook, nullptr);

    HookResult res = hook->execute(context("pre-push", "refs/heads/main abc refs/heads/main def\n"));
    EXPECT_TRUE(res.success);
    EXPECT_TRUE(fileHasContent(tempDir / "pushed.txt", "refs/heads/main abc refs/heads/main def\n"));
}

TEST_F(ScriptHookTest, PlaceholdersAndEnvironment) {
    auto hook = load(R"({"hook": "commit-msg",
                      "steps": [["sh", "-c", "printf '%s|%s|%s' $HOOK $1 \"$$GITHOOKER_HOOK\" > out.txt"]]})");
    ASSERT_NE(hook, nullptr);

    HookResult res = hook->execute(context("commit-msg", "", {".git/COMMIT_EDITMSG"}));
    EXPECT_TRUE(res.success) << logErr.str();
    EXPECT_TRUE(fileHasContent(tempDir / "out.txt", "commit-msg|.git/COMMIT_EDITMSG|commit-msg"));
}

TEST_F(ScriptHookTest, ExpandArgs) {
    HookContext ctx = context("pre-push", "", {"origin", "git@example.com:repo.git"});

    auto expanded = ScriptHook::expandArgs({"check", "$@", "--remote=$1", "$2", "$3", "$$1", "$ROOT/x", "$"}, ctx);
    std::vector<std::string> expected{
        "check", "origin", "git@example.com:repo.git", "--remote=origin",
        "git@example.com:repo.git", "", "$1", (tempDir / "x").string(), "$"};
    EXPECT_EQ(expanded, expected);

    auto noArgs = ScriptHook::expandArgs({"echo", "$@"}, context("pre-commit"));
    EXPECT_EQ(noArgs, (std::vector<std::string>{"echo"}));
}
