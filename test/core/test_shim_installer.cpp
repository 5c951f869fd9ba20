#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <string>
#include "test_utils.hpp"
#include "core/ScriptHook.hpp"
#include "core/ShimInstaller.hpp"
#include "core/ShimScript.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

using namespace githooker;
using namespace githooker::test::utils;

namespace {

ScriptHook makeHook(const std::string& name) {
    HookSpec spec;
    spec.name = name;
    spec.steps.push_back(HookStep{{"true"}, 0});
    return ScriptHook(spec, "githooks/" + name + ".json");
}

}

class ShimInstallerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        initTestRepo(tempDir);
        savedLevel = Logger::instance().level();
        Logger::instance().setLevel(LogLevel::Info);
        Logger::instance().setStreams(logOut, logErr);
    }

    void TearDown() override {
        Logger::instance().resetStreams();
        Logger::instance().setLevel(savedLevel);
        removeDir(tempDir);
    }

    ShimInstaller installer(const std::vector<std::string>& paths = {}) {
        return ShimInstaller(tempDir, "/usr/local/bin/githooker", paths);
    }

    fs::path hooksDir() const { return tempDir / ".git" / "hooks"; }

    fs::path tempDir;
    LogLevel savedLevel{LogLevel::Info};
    std::ostringstream logOut;
    std::ostringstream logErr;
};

TEST_F(ShimInstallerTest, InstallWritesExecutableManagedShim) {
    ScriptHook hook = makeHook("pre-commit");
    auto res = installer().install(hook);
    ASSERT_TRUE(res.has_value()) << res.error().message;

    fs::path shim = hooksDir() / "pre-commit";
    ASSERT_TRUE(fs::exists(shim));
    EXPECT_TRUE(isExecutable(shim));
    std::string content = readFile(shim);
    EXPECT_EQ(content.rfind("#!/bin/sh\n", 0), 0u);
    EXPECT_TRUE(ShimScript::isManaged(content));
    EXPECT_NE(content.find("GITHOOKER_PROJECT_ROOT='" + tempDir.string() + "'"), std::string::npos);
    EXPECT_NE(content.find("GITHOOKER_BIN='/usr/local/bin/githooker'"), std::string::npos);
    EXPECT_NE(content.find("run 'pre-commit' -- \"$@\""), std::string::npos);
    EXPECT_EQ(content.find("--hook-path"), std::string::npos);
    EXPECT_NE(logOut.str().find("Installed hook: pre-commit"), std::string::npos);
}

TEST_F(ShimInstallerTest, InstallBakesSearchPaths) {
    ScriptHook hook = makeHook("pre-push");
    ASSERT_TRUE(installer({"tools/hooks", "ci hooks"}).install(hook).has_value());

    std::string content = readFile(hooksDir() / "pre-push");
    EXPECT_NE(content.find("--hook-path 'tools/hooks' --hook-path 'ci hooks' run 'pre-push'"), std::string::npos);
    // A directory named like a command cannot be swallowed by the greedy form
    EXPECT_EQ(content.find("--hook-paths"), std::string::npos);
}

TEST_F(ShimInstallerTest, InstallTwiceIsIdempotent) {
    ScriptHook hook = makeHook("pre-commit");
    ASSERT_TRUE(installer().install(hook).has_value());
    std::string first = readFile(hooksDir() / "pre-commit");

    auto again = installer().install(hook);
    ASSERT_TRUE(again.has_value()) << again.error().message;
    EXPECT_EQ(readFile(hooksDir() / "pre-commit"), first);
    EXPECT_TRUE(isExecutable(hooksDir() / "pre-commit"));
}

TEST_F(ShimInstallerTest, InstallRefusesToOverwriteForeignHook) {
    fs::path foreign = createFile(hooksDir(), "pre-commit", "#!/bin/sh\necho mine\n");
    ScriptHook hook = makeHook("pre-commit");

    auto res = installer().install(hook);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ForeignHook);
    EXPECT_TRUE(fileHasContent(foreign, "#!/bin/sh\necho mine\n"));
}

TEST_F(ShimInstallerTest, InstallWithoutHooksDirectory) {
    fs::remove_all(hooksDir());
    ScriptHook hook = makeHook("pre-commit");

    auto res = installer().install(hook);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::HooksDirMissing);
    EXPECT_FALSE(fs::exists(hooksDir()));
}

TEST_F(ShimInstallerTest, UninstallRemovesManagedShim) {
    ScriptHook hook = makeHook("pre-commit");
    ASSERT_TRUE(installer().install(hook).has_value());

    auto res = installer().uninstall("pre-commit");
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_TRUE(res.value());
    EXPECT_FALSE(fs::exists(hooksDir() / "pre-commit"));
}

TEST_F(ShimInstallerTest, UninstallWhenNothingInstalled) {
    auto res = installer().uninstall("pre-commit");
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_FALSE(res.value());
    EXPECT_NE(logErr.str().find("Hook script not found"), std::string::npos);
}

TEST_F(ShimInstallerTest, UninstallLeavesForeignHook) {
    fs::path foreign = createFile(hooksDir(), "pre-commit", "#!/bin/sh\nexit 0\n");

    auto res = installer().uninstall("pre-commit");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ForeignHook);
    EXPECT_TRUE(fileHasContent(foreign, "#!/bin/sh\nexit 0\n"));
}

TEST_F(ShimInstallerTest, InvalidNameIsRejected) {
    auto res = installer().uninstall("../config");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
}

TEST_F(ShimInstallerTest, InstalledHooksSkipsSamples) {
    ScriptHook hook = makeHook("pre-push");
    ASSERT_TRUE(installer().install(hook).has_value());
    createFile(hooksDir(), "pre-commit", "#!/bin/sh\nexit 0\n");
    createFile(hooksDir(), "pre-commit.sample", "#!/bin/sh\n");
    createFile(hooksDir(), "update.sample", "#!/bin/sh\n");

    auto res = installer().installedHooks();
    ASSERT_TRUE(res.has_value()) << res.error().message;
    ASSERT_EQ(res.value().size(), 2u);
    EXPECT_EQ(res.value()[0].name, "pre-commit");
    EXPECT_FALSE(res.value()[0].managed);
    EXPECT_EQ(res.value()[1].name, "pre-push");
    EXPECT_TRUE(res.value()[1].managed);
}

TEST_F(ShimInstallerTest, InstalledHooksWithoutHooksDirectory) {
    fs::remove_all(tempDir / ".git");
    auto res = installer().installedHooks();
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().empty());
}

TEST(ShimScriptTest, ShellQuote) {
    EXPECT_EQ(ShimScript::shellQuote("plain"), "'plain'");
    EXPECT_EQ(ShimScript::shellQuote("with space"), "'with space'");
    EXPECT_EQ(ShimScript::shellQuote("it's"), "'it'\"'\"'s'");
    EXPECT_EQ(ShimScript::shellQuote(""), "''");
}

TEST(ShimScriptTest, SentinelMustBeAWholeLine) {
    EXPECT_TRUE(ShimScript::isManaged("#!/bin/sh\n# githooker-managed-hook\nexec true\n"));
    EXPECT_TRUE(ShimScript::isManaged("#!/bin/sh\r\n# githooker-managed-hook\r\n"));
    EXPECT_FALSE(ShimScript::isManaged("#!/bin/sh\necho '# githooker-managed-hook'\n"));
    EXPECT_FALSE(ShimScript::isManaged(""));
}

TEST(ShimScriptTest, RenderQuotesRootWithSpaces) {
    ShimConfig config{"commit-msg", "/home/me/my project", "/opt/githooker/bin/githooker", {}};
    std::string script = ShimScript::render(config);
    EXPECT_NE(script.find("GITHOOKER_PROJECT_ROOT='/home/me/my project'"), std::string::npos);
    EXPECT_NE(script.find("cd \"$GITHOOKER_PROJECT_ROOT\" || exit 1"), std::string::npos);
    EXPECT_NE(script.find("exec \"$GITHOOKER_BIN\" --project-root \"$GITHOOKER_PROJECT_ROOT\" run 'commit-msg'"),
              std::string::npos);
}
