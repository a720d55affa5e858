#include <gtest/gtest.h>
#include <managers/external_invoker.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class ExternalInvokerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    ProcessInvoker invoker;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "gencache_invoker_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    Command shell(const std::string& script, const fs::path& cwd) {
        Command cmd;
        cmd.label = "sh";
        cmd.line = CommandLine("/bin/sh");
        cmd.line.arg("-c").arg(script);
        cmd.working_dir = cwd;
        return cmd;
    }

    std::string read_file(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        std::string s = ss.str();
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
        return s;
    }
};

TEST_F(ExternalInvokerTest, ZeroExitIsSuccess) {
    auto result = invoker.run(shell("exit 0", test_dir));
    EXPECT_TRUE(result.is_ok());
}

TEST_F(ExternalInvokerTest, NonZeroExitIsCommandFailure) {
    Command cmd = shell("exit 3", test_dir);
    cmd.label = "sbt 0.13 (2)";
    cmd.failure_message = "Failed to generate config with sbt 0.13 (2).";

    auto result = invoker.run(cmd);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::Command);
    EXPECT_EQ(result.error.exit_code, 3);
    EXPECT_EQ(result.error.label, "sbt 0.13 (2)");
    EXPECT_EQ(result.error.working_dir, test_dir);
    EXPECT_EQ(result.error.message, "Failed to generate config with sbt 0.13 (2).");
    EXPECT_NE(result.error.command.find("exit 3"), std::string::npos);
}

TEST_F(ExternalInvokerTest, DefaultFailureMessageNamesLabel) {
    auto result = invoker.run(shell("exit 1", test_dir));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.message, "Command 'sh' failed.");
}

TEST_F(ExternalInvokerTest, RunsInWorkingDirectory) {
    fs::path sub = test_dir / "variant";
    fs::create_directories(sub);

    ASSERT_TRUE(invoker.run(shell("pwd > where.txt", sub)).is_ok());
    EXPECT_EQ(fs::canonical(read_file(sub / "where.txt")), fs::canonical(sub));
}

TEST_F(ExternalInvokerTest, MissingProgramExits127) {
    Command cmd;
    cmd.label = "missing";
    cmd.line = CommandLine("gencache-no-such-program");
    cmd.working_dir = test_dir;

    auto result = invoker.run(cmd);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.exit_code, 127);
}

TEST_F(ExternalInvokerTest, MissingWorkingDirectoryExits126) {
    auto result = invoker.run(shell("exit 0", test_dir / "gone"));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.exit_code, 126);
}

TEST_F(ExternalInvokerTest, SignalIsReportedAbove128) {
    auto result = invoker.run(shell("kill -TERM $$", test_dir));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.exit_code, 128 + 15);
}

TEST_F(ExternalInvokerTest, StdinIsNotInherited) {
    // read returns EOF immediately instead of blocking on the terminal
    auto result = invoker.run(shell("read line || exit 0; exit 5", test_dir));
    EXPECT_TRUE(result.is_ok());
}
