#include <gtest/gtest.h>
#include <managers/generation_orchestrator.hpp>
#include "fake_invoker.hpp"
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

class OrchestratorTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string saved_home;
    CacheStore store;
    FakeInvoker invoker;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "gencache_orchestrator_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "home");
        // Job history goes to ~/.gencache/logs
        if (const char* h = std::getenv("HOME")) saved_home = h;
        setenv("HOME", (test_dir / "home").c_str(), 1);
    }

    void TearDown() override {
        if (saved_home.empty()) unsetenv("HOME");
        else setenv("HOME", saved_home.c_str(), 1);
        fs::remove_all(test_dir);
    }

    fs::path write_file(const std::string& rel_path, const std::string& content) {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
        return full;
    }

    Command command(const std::string& label) {
        Command cmd;
        cmd.label = label;
        cmd.line = CommandLine("sbt");
        cmd.working_dir = test_dir;
        return cmd;
    }

    GenerationJob job(const std::string& name, const std::vector<std::string>& labels) {
        GenerationJob j;
        j.name = name;
        j.cache_dir = test_dir / "cache" / name;
        j.inputs.add(test_dir / "x");
        for (const auto& l : labels) j.commands.push_back(command(l));
        return j;
    }
};

TEST_F(OrchestratorTest, FirstRunRegeneratesAndCommits) {
    write_file("x", "1");
    GenerationOrchestrator orch(store, invoker);

    auto result = orch.run_if_stale(job("j", {"A"}));
    ASSERT_TRUE(result.is_ok()) << result.error.describe();
    EXPECT_EQ(result.value.outcome, JobOutcome::Regenerated);
    EXPECT_EQ(result.value.commands_run, 1);
    EXPECT_FALSE(result.value.elapsed.empty());
    EXPECT_TRUE(store.lookup(test_dir / "cache" / "j").has_value());
}

TEST_F(OrchestratorTest, SecondRunIsUpToDateAndSpawnsNothing) {
    write_file("x", "1");
    GenerationOrchestrator orch(store, invoker);
    auto j = job("j", {"A", "B"});

    ASSERT_TRUE(orch.run_if_stale(j).is_ok());
    invoker.calls.clear();

    auto second = orch.run_if_stale(j);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value.outcome, JobOutcome::UpToDate);
    EXPECT_TRUE(invoker.calls.empty());
}

TEST_F(OrchestratorTest, ContentChangeTriggersRegeneration) {
    write_file("x", "1");
    GenerationOrchestrator orch(store, invoker);
    auto j = job("j", {"A"});

    ASSERT_TRUE(orch.run_if_stale(j).is_ok());
    write_file("x", "2");

    auto check = orch.check(j);
    ASSERT_TRUE(check.is_ok());
    EXPECT_TRUE(check.value.stale);

    invoker.calls.clear();
    auto second = orch.run_if_stale(j);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value.outcome, JobOutcome::Regenerated);
    EXPECT_EQ(invoker.labels(), std::vector<std::string>({"A"}));

    // Reverting to older content differs from the last commit too
    write_file("x", "1");
    EXPECT_TRUE(orch.check(j).value.stale);
}

TEST_F(OrchestratorTest, UntrackedChangesAreIgnored) {
    write_file("x", "1");
    write_file("untracked.txt", "a");
    GenerationOrchestrator orch(store, invoker);
    auto j = job("j", {"A"});

    ASSERT_TRUE(orch.run_if_stale(j).is_ok());
    write_file("untracked.txt", "b");

    auto check = orch.check(j);
    ASSERT_TRUE(check.is_ok());
    EXPECT_FALSE(check.value.stale);
}

TEST_F(OrchestratorTest, FailureStopsSequenceAndSkipsCommit) {
    write_file("x", "1");
    invoker.exit_codes["B"] = 2;
    GenerationOrchestrator orch(store, invoker);
    auto j = job("j", {"A", "B", "C"});

    auto result = orch.run_if_stale(j);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::Command);
    EXPECT_EQ(result.error.job, "j");
    EXPECT_EQ(result.error.label, "B");
    EXPECT_EQ(result.error.exit_code, 2);
    EXPECT_EQ(invoker.labels(), std::vector<std::string>({"A", "B"}));
    EXPECT_FALSE(store.lookup(j.cache_dir).has_value());

    // Unchanged inputs still retry the whole sequence
    invoker.exit_codes.clear();
    invoker.calls.clear();
    auto retry = orch.run_if_stale(j);
    ASSERT_TRUE(retry.is_ok());
    EXPECT_EQ(invoker.labels(), std::vector<std::string>({"A", "B", "C"}));
}

TEST_F(OrchestratorTest, FailureKeepsPreviousRecord) {
    write_file("x", "1");
    GenerationOrchestrator orch(store, invoker);
    auto j = job("j", {"A"});
    ASSERT_TRUE(orch.run_if_stale(j).is_ok());
    auto committed = store.lookup(j.cache_dir);

    write_file("x", "2");
    invoker.exit_codes["A"] = 1;
    ASSERT_TRUE(orch.run_if_stale(j).is_err());

    EXPECT_EQ(store.lookup(j.cache_dir)->hex, committed->hex);
}

TEST_F(OrchestratorTest, StaleArtifactsClearedBeforeCommands) {
    write_file("x", "1");
    fs::path index = write_file("staging/index.csv", "old");
    bool existed_during_run = true;
    invoker.actions["A"] = [&](const Command&) {
        existed_during_run = fs::exists(index);
        std::ofstream(index) << "new";
    };

    GenerationOrchestrator orch(store, invoker);
    auto j = job("j", {"A"});
    j.clear_before_run = {index};
    j.outputs = {index};

    ASSERT_TRUE(orch.run_if_stale(j).is_ok());
    EXPECT_FALSE(existed_during_run);
    EXPECT_TRUE(fs::exists(index));
}

TEST_F(OrchestratorTest, UpToDateJobKeepsArtifacts) {
    write_file("x", "1");
    fs::path index = write_file("staging/index.csv", "keep");
    GenerationOrchestrator orch(store, invoker);
    auto j = job("j", {"A"});
    ASSERT_TRUE(orch.run_if_stale(j).is_ok());

    j.clear_before_run = {index};
    ASSERT_TRUE(orch.run_if_stale(j).is_ok());
    EXPECT_TRUE(fs::exists(index));
}

TEST_F(OrchestratorTest, MissingOutputDoesNotFailJob) {
    write_file("x", "1");
    GenerationOrchestrator orch(store, invoker);
    auto j = job("j", {"A"});
    j.outputs = {test_dir / "never-written.csv"};

    auto result = orch.run_if_stale(j);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.outcome, JobOutcome::Regenerated);
}

TEST_F(OrchestratorTest, HashingErrorSpawnsNothing) {
    GenerationOrchestrator orch(store, invoker);
    auto j = job("j", {"A"});
    j.inputs.add_required(test_dir / "seed.json");

    auto result = orch.run_if_stale(j);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::Hashing);
    EXPECT_EQ(result.error.job, "j");
    EXPECT_TRUE(invoker.calls.empty());
}

TEST_F(OrchestratorTest, CommitFailureFailsJob) {
    write_file("x", "1");
    write_file("blocked", "file in the way");
    GenerationOrchestrator orch(store, invoker);
    auto j = job("j", {"A"});
    j.cache_dir = test_dir / "blocked" / "cache";

    auto result = orch.run_if_stale(j);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::Commit);
    EXPECT_EQ(invoker.labels(), std::vector<std::string>({"A"}));
}

TEST_F(OrchestratorTest, RunAllContinuesPastFailures) {
    write_file("x", "1");
    invoker.exit_codes["bad"] = 1;
    GenerationOrchestrator orch(store, invoker);

    auto summary = orch.run_all({job("first", {"bad"}), job("second", {"good"})});
    ASSERT_EQ(summary.results.size(), 2u);
    EXPECT_TRUE(summary.results[0].is_err());
    EXPECT_TRUE(summary.results[1].is_ok());
    EXPECT_FALSE(summary.ok());
    EXPECT_EQ(summary.failed_count(), 1u);
    EXPECT_EQ(summary.regenerated_count(), 1u);
}

TEST_F(OrchestratorTest, StatusCallbackReportsProgress) {
    write_file("x", "1");
    std::vector<std::string> messages;
    GenerationOrchestrator orch(store, invoker,
                                [&](const std::string& m) { messages.push_back(m); });

    ASSERT_TRUE(orch.run_if_stale(job("j", {"A"})).is_ok());
    EXPECT_FALSE(messages.empty());
}

TEST_F(OrchestratorTest, RecordTracksFingerprintAcrossEdits) {
    write_file("x", "1");
    fs::path out = test_dir / "out";
    invoker.actions["gen"] = [&](const Command&) { std::ofstream(out) << "generated"; };
    GenerationOrchestrator orch(store, invoker);
    auto j = job("j", {"gen"});
    j.outputs = {out};

    ASSERT_TRUE(orch.run_if_stale(j).is_ok());
    EXPECT_EQ(invoker.calls.size(), 1u);
    EXPECT_TRUE(fs::exists(out));
    EXPECT_EQ(store.lookup(j.cache_dir)->hex, fingerprint(j.inputs).value.hex);

    auto mtime = fs::last_write_time(out);
    ASSERT_TRUE(orch.run_if_stale(j).is_ok());
    EXPECT_EQ(invoker.calls.size(), 1u);
    EXPECT_EQ(fs::last_write_time(out), mtime);

    write_file("x", "2");
    ASSERT_TRUE(orch.run_if_stale(j).is_ok());
    EXPECT_EQ(invoker.calls.size(), 2u);
    EXPECT_EQ(store.lookup(j.cache_dir)->hex, fingerprint(j.inputs).value.hex);
}

TEST_F(OrchestratorTest, FirstCommandFailureRunsNothingElse) {
    write_file("x", "1");
    invoker.exit_codes["A"] = 1;
    GenerationOrchestrator orch(store, invoker);

    auto result = orch.run_if_stale(job("j", {"A", "B", "C"}));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(invoker.labels(), std::vector<std::string>({"A"}));
}
