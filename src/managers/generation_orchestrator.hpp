#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <cache/hasher.hpp>
#include <cache/cache_store.hpp>
#include "external_invoker.hpp"

namespace fs = std::filesystem;

// One unit of "check staleness, then regenerate via external commands".
struct GenerationJob {
    std::string name;
    fs::path cache_dir;                    // cache key
    TrackedInputSet inputs;
    std::vector<Command> commands;         // run in order, first failure aborts
    std::vector<fs::path> outputs;         // promised, not verified
    std::vector<fs::path> clear_before_run;  // stale artifacts removed before regenerating
};

struct StalenessCheck {
    Fingerprint current;
    std::optional<Fingerprint> previous;   // none on first run or unreadable record
    bool stale = true;
};

enum class JobOutcome {
    UpToDate,
    Regenerated,
};

struct JobReport {
    std::string job;
    JobOutcome outcome = JobOutcome::UpToDate;
    Fingerprint fingerprint;
    std::vector<fs::path> outputs;
    int commands_run = 0;
    std::string elapsed;                   // formatted, regenerations only
};

using JobResult = Result<JobReport, GenError>;

// Per-job results of one run, in declaration order.
struct RunSummary {
    std::vector<JobResult> results;

    bool ok() const;
    size_t failed_count() const;
    size_t regenerated_count() const;
    void merge(const RunSummary& other);
};

class GenerationOrchestrator {
public:
    GenerationOrchestrator(const CacheStore& store, ExternalInvoker& invoker,
                           StatusCallback cb = nullptr);

    // Fingerprint the job's inputs and compare against the committed record.
    // Never spawns a process.
    Result<StalenessCheck, GenError> check(const GenerationJob& job) const;

    // Regenerate the job if it is stale. The record is only committed after
    // every command succeeded.
    JobResult run_if_stale(const GenerationJob& job);

    // Run independent jobs in order; a failed job never stops later ones.
    RunSummary run_all(const std::vector<GenerationJob>& jobs);

private:
    Result<void, GenError> clear_stale_artifacts(const GenerationJob& job);
    void warn_missing_outputs(const GenerationJob& job);
    void status(const std::string& msg);

    const CacheStore& store_;
    ExternalInvoker& invoker_;
    StatusCallback cb_;
};
