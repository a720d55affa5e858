#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/config.hpp>
#include <cache/cache_store.hpp>
#include <cache/staging_resolver.hpp>
#include "generation_orchestrator.hpp"
#include "external_invoker.hpp"

// Staleness of one planned job, as reported by `gencache status`.
struct JobStatus {
    std::string job;
    bool stale = true;
    std::optional<CacheRecord> record;   // last commit, if any
    std::optional<GenError> error;       // planning or hashing failure
    Fingerprint current;
};

// Top-level driver for both generation phases. The staging layout is
// resolved once per call; a ConfigurationError aborts before any job runs.
class GenerationService {
public:
    GenerationService(const Config& config, ExternalInvoker& invoker,
                      StatusCallback cb = nullptr);

    // Clone pinned repositories, then regenerate every discovered project.
    Result<RunSummary, GenError> run_bootstrap();

    // Regenerate the integration index across all build variants.
    Result<RunSummary, GenError> run_integrations();

    // Bootstrap followed by integrations.
    Result<RunSummary, GenError> run_all();

    // Report staleness of every job without running anything.
    Result<std::vector<JobStatus>, GenError> status();

private:
    Result<StagingLayout, GenError> layout() const;
    RunSummary bootstrap_with(const StagingLayout& layout, GenerationOrchestrator& orch);
    RunSummary integrations_with(const StagingLayout& layout, GenerationOrchestrator& orch);
    void status_line(const std::string& msg);

    const Config& config_;
    ExternalInvoker& invoker_;
    CacheStore store_;
    StatusCallback cb_;
};
