#pragma once

#include <core/config.hpp>
#include <cache/staging_resolver.hpp>
#include "generation_orchestrator.hpp"

// Builds the single job that regenerates configuration for every external
// integration build variant and produces the aggregate index file.
class IntegrationsPlanner {
public:
    IntegrationsPlanner(const Config& config, const StagingLayout& layout);

    // Writes the schema version seed file, then describes the job.
    Result<GenerationJob, GenError> plan() const;

    // Tracked inputs of the job (the seed file is required).
    TrackedInputSet tracked_inputs() const;

    // Tool invocation shared by every variant, without a working directory.
    CommandLine variant_command() const;

private:
    const Config& config_;
    const StagingLayout& layout_;
};
