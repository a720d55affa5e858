#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <cache/staging_resolver.hpp>
#include "generation_orchestrator.hpp"

namespace fs = std::filesystem;

// Result of the discovery step, passed explicitly to the planning steps.
struct BootstrapContext {
    std::vector<fs::path> project_dirs;      // immediate sub-directories, sorted
};

// Plans the bootstrap phase: one clone job per pinned repository, then one
// independent job per discovered test project.
class BootstrapPlanner {
public:
    BootstrapPlanner(const Config& config, const StagingLayout& layout);

    Result<BootstrapContext, GenError> discover() const;

    // Writes each repository's ref seed file. A repository whose seed cannot
    // be written is reported in `failures` and left out of the returned jobs.
    std::vector<GenerationJob> clone_jobs(std::vector<GenError>& failures) const;

    std::vector<GenerationJob> project_jobs(const BootstrapContext& context) const;

    // Job for a single project; plugin_files are shared by every project.
    GenerationJob project_job(const fs::path& project_dir,
                              const std::vector<fs::path>& plugin_files) const;

private:
    const Config& config_;
    const StagingLayout& layout_;
};

// Regular files under root whose name ends with one of extensions.
// `skip` (and everything below it) is excluded. Missing root yields nothing.
std::vector<fs::path> collect_files(const fs::path& root,
                                    const std::vector<std::string>& extensions,
                                    const fs::path& skip = {});

// Short repository name from its URL ("https://x/apache/kafka.git" -> "kafka").
std::string repository_name(const std::string& url);
