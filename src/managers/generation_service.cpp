#include "generation_service.hpp"
#include "bootstrap.hpp"
#include "integrations.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

GenerationService::GenerationService(const Config& config, ExternalInvoker& invoker,
                                     StatusCallback cb)
    : config_(config), invoker_(invoker), cb_(std::move(cb)) {}

void GenerationService::status_line(const std::string& msg) {
    if (cb_) cb_(msg);
}

Result<StagingLayout, GenError> GenerationService::layout() const {
    auto resolved = StagingLayout::resolve(config_.staging());
    if (resolved.is_err()) {
        gen_log(resolved.error.describe());
    } else {
        gen_log(fmt::format("staging root {}", resolved.value.staging_root().string()));
    }
    return resolved;
}

// Failures that happen before a job can run still count as failed jobs.
static JobResult planning_failure(const GenError& err) {
    gen_log(err.describe());
    return JobResult::Err(err);
}

RunSummary GenerationService::bootstrap_with(const StagingLayout& layout,
                                             GenerationOrchestrator& orch) {
    RunSummary summary;
    BootstrapPlanner planner(config_, layout);

    // Clones and projects are independent: a failure in one never holds
    // back the other.
    std::vector<GenError> seed_failures;
    auto clones = planner.clone_jobs(seed_failures);
    for (const auto& err : seed_failures) {
        summary.results.push_back(planning_failure(err));
    }
    summary.merge(orch.run_all(clones));

    auto context = planner.discover();
    if (context.is_err()) {
        summary.results.push_back(planning_failure(context.error));
        return summary;
    }

    status_line(fmt::format("Checking {} project(s)", context.value.project_dirs.size()));
    summary.merge(orch.run_all(planner.project_jobs(context.value)));
    return summary;
}

RunSummary GenerationService::integrations_with(const StagingLayout& layout,
                                                GenerationOrchestrator& orch) {
    RunSummary summary;
    IntegrationsPlanner planner(config_, layout);

    auto job = planner.plan();
    if (job.is_err()) {
        summary.results.push_back(planning_failure(job.error));
        return summary;
    }
    summary.results.push_back(orch.run_if_stale(job.value));
    return summary;
}

Result<RunSummary, GenError> GenerationService::run_bootstrap() {
    using R = Result<RunSummary, GenError>;
    auto resolved = layout();
    if (resolved.is_err()) return R::Err(resolved.error);

    if (!config_.bootstrap().enabled) return R::Ok(RunSummary{});
    GenerationOrchestrator orch(store_, invoker_, cb_);
    return R::Ok(bootstrap_with(resolved.value, orch));
}

Result<RunSummary, GenError> GenerationService::run_integrations() {
    using R = Result<RunSummary, GenError>;
    auto resolved = layout();
    if (resolved.is_err()) return R::Err(resolved.error);

    if (!config_.integrations().enabled) return R::Ok(RunSummary{});
    GenerationOrchestrator orch(store_, invoker_, cb_);
    return R::Ok(integrations_with(resolved.value, orch));
}

Result<RunSummary, GenError> GenerationService::run_all() {
    using R = Result<RunSummary, GenError>;
    auto resolved = layout();
    if (resolved.is_err()) return R::Err(resolved.error);

    GenerationOrchestrator orch(store_, invoker_, cb_);
    RunSummary summary;
    if (config_.bootstrap().enabled) {
        summary.merge(bootstrap_with(resolved.value, orch));
    }
    if (config_.integrations().enabled) {
        summary.merge(integrations_with(resolved.value, orch));
    }
    return R::Ok(summary);
}

Result<std::vector<JobStatus>, GenError> GenerationService::status() {
    using R = Result<std::vector<JobStatus>, GenError>;
    auto resolved = layout();
    if (resolved.is_err()) return R::Err(resolved.error);
    const StagingLayout& staging = resolved.value;

    std::vector<GenerationJob> jobs;
    std::vector<JobStatus> statuses;

    auto failed = [&](const GenError& err) {
        JobStatus s;
        s.job = err.job;
        s.error = err;
        statuses.push_back(s);
    };

    if (config_.bootstrap().enabled) {
        BootstrapPlanner planner(config_, staging);
        std::vector<GenError> seed_failures;
        auto clones = planner.clone_jobs(seed_failures);
        for (const auto& err : seed_failures) failed(err);
        jobs.insert(jobs.end(), clones.begin(), clones.end());

        auto context = planner.discover();
        if (context.is_ok()) {
            auto projects = planner.project_jobs(context.value);
            jobs.insert(jobs.end(), projects.begin(), projects.end());
        } else {
            failed(context.error);
        }
    }
    if (config_.integrations().enabled) {
        auto job = IntegrationsPlanner(config_, staging).plan();
        if (job.is_ok()) jobs.push_back(job.value);
        else failed(job.error);
    }

    GenerationOrchestrator orch(store_, invoker_);
    for (const auto& job : jobs) {
        JobStatus s;
        s.job = job.name;
        s.record = store_.load(job.cache_dir);
        auto checked = orch.check(job);
        if (checked.is_ok()) {
            s.current = checked.value.current;
            s.stale = checked.value.stale;
        } else {
            s.error = checked.error;
        }
        statuses.push_back(s);
    }
    return R::Ok(statuses);
}
