#include "generation_orchestrator.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <chrono>
#include <system_error>

// ── RunSummary ───────────────────────────────────────────────

bool RunSummary::ok() const {
    return failed_count() == 0;
}

size_t RunSummary::failed_count() const {
    size_t n = 0;
    for (const auto& r : results) {
        if (r.is_err()) n++;
    }
    return n;
}

size_t RunSummary::regenerated_count() const {
    size_t n = 0;
    for (const auto& r : results) {
        if (r.is_ok() && r.value.outcome == JobOutcome::Regenerated) n++;
    }
    return n;
}

void RunSummary::merge(const RunSummary& other) {
    results.insert(results.end(), other.results.begin(), other.results.end());
}

// ── GenerationOrchestrator ───────────────────────────────────

GenerationOrchestrator::GenerationOrchestrator(const CacheStore& store,
                                               ExternalInvoker& invoker,
                                               StatusCallback cb)
    : store_(store), invoker_(invoker), cb_(std::move(cb)) {}

void GenerationOrchestrator::status(const std::string& msg) {
    if (cb_) cb_(msg);
}

Result<StalenessCheck, GenError> GenerationOrchestrator::check(const GenerationJob& job) const {
    using R = Result<StalenessCheck, GenError>;

    auto fp = fingerprint(job.inputs);
    if (fp.is_err()) {
        GenError err = fp.error;
        err.job = job.name;
        return R::Err(err);
    }

    StalenessCheck result;
    result.current = fp.value;
    result.previous = store_.lookup(job.cache_dir);
    result.stale = CacheStore::is_stale(result.previous, result.current);
    return R::Ok(result);
}

Result<void, GenError> GenerationOrchestrator::clear_stale_artifacts(const GenerationJob& job) {
    for (const auto& path : job.clear_before_run) {
        std::error_code ec;
        fs::remove_all(path, ec);
        if (ec) {
            GenError err = GenError::filesystem(path, "cannot remove stale artifact: " + ec.message());
            err.job = job.name;
            return Result<void, GenError>::Err(err);
        }
    }
    return Result<void, GenError>::Ok();
}

void GenerationOrchestrator::warn_missing_outputs(const GenerationJob& job) {
    for (const auto& out : job.outputs) {
        std::error_code ec;
        if (!fs::exists(out, ec)) {
            gen_log(fmt::format("[{}] warning: declared output {} was not produced",
                                job.name, out.string()));
        }
    }
}

JobResult GenerationOrchestrator::run_if_stale(const GenerationJob& job) {
    auto checked = check(job);
    if (checked.is_err()) {
        gen_log(checked.error.describe());
        append_job_log(job.name, checked.error.describe());
        return JobResult::Err(checked.error);
    }
    const StalenessCheck& staleness = checked.value;

    JobReport report;
    report.job = job.name;
    report.fingerprint = staleness.current;
    report.outputs = job.outputs;

    if (!staleness.stale) {
        gen_log(fmt::format("[{}] up to date ({})", job.name, staleness.current.short_hex()));
        report.outcome = JobOutcome::UpToDate;
        return JobResult::Ok(report);
    }

    gen_log(fmt::format("[{}] stale: {} -> {}", job.name,
                        staleness.previous ? staleness.previous->short_hex() : "none",
                        staleness.current.short_hex()));
    status(fmt::format("Generating {}", job.name));
    append_job_log(job.name, fmt::format("regenerating, fingerprint {}", staleness.current.hex));

    auto start = std::chrono::steady_clock::now();

    auto cleared = clear_stale_artifacts(job);
    if (cleared.is_err()) {
        append_job_log(job.name, cleared.error.describe());
        return JobResult::Err(cleared.error);
    }

    for (const auto& cmd : job.commands) {
        status(fmt::format("Running {} in {}", cmd.label, cmd.working_dir.string()));
        auto ran = invoker_.run(cmd);
        report.commands_run++;
        if (ran.is_err()) {
            GenError err = ran.error;
            err.job = job.name;
            // Nothing is committed: the next run retries the whole sequence.
            append_job_log(job.name, err.describe());
            return JobResult::Err(err);
        }
    }

    warn_missing_outputs(job);

    auto committed = store_.commit(job.cache_dir, staleness.current, job.inputs, job.outputs);
    if (committed.is_err()) {
        GenError err = committed.error;
        err.job = job.name;
        gen_log(err.describe());
        append_job_log(job.name, err.describe());
        return JobResult::Err(err);
    }

    report.outcome = JobOutcome::Regenerated;
    report.elapsed = format_elapsed(std::chrono::steady_clock::now() - start);
    append_job_log(job.name, fmt::format("generated in {} ({} command(s))",
                                         report.elapsed, report.commands_run));
    return JobResult::Ok(report);
}

RunSummary GenerationOrchestrator::run_all(const std::vector<GenerationJob>& jobs) {
    RunSummary summary;
    for (const auto& job : jobs) {
        summary.results.push_back(run_if_stale(job));
    }
    return summary;
}
