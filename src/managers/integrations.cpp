#include "integrations.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

IntegrationsPlanner::IntegrationsPlanner(const Config& config, const StagingLayout& layout)
    : config_(config), layout_(layout) {}

TrackedInputSet IntegrationsPlanner::tracked_inputs() const {
    const auto& cfg = config_.integrations();

    TrackedInputSet inputs;
    inputs.add_required(cfg.schema_file);
    for (const auto& variant : cfg.variants) {
        fs::path dir = cfg.base / variant.dir;
        inputs.add(dir / "build.sbt");
        inputs.add(dir / "project" / "Integrations.scala");
    }
    inputs.add_all(cfg.plugin_sources);
    return inputs;
}

CommandLine IntegrationsPlanner::variant_command() const {
    const auto& cfg = config_.integrations();
    fs::path global_plugins = cfg.base / "global";

    CommandLine cmd = CommandLine::for_tool(config_.tool(), config_.host_os());
    cmd.property(PROP_STAGING, layout_.staging_root().string())
       .property(PROP_INDEX, layout_.index_file().string())
       .property(PROP_GLOBAL_PLUGINS, global_plugins.string())
       .property(PROP_GLOBAL_SETTINGS, (global_plugins / "settings").string())
       .property(PROP_SCHEMA_VERSION, config_.schema_version())
       .args(cfg.tasks);
    return cmd;
}

Result<GenerationJob, GenError> IntegrationsPlanner::plan() const {
    using R = Result<GenerationJob, GenError>;
    const auto& cfg = config_.integrations();

    GenerationJob job;
    job.name = "integrations";

    // Bumping the schema version must invalidate the cache.
    auto seeded = write_file_if_changed(cfg.schema_file, config_.schema_version());
    if (seeded.is_err()) {
        GenError err = seeded.error;
        err.job = job.name;
        return R::Err(err);
    }

    job.cache_dir = layout_.integrations_cache_dir();
    job.inputs = tracked_inputs();
    job.outputs = {layout_.index_file()};
    job.clear_before_run = {layout_.index_file()};

    // Snapshot publishing script; skipped on Windows hosts.
    if (cfg.prelude && config_.host_os() == HostOs::Posix) {
        Command prelude;
        prelude.label = fmt::format("prelude {}", cfg.prelude->script);
        prelude.line = CommandLine("bash");
        prelude.line.arg((cfg.base / cfg.prelude->script).string()).args(cfg.prelude->args);
        prelude.working_dir = cfg.base;
        prelude.failure_message = fmt::format("Failed to run prelude script {}.", cfg.prelude->script);
        job.commands.push_back(prelude);
    }

    CommandLine base_cmd = variant_command();
    for (const auto& variant : cfg.variants) {
        Command cmd;
        cmd.label = variant.label;
        cmd.line = base_cmd;
        cmd.working_dir = cfg.base / variant.dir;
        cmd.failure_message = fmt::format("Failed to generate config with {}.", variant.label);
        job.commands.push_back(cmd);
    }

    gen_log(fmt::format("[{}] planned {} command(s), {} tracked input(s)",
                        job.name, job.commands.size(), job.inputs.size()));
    return R::Ok(job);
}
