#include "bootstrap.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <system_error>

static bool has_extension(const std::string& name, const std::vector<std::string>& extensions) {
    for (const auto& ext : extensions) {
        if (name.size() >= ext.size() &&
            name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
            return true;
        }
    }
    return false;
}

std::vector<fs::path> collect_files(const fs::path& root,
                                    const std::vector<std::string>& extensions,
                                    const fs::path& skip) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return files;

    fs::path skip_norm = skip.empty() ? fs::path() : normalize_path(skip);
    auto it = fs::recursive_directory_iterator(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) return files;

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            gen_log(fmt::format("collect_files: {}: {}", root.string(), ec.message()));
            break;
        }
        const auto& entry = *it;
        if (!skip_norm.empty() && entry.is_directory(ec) &&
            normalize_path(entry.path()) == skip_norm) {
            it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;
        if (has_extension(entry.path().filename().string(), extensions)) {
            files.push_back(normalize_path(entry.path()));
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string repository_name(const std::string& url) {
    std::string name = url;
    auto hash = name.find('#');
    if (hash != std::string::npos) name.erase(hash);
    while (!name.empty() && (name.back() == '/' || name.back() == '\\')) name.pop_back();
    auto slash = name.find_last_of("/:\\");
    if (slash != std::string::npos) name = name.substr(slash + 1);
    const std::string suffix = ".git";
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        name.erase(name.size() - suffix.size());
    }
    return name.empty() ? url : name;
}

// ── BootstrapPlanner ─────────────────────────────────────────

BootstrapPlanner::BootstrapPlanner(const Config& config, const StagingLayout& layout)
    : config_(config), layout_(layout) {}

Result<BootstrapContext, GenError> BootstrapPlanner::discover() const {
    using R = Result<BootstrapContext, GenError>;
    const auto& cfg = config_.bootstrap();

    BootstrapContext context;
    std::error_code ec;
    if (!fs::is_directory(cfg.resources_dir, ec)) {
        GenError err = GenError::configuration(
            fmt::format("bootstrap resources directory {} does not exist",
                        cfg.resources_dir.string()));
        err.job = "bootstrap discovery";
        return R::Err(err);
    }

    for (const auto& entry : fs::directory_iterator(cfg.resources_dir, ec)) {
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            context.project_dirs.push_back(normalize_path(entry.path()));
        }
    }
    if (ec) {
        GenError err = GenError::configuration(
            fmt::format("cannot list {}: {}", cfg.resources_dir.string(), ec.message()));
        err.job = "bootstrap discovery";
        return R::Err(err);
    }
    std::sort(context.project_dirs.begin(), context.project_dirs.end());

    gen_log(fmt::format("bootstrap: discovered {} project(s) under {}",
                        context.project_dirs.size(), cfg.resources_dir.string()));
    return R::Ok(context);
}

std::vector<GenerationJob> BootstrapPlanner::clone_jobs(std::vector<GenError>& failures) const {
    std::vector<GenerationJob> jobs;

    for (const auto& repo : config_.bootstrap().repositories) {
        GenerationJob job;
        job.name = fmt::format("clone {}", repository_name(repo.url));

        // Pinning a different revision must re-clone.
        fs::path ref_file = layout_.clone_ref_file(repo.url);
        auto seeded = write_file_if_changed(ref_file, fmt::format("{}#{}\n", repo.url, repo.revision));
        if (seeded.is_err()) {
            GenError err = seeded.error;
            err.job = job.name;
            failures.push_back(err);
            continue;
        }

        fs::path clone_dir = layout_.clone_dir(repo.url);
        job.cache_dir = layout_.clone_cache_dir(repo.url);
        job.inputs.add_required(ref_file);
        job.clear_before_run = {clone_dir};

        Command clone;
        clone.label = fmt::format("git clone {}", repository_name(repo.url));
        clone.line = CommandLine("git");
        clone.line.arg("clone").arg(repo.url).arg(clone_dir.string());
        clone.working_dir = layout_.staging_root();
        clone.failure_message = fmt::format("Git reference {} is invalid and cannot be cloned.", repo.url);

        Command checkout;
        checkout.label = fmt::format("git checkout {}", repo.revision);
        checkout.line = CommandLine("git");
        checkout.line.arg("checkout").arg("--quiet").arg(repo.revision);
        checkout.working_dir = clone_dir;
        checkout.failure_message = fmt::format("Cannot check out {} in {}.", repo.revision, repo.url);

        job.commands = {clone, checkout};
        jobs.push_back(job);
    }

    return jobs;
}

GenerationJob BootstrapPlanner::project_job(const fs::path& project_dir,
                                            const std::vector<fs::path>& plugin_files) const {
    const auto& cfg = config_.bootstrap();
    fs::path cache_dir = StagingLayout::project_cache_dir(project_dir);

    GenerationJob job;
    job.name = fmt::format("project {}", project_dir.filename().string());
    job.cache_dir = cache_dir;
    job.inputs.add_all(collect_files(project_dir, cfg.extensions, cache_dir));
    job.inputs.add_all(plugin_files);

    Command cmd;
    cmd.label = fmt::format("{} {}", config_.tool(), project_dir.filename().string());
    cmd.line = CommandLine::for_tool(config_.tool(), config_.host_os());
    cmd.line.args(cfg.tasks);
    cmd.working_dir = project_dir;
    cmd.failure_message = fmt::format("Failed to generate config for {}.", project_dir.string());
    job.commands.push_back(cmd);

    return job;
}

std::vector<GenerationJob> BootstrapPlanner::project_jobs(const BootstrapContext& context) const {
    const auto& cfg = config_.bootstrap();
    auto plugin_files = collect_files(cfg.plugin_source_dir, cfg.plugin_extensions);

    std::vector<GenerationJob> jobs;
    jobs.reserve(context.project_dirs.size());
    for (const auto& dir : context.project_dirs) {
        jobs.push_back(project_job(dir, plugin_files));
    }
    return jobs;
}
