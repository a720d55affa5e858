#include "gencache_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <managers/external_invoker.hpp>
#include <managers/generation_service.hpp>
#include <fmt/format.h>
#include <iostream>

GencacheCLI::GencacheCLI(fs::path project_dir) : project_dir_(std::move(project_dir)) {
    register_all_commands();
}

void GencacheCLI::register_all_commands() {
    add_command("run", [](GencacheCLI& cli) { return cli.run_generation("all"); },
                "Bootstrap, then regenerate integration configs");
    add_command("bootstrap", [](GencacheCLI& cli) { return cli.run_generation("bootstrap"); },
                "Clone pinned repositories and regenerate test projects");
    add_command("integrations", [](GencacheCLI& cli) { return cli.run_generation("integrations"); },
                "Regenerate configs for every integration build variant");
    add_command("status", [](GencacheCLI& cli) { return cli.run_status(); },
                "Show which jobs are stale without running anything");
}

void GencacheCLI::add_command(const std::string& name,
                              CommandHandler handler,
                              const std::string& help) {
    commands_[name] = {handler, help};
}

bool GencacheCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

int GencacheCLI::execute_command(const std::string& name) {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + name);
        print_help();
        return 1;
    }
    return it->second.first(*this);
}

void GencacheCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& [name, entry] : commands_) {
        std::cout << theme::color::BLUE << fmt::format("    {:<14}", name) << theme::color::RESET
                  << theme::color::DIM << entry.second << theme::color::RESET << "\n";
    }
    std::cout << "\n";
}

bool GencacheCLI::require_config() {
    if (config_.has_value()) return true;

    auto loaded = Config::load(project_dir_);
    if (loaded.is_err()) {
        gen_log("ConfigurationError: " + loaded.error);
        std::cout << theme::fail(loaded.error);
        return false;
    }
    config_ = loaded.value;
    return true;
}

int GencacheCLI::report(const RunSummary& summary) {
    for (const auto& result : summary.results) {
        if (result.is_err()) {
            const GenError& err = result.error;
            std::cout << theme::fail(fmt::format("{}: {}", err.job, err.message));
            if (err.kind == ErrorKind::Command) {
                std::cout << theme::kv("command", err.command);
                std::cout << theme::kv("directory", err.working_dir.string());
                std::cout << theme::kv("exit code", std::to_string(err.exit_code));
            } else {
                std::cout << theme::kv("error", error_kind_name(err.kind));
            }
            continue;
        }

        const JobReport& r = result.value;
        if (r.outcome == JobOutcome::Regenerated) {
            std::cout << theme::ok(fmt::format("Generated {} in {}", r.job, r.elapsed));
        } else {
            std::cout << theme::info(fmt::format("{} is up to date", r.job));
        }
    }

    std::cout << "\n";
    if (summary.ok()) {
        std::cout << theme::ok(fmt::format("{} job(s), {} regenerated",
                                           summary.results.size(), summary.regenerated_count()));
        return 0;
    }
    std::cout << theme::fail(fmt::format("{} of {} job(s) failed (details in {})",
                                         summary.failed_count(), summary.results.size(),
                                         gen_log_path()));
    return 1;
}

int GencacheCLI::run_generation(const std::string& phase) {
    if (!require_config()) return 1;

    ProcessInvoker invoker;
    GenerationService service(*config_, invoker, [](const std::string& msg) {
        std::cout << theme::step(msg) << std::flush;
    });

    Result<RunSummary, GenError> result =
        phase == "bootstrap"    ? service.run_bootstrap() :
        phase == "integrations" ? service.run_integrations() :
                                  service.run_all();

    if (result.is_err()) {
        std::cout << theme::fail(result.error.describe());
        return 1;
    }
    return report(result.value);
}

int GencacheCLI::run_status() {
    if (!require_config()) return 1;

    ProcessInvoker invoker;
    GenerationService service(*config_, invoker);
    auto result = service.status();
    if (result.is_err()) {
        std::cout << theme::fail(result.error.describe());
        return 1;
    }

    std::cout << theme::section("Generation cache");
    int problems = 0;
    for (const auto& s : result.value) {
        if (s.error) {
            problems++;
            std::cout << theme::fail(fmt::format("{}: {}", s.job, s.error->message));
            continue;
        }
        std::string state = s.stale ? theme::yellow("stale") : theme::green("up to date");
        std::string last = s.record
            ? fmt::format("{} committed {}", s.record->fingerprint.short_hex(),
                          format_age(s.record->committed_at))
            : std::string("never generated");
        std::cout << theme::kv(s.job, fmt::format("{}  {}", state, theme::dim(last)));
    }
    std::cout << "\n";
    return problems == 0 ? 0 : 1;
}
