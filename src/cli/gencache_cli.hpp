#pragma once

#include <string>
#include <map>
#include <functional>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <managers/generation_orchestrator.hpp>

namespace fs = std::filesystem;

class GencacheCLI {
public:
    explicit GencacheCLI(fs::path project_dir = fs::current_path());

    // Returns the process exit status.
    using CommandHandler = std::function<int(GencacheCLI&)>;

    void add_command(const std::string& name, CommandHandler handler, const std::string& help);
    bool has_command(const std::string& name) const;
    int execute_command(const std::string& name);
    void print_help() const;

    int run_generation(const std::string& phase);
    int run_status();

private:
    void register_all_commands();
    bool require_config();
    int report(const RunSummary& summary);

    fs::path project_dir_;
    std::optional<Config> config_;
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
