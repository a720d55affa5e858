#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.gencache/config.yaml (missing file = empty config)
    static Result<Config> load_global();

    // Load project config from <dir>/gencache.yaml
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Load both and combine (prefer project overrides, then GENCACHE_BASE)
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Parse project YAML text; relative paths resolve against project_dir.
    static Result<Config> parse(const std::string& yaml_text, const fs::path& project_dir);

    // Accessors
    const fs::path& project_dir() const { return project_dir_; }
    const std::string& tool() const { return tool_; }
    const std::string& schema_version() const { return schema_version_; }
    const IntegrationsConfig& integrations() const { return integrations_; }
    const BootstrapConfig& bootstrap() const { return bootstrap_; }
    StagingSettings staging() const;

    // Configured host flavour, or the detected one.
    HostOs host_os() const;

public:
    Config() = default;

private:
    void overlay_globals(const Config& global);

    fs::path project_dir_;
    std::optional<fs::path> base_dir_;
    std::optional<fs::path> staging_dir_;
    std::optional<HostOs> host_os_;
    std::string schema_version_;
    std::string tool_;
    IntegrationsConfig integrations_;
    BootstrapConfig bootstrap_;
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
