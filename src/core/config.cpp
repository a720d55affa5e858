#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <stdexcept>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIR;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / GLOBAL_CONFIG_FILE;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_FILE;
}

// Accepts a single scalar or a sequence of scalars.
static std::vector<std::string> as_string_list(const YAML::Node& node,
                                               const std::vector<std::string>& fallback) {
    if (!node) return fallback;
    if (node.IsScalar()) return {node.as<std::string>()};
    if (node.IsSequence()) return node.as<std::vector<std::string>>();
    throw std::runtime_error("expected a string or a list of strings");
}

static HostOs parse_host_os(const std::string& value) {
    if (value == "windows") return HostOs::Windows;
    if (value == "posix" || value == "linux" || value == "macos") return HostOs::Posix;
    throw std::runtime_error("host_os must be 'posix' or 'windows', got '" + value + "'");
}

// The build variants of build-integrations/, oldest first
static std::vector<VariantConfig> default_variants() {
    return {
        {"sbt-0.13",   "sbt 0.13"},
        {"sbt-0.13-2", "sbt 0.13 (2)"},
        {"sbt-0.13-3", "sbt 0.13 (3)"},
        {"sbt-1.0",    "sbt 1.0"},
        {"sbt-1.0-2",  "sbt 1.0 (2)"},
        {"sbt-1.0-3",  "sbt 1.0 (3)"},
    };
}

static IntegrationsConfig parse_integrations_config(const YAML::Node& node, const fs::path& dir) {
    IntegrationsConfig cfg;
    cfg.enabled = node["enabled"].as<bool>(true);
    cfg.base = resolve_path(node["base"].as<std::string>(DEFAULT_INTEGRATIONS), dir);
    cfg.index_prefix = node["index_prefix"].as<std::string>(DEFAULT_INDEX_PREFIX);
    cfg.schema_file = resolve_path(node["schema_file"].as<std::string>(DEFAULT_SCHEMA_FILE), dir);
    cfg.tasks = as_string_list(node["tasks"], {"cleanAllBuilds", "bloopInstall", "buildIndex"});

    if (!node["variants"]) {
        cfg.variants = default_variants();
    } else if (node["variants"].IsSequence()) {
        for (const auto& v : node["variants"]) {
            VariantConfig variant;
            if (v.IsScalar()) {
                // Bare string shorthand: `- sbt-1.0`
                variant.dir = v.as<std::string>();
            } else if (v.IsMap()) {
                variant.dir = v["dir"].as<std::string>("");
                variant.label = v["label"].as<std::string>("");
            }
            if (variant.dir.empty()) {
                throw std::runtime_error("integrations.variants entry without a dir");
            }
            if (variant.label.empty()) variant.label = variant.dir;
            cfg.variants.push_back(variant);
        }
    } else {
        throw std::runtime_error("integrations.variants must be a list");
    }
    if (cfg.enabled && cfg.variants.empty()) {
        throw std::runtime_error("integrations.variants must name at least one build variant");
    }

    // Plugin sources are relative to the integrations base
    for (const auto& src : as_string_list(node["plugin_sources"], {})) {
        cfg.plugin_sources.push_back(resolve_path(src, cfg.base));
    }

    if (node["prelude"] && node["prelude"].IsMap()) {
        PreludeConfig prelude;
        prelude.script = node["prelude"]["script"].as<std::string>("");
        prelude.args = as_string_list(node["prelude"]["args"], {});
        if (prelude.script.empty()) {
            throw std::runtime_error("integrations.prelude requires a script");
        }
        cfg.prelude = prelude;
    }

    return cfg;
}

static BootstrapConfig parse_bootstrap_config(const YAML::Node& node, const fs::path& dir) {
    BootstrapConfig cfg;
    cfg.enabled = node["enabled"].as<bool>(true);
    cfg.resources_dir = resolve_path(node["resources_dir"].as<std::string>(DEFAULT_RESOURCES_DIR), dir);
    cfg.plugin_source_dir = resolve_path(
        node["plugin_source_dir"].as<std::string>(DEFAULT_PLUGIN_SRC_DIR), dir);
    cfg.extensions = as_string_list(node["extensions"], {".sbt", ".scala"});
    cfg.plugin_extensions = as_string_list(node["plugin_extensions"], {".scala"});
    cfg.tasks = as_string_list(node["tasks"], {"bloopInstall"});

    if (node["repositories"] && node["repositories"].IsSequence()) {
        for (const auto& r : node["repositories"]) {
            RepositoryConfig repo;
            repo.url = r["url"].as<std::string>("");
            repo.revision = r["revision"].as<std::string>("");
            if (repo.url.empty() || repo.revision.empty()) {
                throw std::runtime_error("bootstrap.repositories entries need url and revision");
            }
            cfg.repositories.push_back(repo);
        }
    }

    return cfg;
}

// Keys shared by the global and project files
static void parse_locations(const YAML::Node& root, const fs::path& dir,
                            std::optional<fs::path>& base_dir,
                            std::optional<fs::path>& staging_dir,
                            std::optional<HostOs>& host_os) {
    if (root["base_dir"] && root["base_dir"].IsScalar()) {
        base_dir = resolve_path(root["base_dir"].as<std::string>(), dir);
    }
    if (root["staging_dir"] && root["staging_dir"].IsScalar()) {
        staging_dir = resolve_path(root["staging_dir"].as<std::string>(), dir);
    }
    if (root["host_os"] && root["host_os"].IsScalar()) {
        host_os = parse_host_os(root["host_os"].as<std::string>());
    }
}

Result<Config> Config::parse(const std::string& yaml_text, const fs::path& project_dir) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("Project config must be a YAML mapping");
        }

        Config config;
        config.project_dir_ = normalize_path(project_dir);
        parse_locations(root, config.project_dir_, config.base_dir_, config.staging_dir_,
                        config.host_os_);

        config.schema_version_ = root["schema_version"].as<std::string>(DEFAULT_SCHEMA_VERSION);
        config.tool_ = root["tool"].as<std::string>(DEFAULT_TOOL);

        if (root["integrations"] && root["integrations"].IsMap()) {
            config.integrations_ = parse_integrations_config(root["integrations"], config.project_dir_);
        }
        if (root["bootstrap"] && root["bootstrap"].IsMap()) {
            config.bootstrap_ = parse_bootstrap_config(root["bootstrap"], config.project_dir_);
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse project config: ") + e.what());
    }
}

Result<Config> Config::load_global() {
    // No global file is fine: everything can come from the project
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config{});
    }

    try {
        YAML::Node root = YAML::LoadFile(get_global_config_path().string());

        Config config;
        parse_locations(root, platform::home_dir(), config.base_dir_, config.staging_dir_,
                        config.host_os_);
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse global config: ") + e.what());
    }
}

Result<Config> Config::load_project(const fs::path& dir) {
    if (!project_config_exists(dir)) {
        return Result<Config>::Err("Project config not found at " + get_project_config_path(dir).string());
    }

    std::ifstream in(get_project_config_path(dir));
    if (!in) {
        return Result<Config>::Err("Cannot read " + get_project_config_path(dir).string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str(), dir);
}

void Config::overlay_globals(const Config& global) {
    if (!base_dir_) base_dir_ = global.base_dir_;
    if (!staging_dir_) staging_dir_ = global.staging_dir_;
    if (!host_os_) host_os_ = global.host_os_;
}

Result<Config> Config::load(const fs::path& project_dir) {
    auto project_result = load_project(project_dir);
    if (!project_result.is_ok()) {
        return project_result;
    }

    auto global_result = load_global();
    if (!global_result.is_ok()) {
        return global_result;
    }

    Config config = project_result.value;
    config.overlay_globals(global_result.value);

    // Environment is the last resort for the base directory
    if (!config.base_dir_) {
        const char* env = std::getenv(BASE_DIR_ENV);
        if (env && *env) {
            config.base_dir_ = resolve_path(env, config.project_dir_);
        }
    }

    return Result<Config>::Ok(config);
}

StagingSettings Config::staging() const {
    StagingSettings settings;
    settings.base_dir = base_dir_;
    settings.staging_override = staging_dir_;
    settings.schema_version = schema_version_;
    settings.index_prefix = integrations_.index_prefix;
    return settings;
}

HostOs Config::host_os() const {
    return host_os_ ? *host_os_ : platform::detect_host_os();
}
