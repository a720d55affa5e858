#include "staging_resolver.hpp"
#include "hasher.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

Result<StagingLayout, GenError> StagingLayout::resolve(const StagingSettings& settings) {
    using R = Result<StagingLayout, GenError>;

    bool has_base = settings.base_dir && !settings.base_dir->empty();
    bool has_override = settings.staging_override && !settings.staging_override->empty();
    if (!has_base && !has_override) {
        return R::Err(GenError::configuration(
            fmt::format("base directory is not configured (set base_dir in {} or {})",
                        PROJECT_CONFIG_FILE, BASE_DIR_ENV)));
    }
    if (settings.schema_version.empty()) {
        return R::Err(GenError::configuration("schema_version must not be empty"));
    }

    StagingLayout layout;
    layout.staging_root_ = has_override
        ? normalize_path(*settings.staging_override)
        : normalize_path(*settings.base_dir / STAGING_SUBDIR);
    layout.integrations_cache_dir_ = layout.staging_root_ / INTEGRATIONS_CACHE_DIR;

    std::string prefix = settings.index_prefix.empty() ? DEFAULT_INDEX_PREFIX : settings.index_prefix;
    layout.index_file_ = layout.staging_root_ /
        fmt::format("{}-{}.csv", prefix, settings.schema_version);

    return R::Ok(layout);
}

fs::path StagingLayout::project_cache_dir(const fs::path& project_dir) {
    return normalize_path(project_dir / PROJECT_CACHE_SUBDIR);
}

static std::string url_hash(const std::string& url) {
    return sha256_hex(url).substr(0, CLONE_DIR_HASH_CHARS);
}

fs::path StagingLayout::clone_dir(const std::string& url) const {
    return staging_root_ / url_hash(url);
}

// Inside the clone: removing the clone also forgets that it was made.
fs::path StagingLayout::clone_cache_dir(const std::string& url) const {
    return clone_dir(url) / CLONE_RECORD_SUBDIR;
}

fs::path StagingLayout::clone_ref_file(const std::string& url) const {
    return staging_root_ / CLONE_REFS_DIR / (url_hash(url) + ".ref");
}
