#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Locations used by a generation run. Computed once, up front; holds no
// handles and creates nothing on disk.
class StagingLayout {
public:
    // Fails fast with a ConfigurationError when no base is configured.
    static Result<StagingLayout, GenError> resolve(const StagingSettings& settings);

    const fs::path& staging_root() const { return staging_root_; }
    const fs::path& integrations_cache_dir() const { return integrations_cache_dir_; }
    const fs::path& index_file() const { return index_file_; }

    // Cache key of a bootstrap project
    static fs::path project_cache_dir(const fs::path& project_dir);

    // Where a pinned repository is cloned, and the cache key of that clone
    fs::path clone_dir(const std::string& url) const;
    fs::path clone_cache_dir(const std::string& url) const;
    fs::path clone_ref_file(const std::string& url) const;

private:
    fs::path staging_root_;
    fs::path integrations_cache_dir_;
    fs::path index_file_;
};
