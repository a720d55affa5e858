#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include "hasher.hpp"

namespace fs = std::filesystem;

struct CacheRecord {
    std::string key;                  // cache directory the record lives in
    Fingerprint fingerprint;
    std::vector<std::string> inputs;  // informational, not compared
    std::vector<std::string> outputs;
    std::string committed_at;         // ISO timestamp
};

// Persists the last committed fingerprint per cache key. A cache key is the
// job's cache directory; its record is <key>/record.yaml, so unrelated jobs
// never share state.
//
// A missing, unreadable or corrupt record is a cache miss, never an error.
class CacheStore {
public:
    CacheStore() = default;

    std::optional<CacheRecord> load(const fs::path& key) const;
    std::optional<Fingerprint> lookup(const fs::path& key) const;

    // Replaces the record atomically (temp file + rename).
    Result<void, GenError> commit(const fs::path& key,
                                  const Fingerprint& fp,
                                  const TrackedInputSet& inputs,
                                  const std::vector<fs::path>& outputs) const;

    bool is_stale(const fs::path& key, const Fingerprint& current) const;

    // Stale when nothing was committed or the committed digest differs.
    static bool is_stale(const std::optional<Fingerprint>& previous, const Fingerprint& current);

    static fs::path record_path(const fs::path& key);
};
