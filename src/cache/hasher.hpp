#pragma once

#include <string>
#include <vector>
#include <set>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Files whose content decides whether a generation job must re-run.
// Membership is a set: enumeration order and duplicates do not matter.
class TrackedInputSet {
public:
    TrackedInputSet() = default;

    // Missing files contribute an "absent" marker to the fingerprint.
    TrackedInputSet& add(const fs::path& path);

    // Seed files: a missing required file is a HashingError.
    TrackedInputSet& add_required(const fs::path& path);

    TrackedInputSet& add_all(const std::vector<fs::path>& paths);

    // Canonical (absolute, normal, sorted) members
    const std::set<fs::path>& paths() const { return paths_; }
    bool is_required(const fs::path& path) const;
    bool empty() const { return paths_.empty(); }
    size_t size() const { return paths_.size(); }

private:
    std::set<fs::path> paths_;
    std::set<fs::path> required_;
};

struct Fingerprint {
    std::string hex;   // lowercase SHA-256

    bool operator==(const Fingerprint& other) const { return hex == other.hex; }
    bool operator!=(const Fingerprint& other) const { return hex != other.hex; }

    // Abbreviated form for terminal output
    std::string short_hex() const { return hex.substr(0, 12); }
};

// Digest over every member's path and full content.
Result<Fingerprint, GenError> fingerprint(const TrackedInputSet& inputs);

// SHA-256 of an in-memory string, lowercase hex.
std::string sha256_hex(const std::string& data);
