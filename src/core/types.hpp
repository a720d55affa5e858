#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <filesystem>

// Result type for operations that can fail
template <typename T, typename E = std::string>
struct Result {
    bool success;
    T value;
    E error;

    static Result<T, E> Ok(T val) {
        return {true, std::move(val), E{}};
    }

    static Result<T, E> Err(E err) {
        return {false, T{}, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <typename E>
struct Result<void, E> {
    bool success;
    E error;

    static Result<void, E> Ok() {
        return {true, E{}};
    }

    static Result<void, E> Err(E err) {
        return {false, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Generation errors ───────────────────────────────────────

enum class ErrorKind {
    Configuration,   // base directory / required location unresolvable
    Hashing,         // tracked input exists but cannot be read
    CacheRead,       // persisted record unreadable (never fatal)
    Command,         // external command exited non-zero
    Commit,          // new fingerprint could not be persisted
    Filesystem,      // stale artifact could not be cleared, seed not written
};

const char* error_kind_name(ErrorKind kind);

struct GenError {
    ErrorKind kind = ErrorKind::Configuration;
    std::string job;
    std::string message;

    // Populated for ErrorKind::Command
    std::string label;
    std::string command;
    std::filesystem::path working_dir;
    int exit_code = 0;

    // One-line rendering for terminal and log output
    std::string describe() const;

    static GenError configuration(const std::string& message);
    static GenError hashing(const std::filesystem::path& path, const std::string& reason);
    static GenError filesystem(const std::filesystem::path& path, const std::string& reason);
    static GenError commit(const std::filesystem::path& record, const std::string& reason);
};

// Host flavours that change how tool commands are prefixed
enum class HostOs {
    Posix,
    Windows,
};

// ── Configuration structures ────────────────────────────────

struct StagingSettings {
    std::optional<std::filesystem::path> base_dir;          // global base, staging = base/staging
    std::optional<std::filesystem::path> staging_override;  // wins over base_dir when set
    std::string schema_version;
    std::string index_prefix;
};

struct VariantConfig {
    std::string dir;                 // sub-directory of the integrations base
    std::string label;               // human name used in failure messages
};

struct PreludeConfig {
    std::string script;              // relative to the integrations base
    std::vector<std::string> args;
};

struct IntegrationsConfig {
    bool enabled = false;
    std::filesystem::path base;
    std::string index_prefix;
    std::filesystem::path schema_file;
    std::vector<VariantConfig> variants;
    std::vector<std::filesystem::path> plugin_sources;
    std::vector<std::string> tasks;
    std::optional<PreludeConfig> prelude;   // posix hosts only
};

struct RepositoryConfig {
    std::string url;
    std::string revision;
};

struct BootstrapConfig {
    bool enabled = false;
    std::filesystem::path resources_dir;
    std::filesystem::path plugin_source_dir;
    std::vector<std::string> extensions;         // project files that are tracked
    std::vector<std::string> plugin_extensions;  // plugin files that are tracked
    std::vector<std::string> tasks;
    std::vector<RepositoryConfig> repositories;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
