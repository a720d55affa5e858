#include "types.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::Hashing:       return "HashingError";
        case ErrorKind::CacheRead:     return "CacheReadError";
        case ErrorKind::Command:       return "CommandFailure";
        case ErrorKind::Commit:        return "CommitError";
        case ErrorKind::Filesystem:    return "FilesystemError";
    }
    return "UnknownError";
}

std::string GenError::describe() const {
    std::string prefix = job.empty() ? "" : fmt::format("[{}] ", job);
    if (kind == ErrorKind::Command) {
        return fmt::format("{}{}: {} (exit {}, in {}): {}",
                           prefix, error_kind_name(kind), message, exit_code,
                           working_dir.string(), command);
    }
    return fmt::format("{}{}: {}", prefix, error_kind_name(kind), message);
}

GenError GenError::configuration(const std::string& message) {
    GenError e;
    e.kind = ErrorKind::Configuration;
    e.message = message;
    return e;
}

GenError GenError::hashing(const std::filesystem::path& path, const std::string& reason) {
    GenError e;
    e.kind = ErrorKind::Hashing;
    e.message = fmt::format("cannot read tracked input {}: {}", path.string(), reason);
    return e;
}

GenError GenError::filesystem(const std::filesystem::path& path, const std::string& reason) {
    GenError e;
    e.kind = ErrorKind::Filesystem;
    e.message = fmt::format("{}: {}", path.string(), reason);
    return e;
}

GenError GenError::commit(const std::filesystem::path& record, const std::string& reason) {
    GenError e;
    e.kind = ErrorKind::Commit;
    e.message = fmt::format("cannot persist cache record {}: {}", record.string(), reason);
    return e;
}
