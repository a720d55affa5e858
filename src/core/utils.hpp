#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Expand a leading "~" and resolve relative paths against base.
std::filesystem::path resolve_path(const std::string& raw, const std::filesystem::path& base);

// Absolute, lexically normal form used wherever paths are compared or hashed.
std::filesystem::path normalize_path(const std::filesystem::path& p);

// Write content to path unless the file already holds exactly that content.
// Keeps the file untouched (and its mtime stable) when nothing changed.
Result<void, GenError> write_file_if_changed(const std::filesystem::path& path,
                                             const std::string& content);
