#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Host flavour of the running process.
HostOs detect_host_os();

// Current process id (used to name temp files next to their target).
int current_pid();

} // namespace platform
