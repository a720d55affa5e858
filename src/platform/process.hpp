#pragma once

#include <string>
#include <vector>
#include <filesystem>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

struct SpawnOptions {
    std::filesystem::path working_dir;   // empty = inherit the parent's cwd
    std::string stderr_log;              // non-empty = append child's stderr here
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Block until the process exits. Returns its exit code; a child killed
    // by a signal reports 128 + signal number, an invalid handle -1.
    int wait();

private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
#endif
    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const SpawnOptions& options);
};

// Spawn a child process. The child inherits the parent's environment and
// stdout/stderr; stdin is connected to the null device. A program that cannot
// be executed exits with 127, an unusable working directory with 126.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options = {});

} // namespace platform
