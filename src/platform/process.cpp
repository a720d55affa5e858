#include "process.hpp"
#include <core/constants.hpp>

#ifdef _WIN32
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <fcntl.h>
#  include <cerrno>
#endif

#include <sstream>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
#else
    pid_ = other.pid_;
    other.pid_ = -1;
#endif
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
        if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
        handle_ = other.handle_;
        thread_ = other.thread_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        other.pid_ = -1;
#endif
    }
    return *this;
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

int ProcessHandle::wait() {
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return -1;
    WaitForSingleObject(handle_, INFINITE);
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    return static_cast<int>(code);
#else
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    pid_ = -1;  // reaped
    if (ret < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return EXIT_SIGNAL_BASE + WTERMSIG(status);
    return -1;
#endif
}

// ── spawn ────────────────────────────────────────────────────

#ifdef _WIN32

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    // Build command line
    std::ostringstream cmdline;
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    std::string cmd_str = cmdline.str();

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    // Redirect stderr if requested
    HANDLE hStderr = INVALID_HANDLE_VALUE;
    if (!options.stderr_log.empty()) {
        SECURITY_ATTRIBUTES sa = {};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;
        hStderr = CreateFileA(options.stderr_log.c_str(), FILE_APPEND_DATA,
                              FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                              OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (hStderr != INVALID_HANDLE_VALUE) {
            si.dwFlags |= STARTF_USESTDHANDLES;
            si.hStdError = hStderr;
            si.hStdOutput = GetStdHandle(STD_OUTPUT_HANDLE);
            si.hStdInput = nullptr;
        }
    }

    std::string cwd = options.working_dir.string();
    if (CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                       0, nullptr, cwd.empty() ? nullptr : cwd.c_str(), &si, &pi)) {
        handle.handle_ = pi.hProcess;
        handle.thread_ = pi.hThread;
    }

    if (hStderr != INVALID_HANDLE_VALUE) CloseHandle(hStderr);
    return handle;
}

#else // Unix

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    // Everything the child touches is prepared before fork.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    std::string cwd = options.working_dir.string();

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!options.stderr_log.empty()) {
            int fd = open(options.stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(EXIT_CHDIR_FAILED);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(EXIT_SPAWN_FAILED);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    return handle;
}

#endif

} // namespace platform
