#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log: GENCACHE_LOG overrides the default <temp>/gencache_debug.log
inline std::string gen_log_path() {
    static std::string path = [] {
        const char* env = std::getenv("GENCACHE_LOG");
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / "gencache_debug.log").string();
    }();
    return path;
}

// Persistent job history: ~/.gencache/logs/{job}.log
inline std::string job_log_path(const std::string& job) {
    std::string safe = job;
    for (auto& c : safe) {
        if (c == '/' || c == '\\' || c == ':' || c == ' ') c = '_';
    }
    return (platform::home_dir() / ".gencache" / "logs" / (safe + ".log")).string();
}

// Append a timestamped line to a job's persistent log file.
inline void append_job_log(const std::string& job, const std::string& msg) {
    std::string path = job_log_path(job);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) return;
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

inline void gen_log(const std::string& msg) {
    std::ofstream out(gen_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void gen_log_command(const std::string& label, const std::string& cmd,
                            const std::filesystem::path& cwd, int exit_code) {
    gen_log(fmt::format("{} CMD: {}", label, cmd));
    gen_log(fmt::format("{} cwd={} exit={}", label, cwd.string(), exit_code));
}
