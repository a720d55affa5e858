#include "utils.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

fs::path resolve_path(const std::string& raw, const fs::path& base) {
    fs::path p;
    if (raw == "~") {
        p = platform::home_dir();
    } else if (raw.size() > 1 && raw[0] == '~' && (raw[1] == '/' || raw[1] == '\\')) {
        p = platform::home_dir() / raw.substr(2);
    } else {
        p = fs::path(raw);
    }
    if (p.is_relative()) p = base / p;
    return normalize_path(p);
}

fs::path normalize_path(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) abs = p;
    abs = abs.lexically_normal();
    // "dir/" and "dir" name the same thing
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

Result<void, GenError> write_file_if_changed(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        std::ifstream in(path, std::ios::binary);
        if (in) {
            std::string current((std::istreambuf_iterator<char>(in)),
                                std::istreambuf_iterator<char>());
            if (current == content) return Result<void, GenError>::Ok();
        }
    }

    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void, GenError>::Err(GenError::filesystem(path.parent_path(), ec.message()));
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void, GenError>::Err(GenError::filesystem(path, "cannot open for writing"));
    }
    out << content;
    out.close();
    if (!out) {
        return Result<void, GenError>::Err(GenError::filesystem(path, "write failed"));
    }
    return Result<void, GenError>::Ok();
}
