#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <sstream>
#include <iomanip>

// Cross-platform ISO timestamp parsing (YYYY-MM-DDTHH:MM:SS)
static bool parse_iso(const std::string& s, std::time_t* out) {
    struct tm tm_buf = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return false;
    tm_buf.tm_isdst = -1;
    *out = mktime(&tm_buf);
    return true;
}

static std::string format_seconds(long long seconds) {
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_elapsed(std::chrono::steady_clock::duration elapsed) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (ms < 0) ms = 0;
    if (ms < 1000) return fmt::format("{}ms", ms);
    return format_seconds(ms / 1000);
}

std::string format_age(const std::string& iso_time, const std::string& now_iso) {
    if (iso_time.empty()) return "-";

    std::time_t then;
    if (!parse_iso(iso_time, &then)) return "?";

    std::time_t now;
    if (!now_iso.empty()) {
        if (!parse_iso(now_iso, &now)) return "?";
    } else {
        now = std::time(nullptr);
    }

    long long seconds = static_cast<long long>(std::difftime(now, then));
    if (seconds < 0) seconds = 0;
    return format_seconds(seconds) + " ago";
}
