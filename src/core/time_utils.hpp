#pragma once

#include <string>
#include <chrono>

// Human-readable elapsed time: "2h35m", "14m22s", "8s", or "850ms" under a second.
std::string format_elapsed(std::chrono::steady_clock::duration elapsed);

// Age of an ISO timestamp (YYYY-MM-DDTHH:MM:SS) relative to `now_iso`
// (current time when empty), e.g. "3h12m ago".
// Returns "-" if the timestamp is empty, "?" on parse failure.
std::string format_age(const std::string& iso_time, const std::string& now_iso = "");
