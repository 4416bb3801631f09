// QUORUM - Time Utilities Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace quorum {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;

    int64_t RealTime() {
        return std::chrono::duration_cast<Seconds>(
            SystemClock::now().time_since_epoch()).count();
    }
}

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return RealTime();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint{Seconds{timestamp}};
}

int64_t ToUnixTime(SystemTimePoint tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(int64_t seconds) {
    if (seconds < 0) {
        return "-" + FormatDuration(-seconds);
    }
    if (seconds == 0) {
        return "0s";
    }

    int64_t days = seconds / SECONDS_PER_DAY;
    int64_t hours = (seconds % SECONDS_PER_DAY) / SECONDS_PER_HOUR;
    int64_t minutes = (seconds % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE;
    int64_t secs = seconds % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    const char* sep = "";
    if (days > 0) { oss << days << "d"; sep = " "; }
    if (hours > 0) { oss << sep << hours << "h"; sep = " "; }
    if (minutes > 0) { oss << sep << minutes << "m"; sep = " "; }
    if (secs > 0) { oss << sep << secs << "s"; }
    return oss.str();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTimeEnabled.load()) {
        return;
    }
    if (g_mockTime.load() == 0) {
        g_mockTime.store(RealTime());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
    g_mockTime.store(0);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTime.store(timestamp);
    g_mockTimeEnabled.store(true);
}

void AdvanceMockTime(int64_t seconds) {
    g_mockTime.fetch_add(seconds);
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

} // namespace util
} // namespace quorum
