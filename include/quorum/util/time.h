// QUORUM - Time Utilities
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Wall-clock access for deadline arithmetic. All deadline checks go through
// GetTime() so tests and the CLI (-mocktime) can pin the clock.

#ifndef QUORUM_UTIL_TIME_H
#define QUORUM_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace quorum {
namespace util {

using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::time_point<SystemClock>;
using Seconds = std::chrono::seconds;

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 7 * SECONDS_PER_DAY;

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

SystemTimePoint FromUnixTime(int64_t timestamp);
int64_t ToUnixTime(SystemTimePoint tp);

/// "2024-01-15T10:30:00Z"
std::string FormatISO8601(int64_t timestamp);

/// "6d 23h 59m 59s"; "0s" for zero, leading "-" for negative
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Mock Time
// ============================================================================

/// Freeze the clock at the current real time (or the previously set value)
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

/// Enable mock time at the given timestamp
void SetMockTime(int64_t timestamp);

void AdvanceMockTime(int64_t seconds);

/// Current mock value (0 if never set)
int64_t GetMockTime();

/// Enables mock time for a scope and restores real time on exit
class ScopedMockTime {
public:
    explicit ScopedMockTime(int64_t timestamp) { SetMockTime(timestamp); }
    ~ScopedMockTime() { DisableMockTime(); }

    ScopedMockTime(const ScopedMockTime&) = delete;
    ScopedMockTime& operator=(const ScopedMockTime&) = delete;
};

} // namespace util
} // namespace quorum

#endif // QUORUM_UTIL_TIME_H
