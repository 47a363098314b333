// StakeLedger - Time Utilities
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - Duration formatting
// - Mock time for testing and scripted runs

#ifndef STAKELEDGER_UTIL_TIME_H
#define STAKELEDGER_UTIL_TIME_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace stakeledger {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;

using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Convert Unix timestamp to system time point
SystemTimePoint FromUnixTime(int64_t timestamp);

// ============================================================================
// Time Formatting
// ============================================================================

/// Format time point as ISO 8601 string (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(SystemTimePoint tp);

/// Format duration as human-readable string (e.g., "1d 2h 3m 4s")
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time mode; starts at the real time unless a mock time is set
void EnableMockTime();

/// Disable mock time mode
void DisableMockTime();

/// Set mock time (takes effect while mock time is enabled)
void SetMockTime(int64_t timestamp);

/// Advance mock time by duration (negative durations move it back)
void AdvanceMockTime(Seconds duration);

} // namespace util
} // namespace stakeledger

#endif // STAKELEDGER_UTIL_TIME_H
