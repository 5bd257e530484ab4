// TIERSTAKE - Time Utilities
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps with a mock clock for deterministic runs
// - Timestamp and duration formatting
// - Duration parsing for configuration values
//
// The staking engine never reads the clock itself; callers pass "now".

#ifndef TIERSTAKE_UTIL_TIME_H
#define TIERSTAKE_UTIL_TIME_H

#include <cstdint>
#include <optional>
#include <string>

namespace tierstake {
namespace util {

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 60 * SECONDS_PER_MINUTE;
constexpr int64_t SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

// ============================================================================
// Timestamp Arithmetic
// ============================================================================

/// a + b, or nullopt when the sum leaves the int64_t range
std::optional<int64_t> CheckedAddTime(int64_t a, int64_t b);

/// a + b clamped to [INT64_MIN, INT64_MAX]
int64_t SaturatingAddTime(int64_t a, int64_t b);

// ============================================================================
// Mock Time (for testing and scripted runs)
// ============================================================================

/// Enable mock time; starts from the real clock unless already set
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);

/// Advance mock time by a number of seconds, saturating at the int64_t range
void AdvanceMockTime(int64_t seconds);

// ============================================================================
// Formatting and Parsing
// ============================================================================

/// Format a Unix timestamp as UTC, e.g. "1970-01-08T00:00:00Z"
std::string FormatISO8601(int64_t timestamp);

/// Format seconds as "7d", "1d 2h 30m", "45s"
std::string FormatDuration(int64_t seconds);

/**
 * Parse a duration. Accepts plain seconds ("86400") or a number followed by
 * one unit suffix: s, m, h, d ("30d", "12h").
 * Returns nullopt for empty, negative or malformed input.
 */
std::optional<int64_t> ParseDuration(const std::string& str);

} // namespace util
} // namespace tierstake

#endif // TIERSTAKE_UTIL_TIME_H
