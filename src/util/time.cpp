// TIERSTAKE - Time Utilities Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/util/time.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace tierstake {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Timestamp Arithmetic
// ============================================================================

std::optional<int64_t> CheckedAddTime(int64_t a, int64_t b) {
    if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) {
        return std::nullopt;
    }
    if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) {
        return std::nullopt;
    }
    return a + b;
}

int64_t SaturatingAddTime(int64_t a, int64_t b) {
    if (auto sum = CheckedAddTime(a, b)) {
        return *sum;
    }
    return b > 0 ? std::numeric_limits<int64_t>::max() : std::numeric_limits<int64_t>::min();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    if (!g_mockTimeEnabled.load() && g_mockTime.load() == 0) {
        g_mockTime.store(GetTime());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(int64_t seconds) {
    int64_t current = g_mockTime.load();
    while (!g_mockTime.compare_exchange_weak(current, SaturatingAddTime(current, seconds))) {
    }
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    if (gmtime_r(&time, &tm_buf) == nullptr) {
        // Beyond the calendar range of struct tm
        return std::to_string(timestamp);
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(int64_t seconds) {
    if (seconds == 0) {
        return "0s";
    }

    // Magnitude in unsigned arithmetic so INT64_MIN negates cleanly
    uint64_t total = seconds < 0 ? 0 - static_cast<uint64_t>(seconds)
                                 : static_cast<uint64_t>(seconds);

    uint64_t days = total / SECONDS_PER_DAY;
    total %= SECONDS_PER_DAY;
    uint64_t hours = total / SECONDS_PER_HOUR;
    total %= SECONDS_PER_HOUR;
    uint64_t minutes = total / SECONDS_PER_MINUTE;
    uint64_t secs = total % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (seconds < 0) oss << "-";
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (secs > 0) oss << secs << "s";

    std::string result = oss.str();
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

// ============================================================================
// Parsing
// ============================================================================

std::optional<int64_t> ParseDuration(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    std::string digits = str;
    int64_t multiplier = 1;

    char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(str.back())));
    if (std::isalpha(static_cast<unsigned char>(suffix))) {
        switch (suffix) {
            case 's': multiplier = 1; break;
            case 'm': multiplier = SECONDS_PER_MINUTE; break;
            case 'h': multiplier = SECONDS_PER_HOUR; break;
            case 'd': multiplier = SECONDS_PER_DAY; break;
            default: return std::nullopt;
        }
        digits.pop_back();
    }

    if (digits.empty()) {
        return std::nullopt;
    }

    int64_t value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        int digit = c - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }

    if (value > std::numeric_limits<int64_t>::max() / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

} // namespace util
} // namespace tierstake
