// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace dropnet {
namespace util {

/**
 * Mockable wall-clock time
 *
 * Block timestamps go through these functions so tests can pin them with
 * SetMockTime()/MockTimeScope. Timers and deadlines (node schedules, the
 * driver's timeout) use std::chrono::steady_clock directly and are never
 * mocked.
 */

// Unix timestamp in seconds (mock time if set)
int64_t GetTime();

// Unix timestamp in milliseconds (mock time * 1000 if set)
int64_t GetTimeMillis();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 */
void SetMockTime(int64_t time);

// Returns 0 if mock time is disabled
int64_t GetMockTime();

/**
 * Format a Unix timestamp in milliseconds as "YYYY-MM-DD HH:MM:SS.mmm UTC"
 */
std::string FormatTimeMillis(int64_t unix_time_ms);

// Format a duration in milliseconds as seconds with millisecond precision,
// e.g. 90000 -> "90.000s"
std::string FormatDurationMillis(int64_t duration_ms);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace dropnet
