// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace nodeguard {
namespace util {

/**
 * Mockable time source
 *
 * Production code calls GetSteadyTime() instead of steady_clock::now() so
 * tests can push a context past its deadline without waiting.
 * When mock time is 0 (default) the real clock is used.
 */

/**
 * Get current time as steady clock time point
 * Returns mock-derived time if set, otherwise real steady clock time
 */
std::chrono::steady_clock::time_point GetSteadyTime();

/**
 * Set mock time in seconds (0 to disable mocking)
 *
 * Time does not advance automatically while mocked; tests call
 * SetMockTime() again to move it forward.
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting (0 if disabled)
 */
int64_t GetMockTime();

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
} // namespace nodeguard
