// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/status.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace nodeguard {
namespace util {

/**
 * Context - cancellation and deadline for a blocking call
 *
 * Copies share the cancellation flag, so a caller can hand a copy to a
 * registry call and cancel it from another thread. Deadlines are measured
 * on util::GetSteadyTime(), which tests can mock.
 *
 * A default-constructed context never expires.
 */
class Context {
public:
  Context();

  static Context WithTimeout(std::chrono::milliseconds timeout);

  // Derived context sharing this one's cancellation, with the earlier of
  // the two deadlines
  Context WithTimeoutFrom(std::chrono::milliseconds timeout) const;

  void Cancel();
  bool IsCancelled() const;

  /**
   * OK while the context is live, otherwise a TRANSIENT status with
   * "context canceled" or "context deadline exceeded"
   */
  Status Err() const;

  /**
   * Block for up to `duration`
   * @return false if the context ended before the duration elapsed
   */
  bool SleepFor(std::chrono::milliseconds duration) const;

  std::optional<std::chrono::steady_clock::time_point> deadline() const {
    return deadline_;
  }

private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
};

} // namespace util
} // namespace nodeguard
