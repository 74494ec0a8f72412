// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/context.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <thread>

namespace nodeguard {
namespace util {

namespace {
// Granularity at which SleepFor re-checks cancellation
constexpr std::chrono::milliseconds kSleepSlice{5};
} // namespace

Context::Context() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

Context Context::WithTimeout(std::chrono::milliseconds timeout) {
  Context ctx;
  ctx.deadline_ = GetSteadyTime() + timeout;
  return ctx;
}

Context Context::WithTimeoutFrom(std::chrono::milliseconds timeout) const {
  Context ctx(*this);
  auto deadline = GetSteadyTime() + timeout;
  if (!ctx.deadline_ || deadline < *ctx.deadline_) {
    ctx.deadline_ = deadline;
  }
  return ctx;
}

void Context::Cancel() { cancelled_->store(true, std::memory_order_release); }

bool Context::IsCancelled() const {
  return cancelled_->load(std::memory_order_acquire);
}

Status Context::Err() const {
  if (IsCancelled()) {
    return Status::Transient("context canceled");
  }
  if (deadline_ && GetSteadyTime() >= *deadline_) {
    return Status::Transient("context deadline exceeded");
  }
  return Status::Ok();
}

bool Context::SleepFor(std::chrono::milliseconds duration) const {
  auto remaining = duration;
  while (remaining.count() > 0) {
    if (!Err().IsOk()) {
      return false;
    }
    auto slice = std::min(remaining, kSleepSlice);
    std::this_thread::sleep_for(slice);
    remaining -= slice;
  }
  return Err().IsOk();
}

} // namespace util
} // namespace nodeguard
