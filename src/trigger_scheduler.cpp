#include "syncplay/syncplay.h"

namespace syncplay {

TriggerScheduler::TriggerScheduler(std::chrono::milliseconds precision_margin)
    : precision_margin_(precision_margin) {}

TriggerResult TriggerScheduler::Run(int64_t target_ms,
                                    const std::function<void()>& action) {
  using Clock = std::chrono::system_clock;
  const Clock::time_point target{std::chrono::milliseconds(target_ms)};

  const auto remaining = target - Clock::now();
  if (remaining <= Clock::duration::zero()) {
    if (cancelled_) {
      return TriggerResult::kCancelled;
    }
    if (action) {
      action();
    }
    return TriggerResult::kLate;
  }

  // Coarse phase: yield the CPU until precision_margin before the target.
  if (remaining > precision_margin_) {
    const auto sleep_for = remaining - precision_margin_;
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, sleep_for, [this]() { return cancelled_.load(); });
  }

  // Precision phase: spin on the clock to avoid scheduler wake-up latency.
  while (true) {
    if (cancelled_) {
      return TriggerResult::kCancelled;
    }
    if (Clock::now() >= target) {
      break;
    }
  }

  if (cancelled_) {
    return TriggerResult::kCancelled;
  }
  if (action) {
    action();
  }
  return TriggerResult::kExecuted;
}

void TriggerScheduler::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

void TriggerScheduler::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = false;
}

}  // namespace syncplay
