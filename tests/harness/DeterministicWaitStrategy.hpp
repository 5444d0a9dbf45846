// Repository: AdReel
// Component: Deterministic Wait Strategy
// Purpose: Virtual-time wait strategy. WaitUntil jumps the clock to the
//          deadline instead of sleeping.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_TESTS_HARNESS_DETERMINISTIC_WAIT_STRATEGY_HPP_
#define ADREEL_TESTS_HARNESS_DETERMINISTIC_WAIT_STRATEGY_HPP_

#include <chrono>
#include <functional>
#include <vector>

#include "adreel/pipeline/IWaitStrategy.hpp"

namespace adreel::testing {

class DeterministicWaitStrategy : public pipeline::IWaitStrategy {
 public:
  using Clock = std::chrono::steady_clock;

  Clock::time_point Now() const override { return now_; }

  void WaitUntil(Clock::time_point deadline) override {
    waits_.push_back(std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - now_));
    if (deadline > now_) now_ = deadline;
    if (on_wait_) on_wait_(static_cast<int>(waits_.size()));
  }

  // Called after every wait with the 1-based wait number.
  void SetOnWait(std::function<void(int)> hook) { on_wait_ = std::move(hook); }

  std::chrono::milliseconds Elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now_ - origin_);
  }
  int wait_count() const { return static_cast<int>(waits_.size()); }
  const std::vector<std::chrono::milliseconds>& waits() const { return waits_; }

 private:
  Clock::time_point origin_{};
  Clock::time_point now_{};
  std::vector<std::chrono::milliseconds> waits_;
  std::function<void(int)> on_wait_;
};

}  // namespace adreel::testing

#endif  // ADREEL_TESTS_HARNESS_DETERMINISTIC_WAIT_STRATEGY_HPP_
