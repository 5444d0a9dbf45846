// Repository: AdReel
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from deadline math in the job poller and preview.
//          Production: RealtimeWaitStrategy sleeps until deadline.
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2026 AdReel

#ifndef ADREEL_PIPELINE_IWAIT_STRATEGY_HPP_
#define ADREEL_PIPELINE_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <thread>

namespace adreel::pipeline {

class IWaitStrategy {
 public:
  virtual std::chrono::steady_clock::time_point Now() const = 0;
  virtual void WaitUntil(std::chrono::steady_clock::time_point deadline) = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  std::chrono::steady_clock::time_point Now() const override {
    return std::chrono::steady_clock::now();
  }
  void WaitUntil(std::chrono::steady_clock::time_point deadline) override {
    std::this_thread::sleep_until(deadline);
  }
};

}  // namespace adreel::pipeline

#endif  // ADREEL_PIPELINE_IWAIT_STRATEGY_HPP_
