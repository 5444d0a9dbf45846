// Repository: AdReel
// Component: Time Source Interface
// Purpose: Wall-clock access for export file naming; injectable for tests.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_TIME_ITIME_SOURCE_HPP_
#define ADREEL_TIME_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace adreel::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace adreel::time

#endif  // ADREEL_TIME_ITIME_SOURCE_HPP_
