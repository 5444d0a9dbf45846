// Repository: AdReel
// Component: Job Poller
// Purpose: Drives a long-running remote video job from submission to a
//          terminal outcome on a fixed polling interval.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_PIPELINE_JOB_POLLER_HPP_
#define ADREEL_PIPELINE_JOB_POLLER_HPP_

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include "adreel/pipeline/IWaitStrategy.hpp"
#include "adreel/providers/GenerationProviders.hpp"

namespace adreel::pipeline {

constexpr std::chrono::milliseconds kDefaultPollInterval{10000};

// Both bounds are off by default: the poller waits as long as the job runs.
struct PollOptions {
  std::chrono::milliseconds interval = kDefaultPollInterval;
  const std::atomic<bool>* stop_requested = nullptr;
  std::optional<std::chrono::milliseconds> max_wait;
};

enum class PollError {
  kNone,
  kSubmitFailed,
  kPollFailed,
  kJobFailed,
  kNoResult,
  kCancelled,
  kTimedOut,
};

const char* PollErrorToString(PollError error);

struct PollOutcome {
  bool ok = false;
  PollError error = PollError::kNone;
  std::string detail;
  std::string result_uri;
  int poll_count = 0;

  static PollOutcome Success(std::string uri, int polls) {
    PollOutcome o;
    o.ok = true;
    o.result_uri = std::move(uri);
    o.poll_count = polls;
    return o;
  }

  static PollOutcome Failure(PollError err, std::string msg, int polls) {
    PollOutcome o;
    o.ok = false;
    o.error = err;
    o.detail = std::move(msg);
    o.poll_count = polls;
    return o;
  }
};

class JobPoller {
 public:
  JobPoller(providers::IVideoJobService& service, IWaitStrategy& wait);

  // Submit, then wait interval / poll until the job reports done.
  // The result locator is returned, not fetched.
  PollOutcome Run(const providers::VideoJobRequest& request,
                  const PollOptions& options);

 private:
  providers::IVideoJobService& service_;
  IWaitStrategy& wait_;
};

}  // namespace adreel::pipeline

#endif  // ADREEL_PIPELINE_JOB_POLLER_HPP_
