// Repository: AdReel
// Component: Job Poller
// Purpose: Submit / wait / poll loop for remote video jobs.
// Copyright (c) 2026 AdReel

#include "adreel/pipeline/JobPoller.hpp"

#include "adreel/util/Logger.hpp"

namespace adreel::pipeline {

const char* PollErrorToString(PollError error) {
  switch (error) {
    case PollError::kNone: return "NONE";
    case PollError::kSubmitFailed: return "SUBMIT_FAILED";
    case PollError::kPollFailed: return "POLL_FAILED";
    case PollError::kJobFailed: return "JOB_FAILED";
    case PollError::kNoResult: return "NO_RESULT";
    case PollError::kCancelled: return "CANCELLED";
    case PollError::kTimedOut: return "TIMED_OUT";
  }
  return "UNKNOWN";
}

JobPoller::JobPoller(providers::IVideoJobService& service, IWaitStrategy& wait)
    : service_(service), wait_(wait) {}

PollOutcome JobPoller::Run(const providers::VideoJobRequest& request,
                           const PollOptions& options) {
  auto submitted = service_.Submit(request);
  if (!submitted.ok) {
    return PollOutcome::Failure(PollError::kSubmitFailed, submitted.error, 0);
  }

  providers::JobHandle handle = submitted.value;
  util::Logger::Info("[JobPoller] Submitted job name=" + handle.name);

  const auto started = wait_.Now();
  int polls = 0;
  auto stop_requested = [&options]() {
    return options.stop_requested &&
           options.stop_requested->load(std::memory_order_acquire);
  };

  while (!handle.done) {
    if (stop_requested()) {
      util::Logger::Warn("[JobPoller] Cancelled job name=" + handle.name);
      return PollOutcome::Failure(PollError::kCancelled, "video job cancelled", polls);
    }
    if (options.max_wait && wait_.Now() - started >= *options.max_wait) {
      util::Logger::Warn("[JobPoller] Timed out job name=" + handle.name +
                         " polls=" + std::to_string(polls));
      return PollOutcome::Failure(PollError::kTimedOut, "video job timed out", polls);
    }

    wait_.WaitUntil(wait_.Now() + options.interval);
    if (stop_requested()) {
      util::Logger::Warn("[JobPoller] Cancelled job name=" + handle.name);
      return PollOutcome::Failure(PollError::kCancelled, "video job cancelled", polls);
    }

    auto polled = service_.Poll(handle);
    ++polls;
    if (!polled.ok) {
      return PollOutcome::Failure(PollError::kPollFailed, polled.error, polls);
    }
    handle = polled.value;
    util::Logger::Debug("[JobPoller] Poll " + std::to_string(polls) +
                        " name=" + handle.name +
                        " done=" + (handle.done ? "true" : "false"));
  }

  if (handle.has_error) {
    return PollOutcome::Failure(
        PollError::kJobFailed,
        "Video generation failed: " + handle.error_message, polls);
  }
  if (handle.result_uri.empty()) {
    return PollOutcome::Failure(
        PollError::kNoResult,
        "Video generation finished but no video URI was found.", polls);
  }
  util::Logger::Info("[JobPoller] Job done name=" + handle.name +
                     " polls=" + std::to_string(polls));
  return PollOutcome::Success(handle.result_uri, polls);
}

}  // namespace adreel::pipeline
