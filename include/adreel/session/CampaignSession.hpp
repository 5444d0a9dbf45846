// Repository: AdReel
// Component: Campaign Session
// Purpose: Single-writer front door for one campaign: plan acceptance,
//          stage batches gated by readiness, export and post copy.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_SESSION_CAMPAIGN_SESSION_HPP_
#define ADREEL_SESSION_CAMPAIGN_SESSION_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "adreel/campaign/Campaign.hpp"
#include "adreel/output/ExportArtifact.hpp"
#include "adreel/output/IOutputSink.hpp"
#include "adreel/pipeline/PostCopyWriter.hpp"
#include "adreel/pipeline/ScenePipeline.hpp"
#include "adreel/providers/GenerationProviders.hpp"
#include "adreel/render/TimelineCompositor.hpp"
#include "adreel/time/ITimeSource.hpp"

namespace adreel::session {

enum class SessionError {
  kNone,
  kBusy,            // another operation is running
  kNoCampaign,      // no plan accepted yet
  kPlanFailed,
  kNotReady,        // readiness predicate for the stage is false
  kExportFailed,
  kPostCopyFailed,
  kStepsFailed,     // scenes still failed after every allowed re-run
};

const char* SessionErrorToString(SessionError error);

struct SessionResult {
  bool ok = false;
  SessionError error = SessionError::kNone;
  std::string detail;

  static SessionResult Success() {
    SessionResult r;
    r.ok = true;
    return r;
  }

  static SessionResult Failure(SessionError err, std::string msg) {
    SessionResult r;
    r.ok = false;
    r.error = err;
    r.detail = std::move(msg);
    return r;
  }
};

// Non-owning; all collaborators must outlive the session. post_copy may be
// null, in which case GeneratePostCopy fails.
struct SessionServices {
  providers::IStoryboardGenerator* planner = nullptr;
  pipeline::ScenePipeline* pipeline = nullptr;
  render::TimelineCompositor* compositor = nullptr;
  pipeline::PostCopyWriter* post_copy = nullptr;
  const time::ITimeSource* clock = nullptr;
};

// Every operation takes the session for its whole duration. An operation
// started while another runs (including re-entrantly from a status
// observer) is rejected with kBusy and changes nothing.
class CampaignSession {
 public:
  explicit CampaignSession(SessionServices services);
  // Clears the log campaign tag set by AcceptPlan.
  ~CampaignSession();

  CampaignSession(const CampaignSession&) = delete;
  CampaignSession& operator=(const CampaignSession&) = delete;

  // Replaces the current campaign only when planning succeeds. The
  // branding aspect ratio follows the brief, and log lines are tagged with
  // the product slug from then on.
  SessionResult AcceptPlan(const campaign::CampaignBrief& brief,
                           campaign::BrandingConfig branding,
                           const std::string& voice_id);

  SessionResult GenerateAllImages(pipeline::BatchReport* report = nullptr);
  SessionResult GenerateAllVoiceovers(pipeline::BatchReport* report = nullptr);
  // Requires every image complete.
  SessionResult GenerateAllVideos(pipeline::BatchReport* report = nullptr);

  // Runs the batch for `kind`, then re-runs it while scenes are failed, at
  // most `retries` more times. Complete scenes are skipped on every re-run.
  // `keep_going`, when set, is asked before each re-run. Batch errors (busy,
  // not ready) are returned as is; remaining failures yield kStepsFailed.
  SessionResult GenerateWithRetries(campaign::AssetKind kind, int retries,
                                    const std::function<bool()>& keep_going = nullptr,
                                    int* attempts = nullptr);

  // Requires every video and voice-over complete. artifact may be null for
  // presentation sinks (preview).
  SessionResult Export(output::IOutputSink& sink,
                       output::ExportArtifact* artifact,
                       render::ExportReport* report = nullptr);

  // Allowed only once the campaign is ready for export.
  SessionResult GeneratePostCopy(std::string* rendered);

  void SetStatusObserver(pipeline::StatusObserver observer);

  bool HasCampaign() const { return campaign_ != nullptr; }
  const campaign::Campaign* campaign() const { return campaign_.get(); }
  bool IsBusy() const { return busy_.load(std::memory_order_acquire); }

  bool CanGenerateImages() const;
  bool CanGenerateVoiceovers() const;
  bool CanGenerateVideos() const;
  bool CanExport() const;

  size_t FailedCount(campaign::AssetKind kind) const;

 private:
  class BusyGuard;

  SessionResult RunBatch(campaign::AssetKind kind, pipeline::BatchReport* report);

  SessionServices services_;
  std::unique_ptr<campaign::Campaign> campaign_;
  std::atomic<bool> busy_{false};
};

}  // namespace adreel::session

#endif  // ADREEL_SESSION_CAMPAIGN_SESSION_HPP_
