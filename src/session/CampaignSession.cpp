// Repository: AdReel
// Component: Campaign Session
// Purpose: Busy guard, readiness gates and operation dispatch.
// Copyright (c) 2026 AdReel

#include "adreel/session/CampaignSession.hpp"

#include <utility>

#include "adreel/util/Logger.hpp"

namespace adreel::session {

const char* SessionErrorToString(SessionError error) {
  switch (error) {
    case SessionError::kNone: return "NONE";
    case SessionError::kBusy: return "BUSY";
    case SessionError::kNoCampaign: return "NO_CAMPAIGN";
    case SessionError::kPlanFailed: return "PLAN_FAILED";
    case SessionError::kNotReady: return "NOT_READY";
    case SessionError::kExportFailed: return "EXPORT_FAILED";
    case SessionError::kPostCopyFailed: return "POST_COPY_FAILED";
    case SessionError::kStepsFailed: return "STEPS_FAILED";
  }
  return "UNKNOWN";
}

class CampaignSession::BusyGuard {
 public:
  explicit BusyGuard(std::atomic<bool>& flag) : flag_(flag) {
    bool expected = false;
    acquired_ = flag_.compare_exchange_strong(expected, true,
                                              std::memory_order_acq_rel);
  }
  ~BusyGuard() {
    if (acquired_) flag_.store(false, std::memory_order_release);
  }
  BusyGuard(const BusyGuard&) = delete;
  BusyGuard& operator=(const BusyGuard&) = delete;

  bool acquired() const { return acquired_; }

 private:
  std::atomic<bool>& flag_;
  bool acquired_ = false;
};

namespace {

SessionResult Busy() {
  return SessionResult::Failure(SessionError::kBusy, "operation already in progress");
}

SessionResult NoCampaign() {
  return SessionResult::Failure(SessionError::kNoCampaign, "no campaign plan accepted");
}

}  // namespace

CampaignSession::CampaignSession(SessionServices services)
    : services_(services) {}

CampaignSession::~CampaignSession() {
  if (campaign_) util::Logger::SetCampaignTag("");
}

SessionResult CampaignSession::AcceptPlan(const campaign::CampaignBrief& brief,
                                          campaign::BrandingConfig branding,
                                          const std::string& voice_id) {
  BusyGuard guard(busy_);
  if (!guard.acquired()) return Busy();
  if (services_.planner == nullptr) {
    return SessionResult::Failure(SessionError::kPlanFailed,
                                  "plan generation failed: no planner configured");
  }

  auto plan = services_.planner->GeneratePlan(brief);
  if (!plan.ok) {
    util::Logger::Error("[CampaignSession] " + plan.error);
    return SessionResult::Failure(SessionError::kPlanFailed, plan.error);
  }
  if (plan.value.empty()) {
    return SessionResult::Failure(SessionError::kPlanFailed,
                                  "plan generation failed: no scenes");
  }

  branding.aspect_ratio = brief.aspect_ratio;
  campaign_ = std::make_unique<campaign::Campaign>(
      brief, std::move(plan.value), std::move(branding),
      voice_id.empty() ? std::string(providers::kDefaultVoiceId) : voice_id);
  util::Logger::SetCampaignTag(output::ProductSlug(brief.product_description));
  util::Logger::Info("[CampaignSession] Plan accepted scenes=" +
                     std::to_string(campaign_->scenes.size()) + " format=" +
                     campaign::AspectRatioToString(brief.aspect_ratio));
  return SessionResult::Success();
}

SessionResult CampaignSession::RunBatch(campaign::AssetKind kind,
                                        pipeline::BatchReport* report) {
  BusyGuard guard(busy_);
  if (!guard.acquired()) return Busy();
  if (!campaign_) return NoCampaign();
  if (services_.pipeline == nullptr) {
    return SessionResult::Failure(SessionError::kNotReady, "scene pipeline not configured");
  }
  if (kind == campaign::AssetKind::kVideo && !CanGenerateVideos()) {
    return SessionResult::Failure(SessionError::kNotReady,
                                  "all images must be complete before videos");
  }

  pipeline::BatchReport batch;
  switch (kind) {
    case campaign::AssetKind::kImage:
      batch = services_.pipeline->GenerateAllImages(*campaign_);
      break;
    case campaign::AssetKind::kVoiceover:
      batch = services_.pipeline->GenerateAllVoiceovers(*campaign_);
      break;
    case campaign::AssetKind::kVideo:
      batch = services_.pipeline->GenerateAllVideos(*campaign_);
      break;
  }
  if (report) *report = std::move(batch);
  return SessionResult::Success();
}

SessionResult CampaignSession::GenerateAllImages(pipeline::BatchReport* report) {
  return RunBatch(campaign::AssetKind::kImage, report);
}

SessionResult CampaignSession::GenerateAllVoiceovers(pipeline::BatchReport* report) {
  return RunBatch(campaign::AssetKind::kVoiceover, report);
}

SessionResult CampaignSession::GenerateAllVideos(pipeline::BatchReport* report) {
  return RunBatch(campaign::AssetKind::kVideo, report);
}

SessionResult CampaignSession::GenerateWithRetries(
    campaign::AssetKind kind, int retries, const std::function<bool()>& keep_going,
    int* attempts) {
  int attempt = 0;
  while (true) {
    SessionResult result = RunBatch(kind, nullptr);
    ++attempt;
    if (attempts) *attempts = attempt;
    if (!result.ok) return result;

    const size_t failed = FailedCount(kind);
    if (failed == 0) return result;
    if (attempt > retries || (keep_going && !keep_going())) {
      return SessionResult::Failure(
          SessionError::kStepsFailed,
          std::to_string(failed) + " of " + std::to_string(campaign_->assets.size()) +
              " " + campaign::AssetKindToString(kind) + " step(s) failed after " +
              std::to_string(attempt) + " attempt(s)");
    }
    util::Logger::Info(std::string("[CampaignSession] Re-running ") +
                       campaign::AssetKindToString(kind) + " for " +
                       std::to_string(failed) + " failed scene(s)");
  }
}

SessionResult CampaignSession::Export(output::IOutputSink& sink,
                                      output::ExportArtifact* artifact,
                                      render::ExportReport* report) {
  BusyGuard guard(busy_);
  if (!guard.acquired()) return Busy();
  if (!campaign_) return NoCampaign();
  if (!CanExport()) {
    return SessionResult::Failure(SessionError::kNotReady, "assets incomplete");
  }
  if (services_.compositor == nullptr) {
    return SessionResult::Failure(SessionError::kExportFailed, "compositor not configured");
  }

  render::ExportResult result = services_.compositor->Export(*campaign_, sink);
  if (!result.ok) {
    if (result.error == render::ExportError::kExportInProgress) {
      return Busy();
    }
    if (result.error == render::ExportError::kAssetsIncomplete) {
      return SessionResult::Failure(SessionError::kNotReady, result.detail);
    }
    return SessionResult::Failure(
        SessionError::kExportFailed,
        std::string(render::ExportErrorToString(result.error)) + ": " + result.detail);
  }

  if (artifact) {
    const int64_t now_ms = services_.clock ? services_.clock->NowUtcMs() : 0;
    artifact->filename = output::ExportFilename(
        campaign_->brief.product_description, now_ms, sink.FileExtension());
    artifact->mime_type = sink.MimeType();
    artifact->bytes = std::move(result.encoded);
    util::Logger::Info("[CampaignSession] Export ready file=" + artifact->filename +
                       " bytes=" + std::to_string(artifact->bytes.size()));
  }
  if (report) *report = std::move(result.report);
  return SessionResult::Success();
}

SessionResult CampaignSession::GeneratePostCopy(std::string* rendered) {
  BusyGuard guard(busy_);
  if (!guard.acquired()) return Busy();
  if (!campaign_) return NoCampaign();
  if (!CanExport()) {
    return SessionResult::Failure(SessionError::kNotReady,
                                  "campaign is not ready for export");
  }
  if (services_.post_copy == nullptr) {
    return SessionResult::Failure(SessionError::kPostCopyFailed,
                                  "post copy writer not configured");
  }

  auto copy = services_.post_copy->Generate(campaign_->brief, campaign_->scenes);
  if (!copy.ok) {
    return SessionResult::Failure(SessionError::kPostCopyFailed, copy.error);
  }
  if (rendered) *rendered = copy.value.Render();
  return SessionResult::Success();
}

void CampaignSession::SetStatusObserver(pipeline::StatusObserver observer) {
  if (services_.pipeline) services_.pipeline->SetStatusObserver(std::move(observer));
}

bool CampaignSession::CanGenerateImages() const {
  return campaign_ != nullptr && campaign_->IsAligned();
}

bool CampaignSession::CanGenerateVoiceovers() const {
  return campaign_ != nullptr && campaign_->IsAligned();
}

bool CampaignSession::CanGenerateVideos() const {
  return campaign_ != nullptr && campaign_->IsAligned() &&
         campaign_->assets.AllImagesComplete();
}

bool CampaignSession::CanExport() const {
  return campaign_ != nullptr && campaign_->IsAligned() &&
         campaign_->assets.ReadyForExport();
}

size_t CampaignSession::FailedCount(campaign::AssetKind kind) const {
  if (!campaign_) return 0;
  size_t failed = 0;
  for (size_t i = 0; i < campaign_->assets.size(); ++i) {
    if (campaign_->assets.Get(i)->status(kind) == campaign::AssetStatus::kFailed) ++failed;
  }
  return failed;
}

}  // namespace adreel::session
