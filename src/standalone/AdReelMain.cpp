// Repository: AdReel
// Component: AdReel CLI
// Purpose: Drives one campaign end to end against a generation gateway:
//          plan, images, voice-overs, videos, export (optionally post copy
//          and an in-window preview).
// Copyright (c) 2026 AdReel

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

extern "C" {
#include <libavutil/log.h>
}

#include "adreel/campaign/CampaignTypes.hpp"
#include "adreel/config/AppConfig.hpp"
#include "adreel/media/AudioDecoder.hpp"
#include "adreel/media/ClipSource.hpp"
#include "adreel/media/ImageCodec.hpp"
#include "adreel/output/EncoderSink.hpp"
#include "adreel/output/ExportArtifact.hpp"
#include "adreel/output/PreviewWindowSink.hpp"
#include "adreel/pipeline/IWaitStrategy.hpp"
#include "adreel/pipeline/PostCopyWriter.hpp"
#include "adreel/pipeline/ScenePipeline.hpp"
#include "adreel/pipeline/StoryboardPlanner.hpp"
#include "adreel/providers/GrpcGenerationClient.hpp"
#include "adreel/render/DrawTextPainter.hpp"
#include "adreel/render/TimelineCompositor.hpp"
#include "adreel/session/CampaignSession.hpp"
#include "adreel/time/ITimeSource.hpp"
#include "adreel/util/Logger.hpp"

using namespace adreel;

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_stop_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_stop_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string config_path;
  std::string product;
  std::string audience;
  std::string format = "9:16";
  int scenes = 3;
  int retries = 1;
  std::string logo_path;
  std::string watermark;
  std::string voice_id;
  std::string output_dir;
  std::string gateway;
  bool post_copy = false;
  bool preview = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --product TEXT --audience TEXT [OPTIONS]\n"
            << "\n"
            << "Generates a branded short-form video ad through a generation gateway.\n"
            << "\n"
            << "CAMPAIGN:\n"
            << "  --product TEXT       Product description\n"
            << "  --audience TEXT      Target audience\n"
            << "  --format F           9:16 (default) or 1:1\n"
            << "  --scenes N           Number of scenes, 1-10 (default: 3)\n"
            << "  --logo PATH          Logo image (PNG/JPEG/WebP)\n"
            << "  --watermark TEXT     Watermark text for stills and video\n"
            << "  --voice-id ID        Voice for the voice-over\n"
            << "\n"
            << "RUNTIME:\n"
            << "  --config PATH        JSON configuration file\n"
            << "  --gateway HOST:PORT  Generation gateway (overrides config and ADREEL_GATEWAY)\n"
            << "  --output-dir DIR     Where the video is written (default: .)\n"
            << "  --retries N          Re-run each stage N times for failed scenes (default: 1)\n"
            << "  --post-copy          Also generate caption and hashtags\n"
            << "  --preview            Play the result in a window instead of encoding\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  ADREEL_GATEWAY       Gateway address\n"
            << "  ADREEL_DEBUG         Enable debug logging\n"
            << "\n"
            << "EXAMPLE:\n"
            << "    " << program_name
            << " --product \"cold brew coffee\" --audience \"night owls\" \\\n"
            << "        --format 1:1 --logo logo.png --watermark \"@brew\"\n"
            << "\n";
}

bool ParseInt(const std::string& text, int& out) {
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0') return false;
  out = static_cast<int>(value);
  return true;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--product" && i + 1 < argc) {
      args.product = argv[++i];
    } else if (arg == "--audience" && i + 1 < argc) {
      args.audience = argv[++i];
    } else if (arg == "--format" && i + 1 < argc) {
      args.format = argv[++i];
    } else if (arg == "--scenes" && i + 1 < argc) {
      if (!ParseInt(argv[++i], args.scenes)) {
        args.error = "--scenes expects an integer";
        return args;
      }
    } else if (arg == "--retries" && i + 1 < argc) {
      if (!ParseInt(argv[++i], args.retries) || args.retries < 0) {
        args.error = "--retries expects a non-negative integer";
        return args;
      }
    } else if (arg == "--logo" && i + 1 < argc) {
      args.logo_path = argv[++i];
    } else if (arg == "--watermark" && i + 1 < argc) {
      args.watermark = argv[++i];
    } else if (arg == "--voice-id" && i + 1 < argc) {
      args.voice_id = argv[++i];
    } else if (arg == "--output-dir" && i + 1 < argc) {
      args.output_dir = argv[++i];
    } else if (arg == "--gateway" && i + 1 < argc) {
      args.gateway = argv[++i];
    } else if (arg == "--post-copy") {
      args.post_copy = true;
    } else if (arg == "--preview") {
      args.preview = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.product.empty() || args.audience.empty()) {
    args.error = "--product and --audience are required";
    return args;
  }
  if (args.scenes < pipeline::kMinSceneCount || args.scenes > pipeline::kMaxSceneCount) {
    args.error = "--scenes must be between 1 and 10";
    return args;
  }

  args.valid = true;
  return args;
}

std::string MimeTypeForPath(const std::string& path) {
  auto ends_with = [&path](const std::string& suffix) {
    return path.size() >= suffix.size() &&
           path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  if (ends_with(".jpg") || ends_with(".jpeg") || ends_with(".JPG")) return "image/jpeg";
  if (ends_with(".webp")) return "image/webp";
  return "image/png";
}

bool ReadBinaryFile(const std::string& path, std::vector<uint8_t>& out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return false;
  out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  return true;
}

bool WriteBinaryFile(const std::string& path, const std::vector<uint8_t>& bytes) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) return false;
  file.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(file);
}

void PrintBatch(const campaign::Campaign& c, campaign::AssetKind kind) {
  for (size_t i = 0; i < c.assets.size(); ++i) {
    const campaign::SceneAsset* asset = c.assets.Get(i);
    std::cout << "  scene " << c.scenes[i].id << " "
              << campaign::AssetKindToString(kind) << ": "
              << campaign::AssetStatusToString(asset->status(kind));
    if (asset->status(kind) == campaign::AssetStatus::kFailed) {
      std::cout << " (" << asset->error(kind) << ")";
    }
    std::cout << "\n";
  }
}

// One batch stage with in-process re-runs of failed scenes.
bool RunStage(session::CampaignSession& session, campaign::AssetKind kind,
              int retries) {
  int attempts = 0;
  auto result = session.GenerateWithRetries(
      kind, retries,
      [] { return !g_stop_requested.load(std::memory_order_acquire); }, &attempts);
  if (session.campaign()) PrintBatch(*session.campaign(), kind);
  if (!result.ok) {
    std::cerr << "Error: " << result.detail;
    if (result.error == session::SessionError::kStepsFailed) {
      std::cerr << " (campaigns are not kept between runs; raise --retries)";
    }
    std::cerr << "\n";
    return false;
  }
  if (attempts > 1) {
    std::cout << "[adreel] " << campaign::AssetKindToString(kind) << " stage needed "
              << attempts << " attempts\n";
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  av_log_set_level(AV_LOG_ERROR);

  // ---------------------------------------------------------------------------
  // Configuration: file, then environment, then flags.
  // ---------------------------------------------------------------------------
  config::AppConfig cfg;
  if (!args.config_path.empty()) {
    auto loaded = config::AppConfig::LoadFile(args.config_path);
    if (!loaded.ok) {
      std::cerr << "Error: " << loaded.error << "\n";
      return 1;
    }
    cfg = loaded.value;
  }
  cfg.ApplyEnvironment();
  if (!args.gateway.empty()) cfg.gateway_address = args.gateway;
  if (!args.voice_id.empty()) cfg.voice_id = args.voice_id;
  if (!args.output_dir.empty()) cfg.output_dir = args.output_dir;
  if (!cfg.IsValid()) {
    std::cerr << "Error: " << cfg.ValidationError() << "\n";
    return 1;
  }

  campaign::CampaignBrief brief;
  brief.product_description = args.product;
  brief.target_audience = args.audience;
  brief.scene_count = args.scenes;
  if (!campaign::ParseAspectRatio(args.format, &brief.aspect_ratio)) {
    std::cerr << "Error: unknown format '" << args.format << "' (use 9:16 or 1:1)\n";
    return 1;
  }

  // ---------------------------------------------------------------------------
  // Collaborators
  // ---------------------------------------------------------------------------
  providers::GatewayClientConfig gateway_config;
  gateway_config.target_address = cfg.gateway_address;
  gateway_config.text_model = cfg.text_model;
  gateway_config.image_model = cfg.image_model;
  gateway_config.video_model = cfg.video_model;
  gateway_config.rpc_timeout_ms = cfg.rpc_timeout_ms;
  providers::GrpcGenerationClient client(gateway_config);

  media::FFmpegImageCodec image_codec;
  media::FFmpegAudioDecoder audio_decoder;
  render::DrawTextPainter painter;
  pipeline::RealtimeWaitStrategy wait;
  time::SystemTimeSource clock;

  render::FontConfig fonts;
  fonts.font_file = cfg.font_file;
  fonts.caption_font_file = cfg.caption_font_file;

  campaign::BrandingConfig branding;
  branding.watermark_text = args.watermark;
  if (!args.logo_path.empty()) {
    std::vector<uint8_t> logo_bytes;
    if (!ReadBinaryFile(args.logo_path, logo_bytes)) {
      std::cerr << "Error: cannot read logo " << args.logo_path << "\n";
      return 1;
    }
    branding.logo_source =
        media::MakeMediaHandle(MimeTypeForPath(args.logo_path), std::move(logo_bytes));
    auto decoded = image_codec.Decode(branding.logo_source);
    if (!decoded.ok) {
      std::cerr << "Error: logo is not a readable image: " << decoded.error << "\n";
      return 1;
    }
    branding.logo_image = std::move(decoded.value);
  }

  pipeline::PipelineServices services;
  services.images = &client;
  services.speech = &client;
  services.video_jobs = &client;
  services.image_codec = &image_codec;
  services.text_painter = &painter;
  services.wait = &wait;

  pipeline::PipelineConfig pipeline_config;
  pipeline_config.poll_interval = std::chrono::milliseconds(cfg.poll_interval_ms);
  pipeline_config.stop_requested = &g_stop_requested;
  pipeline_config.fonts = fonts;
  pipeline::ScenePipeline scene_pipeline(services, pipeline_config);

  render::CompositorConfig compositor_config;
  compositor_config.fps = cfg.fps;
  compositor_config.fonts = fonts;
  render::TimelineCompositor compositor(compositor_config,
                                        media::FFmpegClipDecoder::Factory(),
                                        audio_decoder, painter);

  pipeline::ModelStoryboardGenerator planner(client);
  pipeline::PostCopyWriter post_copy_writer(client);

  session::SessionServices session_services;
  session_services.planner = &planner;
  session_services.pipeline = &scene_pipeline;
  session_services.compositor = &compositor;
  session_services.post_copy = &post_copy_writer;
  session_services.clock = &clock;
  session::CampaignSession session(session_services);

  session.SetStatusObserver([](const pipeline::StatusEvent& event) {
    util::Logger::Debug("[adreel] scene=" + std::to_string(event.scene_index) + " " +
                        campaign::AssetKindToString(event.kind) + " -> " +
                        campaign::AssetStatusToString(event.status));
  });

  // ---------------------------------------------------------------------------
  // Run
  // ---------------------------------------------------------------------------
  std::cout << "[adreel] Planning " << brief.scene_count << " scenes ("
            << campaign::AspectRatioToString(brief.aspect_ratio) << ") via "
            << cfg.gateway_address << "\n";
  auto planned = session.AcceptPlan(brief, std::move(branding), cfg.voice_id);
  if (!planned.ok) {
    std::cerr << "Error: " << planned.detail << "\n";
    return 1;
  }
  const campaign::Campaign& c = *session.campaign();
  for (const auto& scene : c.scenes) {
    std::cout << "  scene " << scene.id << ": " << scene.on_screen_text << "\n";
  }

  std::cout << "[adreel] Generating images\n";
  if (!RunStage(session, campaign::AssetKind::kImage, args.retries)) return 2;

  std::cout << "[adreel] Generating voice-overs\n";
  if (!RunStage(session, campaign::AssetKind::kVoiceover, args.retries)) return 2;

  std::cout << "[adreel] Generating videos (polling every "
            << cfg.poll_interval_ms << " ms)\n";
  if (!RunStage(session, campaign::AssetKind::kVideo, args.retries)) {
    if (g_stop_requested.load(std::memory_order_acquire)) {
      std::cerr << "Interrupted\n";
      return 130;
    }
    return 2;
  }

  if (g_stop_requested.load(std::memory_order_acquire)) {
    std::cerr << "Interrupted\n";
    return 130;
  }
  if (!session.CanExport()) {
    std::cerr << "Error: campaign is not ready for export\n";
    return 2;
  }

  if (args.preview) {
    output::PreviewWindowSink preview(wait, output::PreviewConfig{});
    auto shown = session.Export(preview, nullptr);
    if (!shown.ok) {
      std::cerr << "Error: " << shown.detail << "\n";
      return 1;
    }
  } else {
    output::EncoderSinkConfig encoder_config;
    encoder_config.container = cfg.container;
    encoder_config.video_bitrate = cfg.video_bitrate;
    encoder_config.audio_bitrate = cfg.audio_bitrate;
    output::FFmpegEncoderSink encoder(encoder_config);

    output::ExportArtifact artifact;
    render::ExportReport report;
    std::cout << "[adreel] Composing video\n";
    auto exported = session.Export(encoder, &artifact, &report);
    if (!exported.ok) {
      std::cerr << "Error: " << exported.detail << "\n";
      return 1;
    }
    const std::string path = cfg.output_dir + "/" + artifact.filename;
    if (!WriteBinaryFile(path, artifact.bytes)) {
      std::cerr << "Error: cannot write " << path << "\n";
      return 1;
    }
    std::cout << "[adreel] Wrote " << path << " (" << artifact.bytes.size()
              << " bytes, " << report.DurationSeconds() << " s, "
              << report.total_frames << " frames)\n";
  }

  if (args.post_copy) {
    std::string copy;
    auto written = session.GeneratePostCopy(&copy);
    if (!written.ok) {
      std::cerr << "Error: " << written.detail << "\n";
      return 1;
    }
    std::cout << "\n" << copy << "\n";
  }

  return 0;
}
