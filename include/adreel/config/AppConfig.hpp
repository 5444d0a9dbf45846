// Repository: AdReel
// Component: Application Configuration
// Purpose: Flat JSON configuration file with defaults and environment overrides.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_CONFIG_APP_CONFIG_HPP_
#define ADREEL_CONFIG_APP_CONFIG_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "adreel/util/Result.hpp"

namespace adreel::config {

// Runtime settings for the CLI. Every field has a default so an empty
// object ("{}") is a complete configuration.
//
// Example:
// {
//   "gateway_address": "127.0.0.1:50061",
//   "fps": 30,
//   "container": "mp4",
//   "poll_interval_ms": 10000
// }
struct AppConfig {
  std::string gateway_address = "127.0.0.1:50061";
  std::string text_model = "gemini-2.5-flash";
  std::string image_model = "gemini-2.5-flash-image-preview";
  std::string video_model = "veo-2.0-generate-001";
  int32_t rpc_timeout_ms = 120000;

  int32_t fps = 30;
  int32_t video_bitrate = 4000000;
  int32_t audio_bitrate = 128000;
  std::string container = "mp4";

  // Empty font files fall back to fontconfig families.
  std::string font_file;
  std::string caption_font_file;

  int32_t poll_interval_ms = 10000;
  std::string voice_id = "21m00Tcm4TlvDq8ikWAM";
  std::string output_dir = ".";

  // Absent or malformed fields keep their defaults; returns nullopt only when
  // the text is not an object or the result fails IsValid().
  static std::optional<AppConfig> FromJson(const std::string& json_str);

  static util::Result<AppConfig> LoadFile(const std::string& path);

  std::string ToJson() const;

  // ADREEL_GATEWAY overrides gateway_address when set and non-empty.
  void ApplyEnvironment();

  bool IsValid() const;
  std::string ValidationError() const;
};

bool IsSupportedContainer(const std::string& container);

}  // namespace adreel::config

#endif  // ADREEL_CONFIG_APP_CONFIG_HPP_
