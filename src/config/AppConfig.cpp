// Repository: AdReel
// Component: Application Configuration
// Purpose: Parse and validate AppConfig from JSON.
// Copyright (c) 2026 AdReel

#include "adreel/config/AppConfig.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

namespace adreel::config {

namespace {
  // The schema is flat and fixed, so fields are pulled out with regexes.

  bool ExtractInt(const std::string& json, const std::string& field_name, int32_t& out_value) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(-?\\d+)");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return false;
    }
    const std::string digits = match[1].str();
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(digits.c_str(), &end, 10);
    if (errno == ERANGE || end == digits.c_str() ||
        value < std::numeric_limits<int32_t>::min() ||
        value > std::numeric_limits<int32_t>::max()) {
      return false;
    }
    out_value = static_cast<int32_t>(value);
    return true;
  }

  // Escaped quotes inside values are not supported.
  bool ExtractString(const std::string& json, const std::string& field_name, std::string& out_value) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*\"([^\"]*)\"");
    std::smatch match;
    if (std::regex_search(json, match, pattern)) {
      out_value = match[1].str();
      return true;
    }
    return false;
  }

  bool LooksLikeObject(const std::string& json) {
    size_t first = json.find_first_not_of(" \t\r\n");
    size_t last = json.find_last_not_of(" \t\r\n");
    return first != std::string::npos && json[first] == '{' && json[last] == '}';
  }

  void ParseFields(const std::string& json, AppConfig& config) {
    ExtractString(json, "gateway_address", config.gateway_address);
    ExtractString(json, "text_model", config.text_model);
    ExtractString(json, "image_model", config.image_model);
    ExtractString(json, "video_model", config.video_model);
    ExtractInt(json, "rpc_timeout_ms", config.rpc_timeout_ms);
    ExtractInt(json, "fps", config.fps);
    ExtractInt(json, "video_bitrate", config.video_bitrate);
    ExtractInt(json, "audio_bitrate", config.audio_bitrate);
    ExtractString(json, "container", config.container);
    ExtractString(json, "font_file", config.font_file);
    ExtractString(json, "caption_font_file", config.caption_font_file);
    ExtractInt(json, "poll_interval_ms", config.poll_interval_ms);
    ExtractString(json, "voice_id", config.voice_id);
    ExtractString(json, "output_dir", config.output_dir);
  }
}

bool IsSupportedContainer(const std::string& container) {
  return container == "mp4" || container == "mov" || container == "mkv";
}

std::optional<AppConfig> AppConfig::FromJson(const std::string& json_str) {
  if (!LooksLikeObject(json_str)) {
    return std::nullopt;
  }

  AppConfig config;
  ParseFields(json_str, config);
  if (!config.IsValid()) {
    return std::nullopt;
  }
  return config;
}

util::Result<AppConfig> AppConfig::LoadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return util::Result<AppConfig>::Failure("cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string json = buffer.str();

  if (!LooksLikeObject(json)) {
    return util::Result<AppConfig>::Failure("config is not a JSON object: " + path);
  }
  AppConfig config;
  ParseFields(json, config);
  if (!config.IsValid()) {
    return util::Result<AppConfig>::Failure(path + ": " + config.ValidationError());
  }
  return util::Result<AppConfig>::Success(config);
}

std::string AppConfig::ToJson() const {
  std::ostringstream oss;
  oss << "{"
      << "\"gateway_address\":\"" << gateway_address << "\","
      << "\"text_model\":\"" << text_model << "\","
      << "\"image_model\":\"" << image_model << "\","
      << "\"video_model\":\"" << video_model << "\","
      << "\"rpc_timeout_ms\":" << rpc_timeout_ms << ","
      << "\"fps\":" << fps << ","
      << "\"video_bitrate\":" << video_bitrate << ","
      << "\"audio_bitrate\":" << audio_bitrate << ","
      << "\"container\":\"" << container << "\","
      << "\"font_file\":\"" << font_file << "\","
      << "\"caption_font_file\":\"" << caption_font_file << "\","
      << "\"poll_interval_ms\":" << poll_interval_ms << ","
      << "\"voice_id\":\"" << voice_id << "\","
      << "\"output_dir\":\"" << output_dir << "\""
      << "}";
  return oss.str();
}

void AppConfig::ApplyEnvironment() {
  const char* gateway = std::getenv("ADREEL_GATEWAY");
  if (gateway != nullptr && gateway[0] != '\0') {
    gateway_address = gateway;
  }
}

bool AppConfig::IsValid() const {
  return ValidationError().empty();
}

std::string AppConfig::ValidationError() const {
  if (gateway_address.empty()) return "gateway_address is empty";
  if (fps <= 0) return "fps must be positive";
  if (video_bitrate <= 0) return "video_bitrate must be positive";
  if (audio_bitrate <= 0) return "audio_bitrate must be positive";
  if (poll_interval_ms <= 0) return "poll_interval_ms must be positive";
  if (rpc_timeout_ms <= 0) return "rpc_timeout_ms must be positive";
  if (!IsSupportedContainer(container)) return "unsupported container: " + container;
  return "";
}

}  // namespace adreel::config
