// Repository: AdReel
// Component: Preview Window Sink
// Purpose: Real-time SDL2 playback of the composed ad.
// Copyright (c) 2026 AdReel

#include "adreel/output/PreviewWindowSink.hpp"

#include <algorithm>

#include "adreel/util/Logger.hpp"

#ifdef ADREEL_SDL2_AVAILABLE
#include <SDL2/SDL.h>
#endif

namespace adreel::output {

PreviewWindowSink::PreviewWindowSink(pipeline::IWaitStrategy& wait,
                                     PreviewConfig config)
    : wait_(wait), config_(std::move(config)) {}

PreviewWindowSink::~PreviewWindowSink() { Cleanup(); }

void PreviewWindowSink::SetStatusCallback(SinkStatusCallback callback) {
  status_callback_ = std::move(callback);
}

void PreviewWindowSink::SetStatus(SinkStatus status, const std::string& message) {
  status_ = status;
  if (status_callback_) status_callback_(status, message);
}

#ifdef ADREEL_SDL2_AVAILABLE

bool PreviewWindowSink::Start(const OutputFormat& format) {
  if (status_ != SinkStatus::kIdle) {
    last_error_ = "Start called while not idle";
    return false;
  }
  SetStatus(SinkStatus::kStarting, "");
  format_ = format;

  util::Logger::Info("[PreviewWindowSink] Initializing SDL2...");
  if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO) < 0) {
    last_error_ = std::string("SDL_Init failed: ") + SDL_GetError();
    util::Logger::Error("[PreviewWindowSink] " + last_error_);
    SetStatus(SinkStatus::kError, last_error_);
    return false;
  }

  int win_h = std::min(format.height, config_.max_window_height);
  int win_w = static_cast<int>(static_cast<int64_t>(format.width) * win_h / format.height);
  SDL_Window* window = SDL_CreateWindow(
      config_.window_title.c_str(), SDL_WINDOWPOS_CENTERED,
      SDL_WINDOWPOS_CENTERED, win_w, win_h,
      SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
  if (!window) {
    last_error_ = std::string("SDL_CreateWindow failed: ") + SDL_GetError();
    util::Logger::Error("[PreviewWindowSink] " + last_error_);
    SDL_Quit();
    SetStatus(SinkStatus::kError, last_error_);
    return false;
  }
  window_ = window;

  SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
  if (!renderer) {
    last_error_ = std::string("SDL_CreateRenderer failed: ") + SDL_GetError();
    util::Logger::Error("[PreviewWindowSink] " + last_error_);
    Cleanup();
    SetStatus(SinkStatus::kError, last_error_);
    return false;
  }
  sdl_renderer_ = renderer;

  SDL_Texture* texture =
      SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32,
                        SDL_TEXTUREACCESS_STREAMING, format.width, format.height);
  if (!texture) {
    last_error_ = std::string("SDL_CreateTexture failed: ") + SDL_GetError();
    util::Logger::Error("[PreviewWindowSink] " + last_error_);
    Cleanup();
    SetStatus(SinkStatus::kError, last_error_);
    return false;
  }
  texture_ = texture;

  SDL_AudioSpec want{};
  want.freq = format.sample_rate;
  want.format = AUDIO_F32SYS;
  want.channels = static_cast<Uint8>(format.channels);
  want.samples = 1024;
  audio_device_ = SDL_OpenAudioDevice(nullptr, 0, &want, nullptr, 0);
  if (audio_device_ == 0) {
    util::Logger::Warn(std::string("[PreviewWindowSink] No audio device: ") +
                       SDL_GetError() + " (video only)");
  } else {
    SDL_PauseAudioDevice(audio_device_, 0);
  }

  origin_ = wait_.Now();
  SetStatus(SinkStatus::kRunning, "");
  return true;
}

bool PreviewWindowSink::PumpEvents() {
  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    if (event.type == SDL_QUIT ||
        (event.type == SDL_KEYDOWN && event.key.keysym.sym == SDLK_ESCAPE)) {
      last_error_ = "preview window closed";
      return false;
    }
  }
  return true;
}

bool PreviewWindowSink::ConsumeVideo(const media::RgbaImage& frame,
                                     int64_t frame_index) {
  if (status_ != SinkStatus::kRunning) {
    last_error_ = "ConsumeVideo while not running";
    return false;
  }
  if (!PumpEvents()) {
    SetStatus(SinkStatus::kError, last_error_);
    return false;
  }

  const auto frame_period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::nanoseconds(1000000000LL / std::max(1, format_.fps)));
  wait_.WaitUntil(origin_ + frame_period * frame_index);

  auto* texture = static_cast<SDL_Texture*>(texture_);
  auto* renderer = static_cast<SDL_Renderer*>(sdl_renderer_);
  SDL_UpdateTexture(texture, nullptr, frame.pixels.data(), frame.Stride());
  SDL_RenderClear(renderer);
  SDL_RenderCopy(renderer, texture, nullptr, nullptr);
  SDL_RenderPresent(renderer);
  return true;
}

bool PreviewWindowSink::ConsumeAudio(const float* interleaved,
                                     int64_t frame_count, int64_t first_frame) {
  (void)first_frame;
  if (status_ != SinkStatus::kRunning) {
    last_error_ = "ConsumeAudio while not running";
    return false;
  }
  if (audio_device_ == 0 || frame_count <= 0) return true;
  const Uint32 bytes = static_cast<Uint32>(frame_count * format_.channels * sizeof(float));
  if (SDL_QueueAudio(audio_device_, interleaved, bytes) < 0) {
    util::Logger::Warn(std::string("[PreviewWindowSink] SDL_QueueAudio: ") + SDL_GetError());
  }
  return true;
}

void PreviewWindowSink::Cleanup() {
  if (audio_device_ != 0) {
    SDL_CloseAudioDevice(audio_device_);
    audio_device_ = 0;
  }
  if (texture_) {
    SDL_DestroyTexture(static_cast<SDL_Texture*>(texture_));
    texture_ = nullptr;
  }
  if (sdl_renderer_) {
    SDL_DestroyRenderer(static_cast<SDL_Renderer*>(sdl_renderer_));
    sdl_renderer_ = nullptr;
  }
  if (window_) {
    SDL_DestroyWindow(static_cast<SDL_Window*>(window_));
    window_ = nullptr;
    SDL_Quit();
  }
}

#else  // !ADREEL_SDL2_AVAILABLE

bool PreviewWindowSink::Start(const OutputFormat& format) {
  format_ = format;
  last_error_ = "preview unavailable (built without SDL2)";
  util::Logger::Warn("[PreviewWindowSink] " + last_error_);
  SetStatus(SinkStatus::kError, last_error_);
  return false;
}

bool PreviewWindowSink::ConsumeVideo(const media::RgbaImage&, int64_t) {
  last_error_ = "preview unavailable (built without SDL2)";
  return false;
}

bool PreviewWindowSink::ConsumeAudio(const float*, int64_t, int64_t) {
  last_error_ = "preview unavailable (built without SDL2)";
  return false;
}

void PreviewWindowSink::Cleanup() {}

#endif  // ADREEL_SDL2_AVAILABLE

bool PreviewWindowSink::Finish(std::vector<uint8_t>* encoded) {
  if (encoded) encoded->clear();
  if (status_ != SinkStatus::kRunning) {
    Cleanup();
    return false;
  }
  SetStatus(SinkStatus::kStopping, "finish");
  Cleanup();
  SetStatus(SinkStatus::kStopped, "finished");
  return true;
}

void PreviewWindowSink::Abort() {
  Cleanup();
  if (status_ != SinkStatus::kIdle) SetStatus(SinkStatus::kStopped, "aborted");
}

}  // namespace adreel::output
