// Repository: AdReel
// Component: FFmpeg Media Contract Tests
// Purpose: Real libav* round trip: the encoder sink writes a playable H.264 +
//          AAC container, the clip decoder reads it back frame by frame, the
//          drawtext painter changes pixels inside its text box, and decoded
//          timestamps are rebased to start at zero.
// Copyright (c) 2026 AdReel

#include <gtest/gtest.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "adreel/media/ClipSource.hpp"
#include "adreel/media/MemoryIO.hpp"
#include "adreel/output/EncoderSink.hpp"
#include "adreel/render/DrawTextPainter.hpp"

namespace adreel::testing {
namespace {

constexpr int kWidth = 64;
constexpr int kHeight = 48;
constexpr int kFps = 30;
constexpr int kFrames = 30;
constexpr int kSampleRate = 48000;
constexpr int kChannels = 2;

class FFmpegMediaContractTest : public ::testing::Test {
 protected:
  // Encodes kFrames gradient frames with a matching tone and returns the
  // container bytes wrapped as a clip blob.
  media::MediaHandle EncodeClip() {
    output::EncoderSinkConfig config;
    config.container = "mp4";
    output::FFmpegEncoderSink sink(config);

    output::OutputFormat format;
    format.width = kWidth;
    format.height = kHeight;
    format.fps = kFps;
    format.sample_rate = kSampleRate;
    format.channels = kChannels;
    if (!sink.Start(format)) {
      ADD_FAILURE() << "Start: " << sink.LastError();
      return nullptr;
    }

    const int64_t audio_per_frame = kSampleRate / kFps;
    std::vector<float> tone(static_cast<size_t>(audio_per_frame) * kChannels);
    media::RgbaImage frame(kWidth, kHeight);
    for (int i = 0; i < kFrames; ++i) {
      media::Fill(frame, media::Rgba{static_cast<uint8_t>(i * 8), 90,
                                     static_cast<uint8_t>(255 - i * 8), 255});
      if (!sink.ConsumeVideo(frame, i)) {
        ADD_FAILURE() << "ConsumeVideo " << i << ": " << sink.LastError();
        return nullptr;
      }
      const int64_t first = i * audio_per_frame;
      for (int64_t s = 0; s < audio_per_frame; ++s) {
        const float v = 0.2f * static_cast<float>(std::sin(
                                   2.0 * M_PI * 440.0 * (first + s) / kSampleRate));
        tone[static_cast<size_t>(s) * kChannels] = v;
        tone[static_cast<size_t>(s) * kChannels + 1] = v;
      }
      if (!sink.ConsumeAudio(tone.data(), audio_per_frame, first)) {
        ADD_FAILURE() << "ConsumeAudio " << i << ": " << sink.LastError();
        return nullptr;
      }
    }

    std::vector<uint8_t> bytes;
    if (!sink.Finish(&bytes)) {
      ADD_FAILURE() << "Finish: " << sink.LastError();
      return nullptr;
    }
    return media::MakeMediaHandle(sink.MimeType(), std::move(bytes));
  }
};

// =============================================================================
// Encoder sink
// =============================================================================

TEST_F(FFmpegMediaContractTest, EncodedContainerHasVideoAndAudioForOneSecond) {
  // GIVEN: one second of frames and audio pushed through the encoder
  media::MediaHandle clip = EncodeClip();
  ASSERT_NE(clip, nullptr);
  EXPECT_EQ(clip->mime_type, "video/mp4");
  ASSERT_FALSE(clip->empty());

  // WHEN: the bytes are demuxed from memory
  media::MemoryDemuxer demuxer(clip);
  std::string error;
  ASSERT_TRUE(demuxer.Open(&error)) << error;

  // THEN: one H.264 stream, one AAC stream, about one second long
  AVFormatContext* fmt = demuxer.format();
  ASSERT_EQ(fmt->nb_streams, 2u);
  int video = 0;
  int audio = 0;
  for (unsigned i = 0; i < fmt->nb_streams; ++i) {
    const AVCodecParameters* par = fmt->streams[i]->codecpar;
    if (par->codec_type == AVMEDIA_TYPE_VIDEO) {
      ++video;
      EXPECT_EQ(par->codec_id, AV_CODEC_ID_H264);
      EXPECT_EQ(par->width, kWidth);
      EXPECT_EQ(par->height, kHeight);
    } else if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
      ++audio;
      EXPECT_EQ(par->codec_id, AV_CODEC_ID_AAC);
    }
  }
  EXPECT_EQ(video, 1);
  EXPECT_EQ(audio, 1);

  ASSERT_NE(fmt->duration, AV_NOPTS_VALUE);
  const double seconds = static_cast<double>(fmt->duration) / AV_TIME_BASE;
  EXPECT_NEAR(seconds, static_cast<double>(kFrames) / kFps, 0.1);
}

TEST_F(FFmpegMediaContractTest, EncoderRejectsOddDimensions) {
  output::FFmpegEncoderSink sink(output::EncoderSinkConfig{});
  output::OutputFormat format;
  format.width = 65;
  format.height = 48;

  EXPECT_FALSE(sink.Start(format));
  EXPECT_EQ(sink.LastError(), "invalid output format 65x48@30");
}

// =============================================================================
// Clip decoder
// =============================================================================

TEST_F(FFmpegMediaContractTest, DecoderReadsEveryEncodedFrameFromZero) {
  media::MediaHandle clip = EncodeClip();
  ASSERT_NE(clip, nullptr);

  media::FFmpegClipDecoder decoder(clip);
  ASSERT_TRUE(decoder.Open()) << decoder.LastError();
  EXPECT_EQ(decoder.Width(), kWidth);
  EXPECT_EQ(decoder.Height(), kHeight);

  media::ClipFrame frame;
  std::vector<int64_t> pts;
  media::ClipReadStatus status;
  while ((status = decoder.ReadFrame(frame)) == media::ClipReadStatus::kFrame) {
    EXPECT_EQ(frame.image.width, kWidth);
    EXPECT_EQ(frame.image.height, kHeight);
    pts.push_back(frame.pts_us);
  }

  EXPECT_EQ(status, media::ClipReadStatus::kEndOfStream) << decoder.LastError();
  ASSERT_EQ(pts.size(), static_cast<size_t>(kFrames));
  EXPECT_EQ(pts.front(), 0);
  for (size_t i = 1; i < pts.size(); ++i) {
    EXPECT_GT(pts[i], pts[i - 1]) << "frame " << i;
  }
  EXPECT_NEAR(static_cast<double>(frame.duration_us), 1e6 / kFps, 1.0);
}

TEST_F(FFmpegMediaContractTest, DecoderRejectsGarbage) {
  media::FFmpegClipDecoder decoder(media::MakeMediaHandle(
      "video/mp4", std::vector<uint8_t>{'n', 'o', 't', ' ', 'a', ' ', 'c', 'l', 'i', 'p'}));

  EXPECT_FALSE(decoder.Open());
  EXPECT_FALSE(decoder.LastError().empty());
}

// =============================================================================
// Clip timeline
// =============================================================================

TEST_F(FFmpegMediaContractTest, TimelineRebasesNegativeFirstTimestamp) {
  // GIVEN: a clip whose first frame carries a negative pts
  media::ClipTimeline timeline(33333);

  // WHEN / THEN: the first frame lands on 0 and spacing is kept
  EXPECT_EQ(timeline.Next(-40000), 0);
  EXPECT_EQ(timeline.Next(-6667), 33333);
  // No timestamp continues one frame later
  EXPECT_EQ(timeline.Next(std::nullopt), 66666);
  // A jump backwards by more than a frame also continues
  EXPECT_EQ(timeline.Next(-40000), 99999);
}

TEST_F(FFmpegMediaContractTest, TimelineResetStartsANewOrigin) {
  media::ClipTimeline timeline(40000);
  EXPECT_EQ(timeline.Next(1000000), 0);
  EXPECT_EQ(timeline.Next(1040000), 40000);

  timeline.Reset();
  EXPECT_EQ(timeline.Next(500000), 0);
  EXPECT_EQ(timeline.Next(std::nullopt), 40000);
}

// =============================================================================
// DrawText painter
// =============================================================================

class DrawTextPainterTest : public ::testing::Test {
 protected:
  static render::TextSpec Spec(const std::string& text, int x, int y) {
    render::TextSpec spec;
    spec.text = text;
    spec.style.font_size = 32;
    spec.style.fill = media::Rgba{255, 255, 255, 255};
    spec.anchor = render::TextAnchor::kBottomLeft;
    spec.x = x;
    spec.y = y;
    return spec;
  }

  // Lowest and highest rows holding a pixel that is no longer black.
  static bool ChangedRows(const media::RgbaImage& image, int* first, int* last) {
    *first = -1;
    *last = -1;
    for (int y = 0; y < image.height; ++y) {
      for (int x = 0; x < image.width; ++x) {
        const media::Rgba p = image.PixelAt(x, y);
        if (p.r != 0 || p.g != 0 || p.b != 0) {
          if (*first < 0) *first = y;
          *last = y;
          break;
        }
      }
    }
    return *first >= 0;
  }

  render::DrawTextPainter painter_;
};

TEST_F(DrawTextPainterTest, PaintChangesPixels) {
  media::RgbaImage canvas(200, 100);
  media::Fill(canvas, media::Rgba{0, 0, 0, 255});

  if (!painter_.Paint(canvas, Spec("AdReel", 20, 80))) {
    GTEST_SKIP() << "no usable font: " << painter_.LastError();
  }

  int first = 0;
  int last = 0;
  EXPECT_TRUE(ChangedRows(canvas, &first, &last));
  EXPECT_EQ(painter_.cached_graph_count(), 1u);
}

TEST_F(DrawTextPainterTest, BottomLeftAnchorKeepsDescendersAboveY) {
  // GIVEN: text with descenders anchored 20px above the bottom
  const int height = 100;
  const int anchor_y = height - 20;
  media::RgbaImage canvas(200, height);
  media::Fill(canvas, media::Rgba{0, 0, 0, 255});

  // WHEN
  if (!painter_.Paint(canvas, Spec("gyp", 20, anchor_y))) {
    GTEST_SKIP() << "no usable font: " << painter_.LastError();
  }

  // THEN: no painted row reaches the anchor and the descenders end near it
  int first = 0;
  int last = 0;
  ASSERT_TRUE(ChangedRows(canvas, &first, &last));
  EXPECT_LE(last, anchor_y);
  EXPECT_GT(last, anchor_y - 12);
}

TEST_F(DrawTextPainterTest, EmptyTextLeavesCanvasUntouched) {
  media::RgbaImage canvas(32, 32);
  media::Fill(canvas, media::Rgba{0, 0, 0, 255});

  EXPECT_TRUE(painter_.Paint(canvas, Spec("", 4, 28)));

  int first = 0;
  int last = 0;
  EXPECT_FALSE(ChangedRows(canvas, &first, &last));
  EXPECT_EQ(painter_.cached_graph_count(), 0u);
}

}  // namespace
}  // namespace adreel::testing
