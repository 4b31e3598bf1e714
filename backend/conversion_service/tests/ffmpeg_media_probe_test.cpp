#include <gtest/gtest.h>

#include "infrastructure/ffmpeg_media_probe.hpp"
#include "test_support.hpp"

extern "C" {
#include <libavutil/log.h>
}

namespace conversion_service {
namespace {

TEST(FfmpegMediaProbeTest, MissingFileIsReported) {
  test_support::TempDir dir;
  FfmpegMediaProbe probe{AV_LOG_QUIET};
  auto info = probe.probe(dir / "absent.mp4");
  ASSERT_FALSE(info.has_value());
  EXPECT_FALSE(info.error().empty());
}

TEST(FfmpegMediaProbeTest, TextFileIsNotMedia) {
  test_support::TempDir dir;
  auto path = dir / "notes.mp4";
  {
    std::ofstream out(path);
    out << "these are shopping notes, not a movie\n";
  }
  FfmpegMediaProbe probe{AV_LOG_QUIET};
  auto info = probe.probe(path);
  if (info) {
    // some demuxers accept arbitrary bytes, but none finds a video stream in them
    EXPECT_FALSE(info->has_video);
  } else {
    EXPECT_FALSE(info.error().empty());
  }
}

} // namespace
} // namespace conversion_service
