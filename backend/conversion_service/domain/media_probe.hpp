#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace conversion_service {

struct MediaInfo {
  std::string format_name;
  std::optional<double> duration_seconds;
  bool has_video{false};
  int audio_streams{0};
  int subtitle_streams{0};
};

class MediaProbe {
public:
  virtual ~MediaProbe() = default;
  // Error text describes why the file is not usable as a video source.
  virtual std::expected<MediaInfo, std::string> probe(const std::filesystem::path& path) = 0;
};

} // namespace conversion_service
