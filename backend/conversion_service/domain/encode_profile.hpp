#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace conversion_service {

enum class TrackPolicy {
  PreserveDefaultOnly,  // first video, first audio, first subtitle track
  PreserveAll           // first video, every audio and subtitle track
};

struct Quality {
  enum class Mode { Crf, Bitrate };
  Mode mode{Mode::Crf};
  long value{23};   // crf value, or bits per second
};

// Immutable description of one conversion target. Everything that ends up on the
// encoder command line comes from these fields, never from the profile's name.
struct EncodeProfile {
  std::string name;
  std::vector<std::string> aliases;
  std::string container_format;   // ffmpeg muxer name
  std::string file_extension;
  std::string video_codec;
  std::string audio_codec;
  Quality quality;
  std::string preset;
  std::optional<std::string> audio_bitrate;
  std::optional<std::string> subtitle_codec;
  TrackPolicy track_policy{TrackPolicy::PreserveDefaultOnly};
  std::optional<int> resolution_cap;  // max output height, aspect ratio kept
  std::vector<std::string> extra_output_args;

  // Full argument list after the executable name.
  std::vector<std::string> encoderArguments(const std::filesystem::path& input,
                                            const std::filesystem::path& output) const;
  std::string debug() const;
};

const char* trackPolicyName(TrackPolicy policy);

} // namespace conversion_service
