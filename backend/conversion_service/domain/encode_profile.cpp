#include "encode_profile.hpp"

namespace conversion_service {

std::vector<std::string> EncodeProfile::encoderArguments(const std::filesystem::path& input,
                                                         const std::filesystem::path& output) const {
  std::vector<std::string> args = {"-hide_banner", "-nostdin", "-y", "-i", input.string()};

  args.insert(args.end(), {"-map", "0:v:0"});
  if (track_policy == TrackPolicy::PreserveAll) {
    args.insert(args.end(), {"-map", "0:a?", "-map", "0:s?"});
  } else {
    args.insert(args.end(), {"-map", "0:a:0?", "-map", "0:s:0?"});
  }

  args.insert(args.end(), {"-c:v", video_codec});
  if (quality.mode == Quality::Mode::Crf) {
    args.insert(args.end(), {"-crf", std::to_string(quality.value)});
  } else {
    args.insert(args.end(), {"-b:v", std::to_string(quality.value)});
  }
  if (!preset.empty()) {
    args.insert(args.end(), {"-preset", preset});
  }
  if (resolution_cap) {
    // -2 keeps the width even, which libx264/libx265 require
    args.insert(args.end(), {"-vf", "scale=-2:'min(" + std::to_string(*resolution_cap) + ",ih)'"});
  }

  args.insert(args.end(), {"-c:a", audio_codec});
  if (audio_bitrate) {
    args.insert(args.end(), {"-b:a", *audio_bitrate});
  }
  if (subtitle_codec) {
    args.insert(args.end(), {"-c:s", *subtitle_codec});
  }

  args.insert(args.end(), extra_output_args.begin(), extra_output_args.end());
  args.insert(args.end(), {"-f", container_format, output.string()});
  return args;
}

std::string EncodeProfile::debug() const {
  std::string text = "name:" + name + ",container:" + container_format + ",video:" + video_codec +
    ",audio:" + audio_codec;
  text += quality.mode == Quality::Mode::Crf ? ",crf:" : ",bitrate:";
  text += std::to_string(quality.value);
  text += ",tracks:";
  text += trackPolicyName(track_policy);
  if (resolution_cap) {
    text += ",max_height:" + std::to_string(*resolution_cap);
  }
  return text;
}

const char* trackPolicyName(TrackPolicy policy) {
  switch (policy) {
    case TrackPolicy::PreserveDefaultOnly: return "preserve_default_only";
    case TrackPolicy::PreserveAll:         return "preserve_all";
  }
  return "preserve_default_only";
}

} // namespace conversion_service
