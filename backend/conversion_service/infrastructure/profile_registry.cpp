#include "profile_registry.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace conversion_service {

ProfileRegistry::ProfileRegistry(std::vector<EncodeProfile> profiles) : profiles_(std::move(profiles)) {
  for (std::size_t i = 0; i < profiles_.size(); ++i) {
    const auto& profile = profiles_[i];
    if (profile.container_format.empty() || profile.file_extension.empty() || profile.video_codec.empty()) {
      throw std::invalid_argument("profile '" + profile.name + "' needs a container, extension and video codec");
    }

    std::vector<std::string> names{profile.name};
    names.insert(names.end(), profile.aliases.begin(), profile.aliases.end());
    for (const auto& name : names) {
      auto normalized = key(name);
      if (normalized.empty()) {
        throw std::invalid_argument("profile names and aliases must not be empty");
      }
      if (!index_.emplace(normalized, i).second) {
        throw std::invalid_argument("duplicate profile name or alias: " + name);
      }
    }
  }
}

EncodeProfile ProfileRegistry::fromConfig(const config::EncodeProfileConfig& profile) {
  EncodeProfile result;
  result.name = profile.name;
  result.aliases = profile.aliases;
  result.container_format = profile.container_format;
  result.file_extension = profile.file_extension;
  result.video_codec = profile.video_codec;
  result.audio_codec = profile.audio_codec;
  if (profile.bitrate > 0) {
    result.quality = {Quality::Mode::Bitrate, profile.bitrate};
  } else {
    result.quality = {Quality::Mode::Crf, profile.crf};
  }
  result.preset = profile.preset;
  if (!profile.audio_bitrate.empty()) {
    result.audio_bitrate = profile.audio_bitrate;
  }
  if (!profile.subtitle_codec.empty()) {
    result.subtitle_codec = profile.subtitle_codec;
  }
  result.track_policy = profile.preserve_all_tracks ? TrackPolicy::PreserveAll : TrackPolicy::PreserveDefaultOnly;
  if (profile.max_height > 0) {
    result.resolution_cap = profile.max_height;
  }
  result.extra_output_args = profile.extra_args;
  return result;
}

ProfileRegistry ProfileRegistry::fromConfig(const std::vector<config::EncodeProfileConfig>& profiles) {
  std::vector<EncodeProfile> converted;
  converted.reserve(profiles.size());
  std::transform(profiles.begin(), profiles.end(), std::back_inserter(converted),
    [](const config::EncodeProfileConfig& profile) { return fromConfig(profile); });
  return ProfileRegistry(std::move(converted));
}

std::expected<EncodeProfile, JobError> ProfileRegistry::resolve(const std::string& name) const {
  auto it = index_.find(key(name));
  if (it == index_.end()) {
    return std::unexpected(JobError::validation("unknown profile: " + name));
  }
  return profiles_[it->second];
}

std::string ProfileRegistry::key(const std::string& name) {
  auto begin = name.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = name.find_last_not_of(" \t");
  std::string result = name.substr(begin, end - begin + 1);
  std::transform(result.begin(), result.end(), result.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

} // namespace conversion_service
