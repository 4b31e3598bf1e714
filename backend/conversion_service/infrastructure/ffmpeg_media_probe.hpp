#pragma once

#include "domain/media_probe.hpp"

namespace conversion_service {

// Inspects a downloaded file with libavformat. Only the container header and a short
// stream-info read are done; nothing is decoded.
class FfmpegMediaProbe : public MediaProbe {
public:
  explicit FfmpegMediaProbe(int loglevel);

  std::expected<MediaInfo, std::string> probe(const std::filesystem::path& path) override;
};

} // namespace conversion_service
