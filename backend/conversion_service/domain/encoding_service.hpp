#pragma once

#include "cancellation.hpp"
#include "conversion_job.hpp"
#include "encode_profile.hpp"
#include "job_error.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>

namespace conversion_service {

struct EncodeRequest {
  std::filesystem::path input;
  EncodeProfile profile;
  std::filesystem::path workspace;                // output is written inside it
  std::optional<double> duration_seconds;         // from the probe, if known
  std::chrono::steady_clock::time_point deadline;
};

class EncodingService {
public:
  virtual ~EncodingService() = default;
  // Returns the output path, or an error of kind Encode. Never returns while a child
  // process it started is still alive.
  virtual std::expected<std::filesystem::path, JobError> encode(
    const EncodeRequest& request,
    const ProgressCallback& on_progress,
    const CancellationToken& cancel
  ) = 0;
};

} // namespace conversion_service
