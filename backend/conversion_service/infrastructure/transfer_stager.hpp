#pragma once

#include "domain/cancellation.hpp"
#include "domain/conversion_job.hpp"
#include "domain/job_error.hpp"
#include "domain/transfer_service.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace conversion_service {

struct TransferOptions {
  std::size_t chunk_bytes{1024 * 1024};
  std::chrono::milliseconds progress_interval{500};
  std::string output_endpoint;     // upload destination, file:// or http(s)://
};

// Moves payloads between remote locations and a job's workspace, enforcing the size
// ceiling while streaming and reporting throttled progress.
class TransferStager {
public:
  TransferStager(std::vector<std::shared_ptr<TransferService>> services, TransferOptions options);

  // Returns bytes written. The partial file is removed on any failure.
  std::expected<std::uint64_t, JobError> download(
    const SourceRef& source,
    const std::filesystem::path& destination,
    std::uint64_t max_bytes,
    const ProgressCallback& on_progress,
    const CancellationToken& cancel
  );

  std::expected<RemoteRef, JobError> upload(
    const std::filesystem::path& source,
    const std::string& object_name,
    const ProgressCallback& on_progress,
    const CancellationToken& cancel
  );

  bool canFetch(const std::string& uri) const { return serviceFor(uri) != nullptr; }
  const TransferOptions& options() const { return options_; }

private:
  std::shared_ptr<TransferService> serviceFor(const std::string& uri) const;

  std::vector<std::shared_ptr<TransferService>> services_;
  TransferOptions options_;
};

} // namespace conversion_service
