#include "transfer_stager.hpp"
#include "progress_throttle.hpp"
#include "common/logger.hpp"

#include <fstream>
#include <system_error>

namespace conversion_service {

namespace {

enum class AbortReason {
  None,
  SizeLimit,
  Cancelled,
  LocalIo
};

double fractionOf(std::uint64_t done, const std::optional<std::uint64_t>& total) {
  if (!total || *total == 0) {
    return 0.0;
  }
  auto fraction = static_cast<double>(done) / static_cast<double>(*total);
  return fraction > 1.0 ? 1.0 : fraction;
}

void removeQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    LOG_WARN("could not remove partial file " + path.string() + ": " + ec.message());
  }
}

} // namespace

TransferStager::TransferStager(std::vector<std::shared_ptr<TransferService>> services,
                               TransferOptions options)
  : services_(std::move(services)), options_(std::move(options)) {}

std::shared_ptr<TransferService> TransferStager::serviceFor(const std::string& uri) const {
  for (const auto& service : services_) {
    if (service->supports(uri)) {
      return service;
    }
  }
  return nullptr;
}

std::expected<std::uint64_t, JobError> TransferStager::download(
  const SourceRef& source,
  const std::filesystem::path& destination,
  std::uint64_t max_bytes,
  const ProgressCallback& on_progress,
  const CancellationToken& cancel
) {
  if (source.declared_size && *source.declared_size > max_bytes) {
    return std::unexpected(JobError::sizeLimit(max_bytes));
  }

  auto service = serviceFor(source.uri);
  if (!service) {
    return std::unexpected(JobError::validation("unsupported source location", source.uri));
  }
  if (cancel.cancelled()) {
    return std::unexpected(JobError::cancelled());
  }

  std::ofstream file(destination, std::ios::binary | std::ios::trunc);
  if (!file) {
    return std::unexpected(JobError::resource("could not stage the upload",
      "failed to open " + destination.string()));
  }

  std::optional<std::uint64_t> total = source.declared_size;
  std::uint64_t received = 0;
  AbortReason reason = AbortReason::None;
  ProgressThrottle throttle{options_.progress_interval};

  auto on_length = [&](std::uint64_t length) -> bool {
    if (length > max_bytes) {
      reason = AbortReason::SizeLimit;
      return false;
    }
    if (!total) {
      total = length;
    }
    return true;
  };

  auto writer = [&](const char* data, std::size_t size) -> bool {
    if (cancel.cancelled()) {
      reason = AbortReason::Cancelled;
      return false;
    }
    if (received + size > max_bytes) {
      reason = AbortReason::SizeLimit;
      return false;
    }
    file.write(data, static_cast<std::streamsize>(size));
    if (!file) {
      reason = AbortReason::LocalIo;
      return false;
    }
    received += size;
    if (on_progress && throttle.ready()) {
      on_progress({JobState::Downloading, fractionOf(received, total), received, total, false});
    }
    return true;
  };

  auto should_abort = [&cancel]() { return cancel.cancelled(); };

  auto fetched = service->fetch(source.uri, writer, on_length, should_abort);
  file.close();
  if (fetched && !file) {
    reason = AbortReason::LocalIo;
  }

  if (!fetched || reason != AbortReason::None) {
    removeQuietly(destination);
    switch (reason) {
      case AbortReason::SizeLimit:
        LOG_INFO("download of " + source.uri + " aborted at " + std::to_string(received) +
          " bytes: size limit " + std::to_string(max_bytes));
        return std::unexpected(JobError::sizeLimit(max_bytes));
      case AbortReason::Cancelled:
        return std::unexpected(JobError::cancelled());
      case AbortReason::LocalIo:
        return std::unexpected(JobError::resource("could not stage the upload",
          "write failed on " + destination.string()));
      case AbortReason::None:
        break;
    }
    if (cancel.cancelled()) {
      return std::unexpected(JobError::cancelled());
    }
    return std::unexpected(JobError::transfer("downloading the file failed", fetched.error()));
  }

  if (source.declared_size && received != *source.declared_size) {
    removeQuietly(destination);
    return std::unexpected(JobError::transfer("downloading the file failed",
      "received " + std::to_string(received) + " of " + std::to_string(*source.declared_size) + " bytes"));
  }

  if (on_progress) {
    on_progress({JobState::Downloading, 1.0, received, total ? total : std::optional(received), true});
  }
  return received;
}

std::expected<RemoteRef, JobError> TransferStager::upload(
  const std::filesystem::path& source,
  const std::string& object_name,
  const ProgressCallback& on_progress,
  const CancellationToken& cancel
) {
  auto service = serviceFor(options_.output_endpoint);
  if (!service) {
    return std::unexpected(JobError::internal("no transport for output endpoint " + options_.output_endpoint));
  }

  std::error_code ec;
  const auto size = std::filesystem::file_size(source, ec);
  if (ec) {
    return std::unexpected(JobError::resource("could not read the converted file",
      "file_size(" + source.string() + "): " + ec.message()));
  }

  std::ifstream file(source, std::ios::binary);
  if (!file) {
    return std::unexpected(JobError::resource("could not read the converted file",
      "failed to open " + source.string()));
  }

  std::uint64_t sent = 0;
  AbortReason reason = AbortReason::None;
  ProgressThrottle throttle{options_.progress_interval};

  auto reader = [&](char* buffer, std::size_t capacity) -> std::optional<std::size_t> {
    if (cancel.cancelled()) {
      reason = AbortReason::Cancelled;
      return std::nullopt;
    }
    file.read(buffer, static_cast<std::streamsize>(capacity));
    auto count = static_cast<std::size_t>(file.gcount());
    if (count == 0 && file.bad()) {
      reason = AbortReason::LocalIo;
      return std::nullopt;
    }
    sent += count;
    if (on_progress && count > 0 && throttle.ready()) {
      on_progress({JobState::Uploading, fractionOf(sent, size), sent, size, false});
    }
    return count;
  };

  auto should_abort = [&cancel]() { return cancel.cancelled(); };

  auto stored = service->store(options_.output_endpoint, object_name, size, reader, should_abort);
  if (!stored) {
    if (reason == AbortReason::Cancelled || cancel.cancelled()) {
      return std::unexpected(JobError::cancelled());
    }
    if (reason == AbortReason::LocalIo) {
      return std::unexpected(JobError::resource("could not read the converted file",
        "read failed on " + source.string()));
    }
    return std::unexpected(JobError::transfer("sending the converted file failed", stored.error()));
  }

  if (on_progress) {
    on_progress({JobState::Uploading, 1.0, sent, size, true});
  }

  return RemoteRef{
    .uri = *stored,
    .name = std::filesystem::path(object_name).filename().string(),
    .size = size
  };
}

} // namespace conversion_service
