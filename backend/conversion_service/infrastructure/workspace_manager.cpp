#include "workspace_manager.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace conversion_service {

namespace {

bool isSafeJobId(const JobId& job_id) {
  return !job_id.empty() && std::all_of(job_id.begin(), job_id.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_';
  });
}

} // namespace

WorkspaceManager::WorkspaceManager(WorkspaceOptions options) : options_(std::move(options)) {
  std::filesystem::create_directories(options_.root);
  options_.root = std::filesystem::absolute(options_.root).lexically_normal();
  if (!options_.root.has_filename()) {
    options_.root = options_.root.parent_path();
  }
}

std::expected<void, JobError> WorkspaceManager::checkFreeSpace() const {
  if (options_.min_free_bytes == 0) {
    return {};
  }

  std::error_code ec;
  auto info = std::filesystem::space(options_.root, ec);
  if (ec) {
    return std::unexpected(JobError::resource("scratch storage is unavailable",
      "space(" + options_.root.string() + "): " + ec.message()));
  }
  if (info.available < options_.min_free_bytes) {
    return std::unexpected(JobError::resource("the service is out of disk space, try again later",
      "available " + std::to_string(info.available) + " bytes, required " +
      std::to_string(options_.min_free_bytes)));
  }
  return {};
}

std::expected<std::filesystem::path, JobError> WorkspaceManager::allocate(const JobId& job_id) {
  if (!isSafeJobId(job_id)) {
    return std::unexpected(JobError::internal("refusing workspace for job id '" + job_id + "'"));
  }

  if (auto space = checkFreeSpace(); !space) {
    return std::unexpected(space.error());
  }

  auto path = options_.root / (std::string(kDirectoryPrefix) + job_id);

  std::lock_guard<std::mutex> lock{mtx_};
  if (active_.contains(path)) {
    return std::unexpected(JobError::resource("workspace allocation failed",
      "workspace already in use: " + path.string()));
  }

  std::error_code ec;
  if (!std::filesystem::create_directory(path, ec)) {
    return std::unexpected(JobError::resource("workspace allocation failed",
      "create_directory(" + path.string() + "): " + (ec ? ec.message() : "already exists")));
  }

  active_.insert(path);
  LOG_DEBUG("workspace allocated: " + path.string());
  return path;
}

std::expected<void, JobError> WorkspaceManager::release(const std::filesystem::path& path) {
  auto normalized = std::filesystem::absolute(path).lexically_normal();
  if (normalized.parent_path() != options_.root) {
    return std::unexpected(JobError::internal("refusing to remove path outside scratch root: " +
      normalized.string()));
  }

  std::lock_guard<std::mutex> lock{mtx_};
  std::error_code ec;
  std::filesystem::remove_all(normalized, ec);
  if (ec) {
    LOG_ERROR("workspace cleanup failed for " + normalized.string() + ": " + ec.message());
    return std::unexpected(JobError::resource("workspace cleanup failed",
      "remove_all(" + normalized.string() + "): " + ec.message()));
  }

  if (active_.erase(normalized) > 0) {
    LOG_DEBUG("workspace released: " + normalized.string());
  }
  return {};
}

std::size_t WorkspaceManager::sweepOrphans() {
  std::lock_guard<std::mutex> lock{mtx_};
  std::size_t removed = 0;

  std::error_code ec;
  std::filesystem::directory_iterator it(options_.root, ec);
  if (ec) {
    LOG_WARN("orphan sweep skipped, cannot list " + options_.root.string() + ": " + ec.message());
    return 0;
  }

  for (const auto& entry : it) {
    const auto name = entry.path().filename().string();
    if (!name.starts_with(kDirectoryPrefix) || !entry.is_directory(ec)) {
      continue;
    }
    if (active_.contains(entry.path())) {
      continue;
    }

    std::error_code remove_ec;
    std::filesystem::remove_all(entry.path(), remove_ec);
    if (remove_ec) {
      LOG_WARN("orphan sweep could not remove " + entry.path().string() + ": " + remove_ec.message());
      continue;
    }
    LOG_INFO("removed orphaned workspace " + entry.path().string());
    ++removed;
  }
  return removed;
}

bool WorkspaceManager::isActive(const std::filesystem::path& path) const {
  std::lock_guard<std::mutex> lock{mtx_};
  return active_.contains(std::filesystem::absolute(path).lexically_normal());
}

std::size_t WorkspaceManager::activeCount() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return active_.size();
}

WorkspaceLease::WorkspaceLease(WorkspaceManager& manager, std::filesystem::path path)
  : manager_(&manager), path_(std::move(path)) {}

WorkspaceLease::WorkspaceLease(WorkspaceLease&& other) noexcept
  : manager_(other.manager_), path_(std::move(other.path_)), released_(other.released_) {
  other.released_ = true;
}

WorkspaceLease::~WorkspaceLease() {
  if (!released_) {
    if (auto result = release(); !result) {
      LOG_ERROR("workspace lease cleanup failed: " + result.error().debug());
    }
  }
}

std::expected<void, JobError> WorkspaceLease::release() {
  if (released_) {
    return {};
  }
  auto result = manager_->release(path_);
  if (result) {
    released_ = true;
  }
  return result;
}

} // namespace conversion_service
