#pragma once

#include "domain/conversion_job.hpp"
#include "domain/job_error.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <set>

namespace conversion_service {

struct WorkspaceOptions {
  std::filesystem::path root;
  std::uint64_t min_free_bytes{0};
};

// Hands out one scratch directory per job under a shared root and remembers which
// ones are live, so leftovers from a crashed run can be told apart and removed.
class WorkspaceManager {
public:
  // Creates the root directory; throws std::filesystem::filesystem_error on failure.
  explicit WorkspaceManager(WorkspaceOptions options);

  WorkspaceManager(const WorkspaceManager&) = delete;
  WorkspaceManager& operator=(const WorkspaceManager&) = delete;

  std::expected<std::filesystem::path, JobError> allocate(const JobId& job_id);
  // Idempotent: releasing an already removed workspace succeeds.
  std::expected<void, JobError> release(const std::filesystem::path& path);
  // Removes job directories under the root that no live job owns. Returns the count.
  std::size_t sweepOrphans();

  bool isActive(const std::filesystem::path& path) const;
  std::size_t activeCount() const;
  const std::filesystem::path& root() const { return options_.root; }

  static constexpr const char* kDirectoryPrefix = "job-";

private:
  std::expected<void, JobError> checkFreeSpace() const;

  WorkspaceOptions options_;
  mutable std::mutex mtx_;
  std::set<std::filesystem::path> active_;
};

// Scoped ownership of one allocated workspace; the destructor releases it on every
// exit path that did not release it explicitly.
class WorkspaceLease {
public:
  WorkspaceLease(WorkspaceManager& manager, std::filesystem::path path);
  ~WorkspaceLease();

  WorkspaceLease(const WorkspaceLease&) = delete;
  WorkspaceLease& operator=(const WorkspaceLease&) = delete;
  WorkspaceLease(WorkspaceLease&& other) noexcept;
  WorkspaceLease& operator=(WorkspaceLease&&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::expected<void, JobError> release();

private:
  WorkspaceManager* manager_;
  std::filesystem::path path_;
  bool released_{false};
};

} // namespace conversion_service
