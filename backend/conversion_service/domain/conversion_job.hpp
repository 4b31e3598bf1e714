#pragma once

#include "job_error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace conversion_service {

using JobId = std::string;

// Declaration order is the pipeline order; transitions only move forward.
enum class JobState {
  Queued,
  Downloading,
  Validating,
  Encoding,
  Uploading,
  Succeeded,
  Failed,
  Cancelled
};

inline bool isTerminal(JobState state) {
  return state == JobState::Succeeded || state == JobState::Failed || state == JobState::Cancelled;
}

inline const char* jobStateName(JobState state) {
  switch (state) {
    case JobState::Queued:      return "queued";
    case JobState::Downloading: return "downloading";
    case JobState::Validating:  return "validating";
    case JobState::Encoding:    return "encoding";
    case JobState::Uploading:   return "uploading";
    case JobState::Succeeded:   return "succeeded";
    case JobState::Failed:      return "failed";
    case JobState::Cancelled:   return "cancelled";
  }
  return "failed";
}

// Inbound payload as announced by the chat bridge.
struct SourceRef {
  std::string uri;                            // file://, plain path, http(s)://
  std::string file_name;
  std::string mime_type;
  std::optional<std::uint64_t> declared_size;
  std::string owner;                          // chat user id, empty when unknown
};

// Where a finished artifact was delivered.
struct RemoteRef {
  std::string uri;
  std::string name;
  std::uint64_t size{0};
};

struct ProgressUpdate {
  JobState stage{JobState::Queued};
  double fraction{0.0};
  std::uint64_t bytes_done{0};
  std::optional<std::uint64_t> bytes_total;
  bool final{false};   // last update of the stage, never coalesced away
};

using ProgressCallback = std::function<void(const ProgressUpdate&)>;

struct JobOutcome {
  JobState state{JobState::Failed};
  std::optional<JobError> error;
  std::optional<RemoteRef> result;
};

struct ConversionJob {
  JobId id;
  SourceRef source;
  std::string profile_name;
  JobState state{JobState::Queued};
  std::filesystem::path workspace_path;
  ProgressUpdate progress;
  std::optional<JobError> error;        // only in Failed
  std::optional<RemoteRef> result;      // only in Succeeded
  std::chrono::system_clock::time_point submitted_at;
  std::optional<std::chrono::system_clock::time_point> finished_at;
};

// Per-job notification sink handed over at submission.
class JobObserver {
public:
  virtual ~JobObserver() = default;
  virtual void onProgress(const JobId& id, const ProgressUpdate& update) = 0;
  virtual void onFinished(const JobId& id, const JobOutcome& outcome) = 0;
};

} // namespace conversion_service
