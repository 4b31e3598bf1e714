#pragma once

#include "progress_dispatcher.hpp"
#include "common/config/config.hpp"
#include "common/thread_pool.hpp"
#include "domain/cancellation.hpp"
#include "domain/conversion_job.hpp"
#include "domain/encode_profile.hpp"
#include "domain/encoding_service.hpp"
#include "domain/media_probe.hpp"
#include "infrastructure/profile_registry.hpp"
#include "infrastructure/transfer_stager.hpp"
#include "infrastructure/workspace_manager.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace conversion_service {

struct OrchestratorOptions {
  std::size_t max_concurrent_jobs{2};
  std::size_t max_jobs_per_owner{0};        // 0 = unlimited
  std::uint64_t max_file_size_bytes{2147483648ULL};
  std::chrono::seconds encoder_timeout{3600};
  std::size_t job_history_limit{256};       // finished jobs kept for snapshots
  std::vector<std::string> allowed_extensions;

  static OrchestratorOptions fromConfig(const config::ConverterConfig& config);
};

struct JobHandle {
  JobId id;
  JobState state{JobState::Queued};
};

// Runs conversion jobs through download, validation, encode and upload with bounded
// concurrency. Admission state (job table, FIFO queue, active counters) lives behind
// one mutex; each admitted job runs sequentially on a worker thread.
class JobOrchestrator {
public:
  JobOrchestrator(OrchestratorOptions options,
                  std::shared_ptr<WorkspaceManager> workspaces,
                  std::shared_ptr<TransferStager> stager,
                  std::shared_ptr<const ProfileRegistry> profiles,
                  std::shared_ptr<MediaProbe> probe,
                  std::shared_ptr<EncodingService> encoder);
  ~JobOrchestrator();

  JobOrchestrator(const JobOrchestrator&) = delete;
  JobOrchestrator& operator=(const JobOrchestrator&) = delete;

  // Never throws for bad input: rejected submissions come back already Failed.
  JobHandle submit(const SourceRef& source, const std::string& profile_name,
                   std::shared_ptr<JobObserver> observer);
  // False when the job is unknown or already terminal.
  bool cancel(const JobId& id);

  std::optional<ConversionJob> snapshot(const JobId& id) const;
  std::vector<ConversionJob> list() const;
  std::size_t activeCount() const;
  std::size_t queuedCount() const;
  std::optional<ConversionJob> waitForTerminal(const JobId& id, std::chrono::milliseconds timeout) const;

  // Cancels everything, waits for running jobs and delivers pending notifications.
  void shutdown();

private:
  struct JobRecord {
    ConversionJob job;
    EncodeProfile profile;
    std::shared_ptr<CancellationToken> cancel{std::make_shared<CancellationToken>()};
    std::uint64_t sequence{0};
  };
  using RecordPtr = std::shared_ptr<JobRecord>;

  static JobId generateId();
  std::optional<JobError> precheck(const SourceRef& source, const std::string& profile_name,
                                   EncodeProfile& profile) const;
  bool looksLikeVideo(const SourceRef& source) const;

  void admitLocked();
  void runJob(RecordPtr record);
  std::expected<RemoteRef, JobError> runPipeline(JobRecord& record);
  void enterStage(JobRecord& record, JobState stage);
  ProgressCallback progressFor(JobRecord& record);
  void complete(JobRecord& record, std::expected<RemoteRef, JobError> result);
  void finalizeLocked(JobRecord& record, const JobOutcome& outcome, bool was_active);

  OrchestratorOptions options_;
  std::shared_ptr<WorkspaceManager> workspaces_;
  std::shared_ptr<TransferStager> stager_;
  std::shared_ptr<const ProfileRegistry> profiles_;
  std::shared_ptr<MediaProbe> probe_;
  std::shared_ptr<EncodingService> encoder_;

  mutable std::mutex mtx_;
  mutable std::condition_variable changed_;
  std::unordered_map<JobId, RecordPtr> jobs_;
  std::deque<JobId> queue_;
  std::deque<JobId> history_;
  std::size_t active_{0};
  std::uint64_t next_sequence_{0};
  std::unordered_map<std::string, std::size_t> active_by_owner_;
  bool stopping_{false};

  ProgressDispatcher dispatcher_;
  // Declared last: destroyed first, so workers finish before the state above goes away.
  ThreadPool pool_;
};

} // namespace conversion_service
