#include "job_orchestrator.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <uuid/uuid.h>

namespace conversion_service {

namespace {

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// Name of the payload as the user sees it: the declared file name, else the last
// path segment of the URI without its query string.
std::string displayName(const SourceRef& source) {
  if (!source.file_name.empty()) {
    return std::filesystem::path(source.file_name).filename().string();
  }
  auto uri = source.uri.substr(0, source.uri.find_first_of("?#"));
  return std::filesystem::path(uri).filename().string();
}

// Lowercase extension without the dot, limited to alphanumerics.
std::string extensionOf(const SourceRef& source) {
  auto ext = std::filesystem::path(displayName(source)).extension().string();
  if (ext.size() < 2 || ext.size() > 9) {
    return {};
  }
  ext = lowercase(ext.substr(1));
  bool safe = std::all_of(ext.begin(), ext.end(), [](unsigned char c) { return std::isalnum(c); });
  return safe ? ext : std::string{};
}

std::string outputStem(const SourceRef& source) {
  auto stem = std::filesystem::path(displayName(source)).stem().string();
  std::string result;
  for (unsigned char c : stem) {
    result.push_back(std::isalnum(c) || c == '-' || c == '_' || c == '.' ? static_cast<char>(c) : '_');
  }
  if (result.empty() || result.front() == '.') {
    result.insert(result.begin(), 'v');
  }
  return result.size() > 96 ? result.substr(0, 96) : result;
}

} // namespace

OrchestratorOptions OrchestratorOptions::fromConfig(const config::ConverterConfig& config) {
  OrchestratorOptions options;
  options.max_concurrent_jobs = config.max_concurrent_jobs;
  options.max_jobs_per_owner = config.max_jobs_per_owner;
  options.max_file_size_bytes = config.max_file_size_bytes;
  options.encoder_timeout = config.encoder_timeout;
  options.job_history_limit = config.job_history_limit;
  options.allowed_extensions = config.allowed_extensions;
  return options;
}

JobOrchestrator::JobOrchestrator(OrchestratorOptions options,
                                 std::shared_ptr<WorkspaceManager> workspaces,
                                 std::shared_ptr<TransferStager> stager,
                                 std::shared_ptr<const ProfileRegistry> profiles,
                                 std::shared_ptr<MediaProbe> probe,
                                 std::shared_ptr<EncodingService> encoder)
  : options_(std::move(options)),
    workspaces_(std::move(workspaces)),
    stager_(std::move(stager)),
    profiles_(std::move(profiles)),
    probe_(std::move(probe)),
    encoder_(std::move(encoder)),
    dispatcher_(ProgressDispatcher::kDefaultQueueCapacity, options_.max_concurrent_jobs + 1),
    pool_(std::max<std::size_t>(options_.max_concurrent_jobs, 1), "job") {
  for (auto& ext : options_.allowed_extensions) {
    ext = lowercase(ext);
  }
}

JobOrchestrator::~JobOrchestrator() {
  shutdown();
}

JobId JobOrchestrator::generateId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return uuid_str;
}

JobHandle JobOrchestrator::submit(const SourceRef& source, const std::string& profile_name,
                                  std::shared_ptr<JobObserver> observer) {
  auto record = std::make_shared<JobRecord>();
  record->job.id = generateId();
  record->job.source = source;
  record->job.profile_name = profile_name;
  record->job.submitted_at = std::chrono::system_clock::now();
  const auto& id = record->job.id;

  auto rejection = precheck(source, profile_name, record->profile);
  if (!rejection) {
    record->job.profile_name = record->profile.name;
  }

  std::lock_guard<std::mutex> lock{mtx_};
  if (!rejection && stopping_) {
    rejection = JobError::resource("the service is shutting down, try again later");
  }
  record->sequence = next_sequence_++;
  jobs_.emplace(id, record);
  dispatcher_.open(id, std::move(observer));

  if (rejection) {
    LOG_INFO("[" + id + "] rejected: " + rejection->debug());
    finalizeLocked(*record, JobOutcome{JobState::Failed, std::move(rejection), std::nullopt}, false);
    return {id, JobState::Failed};
  }

  queue_.push_back(id);
  LOG_INFO("[" + id + "] queued: " + source.uri + " -> " + record->profile.name +
    (source.owner.empty() ? "" : " (owner " + source.owner + ")"));
  admitLocked();
  return {id, record->job.state};
}

std::optional<JobError> JobOrchestrator::precheck(const SourceRef& source, const std::string& profile_name,
                                                  EncodeProfile& profile) const {
  auto resolved = profiles_->resolve(profile_name);
  if (!resolved) {
    return resolved.error();
  }
  profile = std::move(*resolved);

  if (source.uri.empty()) {
    return JobError::validation("no file was provided");
  }
  if (source.declared_size && *source.declared_size > options_.max_file_size_bytes) {
    return JobError::sizeLimit(options_.max_file_size_bytes);
  }
  if (!looksLikeVideo(source)) {
    return JobError::validation("this file does not look like a video",
      "mime '" + source.mime_type + "', name '" + displayName(source) + "'");
  }
  if (!stager_->canFetch(source.uri)) {
    return JobError::validation("this file cannot be fetched", "unsupported uri: " + source.uri);
  }
  return std::nullopt;
}

bool JobOrchestrator::looksLikeVideo(const SourceRef& source) const {
  if (lowercase(source.mime_type).starts_with("video/")) {
    return true;
  }
  auto ext = extensionOf(source);
  return !ext.empty() &&
    std::find(options_.allowed_extensions.begin(), options_.allowed_extensions.end(), ext) !=
      options_.allowed_extensions.end();
}

void JobOrchestrator::admitLocked() {
  if (stopping_) {
    return;
  }
  auto it = queue_.begin();
  while (active_ < options_.max_concurrent_jobs && it != queue_.end()) {
    auto record = jobs_.at(*it);
    const auto& owner = record->job.source.owner;
    if (options_.max_jobs_per_owner > 0 && !owner.empty() &&
        active_by_owner_[owner] >= options_.max_jobs_per_owner) {
      ++it;
      continue;
    }

    it = queue_.erase(it);
    ++active_;
    if (!owner.empty()) {
      ++active_by_owner_[owner];
    }
    LOG_DEBUG("[" + record->job.id + "] admitted, " + std::to_string(active_) + " active");
    pool_.commit([this, record]() { runJob(record); });
  }
}

void JobOrchestrator::runJob(RecordPtr record) {
  std::expected<RemoteRef, JobError> result = std::unexpected(JobError::internal("job did not run"));
  try {
    result = runPipeline(*record);
  } catch (const std::exception& e) {
    LOG_ERROR("[" + record->job.id + "] unexpected exception: " + std::string(e.what()));
    result = std::unexpected(JobError::internal(e.what()));
  }
  complete(*record, std::move(result));
}

std::expected<RemoteRef, JobError> JobOrchestrator::runPipeline(JobRecord& record) {
  const auto& id = record.job.id;
  const auto& source = record.job.source;
  const auto& cancel = *record.cancel;
  if (cancel.cancelled()) {
    return std::unexpected(JobError::cancelled());
  }

  auto allocated = workspaces_->allocate(id);
  if (!allocated) {
    return std::unexpected(allocated.error());
  }
  WorkspaceLease lease(*workspaces_, *allocated);
  {
    std::lock_guard<std::mutex> lock{mtx_};
    record.job.workspace_path = lease.path();
  }

  enterStage(record, JobState::Downloading);
  auto ext = extensionOf(source);
  auto input = lease.path() / (ext.empty() ? std::string("source") : "source." + ext);
  auto downloaded = stager_->download(source, input, options_.max_file_size_bytes, progressFor(record), cancel);
  if (!downloaded) {
    return std::unexpected(downloaded.error());
  }
  if (cancel.cancelled()) {
    return std::unexpected(JobError::cancelled());
  }

  enterStage(record, JobState::Validating);
  if (*downloaded > options_.max_file_size_bytes) {
    return std::unexpected(JobError::sizeLimit(options_.max_file_size_bytes));
  }
  if (*downloaded == 0) {
    return std::unexpected(JobError::validation("the file is empty"));
  }
  auto info = probe_->probe(input);
  if (!info) {
    return std::unexpected(JobError::validation("the file is not a readable video", info.error()));
  }
  if (!info->has_video) {
    return std::unexpected(JobError::validation("the file has no video stream", "format " + info->format_name));
  }
  LOG_DEBUG("[" + id + "] probed " + info->format_name + ", " + std::to_string(info->audio_streams) +
    " audio, " + std::to_string(info->subtitle_streams) + " subtitle streams");
  if (cancel.cancelled()) {
    return std::unexpected(JobError::cancelled());
  }

  enterStage(record, JobState::Encoding);
  EncodeRequest request{
    input,
    record.profile,
    lease.path(),
    info->duration_seconds,
    std::chrono::steady_clock::now() + options_.encoder_timeout
  };
  auto output = encoder_->encode(request, progressFor(record), cancel);
  if (!output) {
    return std::unexpected(output.error());
  }
  std::error_code ec;
  auto output_size = std::filesystem::file_size(*output, ec);
  if (ec) {
    return std::unexpected(JobError::resource("could not read the converted file", ec.message()));
  }
  if (output_size > options_.max_file_size_bytes) {
    return std::unexpected(JobError::sizeLimit(options_.max_file_size_bytes));
  }
  if (cancel.cancelled()) {
    return std::unexpected(JobError::cancelled());
  }

  enterStage(record, JobState::Uploading);
  auto object_name = id + "/" + outputStem(source) + "." + record.profile.file_extension;
  auto remote = stager_->upload(*output, object_name, progressFor(record), cancel);
  if (!remote) {
    return std::unexpected(remote.error());
  }

  if (auto released = lease.release(); !released) {
    LOG_WARN("[" + id + "] " + released.error().debug() + ", left for the startup sweep");
  }
  return *remote;
}

void JobOrchestrator::enterStage(JobRecord& record, JobState stage) {
  std::lock_guard<std::mutex> lock{mtx_};
  record.job.state = stage;
  record.job.progress = ProgressUpdate{stage, 0.0, 0, std::nullopt, false};
  LOG_INFO("[" + record.job.id + "] " + jobStateName(stage));
  dispatcher_.publish(record.job.id, record.job.progress);
}

ProgressCallback JobOrchestrator::progressFor(JobRecord& record) {
  return [this, &record](const ProgressUpdate& update) {
    std::lock_guard<std::mutex> lock{mtx_};
    auto& current = record.job.progress;
    if (update.stage != record.job.state) {
      return;
    }
    ProgressUpdate clamped = update;
    clamped.fraction = std::clamp(update.fraction, current.fraction, 1.0);
    clamped.bytes_done = std::max(update.bytes_done, current.bytes_done);
    current = clamped;
    dispatcher_.publish(record.job.id, clamped);
  };
}

void JobOrchestrator::complete(JobRecord& record, std::expected<RemoteRef, JobError> result) {
  JobOutcome outcome;
  if (record.cancel->cancelled() || (!result && result.error().isCancellation())) {
    outcome.state = JobState::Cancelled;
  } else if (result) {
    outcome.state = JobState::Succeeded;
    outcome.result = std::move(*result);
  } else {
    outcome.state = JobState::Failed;
    outcome.error = std::move(result.error());
  }

  const auto& id = record.job.id;
  if (outcome.state == JobState::Failed) {
    LOG_WARN("[" + id + "] failed: " + outcome.error->debug());
  } else if (outcome.state == JobState::Succeeded) {
    LOG_INFO("[" + id + "] succeeded: " + outcome.result->uri + " (" + std::to_string(outcome.result->size) + " bytes)");
  } else {
    LOG_INFO("[" + id + "] cancelled");
  }

  std::lock_guard<std::mutex> lock{mtx_};
  finalizeLocked(record, outcome, true);
  admitLocked();
}

void JobOrchestrator::finalizeLocked(JobRecord& record, const JobOutcome& outcome, bool was_active) {
  auto& job = record.job;
  job.state = outcome.state;
  job.error = outcome.error;
  job.result = outcome.result;
  job.finished_at = std::chrono::system_clock::now();
  if (outcome.state == JobState::Succeeded) {
    job.progress = ProgressUpdate{JobState::Succeeded, 1.0, job.progress.bytes_done, job.progress.bytes_total, true};
  }

  if (was_active) {
    --active_;
    const auto& owner = job.source.owner;
    if (auto it = active_by_owner_.find(owner); it != active_by_owner_.end() && --it->second == 0) {
      active_by_owner_.erase(it);
    }
  }

  history_.push_back(job.id);
  while (history_.size() > options_.job_history_limit) {
    jobs_.erase(history_.front());
    history_.pop_front();
  }

  dispatcher_.finish(job.id, outcome);
  changed_.notify_all();
}

bool JobOrchestrator::cancel(const JobId& id) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = jobs_.find(id);
  if (it == jobs_.end() || isTerminal(it->second->job.state)) {
    return false;
  }
  auto record = it->second;
  record->cancel->cancel();

  if (auto queued = std::find(queue_.begin(), queue_.end(), id); queued != queue_.end()) {
    queue_.erase(queued);
    LOG_INFO("[" + id + "] cancelled while queued");
    finalizeLocked(*record, JobOutcome{JobState::Cancelled, std::nullopt, std::nullopt}, false);
    return true;
  }
  LOG_INFO("[" + id + "] cancel requested in " + jobStateName(record->job.state));
  return true;
}

std::optional<ConversionJob> JobOrchestrator::snapshot(const JobId& id) const {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second->job;
}

std::vector<ConversionJob> JobOrchestrator::list() const {
  std::lock_guard<std::mutex> lock{mtx_};
  std::vector<RecordPtr> records;
  records.reserve(jobs_.size());
  for (const auto& [id, record] : jobs_) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const RecordPtr& a, const RecordPtr& b) {
    return a->sequence < b->sequence;
  });
  std::vector<ConversionJob> result;
  result.reserve(records.size());
  for (const auto& record : records) {
    result.push_back(record->job);
  }
  return result;
}

std::size_t JobOrchestrator::activeCount() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return active_;
}

std::size_t JobOrchestrator::queuedCount() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return queue_.size();
}

std::optional<ConversionJob> JobOrchestrator::waitForTerminal(const JobId& id,
                                                              std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock{mtx_};
  changed_.wait_for(lock, timeout, [this, &id]() {
    auto it = jobs_.find(id);
    return it == jobs_.end() || isTerminal(it->second->job.state);
  });
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second->job;
}

void JobOrchestrator::shutdown() {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    if (stopping_) {
      return;
    }
    stopping_ = true;
    LOG_INFO("shutting down: " + std::to_string(active_) + " active, " +
      std::to_string(queue_.size()) + " queued");

    while (!queue_.empty()) {
      auto record = jobs_.at(queue_.front());
      queue_.pop_front();
      record->cancel->cancel();
      finalizeLocked(*record, JobOutcome{JobState::Cancelled, std::nullopt, std::nullopt}, false);
    }
    for (auto& [id, record] : jobs_) {
      if (!isTerminal(record->job.state)) {
        record->cancel->cancel();
      }
    }
  }
  pool_.shutdown();
  dispatcher_.flush();
  dispatcher_.stop();
}

} // namespace conversion_service
