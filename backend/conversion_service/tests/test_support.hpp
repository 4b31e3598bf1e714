#pragma once

#include "domain/conversion_job.hpp"
#include "domain/encoding_service.hpp"
#include "domain/media_probe.hpp"
#include "domain/transfer_service.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <expected>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

namespace conversion_service::test_support {

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string& prefix = "conversion_test") {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
      (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
  std::filesystem::path path_;
};

inline std::filesystem::path writeFile(const std::filesystem::path& path, std::size_t size, char fill = 'x') {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  std::string block(64 * 1024, fill);
  while (size > 0) {
    auto count = std::min(size, block.size());
    out.write(block.data(), static_cast<std::streamsize>(count));
    size -= count;
  }
  return path;
}

inline std::string readFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Writes an executable /bin/sh script standing in for ffmpeg.
inline std::filesystem::path writeScript(const std::filesystem::path& path, const std::string& body) {
  std::filesystem::create_directories(path.parent_path());
  {
    std::ofstream out(path, std::ios::trunc);
    out << "#!/bin/sh\n" << body << "\n";
  }
  ::chmod(path.c_str(), 0755);
  return path;
}

// Behaves like a short ffmpeg run: reports a 10s duration and time= progress on stderr,
// writes a small file to its last argument and records its arguments one per line.
inline std::filesystem::path writeSuccessfulEncoder(const std::filesystem::path& path,
                                                    const std::filesystem::path& args_file) {
  return writeScript(path,
    "printf '%s\\n' \"$@\" > '" + args_file.string() + "'\n"
    "eval out=\\${$#}\n"
    "echo 'Input #0, matroska,webm, from input.mkv:' >&2\n"
    "echo '  Duration: 00:00:10.00, start: 0.000000, bitrate: 1000 kb/s' >&2\n"
    "for t in 02 05 08 10; do\n"
    "  printf 'frame=   10 fps=0.0 q=0.0 size=   0kB time=00:00:%s.00 bitrate=N/A speed=1x\\r' $t >&2\n"
    "done\n"
    "printf 'ftypisom-converted' > \"$out\"\n"
    "exit 0");
}

// Records its pid and then sleeps for a long time.
inline std::filesystem::path writeHangingEncoder(const std::filesystem::path& path,
                                                 const std::filesystem::path& pid_file,
                                                 bool ignore_term = false) {
  std::string body = "echo $$ > '" + pid_file.string() + "'\n"
    "echo '  Duration: 00:01:00.00, start: 0.000000' >&2\n";
  if (ignore_term) {
    body += "trap '' TERM\nwhile :; do sleep 1; done";
  } else {
    body += "exec sleep 30";
  }
  return writeScript(path, body);
}

inline std::optional<pid_t> readPid(const std::filesystem::path& pid_file,
                                    std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    std::ifstream in(pid_file);
    pid_t pid = 0;
    if (in >> pid && pid > 0) {
      return pid;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return std::nullopt;
}

inline bool processExists(pid_t pid) {
  return ::kill(pid, 0) == 0 || errno != ESRCH;
}

// Transport for "gen://" URIs that produces payload bytes on the fly.
class GeneratedTransfer : public TransferService {
public:
  GeneratedTransfer(std::uint64_t size, std::size_t chunk, bool report_length)
    : size_(size), chunk_(chunk), report_length_(report_length) {}

  bool supports(const std::string& uri) const override { return uri.starts_with("gen://"); }

  std::expected<void, std::string> fetch(const std::string&, const ChunkWriter& writer,
                                         const LengthHandler& on_length,
                                         const AbortCheck& should_abort) override {
    ++fetch_calls;
    if (report_length_ && on_length && !on_length(size_)) {
      return std::unexpected("aborted at length");
    }
    std::vector<char> buffer(chunk_, 'g');
    std::uint64_t sent = 0;
    while (sent < size_) {
      if (should_abort && should_abort()) {
        return std::unexpected("aborted");
      }
      auto count = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_, size_ - sent));
      if (!writer(buffer.data(), count)) {
        bytes_offered = sent + count;
        return std::unexpected("writer aborted");
      }
      sent += count;
      bytes_offered = sent;
      if (delay_per_chunk.count() > 0) {
        std::this_thread::sleep_for(delay_per_chunk);
      }
    }
    return {};
  }

  std::expected<std::string, std::string> store(const std::string&, const std::string&, std::uint64_t,
                                                const ChunkReader&, const AbortCheck&) override {
    return std::unexpected("gen:// is read-only");
  }

  std::atomic<int> fetch_calls{0};
  std::atomic<std::uint64_t> bytes_offered{0};
  std::chrono::milliseconds delay_per_chunk{0};

private:
  std::uint64_t size_;
  std::size_t chunk_;
  bool report_length_;
};

class FakeMediaProbe : public MediaProbe {
public:
  std::expected<MediaInfo, std::string> probe(const std::filesystem::path&) override {
    ++calls;
    if (!error.empty()) {
      return std::unexpected(error);
    }
    return info;
  }

  MediaInfo info{"matroska,webm", 10.0, true, 1, 0};
  std::string error;
  std::atomic<int> calls{0};
};

// Encoding service double: writes output.<ext> and reports progress. When blocking is
// set it waits until cancelled or released.
class FakeEncoder : public EncodingService {
public:
  std::expected<std::filesystem::path, JobError> encode(const EncodeRequest& request,
                                                        const ProgressCallback& on_progress,
                                                        const CancellationToken& cancel) override {
    int running = ++concurrent;
    int seen = max_concurrent.load();
    while (running > seen && !max_concurrent.compare_exchange_weak(seen, running)) {
    }
    ++calls;
    {
      std::lock_guard<std::mutex> lock{mtx};
      requests.push_back(request);
    }
    struct Leave {
      std::atomic<int>& counter;
      ~Leave() { --counter; }
    } leave{concurrent};

    for (double fraction : {0.25, 0.5, 0.75}) {
      if (on_progress) {
        on_progress({JobState::Encoding, fraction, 0, std::nullopt, false});
      }
    }
    if (blocking) {
      std::unique_lock<std::mutex> lock{mtx};
      while (!released && !cancel.cancelled()) {
        lock.unlock();
        cancel.waitFor(std::chrono::milliseconds(10));
        lock.lock();
      }
    }
    if (cancel.cancelled()) {
      return std::unexpected(JobError::encode(EncodeFailure::Cancelled, "conversion was cancelled"));
    }
    if (failure) {
      return std::unexpected(*failure);
    }
    auto output = request.workspace / ("output." + request.profile.file_extension);
    writeFile(output, output_size, 'o');
    if (on_progress) {
      on_progress({JobState::Encoding, 1.0, 0, std::nullopt, true});
    }
    return output;
  }

  void release() {
    std::lock_guard<std::mutex> lock{mtx};
    released = true;
  }

  std::mutex mtx;
  std::vector<EncodeRequest> requests;
  bool blocking{false};
  bool released{false};
  std::optional<JobError> failure;
  std::size_t output_size{2048};
  std::atomic<int> calls{0};
  std::atomic<int> concurrent{0};
  std::atomic<int> max_concurrent{0};
};

// Collects everything a job reports.
class RecordingObserver : public JobObserver {
public:
  void onProgress(const JobId&, const ProgressUpdate& update) override {
    std::lock_guard<std::mutex> lock{mtx_};
    updates_.push_back(update);
  }

  void onFinished(const JobId&, const JobOutcome& outcome) override {
    {
      std::lock_guard<std::mutex> lock{mtx_};
      outcome_ = outcome;
      ++finished_calls_;
    }
    cv_.notify_all();
  }

  std::optional<JobOutcome> waitFinished(std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    std::unique_lock<std::mutex> lock{mtx_};
    cv_.wait_for(lock, timeout, [this]() { return outcome_.has_value(); });
    return outcome_;
  }

  std::vector<ProgressUpdate> updates() const {
    std::lock_guard<std::mutex> lock{mtx_};
    return updates_;
  }

  int finishedCalls() const {
    std::lock_guard<std::mutex> lock{mtx_};
    return finished_calls_;
  }

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::vector<ProgressUpdate> updates_;
  std::optional<JobOutcome> outcome_;
  int finished_calls_{0};
};

} // namespace conversion_service::test_support
