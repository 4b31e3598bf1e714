#include "encoder_supervisor.hpp"
#include "ffmpeg_progress_parser.hpp"
#include "progress_throttle.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace conversion_service {

namespace {

std::string errnoText(int error) {
  return std::strerror(error);
}

// Tracks the per-invocation state machine and makes the terminal transition exclusive.
class EncoderRun {
public:
  explicit EncoderRun(std::string label) : label_(std::move(label)) {}

  void started(pid_t pid) {
    state_ = EncoderRunState::Running;
    LOG_INFO(label_ + " encoder started, pid " + std::to_string(pid));
  }

  std::expected<std::filesystem::path, JobError> succeed(std::filesystem::path output) {
    finish(EncoderRunState::Succeeded, "output " + output.string());
    return output;
  }

  std::expected<std::filesystem::path, JobError> fail(JobError error) {
    finish(EncoderRunState::Failed, error.debug());
    return std::unexpected(std::move(error));
  }

private:
  void finish(EncoderRunState state, const std::string& detail) {
    if (state_ == EncoderRunState::Succeeded || state_ == EncoderRunState::Failed) {
      return;
    }
    state_ = state;
    auto message = label_ + " encoder " + encoderRunStateName(state) + ": " + detail;
    if (state == EncoderRunState::Failed) {
      LOG_WARN(message);
    } else {
      LOG_INFO(message);
    }
  }

  std::string label_;
  EncoderRunState state_{EncoderRunState::NotStarted};
};

int exitCodeOf(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

const char* encoderRunStateName(EncoderRunState state) {
  switch (state) {
    case EncoderRunState::NotStarted: return "not_started";
    case EncoderRunState::Running:    return "running";
    case EncoderRunState::Succeeded:  return "succeeded";
    case EncoderRunState::Failed:     return "failed";
  }
  return "failed";
}

// Owns a spawned child and the read end of its stderr pipe. If the owner unwinds
// without reaping, the destructor kills the whole process group and waits for it.
class EncoderSupervisor::ChildProcess {
public:
  ChildProcess(pid_t pid, int stream) : pid_(pid), stream_(stream) {}

  ~ChildProcess() {
    if (!reaped_) {
      signalGroup(SIGKILL);
      waitBlocking();
    }
    closeStream();
  }

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  pid_t pid() const { return pid_; }
  int stream() const { return stream_; }

  void closeStream() {
    if (stream_ >= 0) {
      ::close(stream_);
      stream_ = -1;
    }
  }

  // Raw wait status once the child has exited.
  std::optional<int> tryWait() {
    if (reaped_) {
      return status_;
    }
    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
      reaped_ = true;
      status_ = status;
      return status_;
    }
    if (result < 0 && errno != EINTR) {
      LOG_ERROR("waitpid(" + std::to_string(pid_) + ") failed: " + errnoText(errno));
      reaped_ = true;
      status_ = 255 << 8;
      return status_;
    }
    return std::nullopt;
  }

  // SIGTERM to the group, SIGKILL once the grace period is over. Returns the wait status.
  int terminate(std::chrono::milliseconds grace) {
    if (reaped_) {
      return status_;
    }
    signalGroup(SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
      if (auto status = tryWait()) {
        return *status;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    LOG_WARN("encoder pid " + std::to_string(pid_) + " ignored SIGTERM for " +
      std::to_string(grace.count()) + "ms, sending SIGKILL");
    signalGroup(SIGKILL);
    return waitBlocking();
  }

private:
  void signalGroup(int signo) {
    if (::kill(-pid_, signo) != 0 && errno == ESRCH) {
      ::kill(pid_, signo);
    }
  }

  int waitBlocking() {
    while (!reaped_) {
      int status = 0;
      pid_t result = ::waitpid(pid_, &status, 0);
      if (result == pid_) {
        reaped_ = true;
        status_ = status;
      } else if (result < 0 && errno != EINTR) {
        reaped_ = true;
        status_ = 255 << 8;
      }
    }
    return status_;
  }

  pid_t pid_;
  int stream_;
  bool reaped_{false};
  int status_{0};
};

EncoderSupervisor::EncoderSupervisor(EncoderOptions options) : options_(std::move(options)) {}

std::optional<std::string> EncoderSupervisor::resolveExecutable(const std::string& name) {
  if (name.empty()) {
    return std::nullopt;
  }

  auto usable = [](const std::string& candidate) {
    struct stat info {};
    return ::stat(candidate.c_str(), &info) == 0 && S_ISREG(info.st_mode) &&
      ::access(candidate.c_str(), X_OK) == 0;
  };

  if (name.find('/') != std::string::npos) {
    return usable(name) ? std::optional<std::string>(name) : std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  std::stringstream dirs(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    auto candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
    if (usable(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::filesystem::path EncoderSupervisor::outputPathFor(const EncodeRequest& request) {
  return request.workspace / ("output." + request.profile.file_extension);
}

std::expected<std::filesystem::path, JobError> EncoderSupervisor::encode(
  const EncodeRequest& request,
  const ProgressCallback& on_progress,
  const CancellationToken& cancel
) {
  EncoderRun run("[" + request.workspace.filename().string() + "]");
  const auto output = outputPathFor(request);

  auto executable = resolveExecutable(options_.executable);
  if (!executable) {
    return run.fail(JobError::encode(EncodeFailure::SpawnError, "the encoder is not available",
      "executable not found: " + options_.executable));
  }
  if (cancel.cancelled()) {
    return run.fail(JobError::encode(EncodeFailure::Cancelled, "conversion was cancelled"));
  }

  std::vector<std::string> args = request.profile.encoderArguments(request.input, output);
  args.insert(args.begin(), *executable);
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return run.fail(JobError::encode(EncodeFailure::SpawnError, "the encoder could not be started",
      "pipe2: " + errnoText(errno)));
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);

  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t no_signals;
  sigemptyset(&no_signals);
  posix_spawnattr_setsigmask(&attr, &no_signals);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  sigaddset(&default_signals, SIGTERM);
  sigaddset(&default_signals, SIGINT);
  posix_spawnattr_setsigdefault(&attr, &default_signals);
  posix_spawnattr_setpgroup(&attr, 0);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

  pid_t pid = -1;
  int spawn_result = ::posix_spawn(&pid, executable->c_str(), &actions, &attr, argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);
  ::close(fds[1]);

  if (spawn_result != 0) {
    ::close(fds[0]);
    return run.fail(JobError::encode(EncodeFailure::SpawnError, "the encoder could not be started",
      "posix_spawn(" + *executable + "): " + errnoText(spawn_result)));
  }

  ChildProcess child(pid, fds[0]);
  run.started(pid);
  ::fcntl(child.stream(), F_SETFL, ::fcntl(child.stream(), F_GETFL) | O_NONBLOCK);

  FfmpegProgressParser parser(request.duration_seconds);
  ProgressThrottle throttle{options_.progress_interval};
  char buffer[4096];

  // Reads whatever is buffered; false once the pipe reached EOF or broke.
  auto drain = [&]() -> bool {
    while (true) {
      ssize_t count = ::read(child.stream(), buffer, sizeof(buffer));
      if (count > 0) {
        if (parser.feed(std::string_view(buffer, static_cast<std::size_t>(count))) &&
            on_progress && throttle.ready()) {
          on_progress({JobState::Encoding, parser.fraction(), 0, std::nullopt, false});
        }
        continue;
      }
      if (count == 0) {
        return false;
      }
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return true;
      }
      LOG_WARN("reading encoder output failed: " + errnoText(errno));
      return false;
    }
  };

  bool stream_open = true;
  std::optional<int> status;
  while (!status) {
    if (cancel.cancelled()) {
      child.terminate(options_.termination_grace);
      return run.fail(JobError::encode(EncodeFailure::Cancelled, "conversion was cancelled",
        parser.tail()));
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= request.deadline) {
      child.terminate(options_.termination_grace);
      return run.fail(JobError::encode(EncodeFailure::Timeout, "encoding timed out",
        parser.tail()));
    }

    auto wait = std::min<std::chrono::steady_clock::duration>(options_.poll_interval, request.deadline - now);
    auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(wait).count();
    if (stream_open) {
      pollfd descriptor{child.stream(), POLLIN, 0};
      int ready = ::poll(&descriptor, 1, static_cast<int>(std::max<long long>(wait_ms, 1)));
      if (ready > 0) {
        stream_open = drain();
      } else if (ready < 0 && errno != EINTR) {
        LOG_WARN("poll on encoder output failed: " + errnoText(errno));
        stream_open = false;
      }
    } else {
      cancel.waitFor(std::chrono::milliseconds(std::max<long long>(wait_ms, 1)));
    }

    status = child.tryWait();
  }

  if (stream_open) {
    drain();
  }
  parser.finish();
  child.closeStream();

  const int exit_code = exitCodeOf(*status);
  if (exit_code != 0) {
    std::string message = WIFSIGNALED(*status)
      ? "the encoder crashed (signal " + std::to_string(WTERMSIG(*status)) + ")"
      : "the encoder failed (exit code " + std::to_string(exit_code) + ")";
    return run.fail(JobError::encode(EncodeFailure::EncoderFailed, message, parser.tail(), exit_code));
  }

  std::error_code ec;
  auto size = std::filesystem::file_size(output, ec);
  if (ec || size == 0) {
    return run.fail(JobError::encode(EncodeFailure::EncoderFailed, "the encoder produced no output",
      parser.tail(), exit_code));
  }

  if (on_progress) {
    on_progress({JobState::Encoding, 1.0, 0, std::nullopt, true});
  }
  return run.succeed(output);
}

} // namespace conversion_service
