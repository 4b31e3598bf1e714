#pragma once

#include "domain/encoding_service.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace conversion_service {

struct EncoderOptions {
  std::string executable;                               // absolute path or a name looked up in PATH
  std::chrono::milliseconds termination_grace{5000};    // SIGTERM to SIGKILL
  std::chrono::milliseconds progress_interval{500};
  std::chrono::milliseconds poll_interval{100};
};

// Lifecycle of one encoder invocation. Succeeded and Failed are final.
enum class EncoderRunState {
  NotStarted,
  Running,
  Succeeded,
  Failed
};

const char* encoderRunStateName(EncoderRunState state);

// Runs the external encoder as a child process in its own process group, follows its
// progress on stderr and enforces the deadline and cancellation with a
// terminate-then-kill protocol. The child is always reaped before encode() returns.
class EncoderSupervisor : public EncodingService {
public:
  explicit EncoderSupervisor(EncoderOptions options);

  std::expected<std::filesystem::path, JobError> encode(
    const EncodeRequest& request,
    const ProgressCallback& on_progress,
    const CancellationToken& cancel
  ) override;

  static std::optional<std::string> resolveExecutable(const std::string& name);
  static std::filesystem::path outputPathFor(const EncodeRequest& request);

private:
  class ChildProcess;

  EncoderOptions options_;
};

} // namespace conversion_service
