#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace conversion_service {

enum class ErrorKind {
  Validation,         // bad or unsupported input, rejected before resources are spent
  SizeLimitExceeded,
  Resource,           // disk space, workspace allocation, local I/O
  Transfer,           // network or stream failure while downloading or uploading
  Encode,             // see EncodeFailure
  Cancelled,
  Internal
};

enum class EncodeFailure {
  Timeout,
  EncoderFailed,
  Cancelled,
  SpawnError
};

struct JobError {
  ErrorKind kind{ErrorKind::Internal};
  std::optional<EncodeFailure> encode_failure;
  std::optional<int> exit_code;
  std::string message;      // short, safe to show to the user
  std::string diagnostics;  // operator detail: stderr tail, errno text

  static JobError validation(std::string message, std::string diagnostics = {});
  static JobError sizeLimit(std::uint64_t limit_bytes);
  static JobError resource(std::string message, std::string diagnostics = {});
  static JobError transfer(std::string message, std::string diagnostics = {});
  static JobError encode(EncodeFailure failure, std::string message,
                         std::string diagnostics = {}, std::optional<int> exit_code = std::nullopt);
  static JobError cancelled();
  static JobError internal(std::string diagnostics);

  bool isCancellation() const {
    return kind == ErrorKind::Cancelled ||
      (kind == ErrorKind::Encode && encode_failure == EncodeFailure::Cancelled);
  }

  std::string debug() const;
};

const char* errorKindName(ErrorKind kind);
const char* encodeFailureName(EncodeFailure failure);

} // namespace conversion_service
