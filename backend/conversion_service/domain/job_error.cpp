#include "job_error.hpp"

#include <iomanip>
#include <sstream>

namespace conversion_service {

JobError JobError::validation(std::string message, std::string diagnostics) {
  return JobError{ErrorKind::Validation, std::nullopt, std::nullopt, std::move(message), std::move(diagnostics)};
}

JobError JobError::sizeLimit(std::uint64_t limit_bytes) {
  std::ostringstream message;
  message << "file is too large (limit " << std::fixed << std::setprecision(2)
          << static_cast<double>(limit_bytes) / (1024.0 * 1024.0 * 1024.0) << " GB)";
  return JobError{ErrorKind::SizeLimitExceeded, std::nullopt, std::nullopt, message.str(),
                  "limit " + std::to_string(limit_bytes) + " bytes"};
}

JobError JobError::resource(std::string message, std::string diagnostics) {
  return JobError{ErrorKind::Resource, std::nullopt, std::nullopt, std::move(message), std::move(diagnostics)};
}

JobError JobError::transfer(std::string message, std::string diagnostics) {
  return JobError{ErrorKind::Transfer, std::nullopt, std::nullopt, std::move(message), std::move(diagnostics)};
}

JobError JobError::encode(EncodeFailure failure, std::string message,
                          std::string diagnostics, std::optional<int> exit_code) {
  return JobError{ErrorKind::Encode, failure, exit_code, std::move(message), std::move(diagnostics)};
}

JobError JobError::cancelled() {
  return JobError{ErrorKind::Cancelled, std::nullopt, std::nullopt, "conversion was cancelled", {}};
}

JobError JobError::internal(std::string diagnostics) {
  return JobError{ErrorKind::Internal, std::nullopt, std::nullopt, "internal error", std::move(diagnostics)};
}

std::string JobError::debug() const {
  std::string text = errorKindName(kind);
  if (encode_failure) {
    text += ":";
    text += encodeFailureName(*encode_failure);
  }
  if (exit_code) {
    text += " exit_code=" + std::to_string(*exit_code);
  }
  text += " message=\"" + message + "\"";
  if (!diagnostics.empty()) {
    text += " diagnostics=\"" + diagnostics + "\"";
  }
  return text;
}

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:        return "validation_error";
    case ErrorKind::SizeLimitExceeded: return "size_limit_exceeded";
    case ErrorKind::Resource:          return "resource_error";
    case ErrorKind::Transfer:          return "transfer_error";
    case ErrorKind::Encode:            return "encode_error";
    case ErrorKind::Cancelled:         return "cancelled";
    case ErrorKind::Internal:          return "internal_error";
  }
  return "internal_error";
}

const char* encodeFailureName(EncodeFailure failure) {
  switch (failure) {
    case EncodeFailure::Timeout:       return "timeout";
    case EncodeFailure::EncoderFailed: return "encoder_failed";
    case EncodeFailure::Cancelled:     return "cancelled";
    case EncodeFailure::SpawnError:    return "spawn_error";
  }
  return "encoder_failed";
}

} // namespace conversion_service
