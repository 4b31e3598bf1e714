#pragma once

#include "domain/conversion_job.hpp"
#include "domain/encode_profile.hpp"

#include <nlohmann/json.hpp>

namespace conversion_service {

// Wire format shared by the REST surface and the webhook notifier.
nlohmann::json toJson(const ProgressUpdate& progress);
// Diagnostics carry encoder stderr; they are left out of anything sent to end users.
nlohmann::json toJson(const JobError& error, bool with_diagnostics);
nlohmann::json toJson(const RemoteRef& remote);
nlohmann::json toJson(const ConversionJob& job);
nlohmann::json toJson(const JobOutcome& outcome);
nlohmann::json toJson(const EncodeProfile& profile);

// Throws std::invalid_argument when a required field is missing or has the wrong type.
SourceRef sourceFromJson(const nlohmann::json& body);

} // namespace conversion_service
