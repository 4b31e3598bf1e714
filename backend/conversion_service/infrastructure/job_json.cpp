#include "job_json.hpp"

#include <ctime>
#include <stdexcept>

namespace conversion_service {

namespace {

std::string isoTime(std::chrono::system_clock::time_point time) {
  std::time_t t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buffer;
}

template <typename T>
T optionalField(const nlohmann::json& body, const char* key, T fallback) {
  if (!body.contains(key) || body.at(key).is_null()) {
    return fallback;
  }
  try {
    return body.at(key).get<T>();
  } catch (const nlohmann::json::exception&) {
    throw std::invalid_argument(std::string("field '") + key + "' has the wrong type");
  }
}

} // namespace

nlohmann::json toJson(const ProgressUpdate& progress) {
  nlohmann::json json = {
    {"stage", jobStateName(progress.stage)},
    {"fraction", progress.fraction},
    {"bytes_done", progress.bytes_done},
    {"bytes_total", nullptr}
  };
  if (progress.bytes_total) {
    json["bytes_total"] = *progress.bytes_total;
  }
  return json;
}

nlohmann::json toJson(const JobError& error, bool with_diagnostics) {
  nlohmann::json json = {
    {"kind", errorKindName(error.kind)},
    {"encode_failure", nullptr},
    {"exit_code", nullptr},
    {"message", error.message}
  };
  if (error.encode_failure) {
    json["encode_failure"] = encodeFailureName(*error.encode_failure);
  }
  if (error.exit_code) {
    json["exit_code"] = *error.exit_code;
  }
  if (with_diagnostics) {
    json["diagnostics"] = error.diagnostics;
  }
  return json;
}

nlohmann::json toJson(const RemoteRef& remote) {
  return {
    {"uri", remote.uri},
    {"name", remote.name},
    {"size", remote.size}
  };
}

nlohmann::json toJson(const ConversionJob& job) {
  nlohmann::json json = {
    {"id", job.id},
    {"state", jobStateName(job.state)},
    {"profile", job.profile_name},
    {"source", {{"uri", job.source.uri}, {"file_name", job.source.file_name}}},
    {"progress", toJson(job.progress)},
    {"error", nullptr},
    {"result", nullptr},
    {"workspace", job.workspace_path.string()},
    {"submitted_at", isoTime(job.submitted_at)},
    {"finished_at", nullptr}
  };
  if (!job.source.owner.empty()) {
    json["owner"] = job.source.owner;
  }
  if (job.error) {
    json["error"] = toJson(*job.error, true);
  }
  if (job.result) {
    json["result"] = toJson(*job.result);
  }
  if (job.finished_at) {
    json["finished_at"] = isoTime(*job.finished_at);
  }
  return json;
}

nlohmann::json toJson(const JobOutcome& outcome) {
  nlohmann::json json = {{"state", jobStateName(outcome.state)}};
  if (outcome.error) {
    json["error"] = toJson(*outcome.error, false);
  }
  if (outcome.result) {
    json["result"] = toJson(*outcome.result);
  }
  return json;
}

nlohmann::json toJson(const EncodeProfile& profile) {
  nlohmann::json json = {
    {"name", profile.name},
    {"aliases", profile.aliases},
    {"container", profile.container_format},
    {"extension", profile.file_extension},
    {"video_codec", profile.video_codec},
    {"audio_codec", profile.audio_codec},
    {"track_policy", trackPolicyName(profile.track_policy)}
  };
  if (profile.quality.mode == Quality::Mode::Crf) {
    json["crf"] = profile.quality.value;
  } else {
    json["bitrate"] = profile.quality.value;
  }
  if (profile.resolution_cap) {
    json["max_height"] = *profile.resolution_cap;
  }
  return json;
}

SourceRef sourceFromJson(const nlohmann::json& body) {
  if (!body.is_object()) {
    throw std::invalid_argument("request body must be a JSON object");
  }
  SourceRef source;
  source.uri = optionalField<std::string>(body, "source_uri", "");
  if (source.uri.empty()) {
    throw std::invalid_argument("field 'source_uri' is required");
  }
  source.file_name = optionalField<std::string>(body, "file_name", "");
  source.mime_type = optionalField<std::string>(body, "mime_type", "");
  source.owner = optionalField<std::string>(body, "owner", "");
  if (body.contains("size") && !body.at("size").is_null()) {
    if (!body.at("size").is_number_unsigned() && !body.at("size").is_number_integer()) {
      throw std::invalid_argument("field 'size' must be a non-negative integer");
    }
    if (body.at("size").is_number_integer() && body.at("size").get<std::int64_t>() < 0) {
      throw std::invalid_argument("field 'size' must be a non-negative integer");
    }
    source.declared_size = body.at("size").get<std::uint64_t>();
  }
  return source;
}

} // namespace conversion_service
