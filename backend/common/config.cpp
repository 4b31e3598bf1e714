#include "config/config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace config {

namespace {

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

std::uint64_t parseUnsigned(const char* name, const char* value) {
  try {
    std::size_t consumed = 0;
    auto parsed = std::stoull(value, &consumed);
    if (consumed != std::string(value).size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("Invalid numeric value for ") + name + ": " + value);
  }
}

} // namespace

Config::Config() {
  reset();
}

void Config::reset() {
  converter_ = defaultConverter();

  http_ = {
    .host = "0.0.0.0",
    .port = 8090
  };

  profiles_ = defaultProfiles();
  log_level_ = "info";
}

ConverterConfig Config::defaultConverter() {
  return ConverterConfig{
    .max_file_size_bytes = 2147483648ULL,  // 2GB
    .scratch_root_path = "./temp",
    .max_concurrent_jobs = 2,
    .max_jobs_per_owner = 0,
    .encoder_timeout = std::chrono::seconds(3600),
    .encoder_executable_path = "ffmpeg",
    .termination_grace = std::chrono::milliseconds(5000),
    .min_free_space_bytes = 512ULL * 1024 * 1024,
    .transfer_chunk_bytes = 1024 * 1024,
    .progress_interval = std::chrono::milliseconds(500),
    .output_endpoint = "file://./outbox",
    .transfer_auth_token = "",
    .job_history_limit = 256,
    .allowed_extensions = {"mp4", "mkv", "avi", "mov", "wmv", "flv", "webm", "m4v", "mpg", "mpeg", "ts", "3gp"}
  };
}

std::vector<EncodeProfileConfig> Config::defaultProfiles() {
  return {
    EncodeProfileConfig{
      .name = "MP4/H.264",
      .aliases = {"mp4"},
      .container_format = "mp4",
      .file_extension = "mp4",
      .video_codec = "libx264",
      .audio_codec = "aac",
      .crf = 23,
      .bitrate = 0,
      .preset = "medium",
      .audio_bitrate = "",
      .subtitle_codec = "mov_text",
      .preserve_all_tracks = false,
      .max_height = 0,
      .extra_args = {"-movflags", "+faststart"}
    },
    EncodeProfileConfig{
      .name = "MKV/H.265",
      .aliases = {"mkv"},
      .container_format = "matroska",
      .file_extension = "mkv",
      .video_codec = "libx265",
      .audio_codec = "aac",
      .crf = 28,
      .bitrate = 0,
      .preset = "medium",
      .audio_bitrate = "96k",
      .subtitle_codec = "",
      .preserve_all_tracks = true,
      .max_height = 480,
      .extra_args = {}
    }
  };
}

EncodeProfileConfig Config::parseProfile(const nlohmann::json& json) {
  EncodeProfileConfig profile;
  profile.name = json.at("name").get<std::string>();
  profile.aliases = json.value("aliases", std::vector<std::string>{});
  profile.container_format = json.at("container").get<std::string>();
  profile.file_extension = json.value("extension", profile.container_format);
  profile.video_codec = json.at("video_codec").get<std::string>();
  profile.audio_codec = json.value("audio_codec", std::string("aac"));
  profile.crf = json.value("crf", 23);
  profile.bitrate = json.value("bitrate", 0L);
  profile.preset = json.value("preset", std::string("medium"));
  profile.audio_bitrate = json.value("audio_bitrate", std::string());
  profile.subtitle_codec = json.value("subtitle_codec", std::string());
  profile.max_height = json.value("max_height", 0);
  profile.extra_args = json.value("extra_args", std::vector<std::string>{});

  auto policy = json.value("track_policy", std::string("preserve_default_only"));
  if (policy == "preserve_all") {
    profile.preserve_all_tracks = true;
  } else if (policy == "preserve_default_only") {
    profile.preserve_all_tracks = false;
  } else {
    throw std::invalid_argument("Unknown track_policy '" + policy + "' in profile " + profile.name);
  }
  return profile;
}

void Config::loadFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw std::runtime_error("Failed to open config file: " + path);
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
  }
  loadJson(json);
}

void Config::loadJson(const nlohmann::json& json) {
  try {
    auto& c = converter_;
    c.max_file_size_bytes = json.value("max_file_size_bytes", c.max_file_size_bytes);
    c.scratch_root_path = json.value("scratch_root_path", c.scratch_root_path);
    c.max_concurrent_jobs = json.value("max_concurrent_jobs", c.max_concurrent_jobs);
    c.max_jobs_per_owner = json.value("max_jobs_per_owner", c.max_jobs_per_owner);
    c.encoder_timeout = std::chrono::seconds(
      json.value("encoder_timeout_seconds", static_cast<long>(c.encoder_timeout.count())));
    c.encoder_executable_path = json.value("encoder_executable_path", c.encoder_executable_path);
    c.termination_grace = std::chrono::milliseconds(
      json.value("termination_grace_ms", static_cast<long>(c.termination_grace.count())));
    c.min_free_space_bytes = json.value("min_free_space_bytes", c.min_free_space_bytes);
    c.transfer_chunk_bytes = json.value("transfer_chunk_bytes", c.transfer_chunk_bytes);
    c.progress_interval = std::chrono::milliseconds(
      json.value("progress_interval_ms", static_cast<long>(c.progress_interval.count())));
    c.output_endpoint = json.value("output_endpoint", c.output_endpoint);
    c.transfer_auth_token = json.value("transfer_auth_token", c.transfer_auth_token);
    c.job_history_limit = json.value("job_history_limit", c.job_history_limit);
    c.allowed_extensions = json.value("allowed_extensions", c.allowed_extensions);

    if (json.contains("http")) {
      const auto& http = json.at("http");
      http_.host = http.value("host", http_.host);
      http_.port = http.value("port", http_.port);
    }

    if (json.contains("profiles")) {
      std::vector<EncodeProfileConfig> profiles;
      for (const auto& entry : json.at("profiles")) {
        profiles.push_back(parseProfile(entry));
      }
      profiles_ = std::move(profiles);
    }

    log_level_ = json.value("log_level", log_level_);
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("Invalid configuration value: ") + e.what());
  }
}

void Config::applyEnvironment() {
  auto& c = converter_;
  if (auto value = env("MAX_FILE_SIZE")) {
    c.max_file_size_bytes = parseUnsigned("MAX_FILE_SIZE", value);
  }
  if (auto value = env("TEMP_DIR")) {
    c.scratch_root_path = value;
  }
  if (auto value = env("FFMPEG_PATH")) {
    c.encoder_executable_path = value;
  }
  if (auto value = env("MAX_CONCURRENT_JOBS")) {
    c.max_concurrent_jobs = parseUnsigned("MAX_CONCURRENT_JOBS", value);
  }
  if (auto value = env("ENCODER_TIMEOUT_SECONDS")) {
    c.encoder_timeout = std::chrono::seconds(parseUnsigned("ENCODER_TIMEOUT_SECONDS", value));
  }
  if (auto value = env("LOG_LEVEL")) {
    log_level_ = value;
  }
}

void Config::validate(const ConverterConfig& converter) {
  if (converter.max_file_size_bytes == 0) {
    throw std::invalid_argument("max_file_size_bytes must be positive");
  }
  if (converter.scratch_root_path.empty()) {
    throw std::invalid_argument("scratch_root_path must not be empty");
  }
  if (converter.max_concurrent_jobs == 0 || converter.max_concurrent_jobs > kMaxConcurrentJobs) {
    throw std::invalid_argument("max_concurrent_jobs must be between 1 and " +
      std::to_string(kMaxConcurrentJobs));
  }
  if (converter.encoder_timeout.count() <= 0 || converter.encoder_timeout > kMaxEncoderTimeout) {
    throw std::invalid_argument("encoder_timeout_seconds must be between 1 and " +
      std::to_string(kMaxEncoderTimeout.count()));
  }
  if (converter.encoder_executable_path.empty()) {
    throw std::invalid_argument("encoder_executable_path must not be empty");
  }
  if (converter.termination_grace.count() < 0 || converter.termination_grace > kMaxTerminationGrace) {
    throw std::invalid_argument("termination_grace_ms must be between 0 and " +
      std::to_string(kMaxTerminationGrace.count()));
  }
  if (converter.transfer_chunk_bytes == 0) {
    throw std::invalid_argument("transfer_chunk_bytes must be positive");
  }
  if (converter.job_history_limit == 0) {
    throw std::invalid_argument("job_history_limit must be at least 1");
  }
  if (converter.output_endpoint.empty()) {
    throw std::invalid_argument("output_endpoint must not be empty");
  }
}

void Config::validate() const {
  validate(converter_);
  if (profiles_.empty()) {
    throw std::invalid_argument("at least one encode profile is required");
  }
  if (http_.port == 0 || http_.port > 65535) {
    throw std::invalid_argument("http.port must be in 1..65535");
  }
}

} // namespace config
