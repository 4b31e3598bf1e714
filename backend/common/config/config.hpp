#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace config {

struct EncodeProfileConfig {
  std::string name;
  std::vector<std::string> aliases;
  std::string container_format;   // ffmpeg muxer name, "mp4", "matroska"
  std::string file_extension;
  std::string video_codec;        // encoder lib, "libx264", "libx265"
  std::string audio_codec;
  int crf{23};
  long bitrate{0};                // bits per second, 0 selects crf
  std::string preset;
  std::string audio_bitrate;      // empty keeps the encoder default
  std::string subtitle_codec;     // empty keeps the muxer default
  bool preserve_all_tracks{false};
  int max_height{0};              // 0 keeps the source resolution
  std::vector<std::string> extra_args;
};

// Upper bounds enforced by validate().
inline constexpr std::size_t kMaxConcurrentJobs = 64;
inline constexpr std::chrono::seconds kMaxEncoderTimeout = std::chrono::hours(24 * 365);
inline constexpr std::chrono::milliseconds kMaxTerminationGrace = std::chrono::minutes(10);

struct ConverterConfig {
  std::uint64_t max_file_size_bytes;
  std::string scratch_root_path;
  std::size_t max_concurrent_jobs;
  std::size_t max_jobs_per_owner;   // 0 = only the global limit applies
  std::chrono::seconds encoder_timeout;
  std::string encoder_executable_path;
  std::chrono::milliseconds termination_grace;
  std::uint64_t min_free_space_bytes;
  std::size_t transfer_chunk_bytes;
  std::chrono::milliseconds progress_interval;
  std::string output_endpoint;
  std::string transfer_auth_token;
  std::size_t job_history_limit;
  std::vector<std::string> allowed_extensions;
};

struct HttpConfig {
  std::string host;
  unsigned int port;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Throws std::runtime_error when the file cannot be read or parsed,
// std::invalid_argument when a value is out of range.
void loadFile(const std::string& path);
void loadJson(const nlohmann::json& json);
// MAX_FILE_SIZE, TEMP_DIR, FFMPEG_PATH, MAX_CONCURRENT_JOBS, ENCODER_TIMEOUT_SECONDS, LOG_LEVEL
void applyEnvironment();
void validate() const;
// Restores the built-in defaults.
void reset();

// Getters
const ConverterConfig& getConverter() const { return converter_; }
const HttpConfig& getHttp() const { return http_; }
const std::vector<EncodeProfileConfig>& getProfiles() const { return profiles_; }
const std::string& getLogLevel() const { return log_level_; }

static ConverterConfig defaultConverter();
static std::vector<EncodeProfileConfig> defaultProfiles();
static EncodeProfileConfig parseProfile(const nlohmann::json& json);
static void validate(const ConverterConfig& converter);

private:
  Config();

  ConverterConfig converter_;
  HttpConfig http_;
  std::vector<EncodeProfileConfig> profiles_;
  std::string log_level_;
};

} // namespace config
