#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace conversion_service {

// Incremental reader for ffmpeg's stderr. Lines end in '\n' or '\r' (the status line
// is rewritten in place with '\r'). Anything that is not a duration or time report is
// ignored, apart from being kept in a short tail for diagnostics.
class FfmpegProgressParser {
public:
  explicit FfmpegProgressParser(std::optional<double> known_duration = std::nullopt,
                                std::size_t tail_lines = 20);

  // Returns true when fraction() increased.
  bool feed(std::string_view bytes);
  // Parses a trailing line without terminator.
  bool finish();

  double fraction() const { return fraction_; }
  std::optional<double> duration() const { return duration_; }
  std::optional<double> elapsed() const { return elapsed_; }
  std::string tail() const;

  // "HH:MM:SS.ff" to seconds.
  static std::optional<double> parseTimestamp(std::string_view text);

private:
  bool parseLine(std::string_view line);

  static constexpr std::size_t kMaxLineLength = 4096;

  std::string partial_;
  std::deque<std::string> tail_;
  std::size_t tail_lines_;
  std::optional<double> duration_;
  std::optional<double> elapsed_;
  double fraction_{0.0};
};

} // namespace conversion_service
