#include "ffmpeg_progress_parser.hpp"

#include <cstdlib>
#include <regex>

namespace conversion_service {

namespace {

const std::regex kDurationPattern{R"(Duration:\s*(\d+:\d+:\d+(?:\.\d+)?))"};
const std::regex kTimePattern{R"(time=\s*(\d+:\d+:\d+(?:\.\d+)?))"};

bool isStatusLine(std::string_view line) {
  return line.starts_with("frame=") || line.starts_with("size=");
}

} // namespace

FfmpegProgressParser::FfmpegProgressParser(std::optional<double> known_duration, std::size_t tail_lines)
  : tail_lines_(tail_lines) {
  if (known_duration && *known_duration > 0.0) {
    duration_ = known_duration;
  }
}

std::optional<double> FfmpegProgressParser::parseTimestamp(std::string_view text) {
  double parts[3] = {0.0, 0.0, 0.0};
  std::size_t index = 0;
  std::size_t start = 0;

  while (index < 3) {
    auto end = index < 2 ? text.find(':', start) : text.size();
    if (end == std::string_view::npos) {
      return std::nullopt;
    }
    // strtod handles the fractional seconds; the first two fields are integers
    std::string field(text.substr(start, end - start));
    if (field.empty()) {
      return std::nullopt;
    }
    char* parsed_end = nullptr;
    parts[index] = std::strtod(field.c_str(), &parsed_end);
    if (parsed_end != field.c_str() + field.size() || parts[index] < 0.0) {
      return std::nullopt;
    }
    start = end + 1;
    ++index;
  }
  return parts[0] * 3600.0 + parts[1] * 60.0 + parts[2];
}

bool FfmpegProgressParser::feed(std::string_view bytes) {
  bool advanced = false;
  for (char c : bytes) {
    if (c == '\n' || c == '\r') {
      if (!partial_.empty()) {
        advanced = parseLine(partial_) || advanced;
        partial_.clear();
      }
      continue;
    }
    if (partial_.size() < kMaxLineLength) {
      partial_.push_back(c);
    }
  }
  return advanced;
}

bool FfmpegProgressParser::finish() {
  if (partial_.empty()) {
    return false;
  }
  bool advanced = parseLine(partial_);
  partial_.clear();
  return advanced;
}

bool FfmpegProgressParser::parseLine(std::string_view line) {
  std::cmatch match;
  const char* begin = line.data();
  const char* end = line.data() + line.size();

  if (!duration_ && std::regex_search(begin, end, match, kDurationPattern)) {
    if (auto seconds = parseTimestamp(std::string_view(match[1].first, match[1].length()));
        seconds && *seconds > 0.0) {
      duration_ = seconds;
    }
  }

  bool advanced = false;
  if (std::regex_search(begin, end, match, kTimePattern)) {
    if (auto seconds = parseTimestamp(std::string_view(match[1].first, match[1].length()))) {
      elapsed_ = seconds;
      if (duration_) {
        double fraction = *seconds / *duration_;
        if (fraction > 1.0) {
          fraction = 1.0;
        }
        if (fraction > fraction_) {
          fraction_ = fraction;
          advanced = true;
        }
      }
    }
  }

  if (!isStatusLine(line)) {
    tail_.emplace_back(line);
    if (tail_.size() > tail_lines_) {
      tail_.pop_front();
    }
  }
  return advanced;
}

std::string FfmpegProgressParser::tail() const {
  std::string text;
  for (const auto& line : tail_) {
    if (!text.empty()) {
      text += '\n';
    }
    text += line;
  }
  return text;
}

} // namespace conversion_service
