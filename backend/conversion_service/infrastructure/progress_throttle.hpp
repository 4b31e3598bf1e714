#pragma once

#include <chrono>
#include <optional>

namespace conversion_service {

// Time-based debounce for progress reports; the first call always passes.
class ProgressThrottle {
public:
  explicit ProgressThrottle(std::chrono::milliseconds interval) : interval_(interval) {}

  bool ready() {
    auto now = std::chrono::steady_clock::now();
    if (last_ && now - *last_ < interval_) {
      return false;
    }
    last_ = now;
    return true;
  }

private:
  std::chrono::milliseconds interval_;
  std::optional<std::chrono::steady_clock::time_point> last_;
};

} // namespace conversion_service
