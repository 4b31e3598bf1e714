#pragma once

#include "domain/conversion_job.hpp"

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace conversion_service {

// Posts job events as JSON to a callback URL. Delivery is best effort: failures are
// logged and never reach the job.
class WebhookNotifier : public JobObserver {
public:
  explicit WebhookNotifier(std::string callback_url,
                           std::chrono::seconds timeout = std::chrono::seconds(10));

  void onProgress(const JobId& id, const ProgressUpdate& update) override;
  void onFinished(const JobId& id, const JobOutcome& outcome) override;

  static bool isValidUrl(const std::string& url);

private:
  void post(const nlohmann::json& payload);

  std::string callback_url_;
  std::chrono::seconds timeout_;
};

} // namespace conversion_service
