#include "webhook_notifier.hpp"
#include "job_json.hpp"
#include "common/logger.hpp"

#include <memory>
#include <curl/curl.h>

namespace conversion_service {

namespace {

size_t discardBody(char*, size_t size, size_t nmemb, void*) {
  return size * nmemb;
}

} // namespace

WebhookNotifier::WebhookNotifier(std::string callback_url, std::chrono::seconds timeout)
  : callback_url_(std::move(callback_url)), timeout_(timeout) {}

bool WebhookNotifier::isValidUrl(const std::string& url) {
  return url.starts_with("http://") || url.starts_with("https://");
}

void WebhookNotifier::onProgress(const JobId& id, const ProgressUpdate& update) {
  post({
    {"event", "progress"},
    {"job_id", id},
    {"stage", jobStateName(update.stage)},
    {"fraction", update.fraction}
  });
}

void WebhookNotifier::onFinished(const JobId& id, const JobOutcome& outcome) {
  auto payload = toJson(outcome);
  payload["event"] = "finished";
  payload["job_id"] = id;
  post(payload);
}

void WebhookNotifier::post(const nlohmann::json& payload) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    LOG_WARN("webhook: failed to initialize CURL");
    return;
  }
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
    curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);

  const std::string body = payload.dump();
  curl_easy_setopt(curl.get(), CURLOPT_URL, callback_url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discardBody);
  curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    LOG_WARN("webhook " + callback_url_ + " failed: " + curl_easy_strerror(res));
  }
}

} // namespace conversion_service
