#include "rest_api_handler.hpp"
#include "infrastructure/job_json.hpp"
#include "infrastructure/webhook_notifier.hpp"

namespace conversion_service {

RestApiHandler::RestApiHandler(std::shared_ptr<JobOrchestrator> orchestrator,
                               std::shared_ptr<const ProfileRegistry> profiles)
    : orchestrator_(orchestrator), profiles_(profiles) {}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  auto segments = pathSegments(std::string_view(req.target().data(), req.target().size()));
  if (segments.size() < 2 || segments[0] != "api") {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }

  if (segments[1] == "jobs" && segments.size() == 2) {
    if (req.method() == http::verb::post) {
      return handleSubmitJob(parseRequestBody(req.body()));
    }
    if (req.method() == http::verb::get) {
      return handleListJobs();
    }
  } else if (segments[1] == "jobs" && segments.size() == 3) {
    if (req.method() == http::verb::get) {
      return handleGetJob(segments[2]);
    }
    if (req.method() == http::verb::delete_) {
      return handleCancelJob(segments[2]);
    }
  } else if (segments[1] == "profiles" && segments.size() == 2 && req.method() == http::verb::get) {
    return handleListProfiles();
  } else {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }
  return createErrorResponse(http::status::method_not_allowed, "Method not allowed");
}

http::response<http::string_body>
RestApiHandler::handleSubmitJob(const nlohmann::json &body) {
  auto source = sourceFromJson(body);
  if (!body.contains("profile") || !body.at("profile").is_string()) {
    throw std::invalid_argument("field 'profile' is required");
  }

  std::shared_ptr<JobObserver> observer;
  if (body.contains("callback_url") && !body.at("callback_url").is_null()) {
    if (!body.at("callback_url").is_string() ||
        !WebhookNotifier::isValidUrl(body.at("callback_url").get<std::string>())) {
      throw std::invalid_argument("field 'callback_url' must be an http(s) URL");
    }
    observer = std::make_shared<WebhookNotifier>(body.at("callback_url").get<std::string>());
  }

  auto handle = orchestrator_->submit(source, body.at("profile").get<std::string>(), observer);
  nlohmann::json response_json = {
    {"success", handle.state != JobState::Failed},
    {"job_id", handle.id},
    {"state", jobStateName(handle.state)}
  };
  if (handle.state == JobState::Failed) {
    if (auto job = orchestrator_->snapshot(handle.id); job && job->error) {
      response_json["error"] = toJson(*job->error, false);
    }
  }
  return createJsonResponse(http::status::accepted, response_json);
}

http::response<http::string_body> RestApiHandler::handleListJobs() {
  nlohmann::json jobs = nlohmann::json::array();
  for (const auto &job : orchestrator_->list()) {
    jobs.push_back(toJson(job));
  }
  nlohmann::json response_json = {
    {"success", true},
    {"active", orchestrator_->activeCount()},
    {"queued", orchestrator_->queuedCount()},
    {"jobs", jobs}
  };
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::handleGetJob(const std::string &id) {
  auto job = orchestrator_->snapshot(id);
  if (!job) {
    return createErrorResponse(http::status::not_found, "Job not found");
  }
  nlohmann::json response_json = {{"success", true}, {"job", toJson(*job)}};
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::handleCancelJob(const std::string &id) {
  if (!orchestrator_->snapshot(id)) {
    return createErrorResponse(http::status::not_found, "Job not found");
  }
  nlohmann::json response_json = {{"success", true}, {"cancelled", orchestrator_->cancel(id)}};
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body> RestApiHandler::handleListProfiles() {
  nlohmann::json profiles = nlohmann::json::array();
  for (const auto &profile : profiles_->list()) {
    profiles.push_back(toJson(profile));
  }
  return createJsonResponse(http::status::ok, {{"success", true}, {"profiles", profiles}});
}

} // namespace conversion_service
