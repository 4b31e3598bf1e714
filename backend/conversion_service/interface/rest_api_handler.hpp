#pragma once
#include "application/job_orchestrator.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include "infrastructure/profile_registry.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace conversion_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<JobOrchestrator> orchestrator,
                 std::shared_ptr<const ProfileRegistry> profiles);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<JobOrchestrator> orchestrator_;
  std::shared_ptr<const ProfileRegistry> profiles_;

  http::response<http::string_body> handleSubmitJob(const nlohmann::json &body);
  http::response<http::string_body> handleListJobs();
  http::response<http::string_body> handleGetJob(const std::string &id);
  http::response<http::string_body> handleCancelJob(const std::string &id);
  http::response<http::string_body> handleListProfiles();
};

} // namespace conversion_service
