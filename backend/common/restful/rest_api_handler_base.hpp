#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  http::response<http::string_body> handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {
    
    auto finish = [&req](auto& res) {
      res.set(http::field::access_control_allow_origin, "*");
      res.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
      res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
      res.version(req.version());
      res.keep_alive(req.keep_alive());
    };

    if (req.method() == http::verb::options) {
      http::response<http::string_body> res{http::status::no_content, req.version()};
      finish(res);
      res.prepare_payload();
      return res;
    }

    try {
      auto response = doHandleRequest(std::move(req));
      finish(response);
      return response;
    } catch (const std::invalid_argument& e) {
      auto response = createErrorResponse(http::status::bad_request, e.what());
      finish(response);
      return response;
    } catch (const std::exception& e) {
      auto response = createErrorResponse(http::status::internal_server_error, 
                                        "Internal server error: " + std::string(e.what()));
      finish(response);
      return response;
    }
  }

protected:
  virtual http::response<http::string_body> doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;

  http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);
  
  http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message);
  
  // Throws std::invalid_argument on malformed JSON.
  nlohmann::json parseRequestBody(const std::string& body);

  // "/api/jobs/abc?x=1" -> {"api", "jobs", "abc"}; the query string is dropped.
  static std::vector<std::string> pathSegments(std::string_view target);
};

}
