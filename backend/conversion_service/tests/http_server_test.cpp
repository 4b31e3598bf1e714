#include <gtest/gtest.h>

#include "local_http_server.hpp"

namespace conversion_service {
namespace {

using test_support::LocalHttpServer;
using test_support::RecordingHandler;

// Writes raw bytes to the server and reads one response.
http::response<http::string_body> exchange(unsigned short port, const std::string& raw) {
  net::io_context ioc;
  tcp::socket socket{ioc};
  socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port});
  net::write(socket, net::buffer(raw));

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(socket, buffer, res);
  beast::error_code ec;
  socket.shutdown(tcp::socket::shutdown_both, ec);
  return res;
}

TEST(HttpServerTest, ForwardsRequestsToHandler) {
  auto handler = std::make_shared<RecordingHandler>();
  LocalHttpServer server{handler};

  auto res = exchange(server.port(),
    "POST /api/jobs?x=1 HTTP/1.1\r\nHost: localhost\r\nContent-Type: application/json\r\n"
    "Content-Length: 2\r\nConnection: close\r\n\r\n{}");

  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
  ASSERT_EQ(handler->received().size(), 1u);
  EXPECT_EQ(handler->received()[0].method, "POST");
  EXPECT_EQ(handler->received()[0].target, "/api/jobs?x=1");
  EXPECT_EQ(handler->received()[0].body, "{}");
}

TEST(HttpServerTest, OversizedBodyIsRejectedBeforeHandler) {
  auto handler = std::make_shared<RecordingHandler>();
  LocalHttpServer server{handler};

  auto res = exchange(server.port(),
    "POST /api/jobs HTTP/1.1\r\nHost: localhost\r\nContent-Length: " +
    std::to_string(common::HttpServer::kMaxBodyBytes + 1) + "\r\n\r\n");

  EXPECT_EQ(res.result(), http::status::payload_too_large);
  EXPECT_FALSE(res.keep_alive());
  EXPECT_FALSE(nlohmann::json::parse(res.body())["success"].get<bool>());
  EXPECT_TRUE(handler->received().empty());
}

TEST(HttpServerTest, MalformedRequestGetsBadRequest) {
  auto handler = std::make_shared<RecordingHandler>();
  LocalHttpServer server{handler};

  auto res = exchange(server.port(), "GET /api/jobs HTTP/9.9.9\r\n\r\n");

  EXPECT_EQ(res.result(), http::status::bad_request);
  EXPECT_TRUE(handler->received().empty());
}

TEST(HttpServerTest, BindsEphemeralPort) {
  LocalHttpServer server{std::make_shared<RecordingHandler>()};
  EXPECT_NE(server.port(), 0);
}

} // namespace
} // namespace conversion_service
