#pragma once
#include <chrono>
#include <memory>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include "common/restful/rest_api_handler_base.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace common {

// One keep-alive connection. Requests are read with a body limit; oversized or
// malformed requests get a JSON error and the connection is closed.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler);

  void run();

private:
  using Response = http::response<http::string_body>;

  void doRead();
  void onRead(beast::error_code ec, std::size_t bytes_transferred);
  void respond(Response&& response, bool force_close);
  void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
  void doClose();

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::unique_ptr<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<Response> res_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  std::string peer_;
  std::string request_line_;
  std::chrono::steady_clock::time_point started_;
};

class HttpServer {
public:
  // Binds and listens immediately; throws std::runtime_error when that fails.
  HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<RestApiHandlerBase> api_handler);

  void run();
  // Stops accepting; sessions already open finish their current request.
  void stop();
  // The bound address, with the real port when constructed with port 0.
  tcp::endpoint localEndpoint() const;

  static constexpr std::uint64_t kMaxBodyBytes = 1024 * 1024;
  static constexpr std::chrono::seconds kIdleTimeout{30};

private:
  void doAccept();
  void onAccept(beast::error_code ec, tcp::socket socket);

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
};

}
