#include "http_server.hpp"
#include "common/logger.hpp"

#include <nlohmann/json.hpp>

namespace common {

namespace {

http::response<http::string_body> errorResponse(http::status status, const std::string& message,
                                                unsigned version) {
  http::response<http::string_body> res{status, version};
  res.set(http::field::content_type, "application/json");
  res.body() = nlohmann::json{{"success", false}, {"error", message}}.dump();
  res.keep_alive(false);
  res.prepare_payload();
  return res;
}

std::string describe(const tcp::endpoint& endpoint) {
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler)
  : ioc_(ioc), acceptor_(ioc), api_handler_(std::move(api_handler)) {
  auto check = [&endpoint](const beast::error_code& ec, const char* step) {
    if (ec) {
      throw std::runtime_error(std::string("HTTP server on ") + describe(endpoint) + ": " +
        step + " failed: " + ec.message());
    }
  };

  beast::error_code ec;
  acceptor_.open(endpoint.protocol(), ec);
  check(ec, "open");
  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  check(ec, "reuse_address");
  acceptor_.bind(endpoint, ec);
  check(ec, "bind");
  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  check(ec, "listen");
}

void HttpServer::run() {
  LOG_INFO("HTTP server listening on " + describe(localEndpoint()));
  doAccept();
}

void HttpServer::stop() {
  beast::error_code ec;
  acceptor_.close(ec);
  if (ec) {
    LOG_WARN("Closing acceptor failed: " + ec.message());
  }
}

tcp::endpoint HttpServer::localEndpoint() const {
  beast::error_code ec;
  auto endpoint = acceptor_.local_endpoint(ec);
  return ec ? tcp::endpoint{} : endpoint;
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
    return;
  }
  if (ec) {
    LOG_WARN("Accept error: " + ec.message());
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_)->run();
  }
  doAccept();
}

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler)
  : stream_(std::move(socket)), api_handler_(std::move(api_handler)) {
  beast::error_code ec;
  auto remote = stream_.socket().remote_endpoint(ec);
  peer_ = ec ? "unknown" : describe(remote);
}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
  parser_ = std::make_unique<http::request_parser<http::string_body>>();
  parser_->body_limit(HttpServer::kMaxBodyBytes);
  stream_.expires_after(HttpServer::kIdleTimeout);

  http::async_read(stream_, buffer_, *parser_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t) {
  started_ = std::chrono::steady_clock::now();
  if (ec == http::error::end_of_stream || ec == beast::error::timeout) {
    return doClose();
  }
  if (ec == http::error::body_limit) {
    request_line_ = "(oversized request)";
    return respond(errorResponse(http::status::payload_too_large,
      "Request body exceeds " + std::to_string(HttpServer::kMaxBodyBytes) + " bytes", 11), true);
  }
  if (ec) {
    if (ec.category() == http::make_error_code(http::error::bad_version).category()) {
      request_line_ = "(malformed request)";
      return respond(errorResponse(http::status::bad_request, "Malformed HTTP request: " + ec.message(), 11), true);
    }
    LOG_DEBUG("Read error from " + peer_ + ": " + ec.message());
    return doClose();
  }

  auto request = parser_->release();
  request_line_ = std::string(request.method_string()) + " " + std::string(request.target());
  respond(api_handler_->handleRequest(std::move(request)), false);
}

void HttpSession::respond(Response&& response, bool force_close) {
  if (force_close) {
    response.keep_alive(false);
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started_);
  LOG_DEBUG(peer_ + " " + request_line_ + " -> " + std::to_string(response.result_int()) +
    " (" + std::to_string(elapsed.count()) + " ms)");

  res_ = std::make_shared<Response>(std::move(response));
  http::async_write(stream_, *res_,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                              res_->need_eof()));
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t) {
  if (ec) {
    LOG_DEBUG("Write error to " + peer_ + ": " + ec.message());
    return;
  }
  if (close) {
    return doClose();
  }
  res_.reset();
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
