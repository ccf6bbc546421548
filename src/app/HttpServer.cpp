/**
 * @file HttpServer.cpp
 * @brief Beast request parsing and response writing.
 */
#include "app/HttpServer.hpp"

#include <chrono>

#include <netinet/in.h>
#include <sys/socket.h>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

namespace App {
namespace {
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

constexpr std::uint64_t kBodyLimit = 64 * 1024;
constexpr auto kReadTimeout = std::chrono::seconds(10);
constexpr auto kWriteTimeout = std::chrono::seconds(10);
constexpr char kServerName[] = "wifi-portal";

HttpRequest toPortalRequest(const http::request<http::string_body>& req) {
  HttpRequest out;
  out.method = std::string(req.method_string());
  splitTarget(std::string(req.target()), out.path, out.query);
  out.body = req.body();
  auto type = req.find(http::field::content_type);
  if (type != req.end()) out.contentType = std::string(type->value());
  return out;
}

http::response<http::string_body> toBeastResponse(const HttpResponse& res, unsigned version,
                                                  bool head) {
  http::response<http::string_body> out{static_cast<http::status>(res.status), version};
  out.set(http::field::server, kServerName);
  out.set(http::field::content_type, res.contentType);
  out.set(http::field::cache_control, "no-store");
  if (!res.location.empty()) out.set(http::field::location, res.location);
  out.keep_alive(false);
  if (!head) out.body() = res.body;
  out.prepare_payload();
  return out;
}
}  // namespace

HttpServer::HttpServer(std::string address, uint16_t port, PortalServer& portal)
    : m_address(std::move(address)), m_port(port), m_portal(portal) {}

HttpServer::~HttpServer() { end(); }

bool HttpServer::begin() {
  if (m_running.load()) return true;

  beast::error_code ec;
  asio::ip::address address = asio::ip::make_address(m_address, ec);
  if (ec) {
    spdlog::error("[HTTP] Invalid listen address {}: {}", m_address, ec.message());
    return false;
  }
  tcp::endpoint endpoint(address, m_port);
  m_acceptor = std::make_unique<tcp::acceptor>(m_io);

  m_acceptor->open(endpoint.protocol(), ec);
  if (!ec) m_acceptor->set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec) {
    // The gateway address comes and goes with the hotspot.
    int one = 1;
    if (setsockopt(m_acceptor->native_handle(), IPPROTO_IP, IP_FREEBIND, &one, sizeof(one)) != 0) {
      spdlog::warn("[HTTP] IP_FREEBIND not available.");
    }
    m_acceptor->bind(endpoint, ec);
  }
  if (!ec) m_acceptor->listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    spdlog::error("[HTTP] Cannot listen on {}:{}: {}", m_address, m_port, ec.message());
    m_acceptor.reset();
    return false;
  }

  m_running.store(true);
  doAccept();
  m_thread = std::thread([this]() { m_io.run(); });
  spdlog::info("[HTTP] Portal listening on http://{}:{}/", m_address, m_port);
  return true;
}

void HttpServer::end() {
  if (!m_running.exchange(false)) return;
  asio::post(m_io, [this]() {
    beast::error_code ignored;
    m_acceptor->close(ignored);
  });
  if (m_thread.joinable()) m_thread.join();
  m_io.stop();

  std::unique_lock<std::mutex> lock(m_workersMutex);
  m_workersCv.wait(lock, [this]() { return m_activeWorkers == 0; });
  spdlog::info("[HTTP] Portal stopped.");
}

void HttpServer::doAccept() {
  auto connection = std::make_shared<Connection>();
  m_acceptor->async_accept(connection->socket, [this, connection](beast::error_code ec) {
    if (ec == asio::error::operation_aborted || !m_running.load()) return;
    if (ec) {
      spdlog::warn("[HTTP] Accept failed: {}", ec.message());
    } else {
      startWorker(connection);
    }
    doAccept();
  });
}

void HttpServer::startWorker(std::shared_ptr<Connection> connection) {
  {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    ++m_activeWorkers;
  }
  std::thread([this, connection]() {
    serve(*connection);
    std::lock_guard<std::mutex> lock(m_workersMutex);
    --m_activeWorkers;
    m_workersCv.notify_all();
  }).detach();
}

void HttpServer::serve(Connection& connection) {
  asio::io_context& ioc = connection.ioc;
  beast::tcp_stream stream(std::move(connection.socket));
  beast::flat_buffer buffer;
  http::request_parser<http::string_body> parser;
  parser.body_limit(kBodyLimit);

  beast::error_code readEc;
  stream.expires_after(kReadTimeout);
  http::async_read(stream, buffer, parser,
                   [&readEc](beast::error_code ec, std::size_t) { readEc = ec; });
  ioc.run();

  HttpResponse response;
  unsigned version = 11;
  bool head = false;
  if (readEc) {
    if (readEc == http::error::end_of_stream || readEc == beast::error::timeout) return;
    spdlog::debug("[HTTP] Bad request: {}", readEc.message());
    response.status = readEc == http::error::body_limit ? 413 : 400;
    response.body = R"({"error":"invalid_request","message":"Malformed request"})";
  } else {
    const http::request<http::string_body>& req = parser.get();
    version = req.version();
    head = req.method() == http::verb::head;
    response = m_portal.handle(toPortalRequest(req));
  }

  http::response<http::string_body> out = toBeastResponse(response, version, head);
  beast::error_code writeEc;
  stream.expires_after(kWriteTimeout);
  ioc.restart();
  http::async_write(stream, out,
                    [&writeEc](beast::error_code ec, std::size_t) { writeEc = ec; });
  ioc.run();
  if (writeEc) spdlog::debug("[HTTP] Write failed: {}", writeEc.message());

  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
}

}  // namespace App
