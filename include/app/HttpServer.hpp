/**
 * @file HttpServer.hpp
 * @brief Boost.Beast listener for the captive portal.
 *
 * One acceptor thread; every accepted connection is served by its own worker
 * thread with a private io_context, one request per connection.
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "app/ConnectionOrchestrator.hpp"
#include "app/PortalServer.hpp"

namespace App {

class HttpServer : public PortalListener {
 public:
  HttpServer(std::string address, uint16_t port, PortalServer& portal);
  ~HttpServer() override;

  bool begin() override;
  void end() override;

 private:
  // A private io_context and the socket accepted into it; the socket is declared
  // last so it is destroyed before its context.
  struct Connection {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::socket socket{ioc};
  };

  void doAccept();
  void startWorker(std::shared_ptr<Connection> connection);
  void serve(Connection& connection);

  std::string m_address;
  uint16_t m_port;
  PortalServer& m_portal;

  boost::asio::io_context m_io;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> m_acceptor;
  std::thread m_thread;
  std::atomic<bool> m_running{false};

  std::mutex m_workersMutex;
  std::condition_variable m_workersCv;
  int m_activeWorkers = 0;
};

}  // namespace App
