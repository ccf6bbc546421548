/**
 * @file PortalServer.hpp
 * @brief Captive portal routes: listing, connect/forget submission, health and assets.
 *
 * Transport independent: HttpServer parses requests and calls handle() on a worker
 * thread per connection. Mutating routes go through the IntentChannel and block
 * until the orchestrator answers.
 */
#pragma once

#include <chrono>
#include <string>

#include "app/ActivityWatchdog.hpp"
#include "app/HttpTypes.hpp"
#include "app/IntentChannel.hpp"
#include "app/StatusBoard.hpp"
#include "net/NetworkControl.hpp"

namespace App {

struct PortalOptions {
  std::string gateway;
  std::string interfaceName;
  std::string uiDirectory;
  std::chrono::milliseconds submitTimeout{120000};
};

class PortalServer {
 public:
  PortalServer(PortalOptions options, Net::NetworkControl& network, IntentChannel& channel,
               const StatusBoard& status, ActivityWatchdog* watchdog = nullptr);

  HttpResponse handle(const HttpRequest& request);

 private:
  HttpResponse handleIndex();
  HttpResponse handleListNetworks(const HttpRequest& request);
  HttpResponse handleListConnected();
  HttpResponse handleListSaved();
  HttpResponse handleConnect(const HttpRequest& request);
  HttpResponse handleForget(const HttpRequest& request);
  HttpResponse handleForgetAll();
  HttpResponse handleHealth();
  HttpResponse handleStatus();
  HttpResponse handleStatic(const std::string& path);
  HttpResponse redirectToPortal() const;

  HttpResponse submit(Intent intent, IntentResult& result, bool& completed);

  PortalOptions m_options;
  Net::NetworkControl& m_network;
  IntentChannel& m_channel;
  const StatusBoard& m_status;
  ActivityWatchdog* m_watchdog;
};

}  // namespace App
