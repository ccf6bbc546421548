/**
 * @file ConnectionOrchestrator.hpp
 * @brief State machine: scan, hotspot, portal submission, connect, retry or exit.
 *
 * run() executes on the calling thread and is the only writer of the published
 * status and the only caller of mutating hotspot/DHCP operations.
 */
#pragma once

#include <chrono>
#include <string>

#include "app/ActivityWatchdog.hpp"
#include "app/IntentChannel.hpp"
#include "app/StatusBoard.hpp"
#include "net/DhcpDnsConfigurator.hpp"
#include "net/HotspotConfig.hpp"
#include "net/HotspotManager.hpp"
#include "net/NetworkControl.hpp"

namespace App {

enum class ExitCode : int {
  Success = 0,
  ConfigError = 2,
  BusUnavailable = 3,
  HotspotFailure = 4,
  DhcpFailure = 5,
  NotRoot = 6,
  PortalFailure = 7,
};

class PortalListener {
 public:
  virtual ~PortalListener() = default;

  virtual bool begin() = 0;
  virtual void end() = 0;
};

struct OrchestratorOptions {
  int hotspotStartAttempts = 3;
  std::chrono::milliseconds hotspotRetryBackoff{2000};
  int connectTimeoutRetries = 1;
  bool exitOnConnect = true;
  std::chrono::milliseconds idlePoll{500};
};

class ConnectionOrchestrator {
 public:
  ConnectionOrchestrator(const Net::HotspotConfig& config, Net::NetworkControl& network,
                         Net::Hotspot& hotspot, Net::DhcpService& dhcp, IntentChannel& channel,
                         StatusBoard& status, OrchestratorOptions options = OrchestratorOptions());

  // Optional collaborators; both must outlive run().
  void setPortal(PortalListener* portal) { m_portal = portal; }
  void setWatchdog(ActivityWatchdog* watchdog) { m_watchdog = watchdog; }

  ExitCode run();

 private:
  void dispatch(const Intent& intent);
  IntentResult handleConnect(const Net::ConnectionRequest& request);
  IntentResult handleForget(const std::string& ssid);
  IntentResult handleForgetAll();
  IntentResult handleRescan();
  void handleShutdown(ShutdownReason reason);

  bool startHotspot();
  void stopHotspot();
  bool restartHotspot();
  void refreshNetworks();
  void requestExit(ExitCode code);
  ExitCode finish();

  void setPhase(Phase phase);
  void publish();

  Net::HotspotConfig m_config;
  Net::NetworkControl& m_network;
  Net::Hotspot& m_hotspot;
  Net::DhcpService& m_dhcp;
  IntentChannel& m_channel;
  StatusBoard& m_status;
  OrchestratorOptions m_options;
  PortalListener* m_portal = nullptr;
  ActivityWatchdog* m_watchdog = nullptr;

  StatusSnapshot m_state;
  bool m_portalStarted = false;
  bool m_done = false;
  ExitCode m_exitCode = ExitCode::Success;
};

}  // namespace App
