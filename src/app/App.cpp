#include "app/App.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include "app/ActivityWatchdog.hpp"
#include "app/CommandRouter.hpp"
#include "app/Config.hpp"
#include "app/ConnectionOrchestrator.hpp"
#include "app/HttpServer.hpp"
#include "app/IntentChannel.hpp"
#include "app/PortalServer.hpp"
#include "app/StatusBoard.hpp"
#include "net/DhcpDnsConfigurator.hpp"
#include "net/HotspotManager.hpp"
#include "net/NetworkManagerClient.hpp"
#include "util/Log.hpp"
#include "util/Process.hpp"
#include "util/SignalWatcher.hpp"

namespace App {
namespace {
const char* lookupEnv(const char* name) { return std::getenv(name); }

Intent shutdownIntent(ShutdownReason reason) {
  Intent intent;
  intent.kind = IntentKind::Shutdown;
  intent.reason = reason;
  return intent;
}
}  // namespace

int run(int argc, char* argv[]) {
  // Before any thread exists, so every thread inherits the mask.
  if (!Util::SignalWatcher::blockExitSignals()) {
    std::cerr << "Cannot block exit signals" << std::endl;
  }

  Config config;
  Util::ActionResult loaded = loadConfig(argc, argv, lookupEnv, config);
  Util::initLogging(config.logLevel);
  if (!loaded.ok) {
    spdlog::error("[Config] {}", loaded.message);
    std::cerr << usage(argv[0]);
    return static_cast<int>(ExitCode::ConfigError);
  }
  if (config.helpRequested) {
    std::cout << usage(argv[0]);
    return static_cast<int>(ExitCode::Success);
  }

  Util::SystemProcessRunner runner;
  Net::NetworkManagerClient network(runner);

  std::string iface = config.interfaceName;
  if (iface.empty() && network.isAvailable()) iface = network.detectWifiInterface();

  if (config.command != OneShotCommand::None) {
    return CommandRouter::run(config, network, iface, std::cout);
  }

  if (geteuid() != 0) {
    spdlog::error("[App] wifi-portal must run as root.");
    return static_cast<int>(ExitCode::NotRoot);
  }
  if (iface.empty()) {
    if (!network.isAvailable()) {
      spdlog::error("[App] NetworkManager is not reachable.");
      return static_cast<int>(ExitCode::BusUnavailable);
    }
    spdlog::error("[App] No wifi interface found; use --portal-interface.");
    return static_cast<int>(ExitCode::ConfigError);
  }

  Net::HotspotConfig hotspotConfig = makeHotspotConfig(config, iface);
  spdlog::info("[App] Starting: interface {}, mode {}, SSID '{}', gateway {}", iface,
               Net::hotspotModeToString(hotspotConfig.mode), hotspotConfig.ssid,
               hotspotConfig.gateway);

  Net::HotspotManager hotspot(hotspotConfig, network, runner);
  Net::DhcpDnsConfigurator dhcp(runner);
  IntentChannel channel;
  StatusBoard status;

  ActivityWatchdog watchdog(std::chrono::seconds(config.activityTimeoutSec), [&channel]() {
    channel.post(shutdownIntent(ShutdownReason::ActivityTimeout));
  });

  PortalOptions portalOptions;
  portalOptions.gateway = config.gateway;
  portalOptions.interfaceName = iface;
  portalOptions.uiDirectory = config.uiDirectory;
  PortalServer portal(portalOptions, network, channel, status, &watchdog);
  HttpServer http(config.gateway, static_cast<uint16_t>(config.listeningPort), portal);

  OrchestratorOptions options;
  options.connectTimeoutRetries = config.connectTimeoutRetries;
  options.exitOnConnect = !config.stayAlive;
  ConnectionOrchestrator orchestrator(hotspotConfig, network, hotspot, dhcp, channel, status,
                                      options);
  orchestrator.setPortal(&http);
  orchestrator.setWatchdog(&watchdog);

  Util::SignalWatcher signals;
  signals.start([&channel](int) { channel.post(shutdownIntent(ShutdownReason::Signal)); });

  ExitCode code = orchestrator.run();

  http.end();
  watchdog.stop();
  signals.stop();
  return static_cast<int>(code);
}

}  // namespace App
