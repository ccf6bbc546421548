/**
 * @file Config.hpp
 * @brief Command line and environment configuration.
 *
 * Precedence: command line, then environment, then compile-time defaults.
 */
#pragma once

#include <functional>
#include <string>

#include "net/HotspotConfig.hpp"
#include "util/Result.hpp"

#ifndef WIFI_PORTAL_DEFAULT_SSID
#define WIFI_PORTAL_DEFAULT_SSID "WiFi Connect"
#endif
#ifndef WIFI_PORTAL_DEFAULT_GATEWAY
#define WIFI_PORTAL_DEFAULT_GATEWAY "192.168.42.1"
#endif
#ifndef WIFI_PORTAL_DEFAULT_DHCP_RANGE
#define WIFI_PORTAL_DEFAULT_DHCP_RANGE "192.168.42.2,192.168.42.254"
#endif
#ifndef WIFI_PORTAL_DEFAULT_PORT
#define WIFI_PORTAL_DEFAULT_PORT 80
#endif
#ifndef WIFI_PORTAL_DEFAULT_UI_DIRECTORY
#define WIFI_PORTAL_DEFAULT_UI_DIRECTORY "ui"
#endif

namespace App {

enum class OneShotCommand {
  None,
  ForgetAll,
  ForgetNetwork,
  ListNetworks,
  ListConnected,
  ListSaved,
  Connect,
};

struct Config {
  std::string interfaceName;  // empty: detect
  std::string ssid = WIFI_PORTAL_DEFAULT_SSID;
  std::string passphrase;
  std::string gateway = WIFI_PORTAL_DEFAULT_GATEWAY;
  std::string dhcpRangeStart;
  std::string dhcpRangeEnd;
  int listeningPort = WIFI_PORTAL_DEFAULT_PORT;
  int activityTimeoutSec = 0;
  std::string uiDirectory = WIFI_PORTAL_DEFAULT_UI_DIRECTORY;
  bool noDhcpGateway = false;
  bool noDhcpDns = false;
  bool noDhcpRouterOption = false;
  bool wifiDirect = false;
  int connectTimeoutRetries = 1;
  bool stayAlive = false;
  std::string logLevel = "info";

  OneShotCommand command = OneShotCommand::None;
  std::string commandSsid;        // --forget-network / --connect
  std::string commandPassphrase;  // --passphrase
  bool helpRequested = false;
};

using EnvLookup = std::function<const char*(const char*)>;

// Resets getopt state, so it may be called more than once per process.
Util::ActionResult loadConfig(int argc, char* const argv[], const EnvLookup& env, Config& out);

Net::HotspotConfig makeHotspotConfig(const Config& config, const std::string& interfaceName);

std::string usage(const char* program);

}  // namespace App
