/**
 * @file NetworkManagerClient.hpp
 * @brief NetworkManager integration driven through nmcli.
 *
 * nmcli talks to the daemon over D-Bus; all calls here are synchronous and bounded
 * by the runner timeout. Saved profiles stay owned by NetworkManager.
 */
#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "net/NetworkControl.hpp"
#include "util/Process.hpp"

namespace Net {

struct NmClientOptions {
  std::chrono::seconds scanWait{10};
  std::chrono::seconds connectWait{30};
  std::chrono::milliseconds connectivityWait{20000};
  int emptyScanRetries = 3;
  std::chrono::milliseconds emptyScanDelay{1000};
  std::chrono::milliseconds commandTimeout{15000};
  std::chrono::milliseconds pollInterval{1000};
};

class NetworkManagerClient : public NetworkControl {
 public:
  // Connection name of the profile created for the hotspot.
  static constexpr const char* kAccessPointName = "wifi-portal-ap";

  explicit NetworkManagerClient(Util::ProcessRunner& runner,
                                NmClientOptions options = NmClientOptions());

  bool isAvailable() override;
  std::string detectWifiInterface() override;

  std::vector<ScanResult> scan(const std::string& interfaceName) override;
  ConnectResult connect(const std::string& interfaceName,
                        const ConnectionRequest& request) override;
  bool listSaved(std::vector<NetworkProfile>& out) override;
  int forget(const std::string& ssid) override;
  int forgetAll() override;
  bool currentConnection(const std::string& interfaceName, ConnectedInfo& out) override;

  Util::ActionResult activateAccessPoint(const HotspotConfig& config) override;
  Util::ActionResult removeAccessPoints(const std::string& ssid) override;
  bool isAccessPointActive(const std::string& interfaceName) override;

  // Splits a terse (-t) line on unescaped ':' and unescapes "\:" and "\\".
  static std::vector<std::string> splitFields(const std::string& line);
  // Parses `-t -f SSID,SECURITY,SIGNAL,FREQ device wifi list` output.
  static std::vector<ScanResult> parseScanOutput(const std::string& output);
  static ConnectError classifyExit(const Util::CommandOutput& out);

 private:
  struct WifiConnection {
    std::string uuid;
    std::string name;
    std::string ssid;
    std::string mode;     // infrastructure, ap, adhoc, mesh
    std::string keyMgmt;  // empty for open networks
    bool isAccessPoint() const { return mode == "ap"; }
  };

  struct ActiveConnection {
    std::string uuid;
    std::string type;
    std::string device;
    std::string state;
    std::string name;
  };

  Util::CommandOutput nmcli(const std::vector<std::string>& args);
  Util::CommandOutput nmcli(const std::vector<std::string>& args, std::chrono::milliseconds timeout);

  bool listWifiConnections(std::vector<WifiConnection>& out);
  bool readConnection(const std::string& uuid, WifiConnection& conn);
  bool listActive(std::vector<ActiveConnection>& out);
  bool deleteConnection(const std::string& uuid);
  void deleteCreatedProfiles(const std::string& ssid, const std::vector<WifiConnection>& before);
  // Non-AP profiles for ssid that were not in before.
  bool createdProfiles(const std::string& ssid, const std::vector<WifiConnection>& before,
                       std::vector<std::string>& uuids);
  void waitForConnectivity();
  int readSignal(const std::string& interfaceName);
  std::string readIpAddress(const std::string& interfaceName);

  Util::ProcessRunner& m_runner;
  NmClientOptions m_options;
};

}  // namespace Net
