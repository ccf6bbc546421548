#pragma once

#include <string>

namespace Net {

enum class HotspotMode {
  Standard,    // NetworkManager access point
  WifiDirect,  // wpa_supplicant P2P group owner
};

inline const char* hotspotModeToString(HotspotMode mode) {
  return mode == HotspotMode::WifiDirect ? "wifi-direct" : "standard";
}

// Built once at startup from the configuration and never modified afterwards.
struct HotspotConfig {
  std::string ssid;
  std::string passphrase;  // empty means an open network
  std::string gateway;
  std::string dhcpRangeStart;
  std::string dhcpRangeEnd;
  std::string interfaceName;
  HotspotMode mode = HotspotMode::Standard;
  bool noDhcpGateway = false;
  bool noDhcpDns = false;
  bool noDhcpRouterOption = false;

  bool hasPassphrase() const { return !passphrase.empty(); }
  std::string dhcpRange() const { return dhcpRangeStart + "," + dhcpRangeEnd; }
};

}  // namespace Net
