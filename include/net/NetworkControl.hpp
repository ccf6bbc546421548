/**
 * @file NetworkControl.hpp
 * @brief Connection-manager operations used by the hotspot, orchestrator and portal.
 */
#pragma once

#include <string>
#include <vector>

#include "net/HotspotConfig.hpp"
#include "net/WifiTypes.hpp"

namespace Net {

class NetworkControl {
 public:
  virtual ~NetworkControl() = default;

  virtual bool isAvailable() = 0;
  // Empty result when no managed wifi device exists.
  virtual std::string detectWifiInterface() = 0;

  virtual std::vector<ScanResult> scan(const std::string& interfaceName) = 0;
  virtual ConnectResult connect(const std::string& interfaceName,
                                const ConnectionRequest& request) = 0;
  // false when the saved profiles could not be read.
  virtual bool listSaved(std::vector<NetworkProfile>& out) = 0;
  // Number of profiles deleted, -1 when the profile list could not be read.
  virtual int forget(const std::string& ssid) = 0;
  virtual int forgetAll() = 0;
  virtual bool currentConnection(const std::string& interfaceName, ConnectedInfo& out) = 0;

  virtual Util::ActionResult activateAccessPoint(const HotspotConfig& config) = 0;
  virtual Util::ActionResult removeAccessPoints(const std::string& ssid) = 0;
  virtual bool isAccessPointActive(const std::string& interfaceName) = 0;
};

}  // namespace Net
