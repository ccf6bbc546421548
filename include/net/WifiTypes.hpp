/**
 * @file WifiTypes.hpp
 * @brief Value types shared by the NetworkManager client, hotspot and portal.
 */
#pragma once

#include <string>
#include <vector>

#include "util/Result.hpp"

namespace Net {

enum class Security {
  Open,
  WpaPersonal,
  Enterprise,
};

const char* securityToString(Security security);
// From the SECURITY column of `nmcli device wifi list` ("WPA2 802.1X", "WPA1 WPA2", "").
Security securityFromScan(const std::string& flags);
// From a saved profile's 802-11-wireless-security.key-mgmt value.
Security securityFromKeyMgmt(const std::string& keyMgmt);

const char* frequencyBand(int mhz);

struct NetworkProfile {
  std::string ssid;
  Security security = Security::Open;
  std::string connectionId;  // NetworkManager UUID, empty if unknown
};

struct ScanResult {
  std::string ssid;
  Security security = Security::Open;
  int signalStrength = 0;  // 0..100
  std::string frequencyBand = "unknown";
};

struct ConnectedInfo {
  std::string ssid;
  std::string interfaceName;
  Security security = Security::Open;
  std::string connectionName;
  int signalStrength = 0;
  std::string ipAddress;  // empty when no address is assigned yet
};

struct ConnectionRequest {
  std::string ssid;
  std::string passphrase;
  std::string identity;  // set only for enterprise networks

  bool hasPassphrase() const { return !passphrase.empty(); }
  bool isEnterprise() const { return !identity.empty(); }
};

enum class ConnectError {
  None,
  Timeout,
  Rejected,
  NotFound,
  BusUnavailable,
  InvalidRequest,
};

const char* connectErrorToString(ConnectError error);

struct ConnectResult : Util::ActionResult {
  ConnectError error = ConnectError::None;
};

// Strongest first, equal strengths ordered by SSID.
void sortScanResults(std::vector<ScanResult>& results);
// Drops hidden entries and keeps the strongest entry per SSID, then sorts.
std::vector<ScanResult> normalizeScanResults(const std::vector<ScanResult>& raw);

bool isValidSsid(const std::string& ssid);

}  // namespace Net
