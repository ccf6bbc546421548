#include "net/WifiTypes.hpp"

#include <algorithm>
#include <map>

namespace Net {
namespace {
constexpr size_t kMaxSsidBytes = 32;

bool contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}
}  // namespace

const char* securityToString(Security security) {
  switch (security) {
    case Security::Open: return "open";
    case Security::WpaPersonal: return "wpa";
    case Security::Enterprise: return "enterprise";
    default: return "unknown";
  }
}

Security securityFromScan(const std::string& flags) {
  if (contains(flags, "802.1X")) return Security::Enterprise;
  if (contains(flags, "WPA") || contains(flags, "WEP") || contains(flags, "SAE") ||
      contains(flags, "OWE")) {
    return Security::WpaPersonal;
  }
  return Security::Open;
}

Security securityFromKeyMgmt(const std::string& keyMgmt) {
  if (keyMgmt.empty()) return Security::Open;
  if (keyMgmt == "wpa-eap" || keyMgmt == "wpa-eap-suite-b-192" || keyMgmt == "ieee8021x") {
    return Security::Enterprise;
  }
  // wpa-psk, sae, and "none" (static WEP) all take a shared key.
  return Security::WpaPersonal;
}

const char* frequencyBand(int mhz) {
  if (mhz >= 2400 && mhz < 2500) return "2.4GHz";
  if (mhz >= 4900 && mhz < 5900) return "5GHz";
  if (mhz >= 5925 && mhz <= 7125) return "6GHz";
  return "unknown";
}

const char* connectErrorToString(ConnectError error) {
  switch (error) {
    case ConnectError::None: return "none";
    case ConnectError::Timeout: return "timeout";
    case ConnectError::Rejected: return "rejected";
    case ConnectError::NotFound: return "not_found";
    case ConnectError::BusUnavailable: return "unavailable";
    case ConnectError::InvalidRequest: return "invalid_request";
    default: return "rejected";
  }
}

void sortScanResults(std::vector<ScanResult>& results) {
  std::stable_sort(results.begin(), results.end(), [](const ScanResult& a, const ScanResult& b) {
    if (a.signalStrength != b.signalStrength) return a.signalStrength > b.signalStrength;
    return a.ssid < b.ssid;
  });
}

std::vector<ScanResult> normalizeScanResults(const std::vector<ScanResult>& raw) {
  std::map<std::string, ScanResult> strongest;
  for (const auto& entry : raw) {
    if (entry.ssid.empty()) continue;
    auto it = strongest.find(entry.ssid);
    if (it == strongest.end() || entry.signalStrength > it->second.signalStrength) {
      strongest[entry.ssid] = entry;
    }
  }
  std::vector<ScanResult> out;
  out.reserve(strongest.size());
  for (const auto& kv : strongest) out.push_back(kv.second);
  sortScanResults(out);
  return out;
}

bool isValidSsid(const std::string& ssid) {
  return !ssid.empty() && ssid.size() <= kMaxSsidBytes;
}

}  // namespace Net
