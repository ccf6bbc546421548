#include "app/JsonViews.hpp"

namespace App {

void networksToJson(JsonArray arr, const std::vector<Net::ScanResult>& networks) {
  for (const auto& network : networks) {
    JsonObject entry = arr.add<JsonObject>();
    entry["ssid"] = network.ssid;
    entry["security"] = Net::securityToString(network.security);
    entry["signal_strength"] = network.signalStrength;
    entry["frequency"] = network.frequencyBand;
  }
}

void savedToJson(JsonArray arr, const std::vector<Net::NetworkProfile>& saved) {
  for (const auto& profile : saved) {
    JsonObject entry = arr.add<JsonObject>();
    entry["ssid"] = profile.ssid;
    entry["security"] = Net::securityToString(profile.security);
  }
}

void connectedToJson(JsonObject obj, const Net::ConnectedInfo& info) {
  obj["ssid"] = info.ssid;
  obj["interface"] = info.interfaceName;
  obj["security"] = Net::securityToString(info.security);
  obj["connection_name"] = info.connectionName;
  obj["signal_strength"] = info.signalStrength;
  if (!info.ipAddress.empty()) obj["ip_address"] = info.ipAddress;
}

}  // namespace App
