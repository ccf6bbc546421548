#pragma once

#include <vector>

#include <ArduinoJson.h>

#include "net/WifiTypes.hpp"

namespace App {

// JSON shapes shared by the portal routes and the one-shot commands.
void networksToJson(JsonArray arr, const std::vector<Net::ScanResult>& networks);
void savedToJson(JsonArray arr, const std::vector<Net::NetworkProfile>& saved);
void connectedToJson(JsonObject obj, const Net::ConnectedInfo& info);

}  // namespace App
