#include "app/CommandRouter.hpp"

#include <ArduinoJson.h>
#include <spdlog/spdlog.h>

#include "app/ConnectionOrchestrator.hpp"
#include "app/JsonViews.hpp"

namespace App {
namespace CommandRouter {
namespace {
constexpr int kCommandFailed = 1;

void printStructured(std::ostream& out, const char* cmd, const Util::ActionResult& res,
                     const JsonDocument* data = nullptr) {
  JsonDocument doc;
  doc["cmd"] = cmd;
  doc["status"] = res.ok ? "ok" : "error";
  if (!res.message.empty()) doc["message"] = res.message;
  if (data) doc["data"] = data->as<JsonVariantConst>();
  std::string line;
  serializeJson(doc, line);
  out << line << std::endl;
}

int listNetworks(std::ostream& out, Net::NetworkControl& network, const std::string& iface) {
  JsonDocument data;
  std::vector<Net::ScanResult> networks = network.scan(iface);
  networksToJson(data["networks"].to<JsonArray>(), networks);
  printStructured(out, "list-networks",
                  Util::success("Found " + std::to_string(networks.size()) + " networks"), &data);
  return 0;
}

int listConnected(std::ostream& out, Net::NetworkControl& network, const std::string& iface) {
  JsonDocument data;
  Net::ConnectedInfo info;
  if (network.currentConnection(iface, info)) {
    connectedToJson(data["connected"].to<JsonObject>(), info);
  } else {
    data["connected"] = nullptr;
  }
  printStructured(out, "list-connected", Util::success(), &data);
  return 0;
}

int listSaved(std::ostream& out, Net::NetworkControl& network) {
  std::vector<Net::NetworkProfile> saved;
  if (!network.listSaved(saved)) {
    printStructured(out, "list-saved", Util::failure("Could not read saved profiles"));
    return kCommandFailed;
  }
  JsonDocument data;
  savedToJson(data["saved_networks"].to<JsonArray>(), saved);
  printStructured(out, "list-saved", Util::success(), &data);
  return 0;
}

int forgetAll(std::ostream& out, Net::NetworkControl& network) {
  int removed = network.forgetAll();
  if (removed < 0) {
    printStructured(out, "forget-all", Util::failure("Could not read saved profiles"));
    return kCommandFailed;
  }
  JsonDocument data;
  data["removed"] = removed;
  printStructured(out, "forget-all",
                  Util::success("Forgot " + std::to_string(removed) + " saved network(s)"), &data);
  return 0;
}

int forgetNetwork(std::ostream& out, Net::NetworkControl& network, const std::string& ssid) {
  int removed = network.forget(ssid);
  if (removed <= 0) {
    printStructured(out, "forget-network",
                    Util::failure(removed < 0 ? "Could not read saved profiles"
                                              : "No saved network named '" + ssid + "'"));
    return kCommandFailed;
  }
  JsonDocument data;
  data["removed"] = removed;
  printStructured(out, "forget-network", Util::success("Forgot '" + ssid + "'"), &data);
  return 0;
}

int connect(std::ostream& out, Net::NetworkControl& network, const std::string& iface,
            const Config& config) {
  Net::ConnectionRequest request;
  request.ssid = config.commandSsid;
  request.passphrase = config.commandPassphrase;
  Net::ConnectResult result = network.connect(iface, request);
  if (!result.ok) {
    JsonDocument data;
    data["error"] = Net::connectErrorToString(result.error);
    printStructured(out, "connect", result, &data);
    return kCommandFailed;
  }
  printStructured(out, "connect", result);
  return 0;
}
}  // namespace

const char* commandName(OneShotCommand command) {
  switch (command) {
    case OneShotCommand::ForgetAll: return "forget-all";
    case OneShotCommand::ForgetNetwork: return "forget-network";
    case OneShotCommand::ListNetworks: return "list-networks";
    case OneShotCommand::ListConnected: return "list-connected";
    case OneShotCommand::ListSaved: return "list-saved";
    case OneShotCommand::Connect: return "connect";
    case OneShotCommand::None:
    default: return "none";
  }
}

int run(const Config& config, Net::NetworkControl& network, const std::string& interfaceName,
        std::ostream& out) {
  if (!network.isAvailable()) {
    printStructured(out, commandName(config.command),
                    Util::failure("NetworkManager is not reachable"));
    return static_cast<int>(ExitCode::BusUnavailable);
  }
  spdlog::debug("[Cmd] Running {} on {}", commandName(config.command), interfaceName);
  switch (config.command) {
    case OneShotCommand::ListNetworks: return listNetworks(out, network, interfaceName);
    case OneShotCommand::ListConnected: return listConnected(out, network, interfaceName);
    case OneShotCommand::ListSaved: return listSaved(out, network);
    case OneShotCommand::ForgetAll: return forgetAll(out, network);
    case OneShotCommand::ForgetNetwork: return forgetNetwork(out, network, config.commandSsid);
    case OneShotCommand::Connect: return connect(out, network, interfaceName, config);
    case OneShotCommand::None:
    default:
      printStructured(out, "none", Util::failure("No command given"));
      return kCommandFailed;
  }
}

}  // namespace CommandRouter
}  // namespace App
