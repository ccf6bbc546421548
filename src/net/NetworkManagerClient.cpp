/**
 * @file NetworkManagerClient.cpp
 * @brief nmcli command sequences for scan, connect, forget and the hotspot profile.
 */
#include "net/NetworkManagerClient.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <sstream>
#include <thread>

#include <spdlog/spdlog.h>

namespace Net {
namespace {
constexpr char kWifiType[] = "802-11-wireless";
constexpr auto kWaitSlack = std::chrono::seconds(5);

std::string trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::vector<std::string> lines(const std::string& output) {
  std::vector<std::string> out;
  std::istringstream in(output);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

// Joins fields [from, end) back with ':' for a trailing column that may hold colons.
std::string joinFrom(const std::vector<std::string>& fields, size_t from) {
  std::string out;
  for (size_t i = from; i < fields.size(); ++i) {
    if (i > from) out += ':';
    out += fields[i];
  }
  return out;
}

std::string waitArg(std::chrono::seconds wait) { return std::to_string(wait.count()); }

std::chrono::milliseconds waitBudget(std::chrono::seconds wait) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(wait + kWaitSlack);
}

std::string firstLine(const std::string& output) {
  std::vector<std::string> all = lines(output);
  return all.empty() ? std::string() : trim(all.front());
}
}  // namespace

NetworkManagerClient::NetworkManagerClient(Util::ProcessRunner& runner, NmClientOptions options)
    : m_runner(runner), m_options(options) {}

Util::CommandOutput NetworkManagerClient::nmcli(const std::vector<std::string>& args) {
  return nmcli(args, m_options.commandTimeout);
}

Util::CommandOutput NetworkManagerClient::nmcli(const std::vector<std::string>& args,
                                                std::chrono::milliseconds timeout) {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back("nmcli");
  argv.insert(argv.end(), args.begin(), args.end());
  spdlog::debug("[NM] {}", Util::describeCommand(argv));
  Util::CommandOutput out = m_runner.run(argv, timeout);
  if (!out.ok()) {
    spdlog::debug("[NM] exit={} timedOut={} output='{}'", out.exitCode, out.timedOut,
                  firstLine(out.output));
  }
  return out;
}

std::vector<std::string> NetworkManagerClient::splitFields(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (c == '\\' && i + 1 < line.size() && (line[i + 1] == ':' || line[i + 1] == '\\')) {
      current += line[i + 1];
      ++i;
    } else if (c == ':') {
      fields.push_back(current);
      current.clear();
    } else {
      current += c;
    }
  }
  fields.push_back(current);
  return fields;
}

std::vector<ScanResult> NetworkManagerClient::parseScanOutput(const std::string& output) {
  std::vector<ScanResult> raw;
  for (const auto& line : lines(output)) {
    std::vector<std::string> fields = splitFields(line);
    if (fields.size() < 4) continue;
    ScanResult entry;
    entry.ssid = fields[0];
    entry.security = securityFromScan(fields[1]);
    entry.signalStrength = std::max(0, std::min(100, std::atoi(fields[2].c_str())));
    entry.frequencyBand = frequencyBand(std::atoi(fields[3].c_str()));
    raw.push_back(entry);
  }
  return normalizeScanResults(raw);
}

ConnectError NetworkManagerClient::classifyExit(const Util::CommandOutput& out) {
  if (!out.launched) return ConnectError::BusUnavailable;
  if (out.timedOut) return ConnectError::Timeout;
  switch (out.exitCode) {
    case 0: return ConnectError::None;
    case 2: return ConnectError::InvalidRequest;
    case 3: return ConnectError::Timeout;
    case 4: return ConnectError::Rejected;
    case 8: return ConnectError::BusUnavailable;
    case 10: return ConnectError::NotFound;
    default: return ConnectError::Rejected;
  }
}

bool NetworkManagerClient::isAvailable() {
  Util::CommandOutput out = nmcli({"-t", "-f", "RUNNING", "general"});
  return out.ok() && firstLine(out.output) == "running";
}

std::string NetworkManagerClient::detectWifiInterface() {
  Util::CommandOutput out = nmcli({"-t", "-f", "DEVICE,TYPE,STATE", "device", "status"});
  if (!out.ok()) {
    spdlog::warn("[NM] Could not list devices.");
    return "";
  }
  for (const auto& line : lines(out.output)) {
    std::vector<std::string> fields = splitFields(line);
    if (fields.size() < 3) continue;
    if (fields[1] == "wifi" && fields[2] != "unmanaged" && fields[2] != "unavailable") {
      spdlog::info("[NM] Using wifi interface {}", fields[0]);
      return fields[0];
    }
  }
  return "";
}

std::vector<ScanResult> NetworkManagerClient::scan(const std::string& interfaceName) {
  Util::CommandOutput rescan =
      nmcli({"--wait", waitArg(m_options.scanWait), "device", "wifi", "rescan", "ifname",
             interfaceName},
            waitBudget(m_options.scanWait));
  if (!rescan.ok()) {
    spdlog::warn("[NM] Rescan did not complete, using cached list.");
  }

  std::vector<ScanResult> results;
  for (int attempt = 0; attempt <= m_options.emptyScanRetries; ++attempt) {
    if (attempt > 0) std::this_thread::sleep_for(m_options.emptyScanDelay);
    Util::CommandOutput list = nmcli({"-t", "-f", "SSID,SECURITY,SIGNAL,FREQ", "device", "wifi",
                                      "list", "ifname", interfaceName, "--rescan", "no"});
    if (!list.ok()) {
      spdlog::warn("[NM] Reading scan results failed (exit {}).", list.exitCode);
      continue;
    }
    results = parseScanOutput(list.output);
    if (!results.empty()) break;
  }
  spdlog::info("[NM] Scan found {} networks.", results.size());
  return results;
}

bool NetworkManagerClient::listWifiConnections(std::vector<WifiConnection>& out) {
  out.clear();
  Util::CommandOutput list = nmcli({"-t", "-f", "UUID,TYPE,NAME", "connection", "show"});
  if (!list.ok()) return false;
  for (const auto& line : lines(list.output)) {
    std::vector<std::string> fields = splitFields(line);
    if (fields.size() < 3 || fields[1] != kWifiType) continue;
    WifiConnection conn;
    conn.uuid = fields[0];
    conn.name = joinFrom(fields, 2);
    if (!readConnection(conn.uuid, conn)) {
      spdlog::warn("[NM] Skipping unreadable profile '{}'.", conn.name);
      continue;
    }
    out.push_back(conn);
  }
  return true;
}

bool NetworkManagerClient::readConnection(const std::string& uuid, WifiConnection& conn) {
  Util::CommandOutput show = nmcli({"-t", "-f", "802-11-wireless,802-11-wireless-security",
                                    "connection", "show", "uuid", uuid});
  if (!show.ok()) return false;
  for (const auto& line : lines(show.output)) {
    std::vector<std::string> fields = splitFields(line);
    if (fields.size() < 2) continue;
    const std::string& key = fields[0];
    std::string value = joinFrom(fields, 1);
    if (key == "802-11-wireless.ssid") {
      conn.ssid = value;
    } else if (key == "802-11-wireless.mode") {
      conn.mode = value;
    } else if (key == "802-11-wireless-security.key-mgmt") {
      conn.keyMgmt = value == "--" ? "" : value;
    }
  }
  return true;
}

bool NetworkManagerClient::listActive(std::vector<ActiveConnection>& out) {
  out.clear();
  Util::CommandOutput list =
      nmcli({"-t", "-f", "UUID,TYPE,DEVICE,STATE,NAME", "connection", "show", "--active"});
  if (!list.ok()) return false;
  for (const auto& line : lines(list.output)) {
    std::vector<std::string> fields = splitFields(line);
    if (fields.size() < 5) continue;
    ActiveConnection active;
    active.uuid = fields[0];
    active.type = fields[1];
    active.device = fields[2];
    active.state = fields[3];
    active.name = joinFrom(fields, 4);
    out.push_back(active);
  }
  return true;
}

bool NetworkManagerClient::deleteConnection(const std::string& uuid) {
  Util::CommandOutput out = nmcli({"connection", "delete", "uuid", uuid});
  if (!out.ok()) {
    spdlog::warn("[NM] Failed to delete profile {}: {}", uuid, firstLine(out.output));
    return false;
  }
  return true;
}

bool NetworkManagerClient::createdProfiles(const std::string& ssid,
                                           const std::vector<WifiConnection>& before,
                                           std::vector<std::string>& uuids) {
  uuids.clear();
  std::vector<WifiConnection> after;
  if (!listWifiConnections(after)) return false;
  for (const auto& conn : after) {
    if (conn.ssid != ssid || conn.isAccessPoint()) continue;
    bool existed = std::any_of(before.begin(), before.end(),
                               [&](const WifiConnection& old) { return old.uuid == conn.uuid; });
    if (!existed) uuids.push_back(conn.uuid);
  }
  return true;
}

void NetworkManagerClient::deleteCreatedProfiles(const std::string& ssid,
                                                 const std::vector<WifiConnection>& before) {
  std::vector<std::string> uuids;
  if (!createdProfiles(ssid, before, uuids)) return;
  for (const auto& uuid : uuids) {
    spdlog::info("[NM] Removing profile {} left by the failed attempt.", uuid);
    deleteConnection(uuid);
  }
}

void NetworkManagerClient::waitForConnectivity() {
  auto deadline = std::chrono::steady_clock::now() + m_options.connectivityWait;
  std::string state;
  while (true) {
    Util::CommandOutput out = nmcli({"networking", "connectivity", "check"});
    state = out.ok() ? firstLine(out.output) : "";
    if (state == "full" || state == "limited") {
      spdlog::info("[NM] Connectivity: {}", state);
      return;
    }
    if (std::chrono::steady_clock::now() >= deadline) break;
    std::this_thread::sleep_for(m_options.pollInterval);
  }
  spdlog::warn("[NM] No connectivity after connecting (state '{}').", state);
}

ConnectResult NetworkManagerClient::connect(const std::string& interfaceName,
                                            const ConnectionRequest& request) {
  ConnectResult result;
  if (!isValidSsid(request.ssid)) {
    result.error = ConnectError::InvalidRequest;
    result.message = "SSID must be 1-32 bytes";
    return result;
  }

  std::vector<WifiConnection> before;
  if (!listWifiConnections(before)) {
    result.error = ConnectError::BusUnavailable;
    result.message = "NetworkManager is not reachable";
    return result;
  }

  auto saved = std::find_if(before.begin(), before.end(), [&](const WifiConnection& conn) {
    return conn.ssid == request.ssid && !conn.isAccessPoint();
  });

  Util::CommandOutput out;
  if (saved != before.end()) {
    spdlog::info("[NM] Activating saved profile '{}' for '{}'.", saved->name, request.ssid);
    out = nmcli({"--wait", waitArg(m_options.connectWait), "connection", "up", "uuid",
                 saved->uuid, "ifname", interfaceName},
                waitBudget(m_options.connectWait));
  } else if (request.isEnterprise()) {
    spdlog::info("[NM] Creating enterprise profile for '{}'.", request.ssid);
    Util::CommandOutput add = nmcli({"connection", "add", "type", "wifi", "ifname", interfaceName,
                                     "con-name", request.ssid, "ssid", request.ssid,
                                     "wifi-sec.key-mgmt", "wpa-eap", "802-1x.eap", "peap",
                                     "802-1x.phase2-auth", "mschapv2", "802-1x.identity",
                                     request.identity, "802-1x.password", request.passphrase});
    std::vector<std::string> created;
    if (add.ok() && createdProfiles(request.ssid, before, created) && !created.empty()) {
      out = nmcli({"--wait", waitArg(m_options.connectWait), "connection", "up", "uuid",
                   created.front(), "ifname", interfaceName},
                  waitBudget(m_options.connectWait));
    } else {
      out = add;
      if (out.ok()) out.exitCode = 1;  // added, but the new profile is not listed
    }
  } else {
    spdlog::info("[NM] Connecting to new network '{}'.", request.ssid);
    std::vector<std::string> args = {"--wait", waitArg(m_options.connectWait), "device", "wifi",
                                     "connect", request.ssid};
    if (request.hasPassphrase()) {
      args.push_back("password");
      args.push_back(request.passphrase);
    }
    args.push_back("ifname");
    args.push_back(interfaceName);
    out = nmcli(args, waitBudget(m_options.connectWait));
  }

  result.error = classifyExit(out);
  if (result.error != ConnectError::None) {
    result.message = firstLine(out.output);
    if (result.message.empty()) {
      result.message = out.timedOut ? "activation timed out" : "activation failed";
    }
    spdlog::warn("[NM] Connection to '{}' failed: {} ({})", request.ssid,
                 connectErrorToString(result.error), result.message);
    if (saved == before.end()) deleteCreatedProfiles(request.ssid, before);
    return result;
  }

  waitForConnectivity();
  result.ok = true;
  result.message = "Connected to " + request.ssid;
  spdlog::info("[NM] Connected to '{}'.", request.ssid);
  return result;
}

bool NetworkManagerClient::listSaved(std::vector<NetworkProfile>& out) {
  out.clear();
  std::vector<WifiConnection> all;
  if (!listWifiConnections(all)) return false;
  std::map<std::string, NetworkProfile> bySsid;
  for (const auto& conn : all) {
    if (conn.isAccessPoint() || conn.ssid.empty()) continue;
    if (bySsid.count(conn.ssid)) continue;
    NetworkProfile profile;
    profile.ssid = conn.ssid;
    profile.security = securityFromKeyMgmt(conn.keyMgmt);
    profile.connectionId = conn.uuid;
    bySsid[conn.ssid] = profile;
  }
  for (const auto& kv : bySsid) out.push_back(kv.second);
  return true;
}

int NetworkManagerClient::forget(const std::string& ssid) {
  std::vector<WifiConnection> all;
  if (!listWifiConnections(all)) return -1;
  int removed = 0;
  for (const auto& conn : all) {
    if (conn.isAccessPoint() || conn.ssid != ssid) continue;
    if (deleteConnection(conn.uuid)) ++removed;
  }
  spdlog::info("[NM] Forgot {} profile(s) for '{}'.", removed, ssid);
  return removed;
}

int NetworkManagerClient::forgetAll() {
  std::vector<WifiConnection> all;
  if (!listWifiConnections(all)) return -1;
  int removed = 0;
  for (const auto& conn : all) {
    if (conn.isAccessPoint()) continue;
    if (deleteConnection(conn.uuid)) ++removed;
  }
  spdlog::info("[NM] Forgot {} saved profile(s).", removed);
  return removed;
}

int NetworkManagerClient::readSignal(const std::string& interfaceName) {
  Util::CommandOutput out = nmcli({"-t", "-f", "IN-USE,SIGNAL", "device", "wifi", "list",
                                   "ifname", interfaceName, "--rescan", "no"});
  if (!out.ok()) return 0;
  for (const auto& line : lines(out.output)) {
    std::vector<std::string> fields = splitFields(line);
    if (fields.size() >= 2 && fields[0] == "*") return std::atoi(fields[1].c_str());
  }
  return 0;
}

std::string NetworkManagerClient::readIpAddress(const std::string& interfaceName) {
  Util::CommandOutput out = nmcli({"-t", "-f", "IP4.ADDRESS", "device", "show", interfaceName});
  if (!out.ok()) return "";
  for (const auto& line : lines(out.output)) {
    std::vector<std::string> fields = splitFields(line);
    if (fields.size() < 2 || fields[0].compare(0, 11, "IP4.ADDRESS") != 0) continue;
    std::string address = fields[1];
    size_t slash = address.find('/');
    return slash == std::string::npos ? address : address.substr(0, slash);
  }
  return "";
}

bool NetworkManagerClient::currentConnection(const std::string& interfaceName,
                                             ConnectedInfo& out) {
  std::vector<ActiveConnection> active;
  if (!listActive(active)) return false;
  for (const auto& entry : active) {
    if (entry.type != kWifiType || entry.state != "activated") continue;
    if (!interfaceName.empty() && entry.device != interfaceName) continue;
    WifiConnection conn;
    if (!readConnection(entry.uuid, conn) || conn.isAccessPoint()) continue;
    out.ssid = conn.ssid;
    out.interfaceName = entry.device;
    out.security = securityFromKeyMgmt(conn.keyMgmt);
    out.connectionName = entry.name;
    out.signalStrength = readSignal(entry.device);
    out.ipAddress = readIpAddress(entry.device);
    return true;
  }
  return false;
}

Util::ActionResult NetworkManagerClient::activateAccessPoint(const HotspotConfig& config) {
  std::vector<std::string> add = {"connection", "add", "type", "wifi", "ifname",
                                  config.interfaceName, "con-name", kAccessPointName,
                                  "autoconnect", "no", "ssid", config.ssid,
                                  "802-11-wireless.mode", "ap", "802-11-wireless.band", "bg",
                                  "ipv4.method", "manual", "ipv4.addresses",
                                  config.gateway + "/24", "ipv6.method", "ignore"};
  if (config.hasPassphrase()) {
    add.push_back("wifi-sec.key-mgmt");
    add.push_back("wpa-psk");
    add.push_back("wifi-sec.psk");
    add.push_back(config.passphrase);
  }
  Util::CommandOutput created = nmcli(add);
  if (!created.ok()) {
    return Util::failure("Could not create access point profile: " + firstLine(created.output));
  }

  Util::CommandOutput up = nmcli({"--wait", waitArg(m_options.connectWait), "connection", "up",
                                  "id", kAccessPointName, "ifname", config.interfaceName},
                                 waitBudget(m_options.connectWait));
  if (!up.ok()) {
    std::string reason = firstLine(up.output);
    Util::CommandOutput removed = nmcli({"connection", "delete", "id", kAccessPointName});
    if (!removed.ok()) spdlog::warn("[NM] Could not delete access point profile.");
    return Util::failure("Could not activate access point: " + reason);
  }
  return Util::success("Access point '" + config.ssid + "' activated");
}

Util::ActionResult NetworkManagerClient::removeAccessPoints(const std::string& ssid) {
  std::vector<WifiConnection> all;
  if (!listWifiConnections(all)) return Util::failure("NetworkManager is not reachable");
  int removed = 0;
  bool failed = false;
  for (const auto& conn : all) {
    if (!conn.isAccessPoint()) continue;
    if (conn.ssid != ssid && conn.name != kAccessPointName) continue;
    if (deleteConnection(conn.uuid)) {
      ++removed;
    } else {
      failed = true;
    }
  }
  if (failed) return Util::failure("Could not remove every access point profile");
  return Util::success("Removed " + std::to_string(removed) + " access point profile(s)");
}

bool NetworkManagerClient::isAccessPointActive(const std::string& interfaceName) {
  std::vector<ActiveConnection> active;
  if (!listActive(active)) return false;
  for (const auto& entry : active) {
    if (entry.name == kAccessPointName && entry.device == interfaceName &&
        entry.state == "activated") {
      return true;
    }
  }
  return false;
}

}  // namespace Net
