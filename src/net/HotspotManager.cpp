/**
 * @file HotspotManager.cpp
 * @brief Hotspot state transitions and the two backends.
 */
#include "net/HotspotManager.hpp"

#include <thread>

#include <dirent.h>

#include <spdlog/spdlog.h>

namespace Net {
namespace {
constexpr char kDeviceNamePrefix[] = "DIRECT-";
constexpr char kGroupFrequency[] = "freq=2412";
constexpr char kGroupOwnerIntent[] = "15";
}  // namespace

const char* hotspotStateToString(HotspotState state) {
  switch (state) {
    case HotspotState::Down: return "down";
    case HotspotState::Starting: return "starting";
    case HotspotState::Up: return "up";
    case HotspotState::Stopping: return "stopping";
    default: return "unknown";
  }
}

// ---------------------------------------------------------------------------
// AccessPointBackend

AccessPointBackend::AccessPointBackend(const HotspotConfig& config, NetworkControl& network,
                                       HotspotTiming timing)
    : m_config(config), m_network(network), m_timing(timing) {}

Util::ActionResult AccessPointBackend::bringUp() {
  Util::ActionResult cleared = m_network.removeAccessPoints(m_config.ssid);
  if (!cleared.ok) spdlog::warn("[Hotspot] {}", cleared.message);

  Util::ActionResult activated = m_network.activateAccessPoint(m_config);
  if (!activated.ok) return activated;

  auto deadline = std::chrono::steady_clock::now() + m_timing.upTimeout;
  while (true) {
    if (m_network.isAccessPointActive(m_config.interfaceName)) {
      return Util::success("Access point '" + m_config.ssid + "' is up on " +
                           m_config.interfaceName);
    }
    if (std::chrono::steady_clock::now() >= deadline) break;
    std::this_thread::sleep_for(m_timing.pollInterval);
  }
  return Util::failure("Access point did not become active on " + m_config.interfaceName);
}

Util::ActionResult AccessPointBackend::tearDown() {
  return m_network.removeAccessPoints(m_config.ssid);
}

// ---------------------------------------------------------------------------
// WifiDirectBackend

WifiDirectBackend::WifiDirectBackend(const HotspotConfig& config, Util::ProcessRunner& runner,
                                     HotspotTiming timing)
    : m_config(config), m_runner(runner), m_timing(timing) {}

std::string WifiDirectBackend::interfaceName() const {
  if (!m_groupInterface.empty()) return m_groupInterface;
  return "p2p-" + m_config.interfaceName + "-0";
}

Util::ActionResult WifiDirectBackend::runTool(const std::vector<std::string>& argv) {
  spdlog::debug("[P2P] {}", Util::describeCommand(argv));
  Util::CommandOutput out = m_runner.run(argv, m_timing.commandTimeout);
  if (!out.launched) return Util::failure("Cannot run " + argv.front());
  if (out.timedOut) return Util::failure(argv.front() + " timed out");
  if (out.exitCode != 0) {
    return Util::failure(argv.front() + " failed (exit " + std::to_string(out.exitCode) + ")");
  }
  return Util::success(out.output);
}

Util::ActionResult WifiDirectBackend::wpaCli(const std::string& iface,
                                             const std::vector<std::string>& args) {
  std::vector<std::string> argv = {"wpa_cli", "-i", iface};
  argv.insert(argv.end(), args.begin(), args.end());
  Util::ActionResult result = runTool(argv);
  // wpa_cli exits 0 even when the request is refused.
  if (result.ok && result.message.find("FAIL") != std::string::npos) {
    return Util::failure("wpa_cli " + args.front() + " refused");
  }
  return result;
}

bool WifiDirectBackend::hasP2pDevice() {
  Util::ActionResult out = runTool({"iw", "dev"});
  return out.ok && out.message.find("type P2P-device") != std::string::npos;
}

bool WifiDirectBackend::findGroupInterface(std::string& out) const {
  DIR* dir = opendir(m_timing.sysClassNet.c_str());
  if (!dir) return false;
  const std::string prefix = "p2p-" + m_config.interfaceName + "-";
  bool found = false;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name.compare(0, prefix.size(), prefix) == 0) {
      out = name;
      found = true;
      break;
    }
  }
  closedir(dir);
  return found;
}

Util::ActionResult WifiDirectBackend::bringUp() {
  if (!hasP2pDevice()) {
    return Util::failure("No P2P device available; is wpa_supplicant running with P2P support?");
  }

  const std::string& iface = m_config.interfaceName;
  Util::ActionResult step =
      wpaCli(iface, {"set", "device_name", std::string(kDeviceNamePrefix) + m_config.ssid});
  if (!step.ok) return step;
  step = wpaCli(iface, {"set", "p2p_go_intent", kGroupOwnerIntent});
  if (!step.ok) return step;
  step = wpaCli(iface, {"p2p_group_add", kGroupFrequency});
  if (!step.ok) return step;

  auto deadline = std::chrono::steady_clock::now() + m_timing.groupTimeout;
  std::string group;
  while (!findGroupInterface(group)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return Util::failure("P2P group interface did not appear");
    }
    std::this_thread::sleep_for(m_timing.pollInterval);
  }
  m_groupInterface = group;
  spdlog::info("[P2P] Group interface {} is up.", group);

  if (m_config.hasPassphrase()) {
    step = wpaCli(group, {"wps_pin", "any", m_config.passphrase});
  } else {
    step = wpaCli(group, {"wps_pbc"});
  }
  if (!step.ok) return step;

  step = runTool({"ip", "addr", "add", m_config.gateway + "/24", "dev", group});
  if (!step.ok) return step;
  step = runTool({"ip", "link", "set", group, "up"});
  if (!step.ok) return step;
  return Util::success("WiFi Direct group " + group + " ready as DIRECT-" + m_config.ssid);
}

Util::ActionResult WifiDirectBackend::tearDown() {
  std::string group = m_groupInterface;
  if (group.empty() && !findGroupInterface(group)) {
    return Util::success("No P2P group to remove");
  }
  Util::ActionResult removed = wpaCli(m_config.interfaceName, {"p2p_group_remove", group});
  if (removed.ok) m_groupInterface.clear();
  return removed;
}

// ---------------------------------------------------------------------------
// HotspotManager

namespace {
std::unique_ptr<HotspotBackend> makeBackend(const HotspotConfig& config, NetworkControl& network,
                                            Util::ProcessRunner& runner, HotspotTiming timing) {
  if (config.mode == HotspotMode::WifiDirect) {
    return std::make_unique<WifiDirectBackend>(config, runner, timing);
  }
  return std::make_unique<AccessPointBackend>(config, network, timing);
}
}  // namespace

HotspotManager::HotspotManager(const HotspotConfig& config, NetworkControl& network,
                               Util::ProcessRunner& runner, HotspotTiming timing)
    : m_backend(makeBackend(config, network, runner, timing)) {}

HotspotManager::HotspotManager(std::unique_ptr<HotspotBackend> backend)
    : m_backend(std::move(backend)) {}

Util::ActionResult HotspotManager::start() {
  HotspotState current = m_state.load();
  if (current == HotspotState::Up) return Util::success("Hotspot already up");
  if (current != HotspotState::Down) {
    return Util::failure(std::string("Hotspot is ") + hotspotStateToString(current));
  }

  m_state.store(HotspotState::Starting);
  spdlog::info("[Hotspot] Starting {}...", m_backend->name());
  Util::ActionResult result = m_backend->bringUp();
  if (!result.ok) {
    spdlog::error("[Hotspot] Start failed: {}", result.message);
    Util::ActionResult rollback = m_backend->tearDown();
    if (!rollback.ok) spdlog::warn("[Hotspot] Rollback incomplete: {}", rollback.message);
    m_state.store(HotspotState::Down);
    return result;
  }
  m_state.store(HotspotState::Up);
  spdlog::info("[Hotspot] {}", result.message);
  return result;
}

Util::ActionResult HotspotManager::stop() {
  HotspotState current = m_state.load();
  if (current == HotspotState::Down) return Util::success("Hotspot already down");

  m_state.store(HotspotState::Stopping);
  spdlog::info("[Hotspot] Stopping {}...", m_backend->name());
  Util::ActionResult result = m_backend->tearDown();
  m_state.store(HotspotState::Down);
  if (!result.ok) {
    spdlog::warn("[Hotspot] Teardown reported: {}", result.message);
    return result;
  }
  return Util::success("Hotspot stopped");
}

}  // namespace Net
