/**
 * @file ConnectionOrchestrator.cpp
 * @brief Orchestrator control loop and intent handlers.
 */
#include "app/ConnectionOrchestrator.hpp"

#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace App {
namespace {
IntentResult failed(const std::string& error, const std::string& message) {
  IntentResult result;
  result.error = error;
  result.message = message;
  return result;
}

IntentResult succeeded(const std::string& message) {
  IntentResult result;
  result.success = true;
  result.message = message;
  return result;
}

const char* exitCodeName(ExitCode code) {
  switch (code) {
    case ExitCode::Success: return "success";
    case ExitCode::ConfigError: return "config error";
    case ExitCode::BusUnavailable: return "NetworkManager unavailable";
    case ExitCode::HotspotFailure: return "hotspot failure";
    case ExitCode::DhcpFailure: return "DHCP failure";
    case ExitCode::NotRoot: return "not root";
    case ExitCode::PortalFailure: return "portal failure";
    default: return "unknown";
  }
}
}  // namespace

ConnectionOrchestrator::ConnectionOrchestrator(const Net::HotspotConfig& config,
                                               Net::NetworkControl& network, Net::Hotspot& hotspot,
                                               Net::DhcpService& dhcp, IntentChannel& channel,
                                               StatusBoard& status, OrchestratorOptions options)
    : m_config(config),
      m_network(network),
      m_hotspot(hotspot),
      m_dhcp(dhcp),
      m_channel(channel),
      m_status(status),
      m_options(options) {}

void ConnectionOrchestrator::publish() {
  m_state.hotspotActive = m_hotspot.isActive();
  m_status.publish(m_state);
}

void ConnectionOrchestrator::setPhase(Phase phase) {
  if (m_state.phase != phase) {
    spdlog::info("[Orchestrator] {} -> {}", phaseToString(m_state.phase), phaseToString(phase));
  }
  m_state.phase = phase;
  publish();
}

void ConnectionOrchestrator::requestExit(ExitCode code) {
  m_exitCode = code;
  m_done = true;
}

ExitCode ConnectionOrchestrator::run() {
  m_state = StatusSnapshot();
  m_done = false;
  m_exitCode = ExitCode::Success;
  setPhase(Phase::Init);

  if (!m_network.isAvailable()) {
    spdlog::error("[Orchestrator] NetworkManager is not reachable.");
    m_state.lastError = "unavailable";
    m_state.lastMessage = "NetworkManager is not reachable";
    requestExit(ExitCode::BusUnavailable);
    return finish();
  }
  if (m_config.mode == Net::HotspotMode::Standard) {
    Util::ActionResult stale = m_network.removeAccessPoints(m_config.ssid);
    if (!stale.ok) spdlog::warn("[Orchestrator] {}", stale.message);
  }

  setPhase(Phase::Scanning);
  refreshNetworks();

  if (!startHotspot()) return finish();

  while (!m_done) {
    Intent intent;
    if (!m_channel.next(intent, m_options.idlePoll)) continue;
    dispatch(intent);
  }
  return finish();
}

void ConnectionOrchestrator::dispatch(const Intent& intent) {
  IntentResult result;
  switch (intent.kind) {
    case IntentKind::Connect:
      result = handleConnect(intent.request);
      break;
    case IntentKind::Forget:
      result = handleForget(intent.ssid);
      break;
    case IntentKind::ForgetAll:
      result = handleForgetAll();
      break;
    case IntentKind::Rescan:
      result = handleRescan();
      break;
    case IntentKind::Shutdown:
      handleShutdown(intent.reason);
      return;
  }
  m_channel.complete(intent, result);
}

void ConnectionOrchestrator::refreshNetworks() {
  m_state.networks = m_network.scan(m_config.interfaceName);
  m_state.networksUpdatedAt = std::chrono::system_clock::now();
  publish();
}

bool ConnectionOrchestrator::startHotspot() {
  Util::ActionResult started;
  for (int attempt = 1; attempt <= m_options.hotspotStartAttempts; ++attempt) {
    started = m_hotspot.start();
    if (started.ok) break;
    spdlog::warn("[Orchestrator] Hotspot start attempt {}/{} failed: {}", attempt,
                 m_options.hotspotStartAttempts, started.message);
    if (attempt < m_options.hotspotStartAttempts) {
      std::this_thread::sleep_for(m_options.hotspotRetryBackoff);
    }
  }
  if (!started.ok) {
    m_state.lastError = "hotspot_failure";
    m_state.lastMessage = started.message;
    requestExit(ExitCode::HotspotFailure);
    return false;
  }

  Util::ActionResult dhcp = m_dhcp.restart(m_config, m_hotspot.servingInterface());
  if (!dhcp.ok) {
    spdlog::error("[Orchestrator] {}", dhcp.message);
    m_state.lastError = "hotspot_failure";
    m_state.lastMessage = dhcp.message;
    requestExit(ExitCode::DhcpFailure);
    return false;
  }

  if (m_portal && !m_portalStarted) {
    if (!m_portal->begin()) {
      m_state.lastMessage = "Portal listener could not start";
      requestExit(ExitCode::PortalFailure);
      return false;
    }
    m_portalStarted = true;
  }

  m_state.connectedSsid.clear();
  setPhase(Phase::HotspotUp);
  if (m_watchdog) m_watchdog->arm();
  return true;
}

void ConnectionOrchestrator::stopHotspot() {
  if (m_watchdog) m_watchdog->suspend();
  m_dhcp.stop();
  Util::ActionResult stopped = m_hotspot.stop();
  if (!stopped.ok) spdlog::warn("[Orchestrator] {}", stopped.message);
  publish();
}

bool ConnectionOrchestrator::restartHotspot() {
  stopHotspot();
  return startHotspot();
}

IntentResult ConnectionOrchestrator::handleConnect(const Net::ConnectionRequest& request) {
  if (!Net::isValidSsid(request.ssid)) {
    return failed("invalid_request", "SSID must be 1-32 bytes");
  }
  setPhase(Phase::ConnectAttempt);
  stopHotspot();

  int attempts = 1 + (m_options.connectTimeoutRetries > 0 ? m_options.connectTimeoutRetries : 0);
  Net::ConnectResult result;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    spdlog::info("[Orchestrator] Connecting to '{}' (attempt {}/{}).", request.ssid, attempt,
                 attempts);
    result = m_network.connect(m_config.interfaceName, request);
    if (result.ok || result.error != Net::ConnectError::Timeout) break;
  }

  if (result.ok) {
    m_state.connectedSsid = request.ssid;
    m_state.lastError.clear();
    m_state.lastMessage = result.message;
    setPhase(Phase::Connected);
    if (m_options.exitOnConnect) requestExit(ExitCode::Success);
    return succeeded(result.message);
  }

  std::string error = Net::connectErrorToString(result.error);
  m_state.lastError = error;
  m_state.lastMessage = result.message;
  if (!startHotspot()) {
    spdlog::error("[Orchestrator] Hotspot could not be restored after a failed connect.");
  }
  return failed(error, result.message);
}

IntentResult ConnectionOrchestrator::handleForget(const std::string& ssid) {
  if (ssid.empty()) return failed("invalid_request", "Missing SSID");
  int removed = m_network.forget(ssid);
  if (removed < 0) return failed("unavailable", "NetworkManager is not reachable");
  if (removed == 0) return failed("not_found", "No saved network named '" + ssid + "'");

  if (m_state.phase == Phase::Connected) {
    Net::ConnectedInfo info;
    std::vector<Net::NetworkProfile> saved;
    bool stillConnected = m_network.currentConnection(m_config.interfaceName, info);
    bool noneSaved = m_network.listSaved(saved) && saved.empty();
    if (!stillConnected || noneSaved) {
      spdlog::info("[Orchestrator] {}, starting hotspot.",
                   stillConnected ? "No saved networks left" : "Active connection forgotten");
      m_state.connectedSsid.clear();
      if (!startHotspot()) return failed("hotspot_failure", m_state.lastMessage);
    }
  }
  return succeeded("Forgot " + std::to_string(removed) + " profile(s) for '" + ssid + "'");
}

IntentResult ConnectionOrchestrator::handleForgetAll() {
  int removed = m_network.forgetAll();
  if (removed < 0) return failed("unavailable", "NetworkManager is not reachable");
  std::string message = "Forgot " + std::to_string(removed) + " saved network(s)";
  if (!restartHotspot()) return failed("hotspot_failure", m_state.lastMessage);
  return succeeded(message);
}

IntentResult ConnectionOrchestrator::handleRescan() {
  bool hadHotspot = m_state.phase == Phase::HotspotUp;
  if (hadHotspot) {
    setPhase(Phase::Scanning);
    stopHotspot();
  }
  refreshNetworks();
  if (hadHotspot && !startHotspot()) return failed("hotspot_failure", m_state.lastMessage);

  IntentResult result = succeeded("Found " + std::to_string(m_state.networks.size()) + " networks");
  result.networks = m_state.networks;
  return result;
}

void ConnectionOrchestrator::handleShutdown(ShutdownReason reason) {
  if (reason == ShutdownReason::ActivityTimeout) setPhase(Phase::TimedOut);
  requestExit(ExitCode::Success);
}

ExitCode ConnectionOrchestrator::finish() {
  setPhase(Phase::ShuttingDown);
  m_channel.close();
  if (m_watchdog) m_watchdog->suspend();
  m_dhcp.stop();
  Util::ActionResult stopped = m_hotspot.stop();
  if (!stopped.ok) spdlog::warn("[Orchestrator] {}", stopped.message);
  publish();
  spdlog::info("[Orchestrator] Exiting: {}", exitCodeName(m_exitCode));
  return m_exitCode;
}

}  // namespace App
