/**
 * @file DhcpDnsConfigurator.cpp
 * @brief dnsmasq argument generation and restart with bind-failure retries.
 */
#include "net/DhcpDnsConfigurator.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <thread>

#include <signal.h>

#include <spdlog/spdlog.h>

namespace Net {
namespace {
constexpr auto kStalePoll = std::chrono::milliseconds(100);

bool readPid(const std::string& path, int& pid) {
  std::ifstream in(path);
  if (!in) return false;
  in >> pid;
  return static_cast<bool>(in) && pid > 0;
}

// Guards against signalling an unrelated process that reused the pid.
bool isDnsmasq(int pid) {
  std::ifstream comm("/proc/" + std::to_string(pid) + "/comm");
  std::string name;
  if (!comm || !std::getline(comm, name)) return false;
  return name == "dnsmasq";
}
}  // namespace

DhcpDnsConfigurator::DhcpDnsConfigurator(Util::ProcessRunner& runner, DhcpOptions options)
    : m_runner(runner), m_options(options) {}

DhcpDnsConfigurator::~DhcpDnsConfigurator() { stop(); }

std::vector<std::string> DhcpDnsConfigurator::buildArguments(const HotspotConfig& config,
                                                             const std::string& interfaceName) {
  std::vector<std::string> args;
  if (!config.noDhcpDns) {
    args.push_back("--address=/#/" + config.gateway);
  }
  args.push_back("--dhcp-range=" + config.dhcpRange());

  // The router flag only matters once the gateway itself is withheld.
  if (!config.noDhcpGateway) {
    args.push_back("--dhcp-option=option:router," + config.gateway);
  } else if (config.noDhcpRouterOption || config.mode == HotspotMode::WifiDirect) {
    args.push_back("--dhcp-option=3");
  }

  if (!config.noDhcpDns) {
    args.push_back("--dhcp-option=option:dns-server," + config.gateway);
  }
  args.push_back("--interface=" + interfaceName);
  args.push_back("--keep-in-foreground");
  args.push_back("--bind-interfaces");
  args.push_back("--except-interface=lo");
  args.push_back("--conf-file");
  args.push_back("--no-hosts");
  return args;
}

bool DhcpDnsConfigurator::running() { return m_child && m_child->running(); }

void DhcpDnsConfigurator::stop() {
  if (m_child) {
    spdlog::info("[DHCP] Stopping dnsmasq (pid {}).", m_child->pid());
    m_child->terminate(m_options.stopGrace);
    m_child.reset();
    removePidFile();
  }
}

void DhcpDnsConfigurator::stopStale() {
  if (m_options.pidFile.empty()) return;
  int pid = 0;
  if (!readPid(m_options.pidFile, pid)) return;
  if (Util::processAlive(pid) && isDnsmasq(pid)) {
    spdlog::warn("[DHCP] Stopping stale dnsmasq (pid {}).", pid);
    kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + m_options.stopGrace;
    while (Util::processAlive(pid) && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(kStalePoll);
    }
    if (Util::processAlive(pid)) kill(pid, SIGKILL);
  }
  removePidFile();
}

void DhcpDnsConfigurator::writePidFile(int pid) {
  if (m_options.pidFile.empty()) return;
  std::ofstream out(m_options.pidFile, std::ios::trunc);
  if (!out) {
    spdlog::warn("[DHCP] Cannot write {}: {}", m_options.pidFile, strerror(errno));
    return;
  }
  out << pid << "\n";
}

void DhcpDnsConfigurator::removePidFile() {
  if (m_options.pidFile.empty()) return;
  if (std::remove(m_options.pidFile.c_str()) != 0 && errno != ENOENT) {
    spdlog::warn("[DHCP] Cannot remove {}: {}", m_options.pidFile, strerror(errno));
  }
}

Util::ActionResult DhcpDnsConfigurator::restart(const HotspotConfig& config,
                                                const std::string& interfaceName) {
  stop();
  stopStale();

  std::vector<std::string> argv;
  argv.push_back(m_options.binary);
  std::vector<std::string> args = buildArguments(config, interfaceName);
  argv.insert(argv.end(), args.begin(), args.end());

  for (int attempt = 1; attempt <= m_options.maxAttempts; ++attempt) {
    spdlog::info("[DHCP] Starting dnsmasq on {} (attempt {}/{}).", interfaceName, attempt,
                 m_options.maxAttempts);
    std::unique_ptr<Util::ChildHandle> child = m_runner.spawn(argv);
    if (child) {
      // A bind failure makes dnsmasq exit right away.
      std::this_thread::sleep_for(m_options.startupGrace);
      if (child->running()) {
        writePidFile(child->pid());
        m_child = std::move(child);
        spdlog::info("[DHCP] dnsmasq running (pid {}).", m_child->pid());
        return Util::success("dnsmasq running on " + interfaceName);
      }
      spdlog::warn("[DHCP] dnsmasq exited during startup.");
    }
    if (attempt < m_options.maxAttempts) {
      std::this_thread::sleep_for(m_options.backoff * attempt);
    }
  }
  spdlog::error("[DHCP] Giving up after {} attempts.", m_options.maxAttempts);
  return Util::failure("dnsmasq could not bind to " + interfaceName);
}

}  // namespace Net
