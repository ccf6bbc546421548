/**
 * @file DhcpDnsConfigurator.hpp
 * @brief dnsmasq lifecycle for the hotspot interface.
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "net/HotspotConfig.hpp"
#include "util/Process.hpp"
#include "util/Result.hpp"

namespace Net {

class DhcpService {
 public:
  virtual ~DhcpService() = default;

  // Stops any previous instance, then starts a fresh one bound to interfaceName.
  virtual Util::ActionResult restart(const HotspotConfig& config,
                                     const std::string& interfaceName) = 0;
  virtual void stop() = 0;
  virtual bool running() = 0;
};

struct DhcpOptions {
  int maxAttempts = 3;
  std::chrono::milliseconds backoff{1000};  // multiplied by the attempt number
  std::chrono::milliseconds startupGrace{500};
  std::chrono::milliseconds stopGrace{5000};
  std::string pidFile = "/run/wifi-portal-dnsmasq.pid";  // empty disables stale cleanup
  std::string binary = "dnsmasq";
};

class DhcpDnsConfigurator : public DhcpService {
 public:
  explicit DhcpDnsConfigurator(Util::ProcessRunner& runner, DhcpOptions options = DhcpOptions());
  ~DhcpDnsConfigurator() override;

  Util::ActionResult restart(const HotspotConfig& config,
                             const std::string& interfaceName) override;
  void stop() override;
  bool running() override;

  // dnsmasq arguments (without the binary) for the given mode and flags.
  static std::vector<std::string> buildArguments(const HotspotConfig& config,
                                                 const std::string& interfaceName);

 private:
  void stopStale();
  void writePidFile(int pid);
  void removePidFile();

  Util::ProcessRunner& m_runner;
  DhcpOptions m_options;
  std::unique_ptr<Util::ChildHandle> m_child;
};

}  // namespace Net
