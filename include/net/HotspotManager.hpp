/**
 * @file HotspotManager.hpp
 * @brief Access point / P2P group lifecycle.
 *
 * Two backends share one start/stop contract: a NetworkManager access point
 * (Standard) and a wpa_supplicant autonomous P2P group (WifiDirect).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "net/HotspotConfig.hpp"
#include "net/NetworkControl.hpp"
#include "util/Process.hpp"
#include "util/Result.hpp"

namespace Net {

enum class HotspotState {
  Down,
  Starting,
  Up,
  Stopping,
};

const char* hotspotStateToString(HotspotState state);

class Hotspot {
 public:
  virtual ~Hotspot() = default;

  virtual Util::ActionResult start() = 0;
  virtual Util::ActionResult stop() = 0;
  virtual bool isActive() const = 0;
  virtual std::string servingInterface() const = 0;
};

struct HotspotTiming {
  std::chrono::milliseconds upTimeout{15000};
  std::chrono::milliseconds pollInterval{500};
  std::chrono::milliseconds groupTimeout{10000};
  std::chrono::milliseconds commandTimeout{10000};
  std::string sysClassNet = "/sys/class/net";
};

class HotspotBackend {
 public:
  virtual ~HotspotBackend() = default;

  virtual const char* name() const = 0;
  virtual Util::ActionResult bringUp() = 0;
  virtual Util::ActionResult tearDown() = 0;
  virtual std::string interfaceName() const = 0;
};

class AccessPointBackend : public HotspotBackend {
 public:
  AccessPointBackend(const HotspotConfig& config, NetworkControl& network, HotspotTiming timing);

  const char* name() const override { return "access point"; }
  Util::ActionResult bringUp() override;
  Util::ActionResult tearDown() override;
  std::string interfaceName() const override { return m_config.interfaceName; }

 private:
  HotspotConfig m_config;
  NetworkControl& m_network;
  HotspotTiming m_timing;
};

class WifiDirectBackend : public HotspotBackend {
 public:
  WifiDirectBackend(const HotspotConfig& config, Util::ProcessRunner& runner, HotspotTiming timing);

  const char* name() const override { return "wifi-direct group"; }
  Util::ActionResult bringUp() override;
  Util::ActionResult tearDown() override;
  // The p2p-<iface>-N group interface once the group exists.
  std::string interfaceName() const override;

 private:
  bool hasP2pDevice();
  Util::ActionResult wpaCli(const std::string& iface, const std::vector<std::string>& args);
  Util::ActionResult runTool(const std::vector<std::string>& argv);
  bool findGroupInterface(std::string& out) const;

  HotspotConfig m_config;
  Util::ProcessRunner& m_runner;
  HotspotTiming m_timing;
  std::string m_groupInterface;
};

class HotspotManager : public Hotspot {
 public:
  HotspotManager(const HotspotConfig& config, NetworkControl& network, Util::ProcessRunner& runner,
                 HotspotTiming timing = HotspotTiming());
  explicit HotspotManager(std::unique_ptr<HotspotBackend> backend);

  Util::ActionResult start() override;
  Util::ActionResult stop() override;
  bool isActive() const override { return m_state.load() == HotspotState::Up; }
  std::string servingInterface() const override { return m_backend->interfaceName(); }

  HotspotState state() const { return m_state.load(); }

 private:
  std::unique_ptr<HotspotBackend> m_backend;
  std::atomic<HotspotState> m_state{HotspotState::Down};
};

}  // namespace Net
