#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "net/WifiTypes.hpp"

namespace App {

enum class Phase {
  Init,
  Scanning,
  HotspotUp,
  ConnectAttempt,
  Connected,
  TimedOut,
  ShuttingDown,
};

const char* phaseToString(Phase phase);

// One published view of the orchestrator state. Never modified after publish().
struct StatusSnapshot {
  Phase phase = Phase::Init;
  bool hotspotActive = false;
  std::string connectedSsid;
  std::string lastError;
  std::string lastMessage;
  std::vector<Net::ScanResult> networks;
  std::chrono::system_clock::time_point networksUpdatedAt;
  uint64_t version = 0;
};

class StatusBoard {
 public:
  StatusBoard() : m_current(std::make_shared<StatusSnapshot>()) {}

  void publish(StatusSnapshot next) {
    std::lock_guard<std::mutex> lock(m_mutex);
    next.version = m_current->version + 1;
    m_current = std::make_shared<const StatusSnapshot>(std::move(next));
  }

  std::shared_ptr<const StatusSnapshot> snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
  }

 private:
  mutable std::mutex m_mutex;
  std::shared_ptr<const StatusSnapshot> m_current;
};

}  // namespace App
