#include "app/StatusBoard.hpp"

namespace App {

const char* phaseToString(Phase phase) {
  switch (phase) {
    case Phase::Init: return "init";
    case Phase::Scanning: return "scanning";
    case Phase::HotspotUp: return "hotspot_up";
    case Phase::ConnectAttempt: return "connect_attempt";
    case Phase::Connected: return "connected";
    case Phase::TimedOut: return "timed_out";
    case Phase::ShuttingDown: return "shutting_down";
    default: return "unknown";
  }
}

}  // namespace App
