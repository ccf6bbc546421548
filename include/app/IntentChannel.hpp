/**
 * @file IntentChannel.hpp
 * @brief Ordered request/response channel from the portal to the orchestrator.
 *
 * Portal handlers submit() and block for the matching result. At most one
 * submitted intent is in flight; a second submitter gets Busy. Shutdown intents
 * from the watchdog and signal watcher use post() and are never refused.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "net/WifiTypes.hpp"

namespace App {

enum class IntentKind {
  Connect,
  Forget,
  ForgetAll,
  Rescan,
  Shutdown,
};

enum class ShutdownReason {
  None,
  ActivityTimeout,
  Signal,
};

struct Intent {
  uint64_t id = 0;
  IntentKind kind = IntentKind::Shutdown;
  Net::ConnectionRequest request;  // Connect
  std::string ssid;                // Forget
  ShutdownReason reason = ShutdownReason::None;
};

struct IntentResult {
  bool success = false;
  std::string error;  // portal error vocabulary, empty on success
  std::string message;
  std::vector<Net::ScanResult> networks;  // Rescan
};

enum class SubmitStatus {
  Completed,
  Busy,
  TimedOut,
  Closed,
};

class IntentChannel {
 public:
  SubmitStatus submit(Intent intent, std::chrono::milliseconds timeout, IntentResult& out);
  void post(Intent intent);

  // Orchestrator side. Returns false when nothing arrived within wait.
  bool next(Intent& out, std::chrono::milliseconds wait);
  void complete(const Intent& intent, const IntentResult& result);

  // Answers every pending submitter with shutting_down and refuses new ones.
  void close();
  bool closed() const;

 private:
  struct Pending {
    uint64_t id = 0;
    bool done = false;
    IntentResult result;
  };

  mutable std::mutex m_mutex;
  std::condition_variable m_queueCv;
  std::condition_variable m_resultCv;
  std::deque<Intent> m_queue;
  std::shared_ptr<Pending> m_inFlight;
  uint64_t m_nextId = 1;
  bool m_closed = false;
};

}  // namespace App
