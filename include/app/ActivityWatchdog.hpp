#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace App {

// Fires the expiry handler once if no touch() happens within the timeout while
// armed. A zero timeout disables the watchdog entirely.
class ActivityWatchdog {
 public:
  using ExpiryHandler = std::function<void()>;

  ActivityWatchdog(std::chrono::milliseconds timeout, ExpiryHandler onExpiry);
  ~ActivityWatchdog();

  bool enabled() const { return m_timeout.count() > 0; }

  void arm();
  void suspend();
  void touch();
  void stop();

 private:
  void loop();

  std::chrono::milliseconds m_timeout;
  ExpiryHandler m_onExpiry;
  std::mutex m_mutex;
  std::condition_variable m_cv;
  std::chrono::steady_clock::time_point m_deadline;
  bool m_armed = false;
  bool m_fired = false;
  bool m_stopping = false;
  std::thread m_thread;
};

}  // namespace App
