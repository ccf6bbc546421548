#pragma once

#include <atomic>
#include <functional>
#include <thread>

namespace Util {

// Consumes SIGINT/SIGQUIT/SIGTERM/SIGHUP on a dedicated thread. The signals must be
// blocked in every thread, so blockExitSignals() runs before any thread is created.
class SignalWatcher {
 public:
  using Handler = std::function<void(int)>;

  ~SignalWatcher();

  static bool blockExitSignals();

  bool start(Handler handler);
  void stop();

 private:
  void loop();

  Handler m_handler;
  std::atomic<bool> m_running{false};
  std::thread m_thread;
};

}  // namespace Util
