#include "util/SignalWatcher.hpp"

#include <cerrno>
#include <cstring>

#include <signal.h>
#include <pthread.h>
#include <time.h>

#include <spdlog/spdlog.h>

namespace Util {
namespace {
constexpr long kWaitSliceNs = 200L * 1000L * 1000L;

void fillExitSignals(sigset_t& set) {
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGQUIT);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, SIGHUP);
}
}  // namespace

SignalWatcher::~SignalWatcher() { stop(); }

bool SignalWatcher::blockExitSignals() {
  sigset_t set;
  fillExitSignals(set);
  int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
  if (rc != 0) {
    spdlog::error("[Signal] Failed to block signals: {}", strerror(rc));
    return false;
  }
  return true;
}

bool SignalWatcher::start(Handler handler) {
  if (m_running.load()) return true;
  m_handler = std::move(handler);
  m_running.store(true);
  m_thread = std::thread([this]() { loop(); });
  return true;
}

void SignalWatcher::stop() {
  m_running.store(false);
  if (m_thread.joinable()) m_thread.join();
}

void SignalWatcher::loop() {
  sigset_t set;
  fillExitSignals(set);
  struct timespec slice;
  slice.tv_sec = 0;
  slice.tv_nsec = kWaitSliceNs;

  while (m_running.load()) {
    int sig = sigtimedwait(&set, nullptr, &slice);
    if (sig < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      spdlog::error("[Signal] sigtimedwait failed: {}", strerror(errno));
      break;
    }
    spdlog::info("[Signal] Received {}", strsignal(sig));
    if (m_handler) m_handler(sig);
  }
}

}  // namespace Util
