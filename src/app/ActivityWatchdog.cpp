#include "app/ActivityWatchdog.hpp"

#include <spdlog/spdlog.h>

namespace App {

ActivityWatchdog::ActivityWatchdog(std::chrono::milliseconds timeout, ExpiryHandler onExpiry)
    : m_timeout(timeout), m_onExpiry(std::move(onExpiry)) {
  if (enabled()) m_thread = std::thread([this]() { loop(); });
}

ActivityWatchdog::~ActivityWatchdog() { stop(); }

void ActivityWatchdog::arm() {
  if (!enabled()) return;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_armed) spdlog::debug("[Watchdog] Armed for {} ms.", m_timeout.count());
  m_armed = true;
  m_deadline = std::chrono::steady_clock::now() + m_timeout;
  m_cv.notify_all();
}

void ActivityWatchdog::suspend() {
  if (!enabled()) return;
  std::lock_guard<std::mutex> lock(m_mutex);
  m_armed = false;
  m_cv.notify_all();
}

void ActivityWatchdog::touch() {
  if (!enabled()) return;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_armed) m_deadline = std::chrono::steady_clock::now() + m_timeout;
}

void ActivityWatchdog::stop() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping = true;
    m_cv.notify_all();
  }
  if (m_thread.joinable()) m_thread.join();
}

void ActivityWatchdog::loop() {
  std::unique_lock<std::mutex> lock(m_mutex);
  while (!m_stopping) {
    if (!m_armed || m_fired) {
      m_cv.wait(lock);
      continue;
    }
    if (std::chrono::steady_clock::now() < m_deadline) {
      m_cv.wait_until(lock, m_deadline);
      continue;
    }
    m_fired = true;
    m_armed = false;
    spdlog::info("[Watchdog] No activity for {} s, shutting down.",
                 std::chrono::duration_cast<std::chrono::seconds>(m_timeout).count());
    lock.unlock();
    if (m_onExpiry) m_onExpiry();
    lock.lock();
  }
}

}  // namespace App
