#include "app/IntentChannel.hpp"

#include <spdlog/spdlog.h>

namespace App {
namespace {
IntentResult shuttingDownResult() {
  IntentResult result;
  result.error = "shutting_down";
  result.message = "Portal is shutting down";
  return result;
}
}  // namespace

SubmitStatus IntentChannel::submit(Intent intent, std::chrono::milliseconds timeout,
                                   IntentResult& out) {
  std::unique_lock<std::mutex> lock(m_mutex);
  if (m_closed) {
    out = shuttingDownResult();
    return SubmitStatus::Closed;
  }
  if (m_inFlight) return SubmitStatus::Busy;

  std::shared_ptr<Pending> pending = std::make_shared<Pending>();
  intent.id = m_nextId++;
  pending->id = intent.id;
  m_inFlight = pending;
  m_queue.push_back(intent);
  m_queueCv.notify_all();

  bool finished = m_resultCv.wait_for(lock, timeout, [&]() { return pending->done; });
  if (!finished) {
    // The orchestrator still owns the intent; the slot frees when it completes.
    spdlog::warn("[Intent] #{} timed out waiting for a result.", pending->id);
    return SubmitStatus::TimedOut;
  }
  out = pending->result;
  return m_closed && out.error == "shutting_down" ? SubmitStatus::Closed : SubmitStatus::Completed;
}

void IntentChannel::post(Intent intent) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_closed) return;
  intent.id = m_nextId++;
  m_queue.push_back(intent);
  m_queueCv.notify_all();
}

bool IntentChannel::next(Intent& out, std::chrono::milliseconds wait) {
  std::unique_lock<std::mutex> lock(m_mutex);
  if (!m_queueCv.wait_for(lock, wait, [&]() { return !m_queue.empty(); })) return false;
  // Shutdown overtakes queued work.
  for (auto it = m_queue.begin(); it != m_queue.end(); ++it) {
    if (it->kind == IntentKind::Shutdown) {
      out = *it;
      m_queue.erase(it);
      return true;
    }
  }
  out = m_queue.front();
  m_queue.pop_front();
  return true;
}

void IntentChannel::complete(const Intent& intent, const IntentResult& result) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_inFlight || m_inFlight->id != intent.id) return;
  m_inFlight->result = result;
  m_inFlight->done = true;
  m_inFlight.reset();
  m_resultCv.notify_all();
}

void IntentChannel::close() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_closed) return;
  m_closed = true;
  if (m_inFlight) {
    m_inFlight->result = shuttingDownResult();
    m_inFlight->done = true;
    m_inFlight.reset();
  }
  m_queue.clear();
  m_resultCv.notify_all();
  m_queueCv.notify_all();
}

bool IntentChannel::closed() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_closed;
}

}  // namespace App
