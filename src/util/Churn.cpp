#include "util/Churn.hpp"

#include <deque>
#include <mutex>

namespace tasktop::util {

struct ChurnEvent { std::chrono::steady_clock::time_point t; ChurnKind kind; };

static std::mutex g_mu;
static std::deque<ChurnEvent> g_events; // ~10s window

static void prune_older_than(std::chrono::steady_clock::time_point cutoff) {
  while (!g_events.empty() && g_events.front().t < cutoff) g_events.pop_front();
}

void note_churn(ChurnKind kind) {
  auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lk(g_mu);
  prune_older_than(now - std::chrono::seconds(10));
  g_events.push_back(ChurnEvent{now, kind});
}

static int count_since(std::chrono::milliseconds window, const ChurnKind* kind) {
  auto now = std::chrono::steady_clock::now();
  auto cutoff = now - window;
  std::lock_guard<std::mutex> lk(g_mu);
  prune_older_than(now - std::chrono::seconds(10));
  int c = 0;
  for (const auto& e : g_events) {
    if (e.t < cutoff) continue;
    if (kind && e.kind != *kind) continue;
    ++c;
  }
  return c;
}

int count_recent_ms(int ms) {
  return count_since(std::chrono::milliseconds(ms), nullptr);
}

int count_recent_kind_ms(ChurnKind kind, int ms) {
  return count_since(std::chrono::milliseconds(ms), &kind);
}

void reset_churn() {
  std::lock_guard<std::mutex> lk(g_mu);
  g_events.clear();
}

} // namespace tasktop::util
