#include "wasp/AdmissionActor.h"
#include <cassert>
#include <thread>
#include <vector>

using namespace wasp;

namespace {

class UnavailableStateStore final : public IActorStateStore {
 public:
  StoreStatus update(const std::string&, TimeMs, TimeMs, const ActorUpdateFn&) override {
    return StoreStatus::Unavailable;
  }
  size_t sweep(TimeMs) override { return 0; }
  size_t size() const override { return 0; }
};

AdmissionRequest page(TimeMs now, const std::string& ua = "Mozilla/5.0") {
  AdmissionRequest r{};
  r.now_ms = now;
  r.ip = "203.0.113.7";
  r.asn = 64500;
  r.user_agent = ua;
  r.path = "/";
  r.method = "GET";
  return r;
}

void window_resets() {
  MemoryActorStateStore store;
  AdmissionActor actor(ActorConfig{}, store);
  assert(actor.evaluate(page(10000)).hits == 1);
  assert(actor.evaluate(page(10500)).hits == 2);
  // 1100ms after window start: new window.
  assert(actor.evaluate(page(11100)).hits == 1);
  // Exactly 1000ms after window start stays in the window.
  assert(actor.evaluate(page(12100)).hits == 2);
  assert(actor.evaluate(page(12101)).hits == 1);
}

void escalates_on_mutating_api_without_ua() {
  MemoryActorStateStore store;
  AdmissionActor actor(ActorConfig{}, store);
  AdmissionRequest r = page(5000, "");
  r.path = "/api/login";
  r.method = "POST";

  AdmissionVerdict v{};
  for (int i = 0; i < 5; ++i) {
    v = actor.evaluate(r);
    assert(v.score == 0.0);
    assert(v.action == Action::Allow);
  }
  v = actor.evaluate(r); // hits 6: write +2, ua +1, decay -1
  assert(v.score == 2.0);
  actor.evaluate(r);
  v = actor.evaluate(r);
  assert(v.hits == 8 && v.score == 6.0);
  assert(v.action == Action::Challenge);
  actor.evaluate(r);
  v = actor.evaluate(r);
  assert(v.score == 10.0);
  assert(v.action == Action::Tarpit);
  actor.evaluate(r);
  v = actor.evaluate(r);
  assert(v.score == 14.0);
  assert(v.action == Action::Block);

  r.trusted = true;
  v = actor.evaluate(r);
  assert(v.action == Action::Allow);
  assert(v.score == 16.0);
}

void heuristics_are_additive() {
  ActorConfig cfg{};
  AdmissionRequest r = page(0, "x");
  ActorState s{};
  s.last_user_agent = "x";

  s.hits = 16;
  r.path = "/api/items";
  assert(heuristic_delta(cfg, s, r) == 2.0);
  r.path = "/api"; // not under /api/
  assert(heuristic_delta(cfg, s, r) == 0.0);
  s.hits = 36;
  assert(heuristic_delta(cfg, s, r) == 1.0);

  s.hits = 6;
  r.path = "/form";
  r.method = "HEAD";
  assert(heuristic_delta(cfg, s, r) == 0.0);
  r.method = "DELETE";
  assert(heuristic_delta(cfg, s, r) == 2.0);

  s.hits = 36;
  r.path = "/api/items";
  r.method = "POST";
  r.user_agent = "-";
  s.last_user_agent = "curl/8.0";
  assert(heuristic_delta(cfg, s, r) == 6.0);

  s.hits = 1;
  s.last_user_agent.clear();
  r.method = "GET";
  r.user_agent = "new";
  assert(heuristic_delta(cfg, s, r) == 0.0);
}

void thresholds_are_ordered() {
  ActorThresholds t{};
  assert(apply_thresholds(t, 30, 5.0) == Action::Allow);
  assert(apply_thresholds(t, 31, 0.0) == Action::Challenge);
  assert(apply_thresholds(t, 0, 5.5) == Action::Challenge);
  assert(apply_thresholds(t, 71, 0.0) == Action::Tarpit);
  assert(apply_thresholds(t, 0, 8.5) == Action::Tarpit);
  assert(apply_thresholds(t, 121, 0.0) == Action::Block);
  assert(apply_thresholds(t, 0, 12.5) == Action::Block);
  assert(apply_thresholds(t, 71, 12.5) == Action::Block);
  assert(apply_thresholds(t, 31, 8.5) == Action::Tarpit);
}

void idle_state_expires() {
  MemoryActorStateStore store;
  AdmissionActor actor(ActorConfig{}, store);
  AdmissionRequest r = page(1000, "");
  r.method = "PUT";
  for (int i = 0; i < 9; ++i) actor.evaluate(r);
  assert(actor.evaluate(r).score > 0.0);
  assert(store.size() == 1);

  r.now_ms = 1000 + 300000 + 1;
  r.user_agent = "Mozilla/5.0";
  r.method = "GET";
  AdmissionVerdict v = actor.evaluate(r);
  assert(v.hits == 1);
  assert(v.score == 0.0);

  assert(store.sweep(r.now_ms + 300000) == 1);
  assert(store.size() == 0);
}

void fails_safe_without_state() {
  UnavailableStateStore store;
  AdmissionActor actor(ActorConfig{}, store);
  AdmissionRequest r = page(1000);
  AdmissionVerdict v = actor.evaluate(r);
  assert(v.action == Action::Challenge);
  assert(v.hits == 0);
  r.trusted = true;
  assert(actor.evaluate(r).action == Action::Allow);
}

void serializes_same_key() {
  MemoryActorStateStore store;
  AdmissionActor actor(ActorConfig{}, store);
  const int threads = 8;
  const int per_thread = 500;
  std::vector<std::thread> pool;
  for (int t = 0; t < threads; ++t) {
    pool.emplace_back([&] {
      for (int i = 0; i < per_thread; ++i) actor.evaluate(page(50000));
    });
  }
  for (auto& th : pool) th.join();
  assert(actor.evaluate(page(50000)).hits == threads * per_thread + 1);
}

void keys_are_independent() {
  MemoryActorStateStore store;
  AdmissionActor actor(ActorConfig{}, store);
  for (int i = 0; i < 40; ++i) actor.evaluate(page(7000));
  AdmissionRequest other = page(7000);
  other.asn = 64501;
  AdmissionVerdict v = actor.evaluate(other);
  assert(v.hits == 1);
  assert(v.action == Action::Allow);
  assert(store.size() == 2);
}

} // namespace

void test_admission_actor() {
  window_resets();
  escalates_on_mutating_api_without_ua();
  heuristics_are_additive();
  thresholds_are_ordered();
  idle_state_expires();
  fails_safe_without_state();
  serializes_same_key();
  keys_are_independent();
}
