#include "wasp/AggregationEngine.h"
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <thread>
#include <vector>

using namespace wasp;

namespace {

bool close_to(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps * std::max(1.0, std::fabs(b)); }

Event ev(TimeMs ts, Action a, double score) {
  Event e{};
  e.ts = ts;
  e.path = "/";
  e.method = "GET";
  e.action = a;
  e.score = score;
  return e;
}

class RecordingReports final : public IReportGenerator {
 public:
  ReportArtifacts generate(const std::string& zone, const CaseMetrics& m, TimeMs) override {
    ++calls;
    ReportArtifacts out{};
    out.abuse_report = "abuse " + zone + " ef=" + std::to_string(m.evidence_count);
    out.section504_draft = "s504 ef=" + std::to_string(m.evidence_count);
    return out;
  }
  int calls{0};
};

// Flags two recomputes of one case overlapping between scan and write.
class OverlapProbeStore final : public ICaseStore {
 public:
  explicit OverlapProbeStore(ICaseStore& inner) : inner_(inner) {}
  StoreStatus upsert_case(const CaseUpsert& in, std::string& id) override { return inner_.upsert_case(in, id); }
  StoreStatus append_event(const std::string& id, const Event& e) override { return inner_.append_event(id, e); }
  StoreStatus select_events_in_window(const std::string& id, TimeMs from, std::vector<Event>& out) override {
    if (active.fetch_add(1) != 0) overlap = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    return inner_.select_events_in_window(id, from, out);
  }
  StoreStatus update_case_snapshot(const std::string& id, const CaseSnapshot& s) override {
    StoreStatus st = inner_.update_case_snapshot(id, s);
    active.fetch_sub(1);
    return st;
  }
  StoreStatus get_case(const std::string& id, Case& out) override { return inner_.get_case(id, out); }
  StoreStatus find_case_by_key(const std::string& k, Case& out) override { return inner_.find_case_by_key(k, out); }
  StoreStatus count_events(const std::string& id, size_t& out) override { return inner_.count_events(id, out); }

  std::atomic<int> active{0};
  std::atomic<bool> overlap{false};

 private:
  ICaseStore& inner_;
};

void steady_allow_traffic() {
  std::vector<Event> rows;
  for (int i = 0; i < 60; ++i) rows.push_back(ev(1000 * i, Action::Allow, 0.0));
  CaseMetrics m = compute_metrics(rows, AggregationConfig{});
  assert(m.event_count == 60);
  assert(m.attack_rps == 1.0);
  assert(m.est_bandwidth_mbps == 0.015625);
  assert(m.system_capacity_rps == 500.0);
  assert(close_to(m.af, 0.002));
  assert(m.df == 0.0);
  assert(m.bof == 0.0);
  assert(m.evidence_count == 60);
  assert(m.justice == 0.0);
  assert(should_materialize(m, AggregationConfig{}));
}

void blocked_flood() {
  std::vector<Event> rows;
  for (int i = 0; i < 30; ++i) rows.push_back(ev(100 + i, Action::Block, 10.0));
  for (int i = 0; i < 20; ++i) rows.push_back(ev(200 + i, Action::Allow, 10.0));
  CaseMetrics m = compute_metrics(rows, AggregationConfig{});
  assert(m.blocked == 30 && m.allowed == 20);
  assert(m.avg_score == 10.0);
  assert(m.df == 0.5);
  assert(close_to(m.attack_rps, 50.0 / 60.0));
  assert(close_to(m.af, (50.0 / 60.0) / 500.0));
  assert(close_to(m.bof, 300.0, 1e-9));
  assert(m.evidence_count == 80);
  assert(close_to(m.mercy, 1.0 / (1.0 + std::exp(4.0))));
  assert(m.justice == 1.0); // 0.6 + 0.833 clamped
  assert(should_materialize(m, AggregationConfig{}));
}

void empty_window_guards() {
  CaseMetrics m = compute_metrics({}, AggregationConfig{});
  assert(m.event_count == 0);
  assert(m.avg_score == 0.0);
  assert(m.af == 0.0);
  assert(m.bof == 1.0);
  assert(m.evidence_count == 0);
  assert(m.justice == 0.0);
  assert(!should_materialize(m, AggregationConfig{}));

  AggregationConfig no_capacity{};
  no_capacity.system_capacity_rps = 0.0;
  std::vector<Event> rows{ev(1, Action::Allow, 0.0)};
  m = compute_metrics(rows, no_capacity);
  assert(m.af == 0.0);
  assert(m.bof == 1.0);
}

void trigger_edges() {
  AggregationConfig cfg{};
  // One blocked request: DF dominates AF, tiny evidence.
  std::vector<Event> rows{ev(1, Action::Block, 0.0)};
  CaseMetrics m = compute_metrics(rows, cfg);
  assert(m.bof > 1.0);
  assert(m.evidence_count == 1);
  assert(!should_materialize(m, cfg));

  cfg.system_capacity_rps = 1.0 / 60.0;
  m = compute_metrics(rows, cfg);
  assert(m.af >= 1.0);
  assert(should_materialize(m, cfg));

  // Half rounds up.
  std::vector<Event> half{ev(1, Action::Block, 0.5)};
  assert(compute_metrics(half, AggregationConfig{}).evidence_count == 3);
}

void mercy_midpoint() {
  std::vector<Event> rows{ev(1, Action::Challenge, 6.0), ev(2, Action::Challenge, 6.0), ev(3, Action::Tarpit, 6.0)};
  CaseMetrics m = compute_metrics(rows, AggregationConfig{});
  assert(m.avg_score == 6.0);
  assert(m.mercy == 0.5);
  assert(m.df == (2 * 0.6 + 0.9) / 60.0);
}

void recompute_materializes() {
  MemoryCaseStore store;
  RecordingReports reports;
  AggregationEngine engine(AggregationConfig{}, store, reports);

  CaseUpsert up{};
  up.key = case_key("example.com", "198.51.100.4", 13335);
  up.zone = "example.com";
  up.ip = "198.51.100.4";
  up.asn = 13335;
  up.ts = 100000;
  std::string id;
  assert(store.upsert_case(up, id) == StoreStatus::Ok);

  const TimeMs now = 200000;
  assert(store.append_event(id, ev(now - 70000, Action::Block, 20.0)) == StoreStatus::Ok); // too old
  assert(store.append_event(id, ev(now + 5000, Action::Block, 20.0)) == StoreStatus::Ok);  // future
  for (int i = 0; i < 55; ++i) {
    assert(store.append_event(id, ev(now - 59000 + 1000 * i, Action::Challenge, 1.0)) == StoreStatus::Ok);
  }

  RecomputeResult r = engine.recompute(id, "example.com", now);
  assert(r.status == RecomputeStatus::Materialized);
  assert(r.metrics.event_count == 55);
  assert(r.metrics.evidence_count == 58);
  assert(reports.calls == 1);

  Case c{};
  assert(store.get_case(id, c) == StoreStatus::Ok);
  assert(c.status == "OPEN");
  assert(c.last_seen == now);
  assert(c.first_seen == 100000);
  assert(c.evidence_count == 58);
  assert(c.df == r.metrics.df);
  assert(c.abuse_report && *c.abuse_report == "abuse example.com ef=58");
  assert(c.section504_draft && *c.section504_draft == "s504 ef=58");

  // Same window again: identical numbers.
  RecomputeResult again = engine.recompute(id, "example.com", now);
  assert(again.metrics.attack_rps == r.metrics.attack_rps);
  assert(again.metrics.bof == r.metrics.bof);
  assert(again.metrics.mercy == r.metrics.mercy);
  assert(again.metrics.justice == r.metrics.justice);
}

void recompute_below_trigger_leaves_case() {
  MemoryCaseStore store;
  RecordingReports reports;
  AggregationEngine engine(AggregationConfig{}, store, reports);
  CaseUpsert up{};
  up.key = "z:192.0.2.1:1";
  up.ip = "192.0.2.1";
  up.asn = 1;
  up.ts = 10;
  std::string id;
  store.upsert_case(up, id);
  store.append_event(id, ev(90000, Action::Block, 0.0));
  RecomputeResult r = engine.recompute(id, "z", 100000);
  assert(r.status == RecomputeStatus::Computed);
  assert(reports.calls == 0);
  Case c{};
  store.get_case(id, c);
  assert(c.last_seen == 10);
  assert(c.bof == 1.0);
  assert(!c.abuse_report);

  assert(engine.recompute("missing", "z", 100000).status == RecomputeStatus::StoreError);
}

void recompute_is_serialized_per_case() {
  MemoryCaseStore inner;
  OverlapProbeStore store(inner);
  NullReportGenerator reports;
  AggregationEngine engine(AggregationConfig{}, store, reports);
  CaseUpsert up{};
  up.key = "z:192.0.2.9:7";
  up.ip = "192.0.2.9";
  up.asn = 7;
  up.ts = 1;
  std::string id;
  store.upsert_case(up, id);
  store.append_event(id, ev(99000, Action::Allow, 0.0)); // BoF 0, always materializes

  std::vector<std::thread> pool;
  for (int t = 0; t < 4; ++t) {
    pool.emplace_back([&] {
      for (int i = 0; i < 10; ++i) {
        RecomputeResult r = engine.recompute(id, "z", 100000);
        assert(r.status == RecomputeStatus::Materialized);
      }
    });
  }
  for (auto& th : pool) th.join();
  assert(!store.overlap.load());
}

} // namespace

void test_aggregation() {
  steady_allow_traffic();
  blocked_flood();
  empty_window_guards();
  trigger_edges();
  mercy_midpoint();
  recompute_materializes();
  recompute_below_trigger_leaves_case();
  recompute_is_serialized_per_case();
}
