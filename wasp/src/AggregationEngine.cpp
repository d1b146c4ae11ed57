#include "wasp/AggregationEngine.h"
#include "wasp/Util.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace wasp {

CaseMetrics compute_metrics(const std::vector<Event>& events, const AggregationConfig& cfg) {
  CaseMetrics m{};
  const double window_s = static_cast<double>(cfg.window_ms) / 1000.0;
  double score_sum = 0.0;
  for (const auto& e : events) {
    score_sum += e.score;
    switch (e.action) {
      case Action::Allow: ++m.allowed; break;
      case Action::Challenge: ++m.challenged; break;
      case Action::Tarpit: ++m.tarpitted; break;
      case Action::Block: ++m.blocked; break;
    }
  }
  m.event_count = events.size();
  const double n = static_cast<double>(m.event_count);
  m.avg_score = m.event_count > 0 ? score_sum / n : 0.0;

  // Attack force
  m.attack_rps = n / window_s;
  m.est_bandwidth_mbps = m.attack_rps * cfg.avg_request_bytes * 8.0 / 1048576.0;
  m.system_capacity_rps = cfg.system_capacity_rps;
  m.af = m.system_capacity_rps > 0.0 ? m.attack_rps / m.system_capacity_rps : 0.0;

  // Defense force: mitigated requests weighted by severity.
  double weighted = m.challenged * 0.6 + m.tarpitted * 0.9 + m.blocked * 1.0;
  m.df = weighted / window_s;
  m.bof = m.af > 0.0 ? m.df / m.af : 1.0;

  m.evidence_count = static_cast<int64_t>(std::floor(n + m.avg_score * 3.0 + 0.5));
  m.mercy = 1.0 / (1.0 + std::exp(m.avg_score - 6.0));
  double non_allow = m.event_count > 0 ? (m.challenged + m.tarpitted + m.blocked) / n : 0.0;
  m.justice = std::max(0.0, std::min(1.0, non_allow + m.avg_score / 12.0));
  return m;
}

bool should_materialize(const CaseMetrics& m, const AggregationConfig& cfg) {
  return m.evidence_count >= cfg.evidence_trigger || m.af >= cfg.af_trigger || m.bof < cfg.bof_trigger;
}

AggregationEngine::AggregationEngine(const AggregationConfig& cfg, ICaseStore& store,
                                     IReportGenerator& reports, IMetricSink* metrics, ILogSink* log)
    : cfg_(cfg),
      store_(store),
      reports_(reports),
      metrics_(metrics ? metrics : &noop_),
      log_(log ? log : &noop_log_, "aggregate"),
      case_locks_(cfg_.case_lock_stripes) {
  std::string err = validate_config(cfg_);
  if (!err.empty()) throw std::invalid_argument(err);
}

std::mutex& AggregationEngine::case_lock(const std::string& case_id) {
  return case_locks_[fnv1a64(case_id) % cfg_.case_lock_stripes];
}

RecomputeResult AggregationEngine::recompute(const std::string& case_id, const std::string& zone,
                                             TimeMs now_ms) {
  ScopedLatency timer(*metrics_, "wasp_recompute_ms");
  RecomputeResult res{};
  // Single writer per case: the read of the window and the snapshot write
  // must not interleave with another recompute of the same case.
  std::lock_guard<std::mutex> lock(case_lock(case_id));

  const TimeMs from = now_ms > cfg_.window_ms ? now_ms - cfg_.window_ms : 0;
  std::vector<Event> rows;
  res.store = store_.select_events_in_window(case_id, from, rows);
  if (res.store != StoreStatus::Ok) {
    res.status = RecomputeStatus::StoreError;
    log_.warn("window scan for case " + case_id + ": " + to_string(res.store));
    return res;
  }
  // Late clocks may have stamped events past now; they belong to a later window.
  rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const Event& e) { return e.ts > now_ms; }),
             rows.end());

  res.metrics = compute_metrics(rows, cfg_);
  metrics_->observe_histogram("wasp_case_evidence_count", static_cast<double>(res.metrics.evidence_count));
  if (!should_materialize(res.metrics, cfg_)) return res;

  CaseSnapshot snap{};
  snap.last_seen = now_ms;
  snap.metrics = res.metrics;
  snap.artifacts = reports_.generate(zone, res.metrics, now_ms);
  res.store = store_.update_case_snapshot(case_id, snap);
  if (res.store != StoreStatus::Ok) {
    res.status = RecomputeStatus::StoreError;
    log_.warn("snapshot write for case " + case_id + ": " + to_string(res.store));
    return res;
  }
  res.status = RecomputeStatus::Materialized;
  metrics_->inc_counter("wasp_case_materialized_total", 1);
  return res;
}

} // namespace wasp
