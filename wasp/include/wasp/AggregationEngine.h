#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>
#include "CaseStore.h"
#include "Common.h"
#include "Config.h"
#include "Log.h"
#include "Metrics.h"
#include "Report.h"

namespace wasp {

// Metrics over one window of events. `events` must already be limited to the
// window; order only matters for bit-identical reruns.
CaseMetrics compute_metrics(const std::vector<Event>& events, const AggregationConfig& cfg);

// EF >= 50 or AF >= 1 or BoF < 1 with default config.
bool should_materialize(const CaseMetrics& m, const AggregationConfig& cfg);

enum class RecomputeStatus : uint8_t {
  Computed = 0,      // metrics computed, trigger not met
  Materialized = 1,  // snapshot and artifacts written
  StoreError = 2,
};

struct RecomputeResult {
  RecomputeStatus status{RecomputeStatus::Computed};
  StoreStatus store{StoreStatus::Ok};
  CaseMetrics metrics{};
};

class AggregationEngine {
 public:
  AggregationEngine(const AggregationConfig& cfg, ICaseStore& store, IReportGenerator& reports,
                    IMetricSink* metrics = nullptr, ILogSink* log = nullptr);

  // Recomputes the case's trailing window [now - window, now] from the
  // persisted log. Serialized per case_id.
  RecomputeResult recompute(const std::string& case_id, const std::string& zone, TimeMs now_ms);

  const AggregationConfig& config() const { return cfg_; }

 private:
  std::mutex& case_lock(const std::string& case_id);

  AggregationConfig cfg_{};
  ICaseStore& store_;
  IReportGenerator& reports_;
  NoopMetricSink noop_{};
  IMetricSink* metrics_{nullptr};
  NoopLogSink noop_log_{};
  Logger log_;
  std::vector<std::mutex> case_locks_;
};

} // namespace wasp
