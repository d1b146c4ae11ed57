#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include "Common.h"
#include "Config.h"
#include "ActorStateStore.h"
#include "Log.h"
#include "Metrics.h"

namespace wasp {

// Score increment for one request given the state after its hit was counted
// and before last_user_agent is replaced.
double heuristic_delta(const ActorConfig& cfg, const ActorState& state, const AdmissionRequest& req);

// Most severe level first: block, tarpit, challenge, allow.
Action apply_thresholds(const ActorThresholds& t, uint32_t hits, double score);

// Per identity key (ip:asn) admission state machine. Evaluations for the same
// key are serialized by the state store; distinct keys run in parallel.
class AdmissionActor {
 public:
  AdmissionActor(const ActorConfig& cfg, IActorStateStore& store,
                 IMetricSink* metrics = nullptr, ILogSink* log = nullptr);

  AdmissionVerdict evaluate(const AdmissionRequest& req);
  AdmissionVerdict evaluate(const std::string& ip, Asn asn, const std::string& user_agent,
                            const std::string& path, const std::string& method, bool trusted);

 private:
  void maybe_sweep(TimeMs now_ms);

  ActorConfig cfg_{};
  IActorStateStore& store_;
  NoopMetricSink noop_{};
  IMetricSink* metrics_{nullptr};
  NoopLogSink noop_log_{};
  Logger log_;
  std::atomic<TimeMs> last_sweep_ms_{0};
};

} // namespace wasp
