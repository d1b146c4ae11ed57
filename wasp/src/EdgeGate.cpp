#include "wasp/EdgeGate.h"
#include "wasp/Util.h"

namespace wasp {

ResponseKind response_for(Action a) {
  switch (a) {
    case Action::Allow: return ResponseKind::Forward;
    case Action::Challenge: return ResponseKind::ChallengePage;
    case Action::Tarpit: return ResponseKind::SlowDrip;
    case Action::Block: return ResponseKind::Forbidden;
  }
  return ResponseKind::Forbidden;
}

EdgeGate::EdgeGate(const GateConfig& cfg, AdmissionActor& actor, IEventSink& events,
                   IMetricSink* metrics, ILogSink* log)
    : cfg_(cfg),
      actor_(actor),
      events_(events),
      metrics_(metrics ? metrics : &noop_),
      log_(log ? log : &noop_log_, "gate") {}

bool EdgeGate::bypass(const std::string& path) const {
  for (const auto& prefix : cfg_.bypass_prefixes) {
    if (starts_with(path, prefix)) return true;
  }
  return false;
}

GateDecision EdgeGate::admit(const EdgeRequest& req) {
  GateDecision out{};
  const AdmissionRequest& a = req.admission;
  if (bypass(a.path)) {
    out.bypassed = true;
    metrics_->inc_counter("wasp_gate_bypass_total", 1);
    return out;
  }

  out.verdict = actor_.evaluate(a);
  out.response = response_for(out.verdict.action);

  VerdictEvent ev{};
  ev.ts = a.now_ms;
  ev.ip = a.ip;
  ev.asn = a.asn;
  ev.country = req.country;
  ev.user_agent = a.user_agent;
  ev.path = a.path;
  ev.method = a.method;
  ev.action = to_string(out.verdict.action);
  ev.score = out.verdict.score;
  ev.hits = out.verdict.hits;
  ev.zone = req.zone;
  ev.colo = req.colo;
  out.event_emitted = events_.emit(ev);
  if (!out.event_emitted) {
    metrics_->inc_counter("wasp_event_queue_full_total", 1);
    log_.warn("verdict event for " + a.ip + " not queued");
  }
  return out;
}

ChallengeOutcome EdgeGate::on_challenge_response(IChallengeVerifier& verifier, const std::string& token,
                                                 const std::string& ip) {
  if (token.empty()) {
    metrics_->inc_counter("wasp_challenge_total", 1, { {"result", "empty"} });
    return ChallengeOutcome::Retry;
  }
  // Inconclusive checks re-present the challenge; they never escalate.
  if (!verifier.verify(token, ip)) {
    metrics_->inc_counter("wasp_challenge_total", 1, { {"result", "failed"} });
    log_.debug("challenge verification failed for " + ip);
    return ChallengeOutcome::Retry;
  }
  metrics_->inc_counter("wasp_challenge_total", 1, { {"result", "passed"} });
  return ChallengeOutcome::Passed;
}

} // namespace wasp
