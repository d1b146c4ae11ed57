#include "wasp/AdmissionActor.h"
#include "wasp/Util.h"
#include <algorithm>
#include <stdexcept>

namespace wasp {

namespace {
bool is_mutating(const std::string& method) {
  return method != "GET" && method != "HEAD";
}
}

double heuristic_delta(const ActorConfig& cfg, const ActorState& state, const AdmissionRequest& req) {
  const bool api = starts_with(req.path, "/api/");
  double delta = 0.0;
  if (api && state.hits > cfg.api_hits) delta += 2.0;
  if (!api && state.hits > cfg.page_hits) delta += 1.0;
  if (req.user_agent.empty() || req.user_agent == "-") delta += 1.0;
  if (is_mutating(req.method) && state.hits > cfg.write_hits) delta += 2.0;
  // UA flapping
  if (!state.last_user_agent.empty() && state.last_user_agent != req.user_agent) delta += 1.0;
  return delta;
}

Action apply_thresholds(const ActorThresholds& t, uint32_t hits, double score) {
  if (hits > t.block_hits || score > t.block_score) return Action::Block;
  if (hits > t.tarpit_hits || score > t.tarpit_score) return Action::Tarpit;
  if (hits > t.challenge_hits || score > t.challenge_score) return Action::Challenge;
  return Action::Allow;
}

AdmissionActor::AdmissionActor(const ActorConfig& cfg, IActorStateStore& store,
                               IMetricSink* metrics, ILogSink* log)
    : cfg_(cfg),
      store_(store),
      metrics_(metrics ? metrics : &noop_),
      log_(log ? log : &noop_log_, "actor") {
  std::string err = validate_config(cfg_);
  if (!err.empty()) throw std::invalid_argument(err);
}

AdmissionVerdict AdmissionActor::evaluate(const AdmissionRequest& req) {
  const TimeMs now = req.now_ms;
  ActorState snapshot{};

  StoreStatus st = store_.update(IdentityKey{req.ip, req.asn}.str(), now, cfg_.idle_ttl_ms,
                                 [&](ActorState& s, bool fresh) {
    if (fresh) s.window_start_ms = now;
    // Tumbling window; a clock that steps backwards stays in the current one.
    if (now > s.window_start_ms && now - s.window_start_ms > cfg_.window_ms) {
      s.hits = 0;
      s.window_start_ms = now;
    }
    s.hits += 1;
    double delta = heuristic_delta(cfg_, s, req);
    s.last_user_agent = req.user_agent;
    s.score = std::max(0.0, s.score + delta - cfg_.decay);
    snapshot = s;
  });

  AdmissionVerdict out{};
  if (st != StoreStatus::Ok) {
    // Fail safe: never hand out an unauthenticated allow without state.
    metrics_->inc_counter("wasp_actor_store_error_total", 1, { {"status", to_string(st)} });
    log_.warn("state store " + std::string(to_string(st)) + " for " + req.ip +
              ", failing safe");
    out.action = req.trusted ? Action::Allow : Action::Challenge;
  } else {
    out.score = snapshot.score;
    out.hits = snapshot.hits;
    out.action = req.trusted ? Action::Allow
                             : apply_thresholds(cfg_.thresholds, snapshot.hits, snapshot.score);
  }

  metrics_->inc_counter("wasp_admission_verdict_total", 1, { {"action", to_string(out.action)} });
  metrics_->observe_histogram("wasp_admission_score", out.score);
  maybe_sweep(now);
  return out;
}

AdmissionVerdict AdmissionActor::evaluate(const std::string& ip, Asn asn, const std::string& user_agent,
                                          const std::string& path, const std::string& method, bool trusted) {
  AdmissionRequest req{};
  req.now_ms = wall_clock_ms();
  req.ip = ip;
  req.asn = asn;
  req.user_agent = user_agent;
  req.path = path;
  req.method = method;
  req.trusted = trusted;
  return evaluate(req);
}

void AdmissionActor::maybe_sweep(TimeMs now_ms) {
  TimeMs last = last_sweep_ms_.load(std::memory_order_relaxed);
  if (now_ms < last + cfg_.idle_ttl_ms) return;
  // One caller wins the sweep for this period.
  if (!last_sweep_ms_.compare_exchange_strong(last, now_ms)) return;
  size_t dropped = store_.sweep(now_ms);
  if (dropped > 0) {
    metrics_->inc_counter("wasp_actor_state_expired_total", dropped);
    log_.debug("swept " + std::to_string(dropped) + " idle actor states");
  }
  metrics_->set_gauge("wasp_actor_states", static_cast<double>(store_.size()));
}

} // namespace wasp
