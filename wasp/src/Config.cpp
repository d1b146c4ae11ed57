#include "wasp/Config.h"
#include <cmath>

namespace wasp {

std::string validate_config(const ActorConfig& cfg) {
  if (cfg.window_ms == 0) return "actor.window_ms must be > 0";
  if (cfg.idle_ttl_ms < cfg.window_ms) return "actor.idle_ttl_ms must cover at least one window";
  if (!(cfg.decay >= 0.0)) return "actor.decay must be >= 0";
  const auto& t = cfg.thresholds;
  if (t.block_hits < t.tarpit_hits || t.tarpit_hits < t.challenge_hits) {
    return "actor.thresholds hits must be ordered block >= tarpit >= challenge";
  }
  if (t.block_score < t.tarpit_score || t.tarpit_score < t.challenge_score) {
    return "actor.thresholds score must be ordered block >= tarpit >= challenge";
  }
  return {};
}

std::string validate_config(const AggregationConfig& cfg) {
  if (cfg.window_ms < 1000) return "aggregation.window_ms must be >= 1000";
  if (!std::isfinite(cfg.system_capacity_rps) || cfg.system_capacity_rps < 0.0) {
    return "aggregation.system_capacity_rps must be finite and >= 0";
  }
  if (!(cfg.avg_request_bytes > 0.0)) return "aggregation.avg_request_bytes must be > 0";
  if (cfg.case_lock_stripes == 0) return "aggregation.case_lock_stripes must be > 0";
  return {};
}

std::string validate_config(const IngestConfig& cfg) {
  if (cfg.queue_capacity == 0) return "ingest.queue_capacity must be > 0";
  if (cfg.batch_size == 0) return "ingest.batch_size must be > 0";
  if (cfg.max_attempts == 0) return "ingest.max_attempts must be > 0";
  return {};
}

std::string validate_config(const TarpitConfig& cfg) {
  if (cfg.interval_ms == 0) return "tarpit.interval_ms must be > 0";
  if (cfg.chunk.empty()) return "tarpit.chunk must not be empty";
  return {};
}

std::string validate_config(const WaspConfig& cfg) {
  std::string err = validate_config(cfg.actor);
  if (err.empty()) err = validate_config(cfg.aggregation);
  if (err.empty()) err = validate_config(cfg.ingest);
  if (err.empty()) err = validate_config(cfg.tarpit);
  return err;
}

} // namespace wasp
