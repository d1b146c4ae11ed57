#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "Common.h"

namespace wasp {

struct ActorThresholds {
  uint32_t block_hits{120};
  double block_score{12.0};
  uint32_t tarpit_hits{70};
  double tarpit_score{8.0};
  uint32_t challenge_hits{30};
  double challenge_score{5.0};
};

struct ActorConfig {
  TimeMs window_ms{1000};
  TimeMs idle_ttl_ms{300000};
  uint32_t api_hits{15};
  uint32_t page_hits{35};
  uint32_t write_hits{5};
  double decay{1.0};
  ActorThresholds thresholds{};
};

struct AggregationConfig {
  TimeMs window_ms{60000};
  double system_capacity_rps{500.0};
  double avg_request_bytes{2048.0};
  int64_t evidence_trigger{50};
  double af_trigger{1.0};
  double bof_trigger{1.0};
  size_t case_lock_stripes{64};
};

struct IngestConfig {
  size_t queue_capacity{10000};
  size_t batch_size{100};
  uint32_t max_attempts{5};
  uint32_t poll_timeout_ms{200};
};

struct TarpitConfig {
  TimeMs duration_ms{15000};
  TimeMs interval_ms{1100};
  std::string chunk{"."};
};

struct GateConfig {
  std::vector<std::string> bypass_prefixes{"/healthz", "/status"};
};

struct WaspConfig {
  ActorConfig actor{};
  AggregationConfig aggregation{};
  IngestConfig ingest{};
  TarpitConfig tarpit{};
  GateConfig gate{};
};

// Empty string when valid, otherwise the first problem found.
std::string validate_config(const ActorConfig& cfg);
std::string validate_config(const AggregationConfig& cfg);
std::string validate_config(const IngestConfig& cfg);
std::string validate_config(const TarpitConfig& cfg);
std::string validate_config(const WaspConfig& cfg);

} // namespace wasp
