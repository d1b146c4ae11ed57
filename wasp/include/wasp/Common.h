#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wasp {

using TimeMs = uint64_t;
using Asn = uint32_t;

enum class Action : uint8_t {
  Allow = 0,
  Challenge = 1,
  Tarpit = 2,
  Block = 3,
};

const char* to_string(Action a);
std::optional<Action> parse_action(std::string_view text);

enum class StoreStatus : uint8_t {
  Ok = 0,
  NotFound,
  Unavailable, // transient, safe to retry
  Invalid,
};

const char* to_string(StoreStatus s);

struct IdentityKey {
  std::string ip;
  Asn asn{0};

  std::string str() const;
};

// Request features extracted by the transport layer.
struct AdmissionRequest {
  TimeMs now_ms{0};
  std::string ip;
  Asn asn{0};
  std::string user_agent;
  std::string path;
  std::string method;
  bool trusted{false}; // prior successful challenge
};

struct AdmissionVerdict {
  Action action{Action::Allow};
  double score{0.0};
  uint32_t hits{0};
};

struct ActorState {
  uint32_t hits{0};
  TimeMs window_start_ms{0};
  double score{0.0};
  std::string last_user_agent;
};

// Emitted asynchronously per evaluated request. `action` is kept as wire text
// until validated by the ingestion pipeline.
struct VerdictEvent {
  TimeMs ts{0};
  std::string ip;
  Asn asn{0};
  std::string country;
  std::string user_agent;
  std::string path;
  std::string method;
  std::string action;
  double score{0.0};
  uint32_t hits{0};
  std::string zone;
  std::string colo;
};

struct Event {
  int64_t id{0};
  std::string case_id;
  TimeMs ts{0};
  std::string path;
  std::string method;
  std::string user_agent;
  Action action{Action::Allow};
  double score{0.0};
  uint32_t hits{0};
  std::string colo;
};

struct CaseMetrics {
  std::size_t event_count{0};
  double avg_score{0.0};
  uint32_t allowed{0};
  uint32_t challenged{0};
  uint32_t tarpitted{0};
  uint32_t blocked{0};

  double attack_rps{0.0};
  double est_bandwidth_mbps{0.0};
  double system_capacity_rps{0.0};
  double af{0.0};
  double df{0.0};
  double bof{1.0};
  int64_t evidence_count{0};
  double mercy{0.5};
  double justice{0.5};
};

struct ReportArtifacts {
  std::optional<std::string> abuse_report;
  std::optional<std::string> section504_draft;
};

inline constexpr std::string_view kStatusOpen = "OPEN";

struct Case {
  std::string id;
  std::string key;
  std::string zone;
  std::string ip;
  Asn asn{0};
  std::string country;
  TimeMs first_seen{0};
  TimeMs last_seen{0};
  std::string status{kStatusOpen};
  double attack_rps{0.0};
  double est_bandwidth_mbps{0.0};
  double system_capacity_rps{0.0};
  double af{0.0};
  double df{0.0};
  double bof{1.0};
  int64_t evidence_count{0};
  double mercy{0.5};
  double justice{0.5};
  std::optional<std::string> abuse_report;
  std::optional<std::string> section504_draft;
};

// zone:ip:asn
std::string case_key(std::string_view zone, std::string_view ip, Asn asn);

} // namespace wasp
