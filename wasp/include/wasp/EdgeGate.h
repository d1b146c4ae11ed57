#pragma once
#include <cstdint>
#include <string>
#include "AdmissionActor.h"
#include "Common.h"
#include "Config.h"
#include "EventQueue.h"
#include "Log.h"
#include "Metrics.h"

namespace wasp {

// Checks a challenge token with the external verification service.
class IChallengeVerifier {
 public:
  virtual ~IChallengeVerifier() = default;
  // False for a rejected token. A transport failure may also return false.
  virtual bool verify(const std::string& token, const std::string& ip) = 0;
};

enum class ChallengeOutcome : uint8_t {
  Passed = 0, // caller marks the client trusted
  Retry = 1,  // present the challenge again
};

enum class ResponseKind : uint8_t {
  Forward = 0,
  ChallengePage = 1,
  SlowDrip = 2,
  Forbidden = 3,
};

ResponseKind response_for(Action a);

// Request features plus the edge metadata carried into the verdict event.
struct EdgeRequest {
  AdmissionRequest admission{};
  std::string country{"XX"};
  std::string zone;
  std::string colo;
};

struct GateDecision {
  AdmissionVerdict verdict{};
  ResponseKind response{ResponseKind::Forward};
  bool bypassed{false};
  bool event_emitted{false};
};

// Front door of the admission path: health bypass, actor verdict, and a
// non-blocking hand-off of the verdict event to ingestion.
class EdgeGate {
 public:
  EdgeGate(const GateConfig& cfg, AdmissionActor& actor, IEventSink& events,
           IMetricSink* metrics = nullptr, ILogSink* log = nullptr);

  GateDecision admit(const EdgeRequest& req);
  ChallengeOutcome on_challenge_response(IChallengeVerifier& verifier, const std::string& token,
                                         const std::string& ip);

 private:
  bool bypass(const std::string& path) const;

  GateConfig cfg_{};
  AdmissionActor& actor_;
  IEventSink& events_;
  NoopMetricSink noop_{};
  IMetricSink* metrics_{nullptr};
  NoopLogSink noop_log_{};
  Logger log_;
};

} // namespace wasp
