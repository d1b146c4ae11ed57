#pragma once
#include "Common.h"
#include "Config.h"
#include "Log.h"
#include "Metrics.h"
#include "ActorStateStore.h"
#include "AdmissionActor.h"
#include "CaseStore.h"
#include "AggregationEngine.h"
#include "EventQueue.h"
#include "IngestPipeline.h"
#include "EdgeGate.h"
#include "Report.h"
#include "Tarpit.h"

namespace wasp {

// One instance: edge gate and actor on the request side, queue, ingestion
// worker and aggregation engine on the evidence side.
class Wasp {
 public:
  Wasp(const WaspConfig& cfg, ICaseStore& store, IReportGenerator& reports,
       IDeadLetterSink& dead_letters, IMetricSink* metrics = nullptr, ILogSink* log = nullptr);
  ~Wasp();

  GateDecision admit(const EdgeRequest& req) { return gate_.admit(req); }

  void start();
  // Stops accepting events and drains the queue.
  void stop();

  EventQueue& queue() { return queue_; }
  IngestPipeline& pipeline() { return pipeline_; }
  const WaspConfig& config() const { return cfg_; }

 private:
  WaspConfig cfg_{};
  MemoryActorStateStore actor_states_{};
  AdmissionActor actor_;
  EventQueue queue_;
  AggregationEngine engine_;
  IngestPipeline pipeline_;
  IngestWorker worker_;
  EdgeGate gate_;
};

} // namespace wasp
