#include "wasp/Wasp.h"
#include <stdexcept>

namespace wasp {

namespace {
const WaspConfig& checked(const WaspConfig& cfg) {
  std::string err = validate_config(cfg);
  if (!err.empty()) throw std::invalid_argument(err);
  return cfg;
}
}

Wasp::Wasp(const WaspConfig& cfg, ICaseStore& store, IReportGenerator& reports,
           IDeadLetterSink& dead_letters, IMetricSink* metrics, ILogSink* log)
    : cfg_(checked(cfg)),
      actor_(cfg_.actor, actor_states_, metrics, log),
      queue_(cfg_.ingest.queue_capacity),
      engine_(cfg_.aggregation, store, reports, metrics, log),
      pipeline_(cfg_.ingest, store, engine_, dead_letters, metrics, log),
      worker_(pipeline_, queue_),
      gate_(cfg_.gate, actor_, queue_, metrics, log) {}

Wasp::~Wasp() { stop(); }

void Wasp::start() { worker_.start(); }

void Wasp::stop() { worker_.stop(); }

} // namespace wasp
