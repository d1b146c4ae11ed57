#include "wasp/IngestPipeline.h"
#include "wasp/Util.h"
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace wasp {

const char* to_string(IngestOutcome o) {
  switch (o) {
    case IngestOutcome::Acked: return "acked";
    case IngestOutcome::Retry: return "retry";
    case IngestOutcome::DeadLettered: return "dead_lettered";
  }
  return "?";
}

std::string validate_event(const VerdictEvent& ev) {
  if (ev.ts == 0) return "missing ts";
  if (ev.ip.empty()) return "missing ip";
  if (ev.path.empty() || ev.path[0] != '/') return "invalid path";
  if (ev.method.empty()) return "missing method";
  if (!parse_action(ev.action)) return "unknown action '" + ev.action + "'";
  if (!std::isfinite(ev.score) || ev.score < 0.0) return "invalid score";
  return {};
}

void MemoryDeadLetterSink::dead_letter(const Delivery& d, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.push_back(Entry{d, reason});
}

std::vector<MemoryDeadLetterSink::Entry> MemoryDeadLetterSink::entries() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_;
}

IngestPipeline::IngestPipeline(const IngestConfig& cfg, ICaseStore& store, AggregationEngine& engine,
                               IDeadLetterSink& dead_letters, IMetricSink* metrics, ILogSink* log)
    : cfg_(cfg),
      store_(store),
      engine_(engine),
      dead_letters_(dead_letters),
      metrics_(metrics ? metrics : &noop_),
      log_(log ? log : &noop_log_, "ingest") {
  std::string err = validate_config(cfg_);
  if (!err.empty()) throw std::invalid_argument(err);
}

IngestOutcome IngestPipeline::reject(const Delivery& d, const std::string& reason) {
  log_.warn("dead-letter delivery " + std::to_string(d.delivery_id) + ": " + reason);
  dead_letters_.dead_letter(d, reason);
  metrics_->inc_counter("wasp_ingest_outcome_total", 1, { {"outcome", "dead_lettered"} });
  return IngestOutcome::DeadLettered;
}

IngestOutcome IngestPipeline::store_failure(Delivery& d, const std::string& what, StoreStatus st) {
  if (st != StoreStatus::Unavailable) {
    return reject(d, what + ": " + to_string(st));
  }
  if (d.attempts >= cfg_.max_attempts) {
    return reject(d, what + " still unavailable after " + std::to_string(d.attempts) + " attempts");
  }
  log_.info("retry delivery " + std::to_string(d.delivery_id) + ": " + what + " unavailable");
  metrics_->inc_counter("wasp_ingest_outcome_total", 1, { {"outcome", "retry"} });
  return IngestOutcome::Retry;
}

IngestOutcome IngestPipeline::process(Delivery& d, TimeMs now_ms) {
  d.attempts += 1;
  const VerdictEvent& ev = d.event;

  if (d.persisted_case_id.empty()) {
    std::string err = validate_event(ev);
    if (!err.empty()) return reject(d, err);

    CaseUpsert up{};
    up.key = case_key(ev.zone, ev.ip, ev.asn);
    up.zone = ev.zone;
    up.ip = ev.ip;
    up.asn = ev.asn;
    up.country = ev.country;
    up.ts = ev.ts;
    std::string case_id;
    StoreStatus st = store_.upsert_case(up, case_id);
    if (st != StoreStatus::Ok) return store_failure(d, "upsert case", st);

    Event row{};
    row.case_id = case_id;
    row.ts = ev.ts;
    row.path = ev.path;
    row.method = ev.method;
    row.user_agent = ev.user_agent;
    row.action = *parse_action(ev.action);
    row.score = ev.score;
    row.hits = ev.hits;
    row.colo = ev.colo;
    st = store_.append_event(case_id, row);
    if (st != StoreStatus::Ok) return store_failure(d, "append event", st);
    d.persisted_case_id = case_id;
  }

  RecomputeResult r = engine_.recompute(d.persisted_case_id, ev.zone, now_ms);
  if (r.status == RecomputeStatus::StoreError) return store_failure(d, "recompute", r.store);

  metrics_->inc_counter("wasp_ingest_outcome_total", 1, { {"outcome", "acked"} });
  return IngestOutcome::Acked;
}

BatchReport IngestPipeline::process_batch(EventQueue& queue, std::vector<Delivery>& batch, TimeMs now_ms) {
  BatchReport report{};
  for (auto& d : batch) {
    switch (process(d, now_ms)) {
      case IngestOutcome::Acked:
        ++report.acked;
        break;
      case IngestOutcome::Retry:
        ++report.retried;
        queue.requeue(d);
        break;
      case IngestOutcome::DeadLettered:
        ++report.dead_lettered;
        break;
    }
  }
  metrics_->set_gauge("wasp_event_queue_depth", static_cast<double>(queue.size()));
  return report;
}

IngestWorker::IngestWorker(IngestPipeline& pipeline, EventQueue& queue, Clock clock)
    : pipeline_(pipeline), queue_(queue), clock_(clock ? std::move(clock) : Clock(wall_clock_ms)) {}

IngestWorker::~IngestWorker() { stop(); }

void IngestWorker::start() {
  if (thread_.joinable()) return;
  thread_ = std::thread([this] { run(); });
}

void IngestWorker::stop() {
  queue_.close();
  if (thread_.joinable()) thread_.join();
}

void IngestWorker::run() {
  const IngestConfig& cfg = pipeline_.config();
  for (;;) {
    std::vector<Delivery> batch = queue_.pop_batch(cfg.batch_size, cfg.poll_timeout_ms);
    if (batch.empty()) {
      if (queue_.closed()) return;
      continue;
    }
    BatchReport report = pipeline_.process_batch(queue_, batch, clock_());
    processed_ += report.acked + report.dead_lettered;
    // Only retries: give the store a moment before the next attempt.
    if (report.retried > 0 && report.acked == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(cfg.poll_timeout_ms));
    }
  }
}

} // namespace wasp
