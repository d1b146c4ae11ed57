#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "AggregationEngine.h"
#include "CaseStore.h"
#include "Config.h"
#include "EventQueue.h"
#include "Log.h"
#include "Metrics.h"

namespace wasp {

enum class IngestOutcome : uint8_t {
  Acked = 0,
  Retry = 1,
  DeadLettered = 2,
};

const char* to_string(IngestOutcome o);

// Empty when the event can be stored, otherwise why not.
std::string validate_event(const VerdictEvent& ev);

class IDeadLetterSink {
 public:
  virtual ~IDeadLetterSink() = default;
  virtual void dead_letter(const Delivery& d, const std::string& reason) = 0;
};

class MemoryDeadLetterSink final : public IDeadLetterSink {
 public:
  struct Entry {
    Delivery delivery;
    std::string reason;
  };

  void dead_letter(const Delivery& d, const std::string& reason) override;
  std::vector<Entry> entries() const;

 private:
  mutable std::mutex mu_;
  std::vector<Entry> entries_;
};

struct BatchReport {
  size_t acked{0};
  size_t retried{0};
  size_t dead_lettered{0};
};

// Persists verdict events and keeps their case metrics current. Each delivery
// is acknowledged on its own, only after persist and recompute succeeded.
class IngestPipeline {
 public:
  IngestPipeline(const IngestConfig& cfg, ICaseStore& store, AggregationEngine& engine,
                 IDeadLetterSink& dead_letters, IMetricSink* metrics = nullptr, ILogSink* log = nullptr);

  // Advances `d` (attempt count, persisted marker) and reports what to do with it.
  IngestOutcome process(Delivery& d, TimeMs now_ms);

  // Retries go back to `queue`; dead letters go to the sink.
  BatchReport process_batch(EventQueue& queue, std::vector<Delivery>& batch, TimeMs now_ms);

  const IngestConfig& config() const { return cfg_; }

 private:
  IngestOutcome store_failure(Delivery& d, const std::string& what, StoreStatus st);
  IngestOutcome reject(const Delivery& d, const std::string& reason);

  IngestConfig cfg_{};
  ICaseStore& store_;
  AggregationEngine& engine_;
  IDeadLetterSink& dead_letters_;
  NoopMetricSink noop_{};
  IMetricSink* metrics_{nullptr};
  NoopLogSink noop_log_{};
  Logger log_;
};

// Runs pop/process on a dedicated thread until stop().
class IngestWorker {
 public:
  using Clock = std::function<TimeMs()>;

  IngestWorker(IngestPipeline& pipeline, EventQueue& queue, Clock clock = nullptr);
  ~IngestWorker();
  IngestWorker(const IngestWorker&) = delete;
  IngestWorker& operator=(const IngestWorker&) = delete;

  void start();
  // Closes the queue, drains what is left, joins the thread.
  void stop();

  uint64_t processed() const { return processed_.load(); }

 private:
  void run();

  IngestPipeline& pipeline_;
  EventQueue& queue_;
  Clock clock_;
  std::thread thread_;
  std::atomic<uint64_t> processed_{0};
};

} // namespace wasp
