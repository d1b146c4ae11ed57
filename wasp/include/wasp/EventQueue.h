#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include "Common.h"

namespace wasp {

// Where the edge drops verdict events. Must not block the request path.
class IEventSink {
 public:
  virtual ~IEventSink() = default;
  // False when the event could not be accepted (e.g. queue full).
  virtual bool emit(const VerdictEvent& ev) = 0;
};

// One at-least-once delivery of an event.
struct Delivery {
  uint64_t delivery_id{0};
  uint32_t attempts{0};
  VerdictEvent event{};
  // Set once the event row is stored, so a retry only reruns the recompute.
  std::string persisted_case_id;
};

// Bounded multi-producer channel of deliveries.
class EventQueue final : public IEventSink {
 public:
  explicit EventQueue(size_t capacity);

  bool emit(const VerdictEvent& ev) override { return offer(ev); }
  bool offer(const VerdictEvent& ev);
  // Puts a delivery back for another attempt. Ignores capacity so a retry is
  // never lost to producer pressure.
  void requeue(Delivery d);

  // Waits up to timeout_ms for at least one delivery, then drains up to max.
  std::vector<Delivery> pop_batch(size_t max, uint32_t timeout_ms);

  // Wakes all waiters; later offers are refused.
  void close();
  bool closed() const;
  size_t size() const;

 private:
  size_t capacity_{0};
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Delivery> items_;
  uint64_t next_id_{1};
  bool closed_{false};
};

} // namespace wasp
