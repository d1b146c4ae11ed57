#include "wasp/EventQueue.h"
#include <chrono>

namespace wasp {

EventQueue::EventQueue(size_t capacity) : capacity_(capacity) {}

bool EventQueue::offer(const VerdictEvent& ev) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_ || items_.size() >= capacity_) return false;
    Delivery d{};
    d.delivery_id = next_id_++;
    d.event = ev;
    items_.push_back(std::move(d));
  }
  cv_.notify_one();
  return true;
}

void EventQueue::requeue(Delivery d) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    items_.push_back(std::move(d));
  }
  cv_.notify_one();
}

std::vector<Delivery> EventQueue::pop_batch(size_t max, uint32_t timeout_ms) {
  std::vector<Delivery> out;
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
               [this] { return !items_.empty() || closed_; });
  while (!items_.empty() && out.size() < max) {
    out.push_back(std::move(items_.front()));
    items_.pop_front();
  }
  return out;
}

void EventQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool EventQueue::closed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return items_.size();
}

} // namespace wasp
