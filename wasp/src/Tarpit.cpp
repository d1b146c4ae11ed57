#include "wasp/Tarpit.h"
#include <chrono>
#include <stdexcept>

namespace wasp {

const char* to_string(TarpitEnd e) {
  switch (e) {
    case TarpitEnd::Running: return "running";
    case TarpitEnd::Completed: return "completed";
    case TarpitEnd::Cancelled: return "cancelled";
    case TarpitEnd::WriteFailed: return "write_failed";
  }
  return "?";
}

TarpitTask::TarpitTask(const TarpitConfig& cfg, IChunkWriter& writer) : cfg_(cfg), writer_(writer) {
  std::string err = validate_config(cfg_);
  if (!err.empty()) throw std::invalid_argument(err);
}

TarpitTask::~TarpitTask() {
  cancel();
  if (thread_.joinable()) thread_.join();
}

void TarpitTask::start() {
  if (thread_.joinable()) return;
  thread_ = std::thread([this] { run(); });
}

void TarpitTask::cancel() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

TarpitResult TarpitTask::wait() {
  if (thread_.joinable()) thread_.join();
  std::lock_guard<std::mutex> lock(mu_);
  return result_;
}

bool TarpitTask::done() const {
  std::lock_guard<std::mutex> lock(mu_);
  return result_.end != TarpitEnd::Running;
}

void TarpitTask::run() {
  using clock = std::chrono::steady_clock;
  const auto end = clock::now() + std::chrono::milliseconds(cfg_.duration_ms);
  const auto interval = std::chrono::milliseconds(cfg_.interval_ms);
  size_t chunks = 0;
  TarpitEnd why = TarpitEnd::Completed;

  std::unique_lock<std::mutex> lock(mu_);
  while (clock::now() < end) {
    if (cancelled_) {
      why = TarpitEnd::Cancelled;
      break;
    }
    lock.unlock();
    bool ok = writer_.write_chunk(cfg_.chunk);
    lock.lock();
    if (!ok) {
      why = TarpitEnd::WriteFailed;
      break;
    }
    ++chunks;
    if (cv_.wait_for(lock, interval, [this] { return cancelled_; })) {
      why = TarpitEnd::Cancelled;
      break;
    }
  }
  result_.chunks = chunks;
  result_.end = why;
  lock.unlock();

  if (why != TarpitEnd::WriteFailed) writer_.finish();
}

} // namespace wasp
