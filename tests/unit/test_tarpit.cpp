#include "wasp/Tarpit.h"
#include <cassert>
#include <chrono>
#include <mutex>
#include <thread>

using namespace wasp;

namespace {

class RecordingWriter final : public IChunkWriter {
 public:
  explicit RecordingWriter(int fail_on = 0) : fail_on_(fail_on) {}
  bool write_chunk(std::string_view chunk) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++calls_;
    if (fail_on_ > 0 && calls_ >= fail_on_) return false;
    body_.append(chunk);
    return true;
  }
  void finish() override {
    std::lock_guard<std::mutex> lock(mu_);
    finished_ = true;
  }
  std::string body() const {
    std::lock_guard<std::mutex> lock(mu_);
    return body_;
  }
  bool finished() const {
    std::lock_guard<std::mutex> lock(mu_);
    return finished_;
  }

 private:
  mutable std::mutex mu_;
  int fail_on_{0};
  int calls_{0};
  std::string body_;
  bool finished_{false};
};

using steady = std::chrono::steady_clock;

long elapsed_ms(steady::time_point since) {
  return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - since).count());
}

void drips_until_duration() {
  TarpitConfig cfg{};
  cfg.duration_ms = 120;
  cfg.interval_ms = 30;
  RecordingWriter w;
  TarpitTask task(cfg, w);
  task.start();
  TarpitResult r = task.wait();
  assert(r.end == TarpitEnd::Completed);
  assert(r.chunks >= 1 && r.chunks <= 5);
  assert(w.body() == std::string(r.chunks, '.'));
  assert(w.finished());
  assert(task.done());
}

void cancel_wakes_producer() {
  TarpitConfig cfg{};
  cfg.duration_ms = 60000;
  cfg.interval_ms = 5000;
  RecordingWriter w;
  TarpitTask task(cfg, w);
  auto t0 = steady::now();
  task.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  task.cancel();
  TarpitResult r = task.wait();
  assert(elapsed_ms(t0) < 2000);
  assert(r.end == TarpitEnd::Cancelled);
  assert(r.chunks == 1);
  assert(w.finished());
}

void stops_when_peer_goes_away() {
  TarpitConfig cfg{};
  cfg.duration_ms = 60000;
  cfg.interval_ms = 5;
  RecordingWriter w(3);
  TarpitTask task(cfg, w);
  auto t0 = steady::now();
  task.start();
  TarpitResult r = task.wait();
  assert(elapsed_ms(t0) < 2000);
  assert(r.end == TarpitEnd::WriteFailed);
  assert(r.chunks == 2);
  assert(!w.finished());
}

void destructor_cancels() {
  TarpitConfig cfg{};
  cfg.duration_ms = 60000;
  cfg.interval_ms = 5000;
  RecordingWriter w;
  auto t0 = steady::now();
  {
    TarpitTask task(cfg, w);
    task.start();
  }
  assert(elapsed_ms(t0) < 2000);
}

} // namespace

void test_tarpit() {
  drips_until_duration();
  cancel_wakes_producer();
  stops_when_peer_goes_away();
  destructor_cancels();
}
