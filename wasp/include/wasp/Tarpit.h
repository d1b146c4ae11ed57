#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include "Config.h"

namespace wasp {

// Connection side of a tarpit response. A false return means the peer is
// gone and the drip should end.
class IChunkWriter {
 public:
  virtual ~IChunkWriter() = default;
  virtual bool write_chunk(std::string_view chunk) = 0;
  virtual void finish() = 0;
};

enum class TarpitEnd : uint8_t {
  Running = 0,
  Completed = 1,
  Cancelled = 2,
  WriteFailed = 3,
};

const char* to_string(TarpitEnd e);

struct TarpitResult {
  TarpitEnd end{TarpitEnd::Running};
  size_t chunks{0};
};

// Slow-drips chunks to one connection on its own thread. cancel() wakes the
// producer immediately instead of waiting for the next tick.
class TarpitTask {
 public:
  TarpitTask(const TarpitConfig& cfg, IChunkWriter& writer);
  ~TarpitTask();
  TarpitTask(const TarpitTask&) = delete;
  TarpitTask& operator=(const TarpitTask&) = delete;

  void start();
  void cancel();
  // Blocks until the producer ends.
  TarpitResult wait();
  bool done() const;

 private:
  void run();

  TarpitConfig cfg_{};
  IChunkWriter& writer_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool cancelled_{false};
  TarpitResult result_{};
  std::thread thread_;
};

} // namespace wasp
