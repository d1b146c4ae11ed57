#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wasp {

struct MetricLabel {
  std::string key;
  std::string value;
};

using MetricLabels = std::vector<MetricLabel>;

class IMetricSink {
 public:
  virtual ~IMetricSink() = default;
  virtual void inc_counter(std::string_view name, uint64_t value = 1, const MetricLabels& labels = {}) = 0;
  virtual void set_gauge(std::string_view name, double value, const MetricLabels& labels = {}) = 0;
  virtual void observe_histogram(std::string_view name, double value, const MetricLabels& labels = {}) = 0;
};

class NoopMetricSink final : public IMetricSink {
 public:
  void inc_counter(std::string_view, uint64_t, const MetricLabels&) override {}
  void set_gauge(std::string_view, double, const MetricLabels&) override {}
  void observe_histogram(std::string_view, double, const MetricLabels&) override {}
};

// Observes elapsed wall time in milliseconds into a histogram on scope exit.
class ScopedLatency {
 public:
  ScopedLatency(IMetricSink& sink, std::string_view name)
      : sink_(sink), name_(name), start_(std::chrono::steady_clock::now()) {}
  ~ScopedLatency() {
    auto elapsed = std::chrono::steady_clock::now() - start_;
    sink_.observe_histogram(name_, std::chrono::duration<double, std::milli>(elapsed).count());
  }
  ScopedLatency(const ScopedLatency&) = delete;
  ScopedLatency& operator=(const ScopedLatency&) = delete;

 private:
  IMetricSink& sink_;
  std::string name_;
  std::chrono::steady_clock::time_point start_;
};

} // namespace wasp
