#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace reclaim {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
// Optional: can run a background reporter thread that logs snapshots.
class MetricRegistry {
public:
  static MetricRegistry& instance();

  MetricRegistry() = default;
  ~MetricRegistry();

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  void startReporter(unsigned int intervalSeconds = 10);
  void stopReporter();

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  double counter(const std::string& name) const;

  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  void reset();

private:
  void reporterLoop(unsigned int intervalSeconds);

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;

  std::atomic<bool> running_{false};
  std::thread thr_;
};

} // namespace util
} // namespace reclaim

#define RECLAIM_METRIC_INC(name, d) ::reclaim::util::MetricRegistry::instance().increment((name), (d))
#define RECLAIM_METRIC_HIT(name)    ::reclaim::util::MetricRegistry::instance().increment((name), 1.0)
#define RECLAIM_METRIC_SET(name, v) ::reclaim::util::MetricRegistry::instance().setGauge((name), (v))
