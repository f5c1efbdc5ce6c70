#include "reclaim/util/Metrics.hpp"
#include "reclaim/util/Logger.hpp"

#include <chrono>
#include <sstream>
#include <vector>

namespace reclaim {
namespace util {

MetricRegistry& MetricRegistry::instance() {
  static MetricRegistry inst;
  return inst;
}

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

void MetricRegistry::startReporter(unsigned int intervalSeconds) {
  // If already running, restart with new interval.
  stopReporter();

  running_.store(true, std::memory_order_release);
  thr_ = std::thread([this, intervalSeconds]{
    reporterLoop(intervalSeconds);
  });
}

void MetricRegistry::stopReporter() {
  running_.store(false, std::memory_order_release);
  if (thr_.joinable()) thr_.join();
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  counters_.clear();
  gauges_.clear();
}

void MetricRegistry::reporterLoop(unsigned int intervalSeconds) {
  using namespace std::chrono;
  const auto period = seconds(intervalSeconds > 0 ? intervalSeconds : 10);
  const auto tick   = milliseconds(100);

  auto next = steady_clock::now() + period;
  while (running_.load(std::memory_order_acquire)) {
    // Short sleeps so stopReporter() does not wait a full period.
    std::this_thread::sleep_for(tick);
    if (steady_clock::now() < next) continue;
    next += period;

    std::vector<Field> fields;
    {
      std::lock_guard<std::mutex> lk(mu_);
      for (auto& kv : counters_) {
        std::ostringstream v; v << kv.second;
        fields.push_back({kv.first, v.str()});
      }
      for (auto& kv : gauges_) {
        std::ostringstream v; v << kv.second;
        fields.push_back({kv.first, v.str()});
      }
    }
    if (!fields.empty()) logger().log(LogLevel::Info, "metrics", fields);
  }
}

} // namespace util
} // namespace reclaim
