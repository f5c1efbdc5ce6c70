#include "reclaim/rt/CleanupWorker.hpp"

#include "reclaim/cleanup/Cleaner.hpp"
#include "reclaim/util/Logger.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include <string>

namespace reclaim::rt {

CleanupWorker::CleanupWorker(boost::asio::io_context& ioc,
                             cleanup::Cleaner& cleaner,
                             std::chrono::milliseconds interval)
  : ioc_(ioc)
  , cleaner_(cleaner)
  , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1))
  , timer_(ioc)
  , alive_(std::make_shared<std::atomic<bool>>(true)) {}

CleanupWorker::~CleanupWorker() {
  alive_->store(false);
  running_.store(false);
  timer_.cancel();
}

void CleanupWorker::start() {
  if (running_.exchange(true)) return;
  util::logger().log(util::LogLevel::Info, "worker.start",
                     {{"intervalMs", std::to_string(interval_.count())}});
  boost::asio::post(ioc_, [this, alive = alive_] {
    if (!*alive || !running_) return;
    runPass();
    arm(interval_);
  });
}

void CleanupWorker::wake() {
  if (!running_) return;
  boost::asio::post(ioc_, [this, alive = alive_] {
    if (!*alive || !running_) return;
    arm(std::chrono::milliseconds(0));
  });
}

void CleanupWorker::stop() {
  if (!running_.exchange(false)) return;
  boost::asio::dispatch(ioc_, [this, alive = alive_] {
    if (*alive) timer_.cancel();
  });
  util::logger().log(util::LogLevel::Info, "worker.stop",
                     {{"passes", std::to_string(passes())}});
}

void CleanupWorker::arm(std::chrono::milliseconds delay) {
  // Re-arming cancels any wait already pending on the timer.
  timer_.expires_after(delay);
  timer_.async_wait([this, alive = alive_](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || !*alive || !running_) return;
    runPass();
    arm(interval_);
  });
}

void CleanupWorker::runPass() {
  cleanup::CleanupReport report;
  Status st = cleaner_.runCleanup(&report);
  passes_.fetch_add(1, std::memory_order_relaxed);

  if (!st) {
    util::logger().log(util::LogLevel::Error, "worker.pass_failed", {{"error", st.describe()}});
    return;
  }
  if (report.processed > 0) {
    util::logger().log(util::LogLevel::Debug, "worker.pass",
                       {{"processed", std::to_string(report.processed)},
                        {"failed", std::to_string(report.failed)}});
  }
}

} // namespace reclaim::rt
