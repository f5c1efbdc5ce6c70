#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace reclaim {
namespace cleanup { class Cleaner; }

namespace rt {

// Runs cleanup passes on the io_context thread: once at start, then every
// `interval`, plus whenever wake() asks for one. Handlers still queued when
// the worker is destroyed find it gone and do nothing; destroy it on the
// io_context thread or while that context is not running.
class CleanupWorker {
public:
  CleanupWorker(boost::asio::io_context& ioc,
                cleanup::Cleaner& cleaner,
                std::chrono::milliseconds interval);
  ~CleanupWorker();

  CleanupWorker(const CleanupWorker&)            = delete;
  CleanupWorker& operator=(const CleanupWorker&) = delete;

  void start();
  // Requests an extra pass as soon as the io_context gets to it.
  void wake();
  // Cancels the timer. Pending handlers complete with operation_aborted.
  void stop();

  bool running() const { return running_.load(std::memory_order_relaxed); }
  std::size_t passes() const { return passes_.load(std::memory_order_relaxed); }

private:
  void arm(std::chrono::milliseconds delay);
  void runPass();

private:
  boost::asio::io_context&  ioc_;
  cleanup::Cleaner&         cleaner_;
  std::chrono::milliseconds interval_;
  boost::asio::steady_timer timer_;

  std::shared_ptr<std::atomic<bool>> alive_;
  std::atomic<bool>        running_{false};
  std::atomic<std::size_t> passes_{0};
};

} // namespace rt
} // namespace reclaim
