#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/sweep/reliability_sweep.hpp"

namespace creditgate::sweep {

/*
  Background thread that runs the reliability sweep on a fixed interval
  (mode "cron"). The sweep's own cooldown still applies.
*/
class SweepScheduler {
 public:
  SweepScheduler(std::shared_ptr<ReliabilitySweep> sweep, std::chrono::milliseconds interval);
  ~SweepScheduler();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<ReliabilitySweep> sweep_;
  std::chrono::milliseconds         interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace creditgate::sweep
