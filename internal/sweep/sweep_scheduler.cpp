#include "internal/sweep/sweep_scheduler.hpp"

#include "internal/observability/logging.hpp"

namespace creditgate::sweep {

SweepScheduler::SweepScheduler(std::shared_ptr<ReliabilitySweep> sweep, std::chrono::milliseconds interval)
    : sweep_(std::move(sweep)), interval_(interval) {
}

SweepScheduler::~SweepScheduler() {
  Stop();
}

void SweepScheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&SweepScheduler::Run, this);
}

void SweepScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void SweepScheduler::Run() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
    if (!running_) break;

    try {
      SweepOptions options;
      options.mode = "cron";
      sweep_->Run(options);
    } catch (const std::exception& e) {
      CREDITGATE_LOG_ERROR("scheduled unlock sweep failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace creditgate::sweep
