// Repository: Cadence
// Component: TickScheduler Implementation
// Purpose: Single-timer worker with in-place reschedule.
// Copyright (c) 2025 Cadence

#include "cadence/timing/TickScheduler.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "cadence/util/Logger.hpp"

namespace cadence::timing {

using cadence::util::Logger;

TickScheduler::TickScheduler(std::shared_ptr<ITimeSource> clock, TickFn on_tick)
    : clock_(std::move(clock)), on_tick_(std::move(on_tick)) {
  if (!clock_) {
    throw std::invalid_argument("TickScheduler requires a time source");
  }
  if (!on_tick_) {
    throw std::invalid_argument("TickScheduler requires a tick callback");
  }
  worker_thread_ = std::thread(&TickScheduler::WorkerLoop, this);
}

TickScheduler::~TickScheduler() {
  Shutdown();
}

int64_t TickScheduler::ReconcileDelayMs(int64_t new_interval_ms, int64_t elapsed_ms) {
  return std::max<int64_t>(0, new_interval_ms - std::max<int64_t>(0, elapsed_ms));
}

void TickScheduler::SetDeadlineLocked(int64_t delay_ms) {
  deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
  ++revision_;
}

uint64_t TickScheduler::Arm(int64_t initial_delay_ms, int64_t interval_ms) {
  if (interval_ms <= 0) {
    throw std::invalid_argument("TickScheduler interval must be positive: " +
                                std::to_string(interval_ms));
  }

  uint64_t ticket = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return 0;
    }
    PendingTick tick;
    tick.ticket = next_ticket_++;
    tick.armed_at_ms = clock_->NowMs();
    tick.delay_ms = std::max<int64_t>(0, initial_delay_ms);
    tick.interval_ms = interval_ms;
    pending_ = tick;
    SetDeadlineLocked(tick.delay_ms);
    ticket = tick.ticket;
  }
  cv_.notify_all();

  std::ostringstream oss;
  oss << "[TickScheduler] ARM ticket=" << ticket << " delay_ms=" << initial_delay_ms
      << " interval_ms=" << interval_ms;
  Logger::Debug(oss.str());
  return ticket;
}

std::optional<int64_t> TickScheduler::Reschedule(int64_t interval_ms) {
  if (interval_ms <= 0) {
    throw std::invalid_argument("TickScheduler interval must be positive: " +
                                std::to_string(interval_ms));
  }

  int64_t delay_ms = 0;
  int64_t elapsed_ms = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_) {
      return std::nullopt;
    }
    const int64_t now_ms = clock_->NowMs();
    const int64_t remaining_ms = std::max<int64_t>(
        0, pending_->armed_at_ms + pending_->delay_ms - now_ms);
    if (remaining_ms > 0) {
      elapsed_ms = std::max<int64_t>(0, pending_->interval_ms - remaining_ms);
      delay_ms = ReconcileDelayMs(interval_ms, elapsed_ms);
    }
    pending_->armed_at_ms = now_ms;
    pending_->delay_ms = delay_ms;
    pending_->interval_ms = interval_ms;
    SetDeadlineLocked(delay_ms);
  }
  cv_.notify_all();

  std::ostringstream oss;
  oss << "[TickScheduler] RESCHEDULE interval_ms=" << interval_ms
      << " elapsed_ms=" << elapsed_ms << " delay_ms=" << delay_ms;
  Logger::Debug(oss.str());
  return delay_ms;
}

void TickScheduler::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_) return;
    pending_.reset();
    ++revision_;
  }
  cv_.notify_all();
}

void TickScheduler::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
    pending_.reset();
    ++revision_;
  }
  cv_.notify_all();
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
}

bool TickScheduler::IsArmed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.has_value();
}

bool TickScheduler::IsCurrent(uint64_t ticket) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.has_value() && pending_->ticket == ticket;
}

std::optional<TickScheduler::PendingTick> TickScheduler::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

uint64_t TickScheduler::fired_total() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fired_total_;
}

// =============================================================================
// WorkerLoop: waits out the armed deadline, fires, re-arms at interval
// =============================================================================

void TickScheduler::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!shutdown_) {
    if (!pending_) {
      cv_.wait(lock, [this] { return shutdown_ || pending_.has_value(); });
      continue;
    }

    const uint64_t revision = revision_;
    const bool changed = cv_.wait_until(lock, deadline_, [this, revision] {
      return shutdown_ || revision_ != revision;
    });
    if (changed) {
      continue;
    }

    // Deadline reached for the same arming. Next wait is one interval from
    // the previous deadline so a slow callback does not accumulate drift.
    const uint64_t ticket = pending_->ticket;
    const auto now = std::chrono::steady_clock::now();
    deadline_ += std::chrono::milliseconds(pending_->interval_ms);
    if (deadline_ < now) {
      deadline_ = now;
    }
    pending_->armed_at_ms = clock_->NowMs();
    pending_->delay_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                             deadline_ - now).count();
    ++fired_total_;

    lock.unlock();
    try {
      on_tick_(ticket);
    } catch (const std::exception& e) {
      Logger::Error(std::string("[TickScheduler] tick callback failed: ") + e.what());
    }
    lock.lock();
  }
}

}  // namespace cadence::timing
