// Repository: Cadence
// Component: TickScheduler
// Purpose: Owns the single recurring tick timer. Arms, cancels, and
//          reschedules it in place when the period changes mid-wait.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_TIMING_TICK_SCHEDULER_HPP_
#define CADENCE_TIMING_TICK_SCHEDULER_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "cadence/timing/ITimeSource.hpp"

namespace cadence::timing {

// TickScheduler
//
// Persistent worker thread driving at most one armed timer.
//
// Every Arm() stamps a new ticket. The tick callback receives the ticket of
// the arming that fired; owners compare it against IsCurrent() under their
// own lock to discard a callback that raced a Cancel()/Arm().
//
// Lock order: callers may hold their own mutex while calling into the
// scheduler. The worker never holds the scheduler mutex while running the
// callback, so the callback may take the caller's mutex.
class TickScheduler {
 public:
  using TickFn = std::function<void(uint64_t ticket)>;

  struct PendingTick {
    uint64_t ticket = 0;
    int64_t armed_at_ms = 0;  // last (re)arm or fire, ITimeSource clock
    int64_t delay_ms = 0;     // wait measured from armed_at_ms
    int64_t interval_ms = 0;  // steady repeat after the first fire
  };

  TickScheduler(std::shared_ptr<ITimeSource> clock, TickFn on_tick);
  ~TickScheduler();

  TickScheduler(const TickScheduler&) = delete;
  TickScheduler& operator=(const TickScheduler&) = delete;

  // Replaces any armed timer. Returns the new ticket, or 0 after Shutdown().
  uint64_t Arm(int64_t initial_delay_ms, int64_t interval_ms);

  // In-place period change. The already elapsed part of the current wait is
  // credited against the new interval:
  //   delay = max(0, interval_ms - (old_interval - remaining))
  // A wait that is already due stays due. Ticket is unchanged.
  // Returns the reconciled delay, or nullopt if nothing is armed.
  std::optional<int64_t> Reschedule(int64_t interval_ms);

  // Disarms. Does not wait for a callback already in flight.
  void Cancel();

  // Disarms and joins the worker. Must not be called from the callback.
  void Shutdown();

  bool IsArmed() const;
  bool IsCurrent(uint64_t ticket) const;
  std::optional<PendingTick> Pending() const;
  uint64_t fired_total() const;

  static int64_t ReconcileDelayMs(int64_t new_interval_ms, int64_t elapsed_ms);

 private:
  void WorkerLoop();
  void SetDeadlineLocked(int64_t delay_ms);

  std::shared_ptr<ITimeSource> clock_;
  TickFn on_tick_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;

  std::optional<PendingTick> pending_;
  std::chrono::steady_clock::time_point deadline_{};
  uint64_t next_ticket_ = 1;
  uint64_t revision_ = 0;  // bumped on every external change to wake the worker
  uint64_t fired_total_ = 0;
  bool shutdown_ = false;

  std::thread worker_thread_;
};

}  // namespace cadence::timing

#endif  // CADENCE_TIMING_TICK_SCHEDULER_HPP_
