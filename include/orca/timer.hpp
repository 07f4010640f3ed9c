/**
 * @file timer.hpp
 * @brief Periodic task scheduler for the orchestrator's housekeeping.
 *
 * One background thread fires registered callbacks at fixed periods. The
 * registry's cleanup sweep and the worker pool's reaper/health probe run
 * here, so a slow callback delays the others but never a tool call.
 *
 * Callbacks are invoked without the scheduler lock held, so a callback may
 * call Add()/Remove() on the same scheduler.
 */

#ifndef ORCA_TIMER_HPP_
#define ORCA_TIMER_HPP_

#include "orca/platform.hpp"
#include "orca/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace orca {

/**
 * @brief Callback invoked on each period tick.
 * @param ctx User-supplied opaque context pointer (may be nullptr).
 */
using TimerTaskFn = void (*)(void* ctx);

/**
 * @brief Fixed-capacity periodic scheduler driven by one background thread.
 *
 * @code
 *   orca::TimerScheduler sched(4);
 *   sched.Add(30000, &OperationRegistry::SweepTick, &registry);
 *   sched.Start();
 *   ...
 *   sched.Stop();
 * @endcode
 *
 * Non-copyable, non-movable.
 */
class TimerScheduler final {
 public:
  explicit TimerScheduler(uint32_t max_tasks = 8) : slots_(max_tasks) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  /**
   * @brief Register a periodic task. The first firing is one period from now.
   * @return Task id, or kInvalidPeriod (period 0, null fn) / kSlotsFull.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn,
                                        void* ctx = nullptr) {
    if (period_ms == 0U || fn == nullptr) {
      return expected<TimerTaskId, TimerError>::error(TimerError::kInvalidPeriod);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (!slot.active) {
        slot.fn = fn;
        slot.ctx = ctx;
        slot.period = std::chrono::milliseconds(period_ms);
        slot.next_fire = Clock::now() + slot.period;
        slot.id = next_id_++;
        slot.active = true;
        cv_.notify_all();
        return expected<TimerTaskId, TimerError>::success(TimerTaskId(slot.id));
      }
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  /// @brief Remove a task. kNotRunning if @p task_id is unknown.
  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active && slot.id == task_id.value()) {
        slot.active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotRunning);
  }

  /// @brief Start the scheduler thread. kAlreadyRunning if started twice.
  expected<void, TimerError> Start() {
    bool was_running = running_.exchange(true, std::memory_order_acq_rel);
    if (was_running) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /// @brief Stop the scheduler thread and join it. Safe if not running.
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint32_t TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (const auto& slot : slots_) {
      if (slot.active) ++count;
    }
    return count;
  }

 private:
  using Clock = std::chrono::steady_clock;

  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    std::chrono::milliseconds period{0};
    Clock::time_point next_fire{};
    uint32_t id = 0;
    bool active = false;
  };

  struct DueTask {
    TimerTaskFn fn;
    void* ctx;
  };

  std::vector<TaskSlot> slots_;
  uint32_t next_id_ = 1;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;

  void ScheduleLoop() {
    std::vector<DueTask> due;
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
      const Clock::time_point now = Clock::now();
      Clock::time_point wake = now + std::chrono::seconds(1);
      due.clear();

      for (auto& slot : slots_) {
        if (!slot.active) continue;
        if (now >= slot.next_fire) {
          due.push_back(DueTask{slot.fn, slot.ctx});
          // Skip missed periods rather than firing a burst.
          while (slot.next_fire <= now) {
            slot.next_fire += slot.period;
          }
        }
        if (slot.next_fire < wake) wake = slot.next_fire;
      }

      if (!due.empty()) {
        lock.unlock();
        for (const auto& task : due) {
          task.fn(task.ctx);
        }
        lock.lock();
        continue;
      }

      // Woken early by Add()/Stop(); the loop re-evaluates every slot.
      cv_.wait_until(lock, wake);
    }
  }
};

}  // namespace orca

#endif  // ORCA_TIMER_HPP_
