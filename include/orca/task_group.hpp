/**
 * @file task_group.hpp
 * @brief Owner of detached-looking but joinable worker threads.
 *
 * Each Spawn() first joins every thread whose body has returned, so the
 * group holds at most the threads that are still running plus the new one.
 * CloseAndJoin() refuses further spawns and joins the rest.
 */

#ifndef ORCA_TASK_GROUP_HPP_
#define ORCA_TASK_GROUP_HPP_

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace orca {

class TaskGroup final {
 public:
  TaskGroup() = default;
  ~TaskGroup() { (void)CloseAndJoin(); }

  TaskGroup(const TaskGroup&) = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;
  TaskGroup(TaskGroup&&) = delete;
  TaskGroup& operator=(TaskGroup&&) = delete;

  /// @return false once the group is closed; @p fn is then not run.
  template <typename Fn>
  bool Spawn(Fn&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    ReapFinishedLocked();
    auto done = std::make_shared<std::atomic<bool>>(false);
    Task task;
    task.done = done;
    task.thread = std::thread([body = std::forward<Fn>(fn), done]() mutable {
      body();
      done->store(true, std::memory_order_release);
    });
    tasks_.push_back(std::move(task));
    return true;
  }

  /// @brief Threads whose body has not returned yet.
  size_t Active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& t : tasks_) {
      if (!t.done->load(std::memory_order_acquire)) ++n;
    }
    return n;
  }

  /// @brief Threads still held, finished but not yet joined included.
  size_t Tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  /**
   * @brief Refuse new spawns and join every held thread.
   * @return Number of threads joined by this call. Idempotent.
   */
  size_t CloseAndJoin() {
    std::vector<Task> joining;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      joining.swap(tasks_);
    }
    for (auto& t : joining) {
      if (t.thread.joinable()) t.thread.join();
    }
    return joining.size();
  }

 private:
  struct Task {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void ReapFinishedLocked() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
      if (it->done->load(std::memory_order_acquire)) {
        if (it->thread.joinable()) it->thread.join();
        it = tasks_.erase(it);
      } else {
        ++it;
      }
    }
  }

  mutable std::mutex mutex_;
  std::vector<Task> tasks_;
  bool closed_ = false;
};

}  // namespace orca

#endif  // ORCA_TASK_GROUP_HPP_
