/**
 * @file Task.hpp
 * @brief Dependency-counted unit of work scheduled on a ThreadPool.
 * @details A task becomes runnable once every predecessor registered through Finally() has
 *          finished. EventBus uses tasks for three things: one task per handler invocation,
 *          one join task per delivered event, and the completion task handed out by
 *          PublishAsync.
 *
 * @code{.cpp}
 * auto join = std::make_shared<Task<void>>([]() { std::cout << "both done\n"; });
 * first->Finally(join);
 * second->Finally(join);
 * first->TrySchedule(pool);
 * second->TrySchedule(pool);
 * join->Wait();
 * @endcode
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "ThreadPool.hpp"

template <typename T>
class Task;

class TaskBase {
 public:
  virtual ~TaskBase() = default;

  void Wait() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait(lock, [this] { return is_done_.load(std::memory_order_acquire); });
  }

  // Returns false if the task did not finish within the timeout.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    return wait_cv_.wait_for(lock, timeout, [this] { return is_done_.load(std::memory_order_acquire); });
  }

  void OnPredecessorFinished(ThreadPool& pool) {
    if (predecessor_count_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      TrySchedule(pool);
    }
  }

  void TrySchedule(ThreadPool& pool) {
    if (predecessor_count_.load(std::memory_order_acquire) == 0) {
      if (!is_scheduled_.exchange(true, std::memory_order_acq_rel)) {
        Execute(pool);
      }
    }
  }

  bool IsDone() const {
    return is_done_.load(std::memory_order_acquire);
  }

  bool IsScheduled() const {
    return is_scheduled_.load(std::memory_order_acquire);
  }

  std::exception_ptr GetException() const {
    std::lock_guard<std::mutex> lock(exception_mutex_);
    return exception_;
  }

 protected:
  void NotifyFinished() {
    {
      std::lock_guard<std::mutex> lock(wait_mutex_);
      is_done_.store(true, std::memory_order_release);
    }
    wait_cv_.notify_all();
  }

  virtual void Execute(ThreadPool& pool) = 0;
  virtual void NotifySuccessors(ThreadPool& pool) = 0;

  std::atomic<int> predecessor_count_{0};
  std::atomic<bool> is_done_{false};
  std::atomic<bool> is_scheduled_{false};
  std::exception_ptr exception_ = nullptr;
  mutable std::mutex exception_mutex_;
  mutable std::mutex wait_mutex_;
  mutable std::condition_variable wait_cv_;
  std::vector<std::shared_ptr<Task<void>>> successors_;

  template <typename U>
  friend class Task;
};

template <>
class Task<void> : public TaskBase, public std::enable_shared_from_this<Task<void>> {
 public:
  explicit Task(std::function<void()> callback) : callback_(std::move(callback)) {
  }

  // next runs once this task has finished, whether or not it threw
  std::shared_ptr<Task<void>> Finally(std::shared_ptr<Task<void>> next) {
    successors_.push_back(next);
    next->predecessor_count_.fetch_add(1, std::memory_order_relaxed);
    return next;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;
  Task(Task&&) = delete;
  Task& operator=(Task&&) = delete;

 private:
  void Execute(ThreadPool& pool) override {
    auto self = shared_from_this();
    pool.Enqueue([self, &pool]() {
      try {
        if (self->callback_) {
          self->callback_();
        }
      } catch (...) {
        std::lock_guard<std::mutex> lock(self->exception_mutex_);
        self->exception_ = std::current_exception();
      }
      self->NotifyFinished();
      self->NotifySuccessors(pool);
    });
  }

  void NotifySuccessors(ThreadPool& pool) override {
    for (auto& next : successors_) {
      next->OnPredecessorFinished(pool);
    }
  }

  std::function<void()> callback_;
};

using TaskPtr = std::shared_ptr<Task<void>>;

inline TaskPtr MakeTask(std::function<void()> callback) {
  return std::make_shared<Task<void>>(std::move(callback));
}
