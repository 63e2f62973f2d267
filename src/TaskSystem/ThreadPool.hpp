/**
 * @file ThreadPool.hpp
 * @brief Fixed-size worker pool that runs event deliveries and task continuations.
 * @details Jobs are executed in FIFO order of submission. A job that throws is logged and
 *          dropped; the worker keeps running. Shutdown drains every job already queued,
 *          including jobs enqueued by running jobs.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

class ThreadPool {
 public:
  explicit ThreadPool(size_t threads = GetDefaultThreadCount()) {
    threads = std::max(size_t{1}, threads);
    for (size_t i = 0; i < threads; ++i) {
      workers_.emplace_back([this] { WorkerLoop(); });
    }
  }

  void Enqueue(std::function<void()> job) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      jobs_.emplace(std::move(job));
    }
    condition_.notify_one();
  }

  size_t Size() const {
    return workers_.size();
  }

  ~ThreadPool() {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      stop_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_) {
      worker.join();
    }
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

 private:
  static size_t GetDefaultThreadCount() {
    auto core = std::thread::hardware_concurrency();
    if (core == 0) return 1;
    return std::max(size_t{1}, static_cast<size_t>(core - 1));
  }

  void WorkerLoop() {
    while (true) {
      std::function<void()> job;
      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        condition_.wait(lock, [this] { return stop_ || !jobs_.empty(); });

        if (stop_ && jobs_.empty()) {
          return;
        }

        job = std::move(jobs_.front());
        jobs_.pop();
      }

      try {
        job();
      } catch (const std::exception& e) {
        spdlog::error("ThreadPool: job failed: {}", e.what());
      }
    }
  }

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> jobs_;
  std::mutex queue_mutex_;
  std::condition_variable condition_;
  bool stop_ = false;
};
