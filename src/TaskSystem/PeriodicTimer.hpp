/**
 * @file PeriodicTimer.hpp
 * @brief RAII background timer that invokes a callback at a fixed interval.
 * @details The timer thread sleeps in short slices so destruction never waits longer than
 *          one slice. The callback runs on the timer thread; exceptions are logged.
 * @note The timer joins its thread on destruction, no background work outlives it
 *
 * @code{.cpp}
 * PeriodicTimer timer(std::chrono::seconds(1), []() { counters.Reset(); });
 * @endcode
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <thread>

#include <spdlog/spdlog.h>

class PeriodicTimer {
 public:
  template <typename Rep, typename Period>
  PeriodicTimer(std::chrono::duration<Rep, Period> interval, std::function<void()> callback)
      : callback_(std::move(callback)), stop_timer_(false) {
    auto tick = std::max<std::chrono::milliseconds>(
      std::chrono::duration_cast<std::chrono::milliseconds>(interval), std::chrono::milliseconds(1));

    timer_thread_ = std::thread([this, tick]() {
      auto deadline = std::chrono::steady_clock::now() + tick;

      while (!stop_timer_.load(std::memory_order_acquire)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
          Fire();
          deadline += tick;
          continue;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(10)));
      }
    });
  }

  ~PeriodicTimer() {
    stop_timer_.store(true, std::memory_order_release);
    if (timer_thread_.joinable()) {
      timer_thread_.join();
    }
  }

  PeriodicTimer(const PeriodicTimer&) = delete;
  PeriodicTimer& operator=(const PeriodicTimer&) = delete;
  PeriodicTimer(PeriodicTimer&&) = delete;
  PeriodicTimer& operator=(PeriodicTimer&&) = delete;

 private:
  void Fire() {
    try {
      callback_();
    } catch (const std::exception& e) {
      spdlog::error("PeriodicTimer: callback failed: {}", e.what());
    }
  }

  std::function<void()> callback_;
  std::atomic<bool> stop_timer_;
  std::thread timer_thread_;
};
