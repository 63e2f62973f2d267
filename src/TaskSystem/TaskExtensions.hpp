/**
 * @file TaskExtensions.hpp
 * @brief Composition helpers for fan-out/join over the ThreadPool.
 * @details WhenAll wires every task to the join task before scheduling any of them, so a
 *          task that finishes immediately can never miss its successor.
 *
 * @code{.cpp}
 * auto join = MakeTask([]() { std::cout << "batch finished\n"; });
 * WhenAll(pool, {task1, task2, task3}, join);
 * @endcode
 */
#pragma once

#include <memory>
#include <vector>

#include "Task.hpp"
#include "ThreadPool.hpp"

inline TaskPtr WhenAll(ThreadPool& pool, const std::vector<TaskPtr>& tasks, TaskPtr join) {
  if (tasks.empty()) {
    join->TrySchedule(pool);
    return join;
  }

  for (const auto& task : tasks) {
    task->Finally(join);
  }

  for (const auto& task : tasks) {
    task->TrySchedule(pool);
  }

  return join;
}

inline TaskPtr WhenAll(ThreadPool& pool, const std::vector<TaskPtr>& tasks) {
  return WhenAll(pool, tasks, MakeTask([]() {}));
}
