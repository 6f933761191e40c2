// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "task_group.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

#define AIS_LOG_COMPONENT "task_group"
#include "ais_log_macros.hpp"

namespace ais {
namespace uploader {

using logging::kv;

TaskGroup::TaskGroup(size_t width)
    : TaskGroup(width, [](std::function<void()> body) {
      return std::thread(std::move(body));
    }) {}

TaskGroup::TaskGroup(size_t width, ThreadStarter starter)
    : width_(width)
    , starter_(std::move(starter)) {
  if (width_ == 0) {
    throw std::invalid_argument("TaskGroup width must be positive");
  }
}

TaskGroupResult TaskGroup::run(size_t task_count, const Task& task) {
  next_index_.store(0);
  cancel_requested_.store(false);
  stop_dispatch_.store(false);
  started_.store(0);
  succeeded_.store(0);
  failed_.store(0);

  size_t thread_count = std::min(width_, task_count);
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    try {
      threads.push_back(starter_([this, task_count, &task]() { workerLoop(task_count, task); }));
    } catch (const std::system_error& e) {
      if (threads.empty()) {
        AIS_LOG_ERROR("Cannot start any worker thread - " << e.what());
        throw;
      }
      AIS_LOG_WARN(
        "Running with fewer worker threads" << kv("started", threads.size())
                                            << kv("requested", thread_count) << " - " << e.what()
      );
      break;
    }
  }
  joinAll(threads);

  TaskGroupResult result;
  result.started = started_.load();
  result.succeeded = succeeded_.load();
  result.failed = failed_.load();
  result.cancelled = cancel_requested_.load();
  return result;
}

void TaskGroup::joinAll(std::vector<std::thread>& threads) {
  for (auto& t : threads) {
    if (t.joinable()) {
      t.join();
    }
  }
}

void TaskGroup::cancel() {
  cancel_requested_.store(true);
  stop_dispatch_.store(true);
}

void TaskGroup::workerLoop(size_t task_count, const Task& task) {
  while (!stop_dispatch_.load()) {
    size_t index = next_index_.fetch_add(1);
    if (index >= task_count) {
      return;
    }
    started_.fetch_add(1);

    bool ok = false;
    try {
      ok = task(index);
    } catch (const std::exception& e) {
      AIS_LOG_ERROR("Task raised an exception" << kv("index", index) << " - " << e.what());
      ok = false;
    } catch (...) {
      // Nothing may cross the thread boundary; counted as a failed task
      AIS_LOG_ERROR("Task raised a non-standard exception" << kv("index", index));
      ok = false;
    }

    if (ok) {
      succeeded_.fetch_add(1);
    } else {
      failed_.fetch_add(1);
      stop_dispatch_.store(true);
    }
  }
}

}  // namespace uploader
}  // namespace ais
