// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_TASK_GROUP_HPP
#define AIS_TASK_GROUP_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace ais {
namespace uploader {

/**
 * Summary of one TaskGroup::run() call.
 */
struct TaskGroupResult {
  size_t started = 0;
  size_t succeeded = 0;
  size_t failed = 0;
  bool cancelled = false;

  bool allSucceeded(size_t task_count) const {
    return succeeded == task_count;
  }
};

/**
 * Scoped, bounded group of worker threads.
 *
 * run() starts at most `width` threads that hand out task indices in
 * ascending order. After the first failed task (or cancel()) no further
 * index is handed out; tasks already running finish normally. run()
 * returns only after every thread has been joined, so no task outlives
 * the call.
 *
 * If the system refuses to start some of the threads, run() goes on with
 * the ones it got. It throws std::system_error only when not a single
 * thread could be started.
 *
 * Threading Model:
 * - run() must not be called concurrently on the same group
 * - cancel() may be called from any thread, including from a task
 */
class TaskGroup {
public:
  /**
   * Task callback. Returns true on success. An exception escaping the
   * task is logged and counted as a failure.
   */
  using Task = std::function<bool(size_t index)>;

  /**
   * Starts one worker thread; may throw std::system_error.
   */
  using ThreadStarter = std::function<std::thread(std::function<void()>)>;

  explicit TaskGroup(size_t width);

  /**
   * Constructor with an injected thread starter (for testing)
   */
  TaskGroup(size_t width, ThreadStarter starter);

  // Non-copyable, non-movable
  TaskGroup(const TaskGroup&) = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;
  TaskGroup(TaskGroup&&) = delete;
  TaskGroup& operator=(TaskGroup&&) = delete;

  /**
   * Run tasks 0..task_count-1 with at most width() in flight.
   */
  TaskGroupResult run(size_t task_count, const Task& task);

  /**
   * Stop handing out new tasks for the current run. Has no effect on a
   * run that starts afterwards.
   */
  void cancel();

  size_t width() const {
    return width_;
  }

private:
  void workerLoop(size_t task_count, const Task& task);
  void joinAll(std::vector<std::thread>& threads);

  size_t width_;
  ThreadStarter starter_;
  std::atomic<size_t> next_index_{0};
  std::atomic<bool> stop_dispatch_{false};
  std::atomic<bool> cancel_requested_{false};
  std::atomic<size_t> started_{0};
  std::atomic<size_t> succeeded_{0};
  std::atomic<size_t> failed_{0};
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_TASK_GROUP_HPP
