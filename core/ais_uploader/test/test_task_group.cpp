// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for TaskGroup
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "task_group.hpp"

using namespace ais::uploader;

namespace {

void updateMax(std::atomic<int>& max_value, int candidate) {
  int seen = max_value.load();
  while (candidate > seen && !max_value.compare_exchange_weak(seen, candidate)) {
  }
}

}  // namespace

TEST(TaskGroupTest, RejectsZeroWidth) {
  EXPECT_THROW({ TaskGroup group(0); }, std::invalid_argument);
}

TEST(TaskGroupTest, RunsEveryTaskOnce) {
  TaskGroup group(4);
  std::mutex mutex;
  std::multiset<size_t> seen;

  auto result = group.run(25, [&](size_t index) {
    std::lock_guard<std::mutex> lock(mutex);
    seen.insert(index);
    return true;
  });

  EXPECT_EQ(result.started, 25u);
  EXPECT_EQ(result.succeeded, 25u);
  EXPECT_EQ(result.failed, 0u);
  EXPECT_FALSE(result.cancelled);
  EXPECT_TRUE(result.allSucceeded(25));
  ASSERT_EQ(seen.size(), 25u);
  for (size_t i = 0; i < 25; ++i) {
    EXPECT_EQ(seen.count(i), 1u);
  }
}

TEST(TaskGroupTest, NeverExceedsWidth) {
  TaskGroup group(3);
  std::atomic<int> in_flight{0};
  std::atomic<int> max_in_flight{0};

  group.run(12, [&](size_t) {
    updateMax(max_in_flight, ++in_flight);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    --in_flight;
    return true;
  });

  EXPECT_LE(max_in_flight.load(), 3);
  EXPECT_GE(max_in_flight.load(), 1);
}

TEST(TaskGroupTest, EmptyRun) {
  TaskGroup group(2);
  auto result = group.run(0, [](size_t) { return true; });

  EXPECT_EQ(result.started, 0u);
  EXPECT_TRUE(result.allSucceeded(0));
}

TEST(TaskGroupTest, StopsDispatchAfterFailure) {
  TaskGroup group(1);
  auto result = group.run(10, [](size_t index) { return index != 2; });

  // Single worker: tasks 0..2 run, nothing after the failure
  EXPECT_EQ(result.started, 3u);
  EXPECT_EQ(result.succeeded, 2u);
  EXPECT_EQ(result.failed, 1u);
  EXPECT_FALSE(result.allSucceeded(10));
}

TEST(TaskGroupTest, InFlightTasksFinishAfterFailure) {
  TaskGroup group(2);
  std::atomic<bool> slow_finished{false};

  auto result = group.run(10, [&](size_t index) {
    if (index == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      slow_finished = true;
      return true;
    }
    return false;
  });

  EXPECT_TRUE(slow_finished.load());
  EXPECT_GE(result.failed, 1u);
  EXPECT_LT(result.started, 10u);
}

TEST(TaskGroupTest, ExceptionCountsAsFailure) {
  TaskGroup group(2);
  auto result = group.run(1, [](size_t) -> bool { throw std::runtime_error("boom"); });

  EXPECT_EQ(result.failed, 1u);
  EXPECT_EQ(result.succeeded, 0u);
}

TEST(TaskGroupTest, NonStandardExceptionCountsAsFailure) {
  TaskGroup group(2);
  auto result = group.run(3, [](size_t index) -> bool {
    if (index == 0) {
      throw 42;
    }
    return true;
  });

  EXPECT_EQ(result.failed, 1u);
  EXPECT_EQ(result.succeeded + result.failed, result.started);
}

// ============================================================================
// Thread start failures
// ============================================================================

TEST(TaskGroupTest, RunsWithFewerThreadsWhenStartFails) {
  int starts = 0;
  TaskGroup group(4, [&](std::function<void()> body) {
    if (++starts > 2) {
      throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    }
    return std::thread(std::move(body));
  });

  std::atomic<int> in_flight{0};
  std::atomic<int> max_in_flight{0};
  auto result = group.run(12, [&](size_t) {
    updateMax(max_in_flight, ++in_flight);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    --in_flight;
    return true;
  });

  EXPECT_EQ(starts, 3);
  EXPECT_EQ(result.succeeded, 12u);
  EXPECT_LE(max_in_flight.load(), 2);
}

TEST(TaskGroupTest, ThrowsWhenNoThreadStarts) {
  TaskGroup group(3, [](std::function<void()>) -> std::thread {
    throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
  });

  std::atomic<int> ran{0};
  EXPECT_THROW(group.run(5, [&](size_t) { return ++ran > 0; }), std::system_error);
  EXPECT_EQ(ran.load(), 0);
}

TEST(TaskGroupTest, CancelFromTask) {
  TaskGroup group(1);
  auto result = group.run(10, [&](size_t index) {
    if (index == 1) {
      group.cancel();
    }
    return true;
  });

  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(result.started, 2u);
  EXPECT_EQ(result.succeeded, 2u);
  EXPECT_EQ(result.failed, 0u);
}

TEST(TaskGroupTest, GroupIsReusableAfterCancel) {
  TaskGroup group(2);
  group.run(4, [&](size_t) {
    group.cancel();
    return true;
  });

  auto result = group.run(5, [](size_t) { return true; });
  EXPECT_FALSE(result.cancelled);
  EXPECT_EQ(result.succeeded, 5u);
}
