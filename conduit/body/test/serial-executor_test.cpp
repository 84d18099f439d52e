#include "conduit/serial-executor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace conduit {

TEST(SerialExecutorTest, RunsOnCallingThreadWhenIdle) {
  SerialExecutor executor;
  std::thread::id runner;
  executor.submit([&] {
    runner = std::this_thread::get_id();
    EXPECT_TRUE(executor.runningInThisThread());
  });
  EXPECT_EQ(runner, std::this_thread::get_id());
  EXPECT_FALSE(executor.running());
  EXPECT_EQ(executor.pendingTasks(), 0U);
}

TEST(SerialExecutorTest, NestedSubmitRunsImmediately) {
  SerialExecutor executor;
  std::vector<std::string> events;
  executor.submit([&] {
    events.emplace_back("outer-begin");
    executor.submit([&] { events.emplace_back("inner"); });
    events.emplace_back("outer-end");
  });
  EXPECT_EQ(events, (std::vector<std::string>{"outer-begin", "inner", "outer-end"}));
}

TEST(SerialExecutorTest, ThrowingTaskDoesNotStopLaterTasks) {
  SerialExecutor executor;
  int nbRun = 0;
  executor.submit([&] {
    executor.submit([] { throw std::runtime_error("task failure"); });
    ++nbRun;
  });
  executor.submit([&] { ++nbRun; });
  EXPECT_EQ(nbRun, 2);
  EXPECT_FALSE(executor.running());
}

TEST(SerialExecutorTest, NonStdExceptionDoesNotStopLaterTasks) {
  SerialExecutor executor;
  int nbRun = 0;
  executor.submit([&] {
    executor.submit([] { throw 7; });
    ++nbRun;
  });
  executor.submit([&] { ++nbRun; });
  EXPECT_EQ(nbRun, 2);
  EXPECT_EQ(executor.pendingTasks(), 0U);
  EXPECT_FALSE(executor.running());
}

TEST(SerialExecutorTest, OwnerRunsTasksQueuedBehindNonStdException) {
  SerialExecutor executor;
  std::atomic<bool> ownerInside{false};
  std::atomic<bool> proceed{false};
  std::atomic<int> nbRun{0};

  std::thread owner([&] {
    executor.submit([&] {
      ownerInside.store(true);
      while (!proceed.load()) {
        std::this_thread::yield();
      }
    });
  });
  while (!ownerInside.load()) {
    std::this_thread::yield();
  }

  std::thread thrower([&] { executor.submit([] { throw 7; }); });
  thrower.join();
  std::thread counter([&] { executor.submit([&] { ++nbRun; }); });
  counter.join();
  EXPECT_EQ(nbRun.load(), 0);

  proceed.store(true);
  owner.join();

  EXPECT_EQ(nbRun.load(), 1);
  EXPECT_EQ(executor.pendingTasks(), 0U);
  EXPECT_FALSE(executor.running());
}

TEST(SerialExecutorTest, TasksNeverRunConcurrently) {
  static constexpr int kNbThreads = 8;
  static constexpr int kNbTasksPerThread = 10000;

  SerialExecutor executor;
  std::atomic<bool> inside{false};
  std::atomic<int> nbOverlaps{0};
  int64_t counter = 0;  // not atomic on purpose, protected by the executor

  std::vector<std::thread> threads;
  for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
    threads.emplace_back([&] {
      for (int taskPos = 0; taskPos < kNbTasksPerThread; ++taskPos) {
        executor.submit([&] {
          if (inside.exchange(true)) {
            ++nbOverlaps;
          }
          ++counter;
          inside.store(false);
        });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(nbOverlaps.load(), 0);
  EXPECT_EQ(counter, int64_t{kNbThreads} * kNbTasksPerThread);
  EXPECT_EQ(executor.pendingTasks(), 0U);
  EXPECT_FALSE(executor.running());
}

TEST(SerialExecutorTest, KeepsSubmissionOrderOfEachThread) {
  static constexpr int kNbThreads = 4;
  static constexpr int kNbTasksPerThread = 5000;

  SerialExecutor executor;
  std::vector<int> lastSeen(kNbThreads, -1);
  int nbOutOfOrder = 0;

  std::vector<std::thread> threads;
  for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
    threads.emplace_back([&, threadPos] {
      for (int taskPos = 0; taskPos < kNbTasksPerThread; ++taskPos) {
        executor.submit([&, threadPos, taskPos] {
          if (lastSeen[threadPos] + 1 != taskPos) {
            ++nbOutOfOrder;
          }
          lastSeen[threadPos] = taskPos;
        });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(nbOutOfOrder, 0);
  for (int seen : lastSeen) {
    EXPECT_EQ(seen, kNbTasksPerThread - 1);
  }
}

}  // namespace conduit
