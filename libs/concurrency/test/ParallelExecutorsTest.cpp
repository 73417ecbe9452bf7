#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include <atomic>
#include <chrono>
#include <thread>
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>

using namespace concurrency;

// Helper function to create a simple task that increments a counter
auto createIncrementTask(std::atomic<int>& counter) {
  return [&counter]() { counter.fetch_add(1, std::memory_order_relaxed); };
}

// Helper function to create a task that throws an exception
auto createThrowingTask(const std::string& message) {
  return [message]() { throw std::runtime_error(message); };
}

TEST_CASE("SingleThreadExecutor operations", "[SingleThreadExecutor]")
{
  SingleThreadExecutor executor;

  SECTION("Basic task execution")
  {
    std::atomic<int> counter{0};
    auto future = executor.submit(createIncrementTask(counter));

    REQUIRE_NOTHROW(future.get());
    REQUIRE(counter.load() == 1);
  }

  SECTION("Task executes immediately")
  {
    std::atomic<bool> executed{false};
    auto future = executor.submit([&executed]() { executed.store(true); });

    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    REQUIRE(executed.load());
  }

  SECTION("Reports a single thread")
  {
    REQUIRE(executor.getNumThreads() == 1);
  }

  SECTION("Exception propagation through future")
  {
    auto future = executor.submit(createThrowingTask("test exception"));

    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }

  SECTION("waitAll helper method")
  {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 5; ++i) {
      futures.push_back(executor.submit(createIncrementTask(counter)));
    }

    REQUIRE_NOTHROW(executor.waitAll(futures));
    REQUIRE(counter.load() == 5);
  }
}

TEST_CASE("ThreadPoolExecutor operations", "[ThreadPoolExecutor]")
{
  SECTION("Zero workers is rejected")
  {
    REQUIRE_THROWS_AS(ThreadPoolExecutor(0), std::invalid_argument);
  }

  SECTION("Requested size is honoured")
  {
    ThreadPoolExecutor executor(3);
    REQUIRE(executor.getNumThreads() == 3);
  }

  SECTION("Tasks never exceed the pool size")
  {
    ThreadPoolExecutor executor(4);
    std::atomic<int> concurrentCount{0};
    std::atomic<int> maxConcurrent{0};
    std::vector<std::future<void>> futures;

    auto task = [&concurrentCount, &maxConcurrent]() {
      int current = concurrentCount.fetch_add(1) + 1;

      int expected = maxConcurrent.load();
      while (expected < current &&
             !maxConcurrent.compare_exchange_weak(expected, current)) {
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      concurrentCount.fetch_sub(1);
    };

    for (int i = 0; i < 8; ++i) {
      futures.push_back(executor.submit(task));
    }

    for (auto& f : futures) {
      f.wait();
    }

    REQUIRE(maxConcurrent.load() >= 2);
    REQUIRE(maxConcurrent.load() <= 4);
  }

  SECTION("Exception propagation through packaged_task")
  {
    ThreadPoolExecutor executor(2);

    auto future = executor.submit(createThrowingTask("pool exception"));

    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }

  SECTION("Single thread pool processes tasks sequentially")
  {
    ThreadPoolExecutor executor(1);
    std::vector<int> executionOrder;
    std::mutex orderMutex;
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 10; ++i) {
      futures.push_back(executor.submit([&executionOrder, &orderMutex, i]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        std::lock_guard<std::mutex> lock(orderMutex);
        executionOrder.push_back(i);
      }));
    }

    for (auto& f : futures) {
      f.wait();
    }

    REQUIRE(executionOrder.size() == 10);
    REQUIRE(std::is_sorted(executionOrder.begin(), executionOrder.end()));
  }

  SECTION("Destructor waits for pending tasks")
  {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    {
      ThreadPoolExecutor executor(2);

      for (int i = 0; i < 10; ++i) {
        futures.push_back(executor.submit([&counter]() {
          std::this_thread::sleep_for(std::chrono::milliseconds(10));
          counter.fetch_add(1);
        }));
      }
    }

    REQUIRE(counter.load() == 10);
  }

  SECTION("Large number of small tasks")
  {
    ThreadPoolExecutor executor(4);
    std::atomic<int> sum{0};
    std::vector<std::future<void>> futures;

    const int numTasks = 1000;
    for (int i = 0; i < numTasks; ++i) {
      futures.push_back(executor.submit([&sum, i]() {
        sum.fetch_add(i);
      }));
    }

    executor.waitAll(futures);

    int expectedSum = (numTasks * (numTasks - 1)) / 2;
    REQUIRE(sum.load() == expectedSum);
  }

  SECTION("waitIdle returns once queued work has drained")
  {
    ThreadPoolExecutor executor(2);
    std::atomic<int> counter{0};

    for (int i = 0; i < 6; ++i) {
      executor.submit([&counter]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        counter.fetch_add(1);
      });
    }

    executor.waitIdle();
    REQUIRE(counter.load() == 6);
    REQUIRE(executor.getBusyWorkers() == 0);
    REQUIRE(executor.getQueuedTasks() == 0);
  }

  SECTION("Shutdown finishes queued tasks and refuses new ones")
  {
    ThreadPoolExecutor executor(1);
    std::atomic<int> counter{0};

    for (int i = 0; i < 4; ++i) {
      executor.submit([&counter]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        counter.fetch_add(1);
      });
    }

    executor.shutdown();
    REQUIRE(counter.load() == 4);
    REQUIRE_THROWS_AS(executor.submit(createIncrementTask(counter)), std::runtime_error);
  }
}
