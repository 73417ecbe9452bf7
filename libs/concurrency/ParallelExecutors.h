#pragma once

#include "IParallelExecutor.h"
#include <deque>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>

/**
 * @file ParallelExecutors.h
 * @brief Provides executor policies for parallel task execution.
 *
 * This file defines two implementations of the IParallelExecutor interface:
 *  - SingleThreadExecutor: runs tasks inline on the calling thread (deterministic, no concurrency).
 *  - ThreadPoolExecutor: a fixed pool of workers whose size is chosen at construction.
 *
 * @section usage Guidance on choosing an executor policy
 * - SingleThreadExecutor: Use in unit tests or when debugging, or when concurrency must be disabled.
 * - ThreadPoolExecutor: Use for batches of backtests. The pool size is the only concurrency
 *   knob; it bounds how many backtests can be in flight at once.
 *
 * Executors are ordinary objects owned by their caller. There is no process-wide pool.
 */
namespace concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   *
   * All tasks run inline, with no actual concurrency. Useful for deterministic unit tests
   * or single-threaded fallbacks where concurrency should be disabled.
   */
  class SingleThreadExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try {
	task();
	prom.set_value();
      } catch (...) {
	prom.set_exception(std::current_exception());
      }
      return fut;
    }

    std::size_t getNumThreads() const override
    {
      return 1;
    }
  };

  /**
   * @brief Fixed pool of worker threads for batches of backtests.
   *
   * The pool size is fixed at construction and must be at least one.
   * Submitted tasks wait in a FIFO queue as std::packaged_task objects, so
   * an exception thrown by a task is delivered through its future.
   *
   * shutdown() stops accepting work, lets the workers finish everything
   * already queued and joins them. The destructor calls it.
   */
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    explicit ThreadPoolExecutor(std::size_t numWorkers)
      : busy_(0),
	accepting_(true)
    {
      if (numWorkers == 0)
	throw std::invalid_argument("ThreadPoolExecutor: at least one worker is required");

      workers_.reserve(numWorkers);
      try {
	for (std::size_t i = 0; i < numWorkers; ++i)
	  workers_.emplace_back([this] { workerLoop(); });
      }
      catch (...) {
	shutdown();
	throw;
      }
    }

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      std::packaged_task<void()> packaged(std::move(task));
      std::future<void> fut = packaged.get_future();
      {
	std::lock_guard<std::mutex> lock(mutex_);
	if (!accepting_)
	  throw std::runtime_error("ThreadPoolExecutor: submit after shutdown");
	queue_.push_back(std::move(packaged));
      }
      workAvailable_.notify_one();
      return fut;
    }

    std::size_t getNumThreads() const override
    {
      return workers_.size();
    }

    // Tasks currently running on a worker
    std::size_t getBusyWorkers() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return busy_;
    }

    std::size_t getQueuedTasks() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return queue_.size();
    }

    // Blocks until the queue is empty and no worker is running a task
    void waitIdle()
    {
      std::unique_lock<std::mutex> lock(mutex_);
      idle_.wait(lock, [this] { return queue_.empty() && busy_ == 0; });
    }

    void shutdown()
    {
      {
	std::lock_guard<std::mutex> lock(mutex_);
	accepting_ = false;
      }
      workAvailable_.notify_all();
      for (auto& worker : workers_)
	if (worker.joinable())
	  worker.join();
    }

  private:
    void workerLoop()
    {
      for (;;) {
	std::packaged_task<void()> task;
	{
	  std::unique_lock<std::mutex> lock(mutex_);
	  workAvailable_.wait(lock, [this] { return !accepting_ || !queue_.empty(); });
	  if (queue_.empty())
	    return;
	  task = std::move(queue_.front());
	  queue_.pop_front();
	  ++busy_;
	}

	task();

	{
	  std::lock_guard<std::mutex> lock(mutex_);
	  --busy_;
	  if (queue_.empty() && busy_ == 0)
	    idle_.notify_all();
	}
      }
    }

  private:
    std::vector<std::thread>               workers_;
    std::deque<std::packaged_task<void()>> queue_;
    mutable std::mutex                     mutex_;
    std::condition_variable                workAvailable_;
    std::condition_variable                idle_;
    std::size_t                            busy_;
    bool                                   accepting_;
  };
} // namespace concurrency
