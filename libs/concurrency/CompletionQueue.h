// concurrency/CompletionQueue.h
#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace concurrency
{
  /**
   * @brief Multi-producer, single-consumer queue of finished work items.
   *
   * Workers push results as they finish; one owner thread pops them in
   * completion order. The owner is the only code that touches the
   * aggregated results, so those need no locking of their own.
   */
  template <class T>
  class CompletionQueue {
  public:
    CompletionQueue() = default;
    CompletionQueue(const CompletionQueue&) = delete;
    CompletionQueue& operator=(const CompletionQueue&) = delete;

    void push(T item)
    {
      {
	std::lock_guard<std::mutex> lock(mutex_);
	items_.push_back(std::move(item));
      }
      ready_.notify_one();
    }

    // Blocks until an item is available
    T pop()
    {
      std::unique_lock<std::mutex> lock(mutex_);
      ready_.wait(lock, [this]{ return !items_.empty(); });
      T item = std::move(items_.front());
      items_.pop_front();
      return item;
    }

    bool tryPop(T& out)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (items_.empty())
	return false;
      out = std::move(items_.front());
      items_.pop_front();
      return true;
    }

    std::size_t size() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return items_.size();
    }

  private:
    mutable std::mutex      mutex_;
    std::condition_variable ready_;
    std::deque<T>           items_;
  };
} // namespace concurrency
