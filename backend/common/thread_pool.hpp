#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "common/logger.hpp"

// Fixed-size worker pool. Tasks run in submission order; shutdown() drains the queue
// before joining, so every committed task runs exactly once.
class ThreadPool {
  using Task = std::packaged_task<void()>;

public:
  explicit ThreadPool(std::size_t size, std::string name = "worker") : name_(std::move(name)) {
    pool_size_ = size < 1 ? 1 : size;
    threads_.reserve(pool_size_);

    for (std::size_t i = 0; i < pool_size_; i++) {
      threads_.emplace_back([this, i]() -> void {
        common::setThreadName(name_ + "-" + std::to_string(i));
        while (true) {
          Task task;
          {
            std::unique_lock<std::mutex> lock{mtx_};
            cv_.wait(lock, [this]() -> bool {
              return stop_.load(std::memory_order_acquire) || !tasks_.empty();
            });

            if (stop_.load(std::memory_order_acquire) && tasks_.empty()) {
              break;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
          }
          task();
        }
      });
    }
  }

  ~ThreadPool() {
    shutdown();
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  template <typename Func, typename... Args>
  auto commit(Func&& func, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>> {
    using ReturnType = std::invoke_result_t<Func, Args...>;

    auto task = std::packaged_task<ReturnType()>(
      [func = std::forward<Func>(func), args...]() mutable -> ReturnType {
        return func(args...);
      });

    auto ret = task.get_future();
    {
      std::lock_guard<std::mutex> lock{mtx_};
      if (stop_.load(std::memory_order_relaxed)) {
        throw std::runtime_error("ThreadPool is stopped");
      }
      tasks_.emplace([task = std::move(task)]() mutable -> void {
        task();
      });
    }
    cv_.notify_one();
    return ret;
  }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lock{mtx_};
      stop_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    for (auto& thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

  std::size_t size() const { return pool_size_; }

private:
  std::string name_;
  std::mutex mtx_;
  std::condition_variable cv_;

  std::queue<Task> tasks_;
  std::vector<std::jthread> threads_;

  std::atomic_bool stop_{false};
  std::size_t pool_size_{0};
};
