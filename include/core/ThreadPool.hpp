#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace xdiff::core {

/// Fixed-size pool of std::jthread workers.
/// Tasks run in submission order; a task's exception is delivered through its
/// future.
/// Class abbreviation: tp
class ThreadPool {
 public:
  /// iSize <= 0 selects std::thread::hardware_concurrency() (at least 1).
  explicit ThreadPool(int iSize = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  template <typename F, typename... Args>
  auto submit(F&& fnTask, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

  /// Stop accepting work, run what is queued, join all workers. Idempotent.
  void shutdown();

  int size() const { return static_cast<int>(_vWorkers.size()); }

 private:
  void workerLoop();

  std::vector<std::jthread> _vWorkers;
  std::queue<std::packaged_task<void()>> _qTasks;
  std::mutex _mtx;
  std::condition_variable _cv;
  bool _bStopping = false;
};

template <typename F, typename... Args>
auto ThreadPool::submit(F&& fnTask, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>> {
  using Result = std::invoke_result_t<F, Args...>;

  // The typed task is shared with the void() wrapper that sits in the queue.
  auto spTask = std::make_shared<std::packaged_task<Result()>>(
      std::bind(std::forward<F>(fnTask), std::forward<Args>(args)...));
  std::future<Result> fut = spTask->get_future();

  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) {
      throw std::runtime_error("ThreadPool: submit after shutdown");
    }
    _qTasks.emplace([spTask]() { (*spTask)(); });
  }
  _cv.notify_one();
  return fut;
}

}  // namespace xdiff::core
