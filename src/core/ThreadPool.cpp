#include "core/ThreadPool.hpp"

#include <algorithm>

namespace xdiff::core {

ThreadPool::ThreadPool(int iSize) {
  if (iSize <= 0) {
    iSize = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
  }
  _vWorkers.reserve(iSize);
  for (int i = 0; i < iSize; ++i) {
    _vWorkers.emplace_back([this]() { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::workerLoop() {
  for (;;) {
    std::packaged_task<void()> task;
    {
      std::unique_lock<std::mutex> lock(_mtx);
      _cv.wait(lock, [this]() { return _bStopping || !_qTasks.empty(); });
      if (_qTasks.empty()) return;  // stopping and drained
      task = std::move(_qTasks.front());
      _qTasks.pop();
    }
    task();
  }
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) return;
    _bStopping = true;
  }
  _cv.notify_all();

  for (auto& thWorker : _vWorkers) {
    if (thWorker.joinable()) {
      thWorker.join();
    }
  }
}

}  // namespace xdiff::core
