#include "core/DiffStream.hpp"

#include <algorithm>

namespace xdiff::core {

DiffStream::DiffStream(std::size_t uCapacity) : _uCapacity(std::max<std::size_t>(1, uCapacity)) {}

DiffStream::~DiffStream() {
  cancel();
  if (_thRun.joinable()) {
    _thRun.join();
  }
}

std::optional<common::DiffRecord> DiffStream::next() {
  std::unique_lock<std::mutex> lock(_mtx);
  _cvNotEmpty.wait(lock, [this]() {
    return !_dqRecords.empty() || _state != StreamState::Running || _ssStop.stop_requested();
  });

  if (_ssStop.stop_requested() && _state != StreamState::Failed) {
    return std::nullopt;
  }
  if (!_dqRecords.empty()) {
    common::DiffRecord drRecord = std::move(_dqRecords.front());
    _dqRecords.pop_front();
    lock.unlock();
    _cvNotFull.notify_one();
    return drRecord;
  }
  if (_epFailure) {
    std::rethrow_exception(_epFailure);
  }
  return std::nullopt;
}

void DiffStream::cancel() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_ssStop.stop_requested()) return;
    _ssStop.request_stop();
  }
  _cvNotEmpty.notify_all();
  _cvNotFull.notify_all();
}

void DiffStream::wait() {
  std::unique_lock<std::mutex> lock(_mtx);
  _cvFinished.wait(lock, [this]() { return _state != StreamState::Running; });
}

StreamState DiffStream::state() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _state;
}

common::DiffStats DiffStream::stats() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _dsStats;
}

bool DiffStream::push(common::DiffRecord drRecord) {
  {
    std::unique_lock<std::mutex> lock(_mtx);
    _cvNotFull.wait(lock, [this]() {
      return _dqRecords.size() < _uCapacity || _ssStop.stop_requested();
    });
    if (_ssStop.stop_requested()) return false;
    _dqRecords.push_back(std::move(drRecord));
  }
  _cvNotEmpty.notify_one();
  return true;
}

void DiffStream::finish(common::DiffStats dsStats, std::exception_ptr epFailure) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _dsStats = std::move(dsStats);
    if (epFailure) {
      _state = StreamState::Failed;
      _epFailure = epFailure;
    } else if (_ssStop.stop_requested()) {
      _state = StreamState::Cancelled;
    } else {
      _state = StreamState::Completed;
    }
  }
  _cvNotEmpty.notify_all();
  _cvFinished.notify_all();
}

void DiffStream::attach(std::jthread thRun) {
  _thRun = std::move(thRun);
}

const char* toString(StreamState state) {
  switch (state) {
    case StreamState::Running:
      return "running";
    case StreamState::Completed:
      return "completed";
    case StreamState::Cancelled:
      return "cancelled";
    case StreamState::Failed:
      return "failed";
  }
  return "unknown";
}

}  // namespace xdiff::core
