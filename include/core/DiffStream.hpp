#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <iterator>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

#include "common/Types.hpp"

namespace xdiff::core {

enum class StreamState { Running, Completed, Cancelled, Failed };

/// Lazily produced, finite, single-pass sequence of diff records.
///
/// A bounded blocking queue between one diff run (producer) and its consumer.
/// The producer blocks while the queue is full and is released by cancel().
/// Records of one segment arrive in key order; there is no order across
/// segments. Destroying the stream cancels and joins the run.
/// Class abbreviation: dst
class DiffStream {
 public:
  explicit DiffStream(std::size_t uCapacity);
  ~DiffStream();

  DiffStream(const DiffStream&) = delete;
  DiffStream& operator=(const DiffStream&) = delete;

  // ── Consumer side ───────────────────────────────────────────────────────

  /// Next record, or nullopt once the run has ended and the queue is drained
  /// (or the stream was cancelled). Rethrows the run's failure after the
  /// records produced before it have been consumed.
  std::optional<common::DiffRecord> next();

  /// Stop the run: no new work is scheduled and in-flight queries are
  /// interrupted best-effort. Idempotent, callable from any thread.
  void cancel();

  /// Block until the run has ended. A full queue keeps the run from ending,
  /// so drain or cancel first.
  void wait();

  StreamState state() const;

  /// Totals of the run. Final once state() is no longer Running.
  common::DiffStats stats() const;

  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = common::DiffRecord;
    using difference_type = std::ptrdiff_t;
    using pointer = const common::DiffRecord*;
    using reference = const common::DiffRecord&;

    Iterator() = default;
    explicit Iterator(DiffStream* pStream) : _pStream(pStream) { advance(); }

    reference operator*() const { return *_oCurrent; }
    pointer operator->() const { return &*_oCurrent; }
    Iterator& operator++() {
      advance();
      return *this;
    }
    bool operator==(const Iterator& other) const { return _pStream == other._pStream; }
    bool operator!=(const Iterator& other) const { return !(*this == other); }

   private:
    void advance() {
      _oCurrent = _pStream->next();
      if (!_oCurrent) _pStream = nullptr;
    }

    DiffStream* _pStream = nullptr;
    std::optional<common::DiffRecord> _oCurrent;
  };

  Iterator begin() { return Iterator(this); }
  Iterator end() { return Iterator(); }

  // ── Producer side ───────────────────────────────────────────────────────

  /// Enqueue a record, blocking while the queue is full.
  /// Returns false when the stream was cancelled; the record is dropped.
  bool push(common::DiffRecord drRecord);

  /// End the run. A cancelled stream ends as Cancelled unless epFailure is set.
  void finish(common::DiffStats dsStats, std::exception_ptr epFailure = nullptr);

  /// Observed by the run to stop scheduling work.
  std::stop_token stopToken() const { return _ssStop.get_token(); }

  /// Hand over the thread executing the run; joined on destruction.
  void attach(std::jthread thRun);

 private:
  const std::size_t _uCapacity;
  std::stop_source _ssStop;

  mutable std::mutex _mtx;
  std::condition_variable _cvNotEmpty;
  std::condition_variable _cvNotFull;
  std::condition_variable _cvFinished;
  std::deque<common::DiffRecord> _dqRecords;
  StreamState _state = StreamState::Running;
  common::DiffStats _dsStats;
  std::exception_ptr _epFailure;

  std::jthread _thRun;
};

const char* toString(StreamState state);

}  // namespace xdiff::core
