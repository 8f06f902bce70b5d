#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <semaphore>
#include <stop_token>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "common/Types.hpp"
#include "dal/ITableAccessor.hpp"

namespace xdiff::core {

/// One side of a diff: the accessor, its table, a cap on concurrent queries
/// and the retry policy for transient failures.
///
/// Every call acquires a query slot, then runs the accessor call, retrying
/// TransientQueryError with exponential backoff. Permanent failures and
/// exhausted retries throw SegmentFailedError naming the range and operation.
/// Observed cancellation throws CancelledError.
/// Class abbreviation: se
class SideExecutor {
 public:
  struct RetryPolicy {
    int iMaxRetries = 3;
    std::chrono::milliseconds durBackoff{100};
    std::chrono::milliseconds durBackoffMax{5000};
  };

  SideExecutor(std::string sSideName, dal::ITableAccessor& taAccessor,
               common::TableRef trTable, int iMaxInFlight, RetryPolicy rpRetry,
               std::stop_token stToken);

  std::vector<common::ColumnInfo> describe();
  std::optional<common::KeyBounds> bounds();
  int64_t count(const common::KeyRange& krRange);
  common::Checksum checksum(const common::KeyRange& krRange);
  std::vector<common::Row> rows(const common::KeyRange& krRange);

  /// Install the agreed column normalization. Call before any range work.
  void setColumnInfos(std::vector<common::ColumnInfo> vColumnInfos);

  const common::TableRef& table() const { return _trTable; }
  const std::string& sideName() const { return _sSideName; }
  dal::ITableAccessor& accessor() { return _taAccessor; }

  /// Accessor calls issued, retries included.
  int64_t queries() const { return _iQueries.load(); }

 private:
  template <typename F>
  auto run(const char* pOperation, const std::string& sTarget, F&& fnCall) -> decltype(fnCall());

  void acquireSlot();
  void backoff(std::chrono::milliseconds durWait);
  [[noreturn]] void throwCancelled(const char* pOperation, const std::string& sTarget) const;

  std::string _sSideName;
  dal::ITableAccessor& _taAccessor;
  common::TableRef _trTable;
  std::counting_semaphore<> _smSlots;
  RetryPolicy _rpRetry;
  std::stop_token _stToken;
  std::atomic<int64_t> _iQueries{0};

  std::mutex _mtxBackoff;
  std::condition_variable_any _cvBackoff;
};

/// Run fnLeft on its own thread and fnRight on the calling one. Both always
/// finish before this returns; the left side's error wins if both fail.
template <typename FL, typename FR>
auto onBothSides(FL&& fnLeft, FR&& fnRight)
    -> std::pair<std::invoke_result_t<FL&>, std::invoke_result_t<FR&>> {
  auto futLeft = std::async(std::launch::async, std::forward<FL>(fnLeft));

  std::optional<std::invoke_result_t<FR&>> oRight;
  std::exception_ptr epRight;
  try {
    oRight.emplace(fnRight());
  } catch (...) {
    // Held until the left call has finished, whatever was thrown.
    epRight = std::current_exception();
  }

  auto left = futLeft.get();
  if (epRight) std::rethrow_exception(epRight);
  return {std::move(left), std::move(*oRight)};
}

}  // namespace xdiff::core
