#include "core/SideExecutor.hpp"

#include <algorithm>

#include "common/Errors.hpp"
#include "common/KeyCodec.hpp"
#include "common/Logger.hpp"

namespace xdiff::core {

namespace {

constexpr std::chrono::milliseconds kSlotPollInterval{50};

/// Releases a semaphore slot on scope exit.
class SlotGuard {
 public:
  explicit SlotGuard(std::counting_semaphore<>& smSlots) : _smSlots(smSlots) {}
  ~SlotGuard() { _smSlots.release(); }

  SlotGuard(const SlotGuard&) = delete;
  SlotGuard& operator=(const SlotGuard&) = delete;

 private:
  std::counting_semaphore<>& _smSlots;
};

}  // namespace

SideExecutor::SideExecutor(std::string sSideName, dal::ITableAccessor& taAccessor,
                           common::TableRef trTable, int iMaxInFlight, RetryPolicy rpRetry,
                           std::stop_token stToken)
    : _sSideName(std::move(sSideName)),
      _taAccessor(taAccessor),
      _trTable(std::move(trTable)),
      _smSlots(std::max(1, iMaxInFlight)),
      _rpRetry(rpRetry),
      _stToken(std::move(stToken)) {}

void SideExecutor::setColumnInfos(std::vector<common::ColumnInfo> vColumnInfos) {
  _trTable.vColumnInfos = std::move(vColumnInfos);
}

void SideExecutor::acquireSlot() {
  while (!_smSlots.try_acquire_for(kSlotPollInterval)) {
    if (_stToken.stop_requested()) {
      throw common::CancelledError(_sSideName + ": cancelled while waiting for a query slot");
    }
  }
}

void SideExecutor::backoff(std::chrono::milliseconds durWait) {
  std::unique_lock<std::mutex> lock(_mtxBackoff);
  _cvBackoff.wait_for(lock, _stToken, durWait, []() { return false; });
}

void SideExecutor::throwCancelled(const char* pOperation, const std::string& sTarget) const {
  throw common::CancelledError(_sSideName + ": " + pOperation + " on " + sTarget +
                               " cancelled");
}

template <typename F>
auto SideExecutor::run(const char* pOperation, const std::string& sTarget, F&& fnCall)
    -> decltype(fnCall()) {
  auto spLog = common::Logger::get();
  auto durWait = _rpRetry.durBackoff;

  for (int iAttempt = 0;; ++iAttempt) {
    if (_stToken.stop_requested()) throwCancelled(pOperation, sTarget);

    acquireSlot();
    try {
      SlotGuard sgSlot(_smSlots);
      _iQueries.fetch_add(1);
      return fnCall();
    } catch (const common::CancelledError&) {
      throw;
    } catch (const common::SchemaMismatchError&) {
      throw;
    } catch (const common::TransientQueryError& ex) {
      if (_stToken.stop_requested()) throwCancelled(pOperation, sTarget);
      if (iAttempt >= _rpRetry.iMaxRetries) {
        throw common::SegmentFailedError(
            sTarget, pOperation,
            std::string(ex.what()) + " (after " + std::to_string(iAttempt + 1) + " attempts)");
      }
      spLog->warn("{}: {} on {} failed transiently (attempt {}/{}), retrying in {}ms: {}",
                  _sSideName, pOperation, sTarget, iAttempt + 1, _rpRetry.iMaxRetries + 1,
                  durWait.count(), ex.what());
    } catch (const std::exception& ex) {
      // Interrupted queries surface as arbitrary backend errors.
      if (_stToken.stop_requested()) throwCancelled(pOperation, sTarget);
      throw common::SegmentFailedError(sTarget, pOperation, ex.what());
    }

    backoff(durWait);
    durWait = std::min(durWait * 2, _rpRetry.durBackoffMax);
  }
}

std::vector<common::ColumnInfo> SideExecutor::describe() {
  return run("describe", _trTable.sTablePath,
             [this]() { return _taAccessor.describe(_trTable); });
}

std::optional<common::KeyBounds> SideExecutor::bounds() {
  return run("bounds", _trTable.sTablePath, [this]() { return _taAccessor.bounds(_trTable); });
}

int64_t SideExecutor::count(const common::KeyRange& krRange) {
  const std::string sTarget =
      common::KeyCodec::describe(krRange, _trTable.keyType, _trTable.iKeyScale);
  return run("count", sTarget, [&]() { return _taAccessor.count(_trTable, krRange); });
}

common::Checksum SideExecutor::checksum(const common::KeyRange& krRange) {
  const std::string sTarget =
      common::KeyCodec::describe(krRange, _trTable.keyType, _trTable.iKeyScale);
  return run("checksum", sTarget, [&]() { return _taAccessor.checksum(_trTable, krRange); });
}

std::vector<common::Row> SideExecutor::rows(const common::KeyRange& krRange) {
  const std::string sTarget =
      common::KeyCodec::describe(krRange, _trTable.keyType, _trTable.iKeyScale);
  return run("rows", sTarget, [&]() { return _taAccessor.rows(_trTable, krRange); });
}

}  // namespace xdiff::core
