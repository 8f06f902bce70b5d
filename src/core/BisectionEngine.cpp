#include "core/BisectionEngine.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

#include "common/Errors.hpp"
#include "common/KeyCodec.hpp"
#include "common/Logger.hpp"
#include "core/ExactRowDiffer.hpp"
#include "core/RangePartitioner.hpp"
#include "core/SchemaMatcher.hpp"
#include "core/SegmentComparator.hpp"
#include "core/SideExecutor.hpp"
#include "core/ThreadPool.hpp"

namespace xdiff::core {

using common::KeyRange;

namespace {

/// Which sides may hold rows of a work item's range. A range found empty on
/// one side stays empty there in every sub-range.
enum class Presence { Both, LeftOnly, RightOnly };

/// A pending key range and its recursion depth. Depth 0 is the root.
struct WorkItem {
  KeyRange krRange;
  int iDepth = 0;
  Presence presence = Presence::Both;
};

/// Outcome of one work item, handed from a pool worker back to the driver.
struct Completion {
  WorkItem wi;
  std::vector<WorkItem> vChildren;
  std::exception_ptr epFailure;
};

/// State of a single diff run. Owned by the run thread.
/// Class abbreviation: br
class BisectionRun {
 public:
  BisectionRun(dal::ITableAccessor& taLeft, dal::ITableAccessor& taRight,
               common::TableRef trLeft, common::TableRef trRight, const DiffOptions& doOptions,
               DiffStream& dstOut)
      : _doOptions(doOptions),
        _dstOut(dstOut),
        _seLeft("left", taLeft, std::move(trLeft), doOptions.iLeftMaxInFlight,
                retryPolicy(doOptions), _ssRun.get_token()),
        _seRight("right", taRight, std::move(trRight), doOptions.iRightMaxInFlight,
                 retryPolicy(doOptions), _ssRun.get_token()),
        _rpPartitioner(_seLeft.table().keyType, doOptions.iBisectionFactor),
        _scComparator(_seLeft, _seRight, doOptions.iBisectionThreshold),
        _erdDiffer(_seLeft, _seRight) {}

  void execute();

 private:
  static SideExecutor::RetryPolicy retryPolicy(const DiffOptions& doOptions) {
    return SideExecutor::RetryPolicy{doOptions.iMaxRetries, doOptions.durRetryBackoff,
                                     doOptions.durRetryBackoffMax};
  }

  std::optional<KeyRange> init();
  void drive(const KeyRange& krRoot);
  std::vector<WorkItem> process(const WorkItem& wi);
  std::vector<WorkItem> processOneSided(const WorkItem& wi);
  std::vector<WorkItem> splitOrDiff(const WorkItem& wi, Presence presence);
  void diffExactly(const KeyRange& krRange, Presence presence);

  /// Decide what a failed work item means for the run. Returns the failure
  /// when it must end the run.
  std::exception_ptr triage(const WorkItem& wi, std::exception_ptr epFailure);

  std::string describe(const KeyRange& krRange) const {
    return common::KeyCodec::describe(krRange, _seLeft.table().keyType,
                                      _seLeft.table().iKeyScale);
  }

  void noteDepth(int iDepth);
  common::DiffStats collectStats() const;

  const DiffOptions _doOptions;
  DiffStream& _dstOut;

  // Requested by the consumer's cancel() or by a fatal failure.
  std::stop_source _ssRun;

  SideExecutor _seLeft;
  SideExecutor _seRight;
  RangePartitioner _rpPartitioner;
  SegmentComparator _scComparator;
  ExactRowDiffer _erdDiffer;

  std::atomic<int64_t> _iLeftRows{0};
  std::atomic<int64_t> _iRightRows{0};
  std::atomic<int64_t> _iAdded{0};
  std::atomic<int64_t> _iRemoved{0};
  std::atomic<int64_t> _iChanged{0};
  std::atomic<int64_t> _iSegmentsCompared{0};
  std::atomic<int64_t> _iSegmentsMatched{0};
  std::atomic<int64_t> _iExactDiffs{0};
  std::atomic<int64_t> _iLeftRowsDownloaded{0};
  std::atomic<int64_t> _iRightRowsDownloaded{0};
  std::atomic<int> _iMaxDepthReached{0};
  std::vector<std::string> _vFailedRanges;  // driver thread only
};

void BisectionRun::execute() {
  auto spLog = common::Logger::get();

  // Consumer cancellation stops the run; stopping the run interrupts the
  // queries still in flight on both sides.
  std::stop_callback scForward(_dstOut.stopToken(), [this]() { _ssRun.request_stop(); });
  std::stop_callback scInterrupt(_ssRun.get_token(), [this]() {
    _seLeft.accessor().cancel();
    _seRight.accessor().cancel();
  });

  spLog->info("Diff started: {} ({}) vs {} ({}), key {} ({}), factor={}, threshold={}, "
              "max depth={}",
              _seLeft.table().sTablePath, _seLeft.accessor().name(),
              _seRight.table().sTablePath, _seRight.accessor().name(),
              _seLeft.table().sKeyColumn, common::toString(_seLeft.table().keyType),
              _doOptions.iBisectionFactor, _doOptions.iBisectionThreshold,
              _doOptions.iMaxDepth);

  std::exception_ptr epFailure;
  try {
    if (auto oRoot = init()) {
      drive(*oRoot);
    }
  } catch (const common::CancelledError& ex) {
    spLog->debug("Diff run unwound after cancellation: {}", ex.what());
  } catch (const std::exception& ex) {
    if (_dstOut.stopToken().stop_requested()) {
      spLog->warn("Diff run failed after cancellation: {}", ex.what());
    } else {
      spLog->error("Diff run failed: {}", ex.what());
      epFailure = std::current_exception();
    }
  } catch (...) {
    spLog->error("Diff run failed with unknown error");
    epFailure = std::current_exception();
  }

  common::DiffStats dsStats = collectStats();
  spLog->info("Diff finished: +{} -{} ~{} | {} segments compared ({} matched), {} exact diffs, "
              "max depth {} | rows downloaded {}/{} | queries {}/{}",
              dsStats.iAdded, dsStats.iRemoved, dsStats.iChanged, dsStats.iSegmentsCompared,
              dsStats.iSegmentsMatched, dsStats.iExactDiffs, dsStats.iMaxDepthReached,
              dsStats.iLeftRowsDownloaded, dsStats.iRightRowsDownloaded, dsStats.iLeftQueries,
              dsStats.iRightQueries);
  if (!dsStats.vFailedRanges.empty()) {
    spLog->warn("{} ranges were skipped after failing", dsStats.vFailedRanges.size());
  }

  _dstOut.finish(std::move(dsStats), epFailure);
}

std::optional<KeyRange> BisectionRun::init() {
  auto spLog = common::Logger::get();

  auto [vLeftInfos, vRightInfos] =
      onBothSides([this]() { return _seLeft.describe(); },
                  [this]() { return _seRight.describe(); });
  auto [vLeftAgreed, vRightAgreed] = SchemaMatcher::agree(_seLeft.table(), vLeftInfos,
                                                          _seRight.table(), vRightInfos);
  for (size_t i = 0; i < vLeftAgreed.size(); ++i) {
    spLog->debug("Column {} / {} compared as {} (scale {})", vLeftAgreed[i].sName,
                 vRightAgreed[i].sName, common::toString(vLeftAgreed[i].type),
                 vLeftAgreed[i].iScale);
  }
  _seLeft.setColumnInfos(std::move(vLeftAgreed));
  _seRight.setColumnInfos(std::move(vRightAgreed));

  auto [oLeftBounds, oRightBounds] = onBothSides([this]() { return _seLeft.bounds(); },
                                                 [this]() { return _seRight.bounds(); });
  if (!oLeftBounds && !oRightBounds) {
    spLog->info("Both tables are empty");
    return std::nullopt;
  }

  const auto& tr = _seLeft.table();
  common::Key keyMin = oLeftBounds ? oLeftBounds->keyMin : oRightBounds->keyMin;
  common::Key keyMax = oLeftBounds ? oLeftBounds->keyMax : oRightBounds->keyMax;
  if (oLeftBounds && oRightBounds) {
    keyMin = std::min(oLeftBounds->keyMin, oRightBounds->keyMin);
    keyMax = std::max(oLeftBounds->keyMax, oRightBounds->keyMax);
  }
  if (oLeftBounds) {
    spLog->debug("Left key bounds [{}, {}]",
                 common::KeyCodec::toString(oLeftBounds->keyMin, tr.keyType, tr.iKeyScale),
                 common::KeyCodec::toString(oLeftBounds->keyMax, tr.keyType, tr.iKeyScale));
  }
  if (oRightBounds) {
    spLog->debug("Right key bounds [{}, {}]",
                 common::KeyCodec::toString(oRightBounds->keyMin, tr.keyType, tr.iKeyScale),
                 common::KeyCodec::toString(oRightBounds->keyMax, tr.keyType, tr.iKeyScale));
  }

  KeyRange krRoot = common::KeyCodec::makeRange(
      keyMin, common::KeyCodec::exclusiveUpperBound(keyMax, tr.keyType));
  spLog->info("Root range {}", describe(krRoot));
  return krRoot;
}

void BisectionRun::drive(const KeyRange& krRoot) {
  auto spLog = common::Logger::get();

  std::mutex mtxDone;
  std::condition_variable cvDone;
  std::deque<Completion> dqDone;

  // Declared after the completion queue so workers are joined before it goes.
  ThreadPool tpWorkers(_doOptions.iThreads);
  const int iMaxInFlight = tpWorkers.size();

  std::deque<WorkItem> dqPending{WorkItem{krRoot, 0}};
  int iInFlight = 0;
  std::exception_ptr epFatal;

  for (;;) {
    while (!_ssRun.stop_requested() && iInFlight < iMaxInFlight && !dqPending.empty()) {
      WorkItem wi = std::move(dqPending.front());
      dqPending.pop_front();
      ++iInFlight;
      // The outcome comes back through dqDone, not the future.
      tpWorkers.submit([this, wi, &mtxDone, &cvDone, &dqDone]() {
        Completion cmp{wi, {}, nullptr};
        try {
          cmp.vChildren = process(wi);
        } catch (...) {
          cmp.epFailure = std::current_exception();
        }
        {
          std::lock_guard<std::mutex> lock(mtxDone);
          dqDone.push_back(std::move(cmp));
        }
        cvDone.notify_one();
      });
    }

    if (iInFlight == 0) break;

    std::deque<Completion> dqBatch;
    {
      std::unique_lock<std::mutex> lock(mtxDone);
      cvDone.wait(lock, [&dqDone]() { return !dqDone.empty(); });
      dqBatch.swap(dqDone);
    }

    for (auto& cmp : dqBatch) {
      --iInFlight;
      if (cmp.epFailure) {
        if (auto ep = triage(cmp.wi, cmp.epFailure); ep && !epFatal) {
          epFatal = ep;
          _ssRun.request_stop();
        }
        continue;
      }
      // Children go first so the pending set stays small.
      for (auto it = cmp.vChildren.rbegin(); it != cmp.vChildren.rend(); ++it) {
        dqPending.push_front(std::move(*it));
      }
    }
  }

  tpWorkers.shutdown();

  if (epFatal) std::rethrow_exception(epFatal);
  if (!dqPending.empty()) {
    spLog->info("Diff stopped with {} ranges not compared", dqPending.size());
  }
}

std::exception_ptr BisectionRun::triage(const WorkItem& wi, std::exception_ptr epFailure) {
  auto spLog = common::Logger::get();
  try {
    std::rethrow_exception(epFailure);
  } catch (const common::CancelledError&) {
    return nullptr;
  } catch (const common::SchemaMismatchError&) {
    return epFailure;
  } catch (const common::AppError& ex) {
    if (_doOptions.bSkipFailedSegments && !_ssRun.stop_requested()) {
      spLog->error("Skipping range {} at depth {}: {}", describe(wi.krRange), wi.iDepth,
                   ex.what());
      _vFailedRanges.push_back(describe(wi.krRange) + ": " + ex.what());
      return nullptr;
    }
    return epFailure;
  } catch (const std::exception&) {
    return epFailure;
  }
}

std::vector<WorkItem> BisectionRun::process(const WorkItem& wi) {
  auto spLog = common::Logger::get();
  if (_ssRun.stop_requested()) {
    throw common::CancelledError("work item not started: run is stopping");
  }
  noteDepth(wi.iDepth);
  if (wi.presence != Presence::Both) return processOneSided(wi);

  const SegmentComparison cmp = _scComparator.compare(wi.krRange);
  _iSegmentsCompared.fetch_add(1);
  if (wi.iDepth == 0) {
    _iLeftRows.store(cmp.sgLeft.iCount);
    _iRightRows.store(cmp.sgRight.iCount);
  }
  spLog->debug("Range {} at depth {}: {} (rows {}/{})", describe(wi.krRange), wi.iDepth,
               toString(cmp.verdict), cmp.sgLeft.iCount, cmp.sgRight.iCount);

  switch (cmp.verdict) {
    case SegmentVerdict::Match:
      _iSegmentsMatched.fetch_add(1);
      return {};
    case SegmentVerdict::OneSided: {
      const Presence presence =
          cmp.sgLeft.iCount > 0 ? Presence::LeftOnly : Presence::RightOnly;
      if (std::max(cmp.sgLeft.iCount, cmp.sgRight.iCount) <= _doOptions.iBisectionThreshold) {
        diffExactly(wi.krRange, presence);
        return {};
      }
      return splitOrDiff(wi, presence);
    }
    case SegmentVerdict::SmallMismatch:
      diffExactly(wi.krRange, Presence::Both);
      return {};
    case SegmentVerdict::LargeMismatch:
      break;
  }
  return splitOrDiff(wi, Presence::Both);
}

std::vector<WorkItem> BisectionRun::processOneSided(const WorkItem& wi) {
  auto spLog = common::Logger::get();
  SideExecutor& seSide = wi.presence == Presence::LeftOnly ? _seLeft : _seRight;

  // Only the non-empty side is counted; every row found is a difference.
  const int64_t iCount = seSide.count(wi.krRange);
  _iSegmentsCompared.fetch_add(1);
  spLog->debug("Range {} at depth {}: {} rows on the {} side only", describe(wi.krRange),
               wi.iDepth, iCount, seSide.sideName());

  if (iCount == 0) return {};
  if (iCount <= _doOptions.iBisectionThreshold) {
    diffExactly(wi.krRange, wi.presence);
    return {};
  }
  return splitOrDiff(wi, wi.presence);
}

std::vector<WorkItem> BisectionRun::splitOrDiff(const WorkItem& wi, Presence presence) {
  auto spLog = common::Logger::get();
  if (wi.iDepth >= _doOptions.iMaxDepth) {
    spLog->debug("Range {} reached max depth {}, diffing exactly", describe(wi.krRange),
                 _doOptions.iMaxDepth);
    diffExactly(wi.krRange, presence);
    return {};
  }

  std::vector<KeyRange> vParts = _rpPartitioner.split(wi.krRange);
  if (vParts.size() <= 1) {
    spLog->debug("Range {} cannot be split further, diffing exactly", describe(wi.krRange));
    diffExactly(wi.krRange, presence);
    return {};
  }

  spLog->trace("Splitting {} into {} ranges at depth {}", describe(wi.krRange), vParts.size(),
               wi.iDepth + 1);
  std::vector<WorkItem> vChildren;
  vChildren.reserve(vParts.size());
  for (auto& krPart : vParts) {
    vChildren.push_back(WorkItem{std::move(krPart), wi.iDepth + 1, presence});
  }
  return vChildren;
}

void BisectionRun::diffExactly(const KeyRange& krRange, Presence presence) {
  ExactRowDiffer::Result res = _erdDiffer.diff(krRange, presence != Presence::RightOnly,
                                               presence != Presence::LeftOnly);
  _iExactDiffs.fetch_add(1);
  _iLeftRowsDownloaded.fetch_add(res.iLeftRows);
  _iRightRowsDownloaded.fetch_add(res.iRightRows);

  for (auto& drRecord : res.vRecords) {
    const common::DiffKind kind = drRecord.kind;
    if (!_dstOut.push(std::move(drRecord))) {
      throw common::CancelledError("stream cancelled by consumer");
    }
    switch (kind) {
      case common::DiffKind::Added:
        _iAdded.fetch_add(1);
        break;
      case common::DiffKind::Removed:
        _iRemoved.fetch_add(1);
        break;
      case common::DiffKind::Changed:
        _iChanged.fetch_add(1);
        break;
    }
  }
}

void BisectionRun::noteDepth(int iDepth) {
  int iSeen = _iMaxDepthReached.load();
  while (iDepth > iSeen && !_iMaxDepthReached.compare_exchange_weak(iSeen, iDepth)) {
  }
}

common::DiffStats BisectionRun::collectStats() const {
  common::DiffStats ds;
  ds.iLeftRows = _iLeftRows.load();
  ds.iRightRows = _iRightRows.load();
  ds.iAdded = _iAdded.load();
  ds.iRemoved = _iRemoved.load();
  ds.iChanged = _iChanged.load();
  ds.iSegmentsCompared = _iSegmentsCompared.load();
  ds.iSegmentsMatched = _iSegmentsMatched.load();
  ds.iExactDiffs = _iExactDiffs.load();
  ds.iLeftRowsDownloaded = _iLeftRowsDownloaded.load();
  ds.iRightRowsDownloaded = _iRightRowsDownloaded.load();
  ds.iLeftQueries = _seLeft.queries();
  ds.iRightQueries = _seRight.queries();
  ds.iMaxDepthReached = _iMaxDepthReached.load();
  ds.vFailedRanges = _vFailedRanges;
  return ds;
}

}  // namespace

BisectionEngine::BisectionEngine(dal::ITableAccessor& taLeft, dal::ITableAccessor& taRight,
                                 DiffOptions doOptions)
    : _taLeft(taLeft), _taRight(taRight), _doOptions(std::move(doOptions)) {
  _doOptions.validate();
}

std::unique_ptr<DiffStream> BisectionEngine::diff(common::TableRef trLeft,
                                                  common::TableRef trRight) {
  auto upStream = std::make_unique<DiffStream>(_doOptions.uStreamCapacity);
  auto upRun = std::make_unique<BisectionRun>(_taLeft, _taRight, std::move(trLeft),
                                              std::move(trRight), _doOptions, *upStream);
  upStream->attach(std::jthread([upRun = std::move(upRun)]() { upRun->execute(); }));
  return upStream;
}

}  // namespace xdiff::core
