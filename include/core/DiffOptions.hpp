#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace xdiff::core {

/// Tuning knobs of one diff run.
/// Class abbreviation: do
struct DiffOptions {
  int iBisectionFactor = 10;           // b: sub-ranges per split, >= 2
  int64_t iBisectionThreshold = 16384;  // t: max rows diffed exactly, >= 1
  int iMaxDepth = 16;                  // depth at which a range is diffed exactly

  int iThreads = 0;  // work items in flight; 0 = hardware concurrency
  int iLeftMaxInFlight = 4;
  int iRightMaxInFlight = 4;

  int iMaxRetries = 3;
  std::chrono::milliseconds durRetryBackoff{100};
  std::chrono::milliseconds durRetryBackoffMax{5000};

  /// false: the first permanently failed work item fails the run.
  /// true: it is logged and recorded in DiffStats::vFailedRanges.
  bool bSkipFailedSegments = false;

  /// Records buffered between the run and a slow consumer.
  std::size_t uStreamCapacity = 1024;

  /// Throws ConfigError on out-of-range values.
  void validate() const;
};

}  // namespace xdiff::core
