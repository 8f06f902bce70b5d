#pragma once

#include <cstdint>

#include "common/Types.hpp"
#include "core/SideExecutor.hpp"

namespace xdiff::core {

/// Outcome of comparing one key range on both sides.
enum class SegmentVerdict {
  Match,          // counts and checksums equal
  SmallMismatch,  // differs, max(count) <= threshold: diff rows exactly
  LargeMismatch,  // differs above the threshold: bisect
  OneSided,       // differs and one side is empty: fetch the other side only
};

/// Count and checksum of a key range on one side.
/// Class abbreviation: sg
struct Segment {
  int64_t iCount = 0;
  common::Checksum checksum = "0";
};

/// Class abbreviation: cmp
struct SegmentComparison {
  common::KeyRange krRange;
  Segment sgLeft;
  Segment sgRight;
  SegmentVerdict verdict = SegmentVerdict::Match;
};

/// Measures a range on both sides concurrently and classifies it.
/// Class abbreviation: sc
class SegmentComparator {
 public:
  SegmentComparator(SideExecutor& seLeft, SideExecutor& seRight, int64_t iThreshold);

  SegmentComparison compare(const common::KeyRange& krRange);

  static SegmentVerdict classify(const Segment& sgLeft, const Segment& sgRight,
                                 int64_t iThreshold);

 private:
  static Segment measure(SideExecutor& seSide, const common::KeyRange& krRange);

  SideExecutor& _seLeft;
  SideExecutor& _seRight;
  int64_t _iThreshold;
};

const char* toString(SegmentVerdict verdict);

}  // namespace xdiff::core
