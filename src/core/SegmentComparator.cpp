#include "core/SegmentComparator.hpp"

#include <algorithm>

namespace xdiff::core {

SegmentComparator::SegmentComparator(SideExecutor& seLeft, SideExecutor& seRight,
                                     int64_t iThreshold)
    : _seLeft(seLeft), _seRight(seRight), _iThreshold(iThreshold) {}

Segment SegmentComparator::measure(SideExecutor& seSide, const common::KeyRange& krRange) {
  Segment sg;
  sg.iCount = seSide.count(krRange);
  // The checksum of an empty range is known without asking.
  if (sg.iCount > 0) {
    sg.checksum = seSide.checksum(krRange);
  }
  return sg;
}

SegmentComparison SegmentComparator::compare(const common::KeyRange& krRange) {
  auto [sgLeft, sgRight] = onBothSides([this, &krRange]() { return measure(_seLeft, krRange); },
                                       [this, &krRange]() { return measure(_seRight, krRange); });

  SegmentComparison cmp{krRange, std::move(sgLeft), std::move(sgRight), SegmentVerdict::Match};
  cmp.verdict = classify(cmp.sgLeft, cmp.sgRight, _iThreshold);
  return cmp;
}

SegmentVerdict SegmentComparator::classify(const Segment& sgLeft, const Segment& sgRight,
                                           int64_t iThreshold) {
  if (sgLeft.iCount == sgRight.iCount && sgLeft.checksum == sgRight.checksum) {
    return SegmentVerdict::Match;
  }
  if (sgLeft.iCount == 0 || sgRight.iCount == 0) {
    return SegmentVerdict::OneSided;
  }
  if (std::max(sgLeft.iCount, sgRight.iCount) <= iThreshold) {
    return SegmentVerdict::SmallMismatch;
  }
  return SegmentVerdict::LargeMismatch;
}

const char* toString(SegmentVerdict verdict) {
  switch (verdict) {
    case SegmentVerdict::Match:
      return "match";
    case SegmentVerdict::SmallMismatch:
      return "small-mismatch";
    case SegmentVerdict::LargeMismatch:
      return "large-mismatch";
    case SegmentVerdict::OneSided:
      return "one-sided";
  }
  return "unknown";
}

}  // namespace xdiff::core
