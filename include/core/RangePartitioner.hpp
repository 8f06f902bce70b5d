#pragma once

#include <vector>

#include "common/Types.hpp"

namespace xdiff::core {

/// Splits a key range into at most b contiguous half-open sub-ranges that
/// cover it exactly.
///
/// Integer, decimal (unscaled) and timestamp (microsecond) keys are split by
/// linear interpolation over their int64 value, UUID keys over their 128-bit
/// value. String keys interpolate the eight bytes after the common prefix as
/// a base-128 numeral, producing 7-bit ASCII boundaries without NUL bytes.
///
/// A single returned sub-range means the range cannot be split further.
/// An unbounded range is split up to the domain maximum and its last
/// sub-range stays unbounded.
/// Class abbreviation: rp
class RangePartitioner {
 public:
  RangePartitioner(common::KeyType keyType, int iFactor);

  std::vector<common::KeyRange> split(const common::KeyRange& krRange) const;

  int factor() const { return _iFactor; }

 private:
  using Ordinal = unsigned __int128;

  std::vector<common::Key> numericBoundaries(const common::KeyRange& krRange) const;
  std::vector<common::Key> stringBoundaries(const common::KeyRange& krRange) const;

  /// Interior points lo < p < hi splitting [lo, hi) into min(b, hi - lo) parts.
  std::vector<Ordinal> interpolate(Ordinal oLo, Ordinal oHi) const;

  common::KeyType _keyType;
  int _iFactor;
};

}  // namespace xdiff::core
