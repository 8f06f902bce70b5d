#pragma once

#include <memory>

#include "common/Types.hpp"
#include "core/DiffOptions.hpp"
#include "core/DiffStream.hpp"
#include "dal/ITableAccessor.hpp"

namespace xdiff::core {

/// Diffs two tables by recursive checksum bisection.
///
/// A run first agrees on the column normalization of both sides and reads
/// both key bounds, then compares their union as the root range. Matching
/// ranges are dropped, small mismatches are diffed row by row, and large
/// mismatches are split into at most b children one level deeper. A range
/// empty on one side is split by counting the other side only, and fetched
/// from that side once it holds at most t rows.
/// At max depth, or when a range cannot be split, the range is diffed
/// exactly. Work items are processed on a thread pool with a bounded number
/// in flight; records are delivered through the returned DiffStream.
/// Class abbreviation: be
class BisectionEngine {
 public:
  /// Throws ConfigError for invalid options.
  BisectionEngine(dal::ITableAccessor& taLeft, dal::ITableAccessor& taRight,
                  DiffOptions doOptions);

  /// Start a run on its own thread. Both accessors must outlive the stream.
  std::unique_ptr<DiffStream> diff(common::TableRef trLeft, common::TableRef trRight);

  const DiffOptions& options() const { return _doOptions; }

 private:
  dal::ITableAccessor& _taLeft;
  dal::ITableAccessor& _taRight;
  DiffOptions _doOptions;
};

}  // namespace xdiff::core
