#pragma once

#include <cstdint>
#include <vector>

#include "common/Types.hpp"
#include "core/SideExecutor.hpp"

namespace xdiff::core {

/// Fetches the rows of a small mismatching range and merges them by key into
/// Removed / Added / Changed records, in key order.
/// Class abbreviation: erd
class ExactRowDiffer {
 public:
  struct Result {
    std::vector<common::DiffRecord> vRecords;
    int64_t iLeftRows = 0;
    int64_t iRightRows = 0;
  };

  ExactRowDiffer(SideExecutor& seLeft, SideExecutor& seRight);

  /// A side that is known to be empty in krRange can be skipped.
  Result diff(const common::KeyRange& krRange, bool bFetchLeft = true, bool bFetchRight = true);

  /// Merge two key-ordered row lists. Throws OrderingError when either list
  /// is not strictly increasing by key.
  static std::vector<common::DiffRecord> merge(std::vector<common::Row> vLeft,
                                               std::vector<common::Row> vRight);

 private:
  SideExecutor& _seLeft;
  SideExecutor& _seRight;
};

}  // namespace xdiff::core
