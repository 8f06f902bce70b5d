#include "core/ExactRowDiffer.hpp"

#include <string>
#include <tuple>

#include "common/Errors.hpp"

namespace xdiff::core {

using common::DiffRecord;
using common::Row;

namespace {

void checkAscending(const std::vector<Row>& vRows, const char* pSide) {
  for (size_t i = 1; i < vRows.size(); ++i) {
    if (!(vRows[i - 1].key < vRows[i].key)) {
      throw common::OrderingError(
          "rows_not_ordered", std::string(pSide) + " rows are not strictly increasing by key (at " +
                                  "position " + std::to_string(i) + ")");
    }
  }
}

}  // namespace

ExactRowDiffer::ExactRowDiffer(SideExecutor& seLeft, SideExecutor& seRight)
    : _seLeft(seLeft), _seRight(seRight) {}

ExactRowDiffer::Result ExactRowDiffer::diff(const common::KeyRange& krRange, bool bFetchLeft,
                                            bool bFetchRight) {
  std::vector<Row> vLeft;
  std::vector<Row> vRight;

  if (bFetchLeft && bFetchRight) {
    std::tie(vLeft, vRight) =
        onBothSides([this, &krRange]() { return _seLeft.rows(krRange); },
                    [this, &krRange]() { return _seRight.rows(krRange); });
  } else if (bFetchLeft) {
    vLeft = _seLeft.rows(krRange);
  } else if (bFetchRight) {
    vRight = _seRight.rows(krRange);
  }

  Result res;
  res.iLeftRows = static_cast<int64_t>(vLeft.size());
  res.iRightRows = static_cast<int64_t>(vRight.size());
  res.vRecords = merge(std::move(vLeft), std::move(vRight));
  return res;
}

std::vector<DiffRecord> ExactRowDiffer::merge(std::vector<Row> vLeft, std::vector<Row> vRight) {
  checkAscending(vLeft, "left");
  checkAscending(vRight, "right");

  std::vector<DiffRecord> vRecords;
  size_t uL = 0;
  size_t uR = 0;
  while (uL < vLeft.size() && uR < vRight.size()) {
    Row& rwLeft = vLeft[uL];
    Row& rwRight = vRight[uR];
    if (rwLeft.key < rwRight.key) {
      vRecords.push_back(DiffRecord::removed(std::move(rwLeft.key), std::move(rwLeft.vValues)));
      ++uL;
    } else if (rwRight.key < rwLeft.key) {
      vRecords.push_back(DiffRecord::added(std::move(rwRight.key), std::move(rwRight.vValues)));
      ++uR;
    } else {
      if (rwLeft.vValues != rwRight.vValues) {
        vRecords.push_back(DiffRecord::changed(std::move(rwLeft.key), std::move(rwLeft.vValues),
                                               std::move(rwRight.vValues)));
      }
      ++uL;
      ++uR;
    }
  }
  for (; uL < vLeft.size(); ++uL) {
    vRecords.push_back(DiffRecord::removed(std::move(vLeft[uL].key), std::move(vLeft[uL].vValues)));
  }
  for (; uR < vRight.size(); ++uR) {
    vRecords.push_back(
        DiffRecord::added(std::move(vRight[uR].key), std::move(vRight[uR].vValues)));
  }
  return vRecords;
}

}  // namespace xdiff::core
