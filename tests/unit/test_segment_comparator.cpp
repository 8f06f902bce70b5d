#include "core/SegmentComparator.hpp"

#include <gtest/gtest.h>

#include <stop_token>
#include <string>

#include "common/Errors.hpp"
#include "support/MemoryTableAccessor.hpp"

using namespace xdiff::common;
using xdiff::core::Segment;
using xdiff::core::SegmentComparator;
using xdiff::core::SegmentVerdict;
using xdiff::core::SideExecutor;
using xdiff::test::MemoryTableAccessor;

namespace {

TableRef makeTable() {
  TableRef tr;
  tr.sTablePath = "items";
  tr.vColumns = {"v"};
  tr.vColumnInfos = {ColumnInfo{"v", ColumnType::Text, 0}};
  return tr;
}

void fill(MemoryTableAccessor& mta, int64_t iFrom, int64_t iTo) {
  for (int64_t i = iFrom; i < iTo; ++i) {
    mta.put(Key{i}, {std::to_string(i)});
  }
}

}  // namespace

TEST(SegmentComparatorTest, ClassifyMatch) {
  EXPECT_EQ(SegmentComparator::classify({10, "123"}, {10, "123"}, 5), SegmentVerdict::Match);
  EXPECT_EQ(SegmentComparator::classify({0, "0"}, {0, "0"}, 5), SegmentVerdict::Match);
}

TEST(SegmentComparatorTest, ClassifyBySizeAgainstThreshold) {
  EXPECT_EQ(SegmentComparator::classify({5, "1"}, {5, "2"}, 5), SegmentVerdict::SmallMismatch);
  EXPECT_EQ(SegmentComparator::classify({5, "1"}, {6, "2"}, 5), SegmentVerdict::LargeMismatch);
  EXPECT_EQ(SegmentComparator::classify({100, "1"}, {100, "2"}, 5),
            SegmentVerdict::LargeMismatch);
}

TEST(SegmentComparatorTest, EqualChecksumWithDifferentCountIsMismatch) {
  EXPECT_EQ(SegmentComparator::classify({3, "77"}, {4, "77"}, 10),
            SegmentVerdict::SmallMismatch);
}

TEST(SegmentComparatorTest, ClassifyOneSidedRegardlessOfSize) {
  EXPECT_EQ(SegmentComparator::classify({0, "0"}, {1'000'000, "9"}, 5), SegmentVerdict::OneSided);
  EXPECT_EQ(SegmentComparator::classify({7, "9"}, {0, "0"}, 5), SegmentVerdict::OneSided);
}

TEST(SegmentComparatorTest, CompareQueriesBothSides) {
  MemoryTableAccessor mtaLeft;
  MemoryTableAccessor mtaRight;
  fill(mtaLeft, 0, 100);
  fill(mtaRight, 0, 100);
  mtaRight.put(Key{int64_t{42}}, {std::string("changed")});

  std::stop_source ssRun;
  SideExecutor seLeft("left", mtaLeft, makeTable(), 2, {}, ssRun.get_token());
  SideExecutor seRight("right", mtaRight, makeTable(), 2, {}, ssRun.get_token());
  SegmentComparator sc(seLeft, seRight, 10);

  const auto cmpWhole = sc.compare(KeyRange{Key{int64_t{0}}, Key{int64_t{100}}});
  EXPECT_EQ(cmpWhole.sgLeft.iCount, 100);
  EXPECT_EQ(cmpWhole.sgRight.iCount, 100);
  EXPECT_NE(cmpWhole.sgLeft.checksum, cmpWhole.sgRight.checksum);
  EXPECT_EQ(cmpWhole.verdict, SegmentVerdict::LargeMismatch);

  const auto cmpClean = sc.compare(KeyRange{Key{int64_t{0}}, Key{int64_t{40}}});
  EXPECT_EQ(cmpClean.verdict, SegmentVerdict::Match);

  const auto cmpSmall = sc.compare(KeyRange{Key{int64_t{40}}, Key{int64_t{45}}});
  EXPECT_EQ(cmpSmall.verdict, SegmentVerdict::SmallMismatch);

  EXPECT_EQ(mtaLeft.iCountCalls.load(), 3);
  EXPECT_EQ(mtaRight.iChecksumCalls.load(), 3);
}

TEST(SegmentComparatorTest, EmptySideSkipsChecksumQuery) {
  MemoryTableAccessor mtaLeft;
  MemoryTableAccessor mtaRight;
  fill(mtaRight, 0, 10);

  std::stop_source ssRun;
  SideExecutor seLeft("left", mtaLeft, makeTable(), 1, {}, ssRun.get_token());
  SideExecutor seRight("right", mtaRight, makeTable(), 1, {}, ssRun.get_token());
  SegmentComparator sc(seLeft, seRight, 1);

  const auto cmp = sc.compare(KeyRange{Key{int64_t{0}}, Key{int64_t{10}}});
  EXPECT_EQ(cmp.verdict, SegmentVerdict::OneSided);
  EXPECT_EQ(cmp.sgLeft.checksum, "0");
  EXPECT_EQ(mtaLeft.iChecksumCalls.load(), 0);
  EXPECT_EQ(mtaRight.iChecksumCalls.load(), 1);
}

TEST(SegmentComparatorTest, FailureOnOneSideSurfacesAfterBothFinish) {
  MemoryTableAccessor mtaLeft;
  MemoryTableAccessor mtaRight;
  fill(mtaLeft, 0, 10);
  fill(mtaRight, 0, 10);
  mtaRight.setFault([](const std::string& sOperation) {
    if (sOperation == "count") throw QueryError("sql_error", "relation does not exist");
  });

  std::stop_source ssRun;
  SideExecutor seLeft("left", mtaLeft, makeTable(), 1, {}, ssRun.get_token());
  SideExecutor seRight("right", mtaRight, makeTable(), 1, {}, ssRun.get_token());
  SegmentComparator sc(seLeft, seRight, 5);

  EXPECT_THROW(sc.compare(KeyRange{Key{int64_t{0}}, Key{int64_t{10}}}), SegmentFailedError);
  EXPECT_EQ(mtaLeft.iChecksumCalls.load(), 1);
}
