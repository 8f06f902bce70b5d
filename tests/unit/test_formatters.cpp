#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "output/JsonFormatter.hpp"
#include "output/TextFormatter.hpp"

using namespace xdiff::common;
using xdiff::core::StreamState;
using xdiff::output::JsonFormatter;
using xdiff::output::TextFormatter;

namespace {

TableRef makeTable(const std::string& sPath, std::vector<std::string> vColumns) {
  TableRef tr;
  tr.sTablePath = sPath;
  tr.sKeyColumn = "id";
  tr.vColumns = std::move(vColumns);
  return tr;
}

DiffStats sampleStats() {
  DiffStats ds;
  ds.iLeftRows = 1000;
  ds.iRightRows = 1001;
  ds.iRemoved = 1;
  ds.iAdded = 2;
  ds.iChanged = 1;
  ds.iSegmentsCompared = 31;
  ds.iExactDiffs = 3;
  ds.iMaxDepthReached = 2;
  return ds;
}

void writeSample(xdiff::output::IDiffFormatter& fmt) {
  fmt.write(DiffRecord::removed(Key{int64_t{3}}, {std::string("c"), std::nullopt}));
  fmt.write(DiffRecord::added(Key{int64_t{1001}}, {std::string("n"), std::string("1")}));
  fmt.write(DiffRecord::changed(Key{int64_t{500}}, {std::string("a"), std::string("1")},
                                {std::string("a"), std::string("2")}));
}

}  // namespace

// ── TextFormatter ──────────────────────────────────────────────────────────

TEST(TextFormatterTest, FormatRow) {
  EXPECT_EQ(TextFormatter::formatRow("7", {std::string("x"), std::nullopt}), "(7, x, NULL)");
  EXPECT_EQ(TextFormatter::formatRow("7", {}), "(7)");
}

TEST(TextFormatterTest, WritesSignedLines) {
  std::ostringstream oss;
  TextFormatter tf(oss, false);
  tf.begin(makeTable("a", {"name", "qty"}), makeTable("b", {"name", "qty"}));
  writeSample(tf);
  tf.finish(sampleStats(), StreamState::Completed);

  EXPECT_EQ(oss.str(),
            "- (3, c, NULL)\n"
            "+ (1001, n, 1)\n"
            "- (500, a, 1)\n"
            "+ (500, a, 2)\n");
}

TEST(TextFormatterTest, StatsBlock) {
  std::ostringstream oss;
  TextFormatter tf(oss, true);
  tf.begin(makeTable("a", {"v"}), makeTable("b", {"v"}));
  tf.finish(sampleStats(), StreamState::Completed);

  const std::string sOut = oss.str();
  EXPECT_NE(sOut.find("1000 rows in table A\n"), std::string::npos);
  EXPECT_NE(sOut.find("1001 rows in table B\n"), std::string::npos);
  EXPECT_NE(sOut.find("1 rows exclusive to table A"), std::string::npos);
  EXPECT_NE(sOut.find("2 rows exclusive to table B"), std::string::npos);
  EXPECT_NE(sOut.find("998 rows unchanged\n"), std::string::npos);
  // 100 * (1 - 998 / 1001)
  EXPECT_NE(sOut.find("0.30% difference score"), std::string::npos);
  EXPECT_NE(sOut.find("segments_compared = 31"), std::string::npos);
}

TEST(TextFormatterTest, IncompleteRunsAreFlagged) {
  std::ostringstream ossCancelled;
  TextFormatter tfCancelled(ossCancelled, false);
  tfCancelled.begin(makeTable("a", {"v"}), makeTable("b", {"v"}));
  tfCancelled.finish(DiffStats{}, StreamState::Cancelled);
  EXPECT_EQ(ossCancelled.str(), "# diff cancelled, report is incomplete\n");

  std::ostringstream ossFailed;
  TextFormatter tfFailed(ossFailed, false);
  tfFailed.begin(makeTable("a", {"v"}), makeTable("b", {"v"}));
  tfFailed.finish(DiffStats{}, StreamState::Failed);
  EXPECT_EQ(ossFailed.str(), "# diff failed, report is incomplete\n");
}

TEST(TextFormatterTest, SkippedRangesAreListed) {
  std::ostringstream oss;
  TextFormatter tf(oss, false);
  tf.begin(makeTable("a", {"v"}), makeTable("b", {"v"}));
  DiffStats ds;
  ds.vFailedRanges = {"[10, 20): timeout"};
  tf.finish(ds, StreamState::Completed);
  EXPECT_EQ(oss.str(), "# skipped range [10, 20): timeout\n");
}

// ── JsonFormatter ──────────────────────────────────────────────────────────

TEST(JsonFormatterTest, IdenticalDocument) {
  std::ostringstream oss;
  JsonFormatter jf(oss, false);
  jf.begin(makeTable("db.public.orders", {"v"}), makeTable("orders", {"v"}));
  jf.finish(DiffStats{}, StreamState::Completed);

  const auto j = nlohmann::json::parse(oss.str());
  EXPECT_EQ(j["version"], "1.0.0");
  EXPECT_EQ(j["status"], "success");
  EXPECT_EQ(j["result"], "identical");
  EXPECT_EQ(j["dataset1"], nlohmann::json::array({"db", "public", "orders"}));
  EXPECT_EQ(j["dataset2"], nlohmann::json::array({"orders"}));
  EXPECT_TRUE(j["rows"]["exclusive"]["dataset1"].empty());
  EXPECT_TRUE(j["rows"]["diff"].empty());
  EXPECT_TRUE(j["summary"].is_null());
  EXPECT_TRUE(j["columns"].is_null());
}

TEST(JsonFormatterTest, RecordsAndSummary) {
  std::ostringstream oss;
  JsonFormatter jf(oss, true);
  jf.begin(makeTable("a", {"name", "qty"}), makeTable("b", {"title", "amount"}));
  writeSample(jf);

  const auto j = jf.document(sampleStats(), StreamState::Completed);
  EXPECT_EQ(j["result"], "different");

  const auto& jLeftOnly = j["rows"]["exclusive"]["dataset1"];
  ASSERT_EQ(jLeftOnly.size(), 1u);
  EXPECT_EQ(jLeftOnly[0]["id"]["value"], "3");
  EXPECT_TRUE(jLeftOnly[0]["id"]["isPK"].get<bool>());
  EXPECT_TRUE(jLeftOnly[0]["qty"]["value"].is_null());

  const auto& jRightOnly = j["rows"]["exclusive"]["dataset2"];
  ASSERT_EQ(jRightOnly.size(), 1u);
  EXPECT_EQ(jRightOnly[0]["title"]["value"], "n");

  const auto& jDiff = j["rows"]["diff"];
  ASSERT_EQ(jDiff.size(), 1u);
  EXPECT_FALSE(jDiff[0]["name"]["isDiff"].get<bool>());
  EXPECT_TRUE(jDiff[0]["qty"]["isDiff"].get<bool>());
  EXPECT_EQ(jDiff[0]["qty"]["dataset1"], "1");
  EXPECT_EQ(jDiff[0]["qty"]["dataset2"], "2");

  const auto& jSummary = j["summary"];
  EXPECT_EQ(jSummary["rows"]["total"]["dataset1"], 1000);
  EXPECT_EQ(jSummary["rows"]["exclusive"]["dataset2"], 2);
  EXPECT_EQ(jSummary["rows"]["updated"], 1);
  EXPECT_EQ(jSummary["rows"]["unchanged"], 998);
  EXPECT_EQ(jSummary["stats"]["diffCounts"]["qty"], 1);
  EXPECT_FALSE(jSummary["stats"]["diffCounts"].contains("name"));
  EXPECT_EQ(jSummary["stats"]["segmentsCompared"], 31);
}

TEST(JsonFormatterTest, StatusReflectsStreamState) {
  std::ostringstream oss;
  JsonFormatter jf(oss, false);
  jf.begin(makeTable("a", {"v"}), makeTable("b", {"v"}));
  EXPECT_EQ(jf.document(DiffStats{}, StreamState::Cancelled)["status"], "cancelled");
  EXPECT_EQ(jf.document(DiffStats{}, StreamState::Failed)["status"], "failed");
}
