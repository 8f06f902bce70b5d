#include "dal/SqliteAccessor.hpp"

#include "common/Errors.hpp"
#include "common/KeyCodec.hpp"
#include "common/RowHash.hpp"
#include "core/BisectionEngine.hpp"
#include "dal/AccessorFactory.hpp"

#include <gtest/gtest.h>
#include <sqlite3.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace xdiff::common;
using xdiff::dal::SqliteAccessor;

namespace {

/// Scratch database file, removed on destruction.
class ScratchDb {
 public:
  explicit ScratchDb(const std::string& sTag) {
    _sPath = (std::filesystem::temp_directory_path() /
              ("xdiff_" + sTag + "_" + std::to_string(::getpid()) + ".db"))
                 .string();
    std::filesystem::remove(_sPath);
    if (sqlite3_open(_sPath.c_str(), &_pDb) != SQLITE_OK) {
      throw std::runtime_error("cannot create " + _sPath);
    }
  }
  ~ScratchDb() {
    sqlite3_close(_pDb);
    std::filesystem::remove(_sPath);
  }

  ScratchDb(const ScratchDb&) = delete;
  ScratchDb& operator=(const ScratchDb&) = delete;

  void exec(const std::string& sSql) {
    char* pErr = nullptr;
    if (sqlite3_exec(_pDb, sSql.c_str(), nullptr, nullptr, &pErr) != SQLITE_OK) {
      const std::string sMsg = pErr ? pErr : "unknown error";
      sqlite3_free(pErr);
      throw std::runtime_error(sMsg + " in: " + sSql);
    }
  }

  const std::string& path() const { return _sPath; }

 private:
  std::string _sPath;
  sqlite3* _pDb = nullptr;
};

TableRef itemsTable(std::vector<std::string> vColumns) {
  TableRef tr;
  tr.sTablePath = "items";
  tr.sKeyColumn = "id";
  tr.keyType = KeyType::Integer;
  tr.vColumns = std::move(vColumns);
  return tr;
}

void fillSequence(ScratchDb& db, int iFrom, int iTo) {
  db.exec("BEGIN");
  for (int i = iFrom; i < iTo; ++i) {
    db.exec("INSERT INTO items (id, name) VALUES (" + std::to_string(i) + ", 'name" +
            std::to_string(i) + "')");
  }
  db.exec("COMMIT");
}

KeyRange range(int64_t iStart, std::optional<int64_t> oEnd) {
  KeyRange kr{Key{iStart}, std::nullopt};
  if (oEnd) kr.oKeyEnd = Key{*oEnd};
  return kr;
}

}  // namespace

class SqliteAccessorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _upDb = std::make_unique<ScratchDb>(
        ::testing::UnitTest::GetInstance()->current_test_info()->name());
    _upDb->exec(
        "CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT, price DECIMAL(10,2), "
        "ratio REAL, created TIMESTAMP, flag BOOLEAN, uid UUID)");
  }

  std::unique_ptr<ScratchDb> _upDb;
};

TEST_F(SqliteAccessorTest, ClassifyDeclaredTypes) {
  EXPECT_EQ(SqliteAccessor::classify("a", "INTEGER").type, ColumnType::Integer);
  EXPECT_EQ(SqliteAccessor::classify("a", "bigint").type, ColumnType::Integer);
  EXPECT_EQ(SqliteAccessor::classify("a", "VARCHAR(20)").type, ColumnType::Text);
  EXPECT_EQ(SqliteAccessor::classify("a", "DOUBLE PRECISION").type, ColumnType::Float);
  EXPECT_EQ(SqliteAccessor::classify("a", "NUMERIC(12, 3)").iScale, 3);
  EXPECT_EQ(SqliteAccessor::classify("a", "DATETIME").type, ColumnType::Timestamp);
  EXPECT_EQ(SqliteAccessor::classify("a", "uuid").type, ColumnType::Uuid);
  EXPECT_EQ(SqliteAccessor::classify("a", "BOOLEAN").type, ColumnType::Boolean);
  EXPECT_EQ(SqliteAccessor::classify("a", "").type, ColumnType::Unknown);
}

TEST_F(SqliteAccessorTest, DescribeReportsKeyThenColumns) {
  SqliteAccessor sa(_upDb->path(), 1);
  const auto vInfos = sa.describe(itemsTable({"price", "name", "created"}));

  ASSERT_EQ(vInfos.size(), 4u);
  EXPECT_EQ(vInfos[0].sName, "id");
  EXPECT_EQ(vInfos[0].type, ColumnType::Integer);
  EXPECT_EQ(vInfos[1].type, ColumnType::Decimal);
  EXPECT_EQ(vInfos[1].iScale, 2);
  EXPECT_EQ(vInfos[2].type, ColumnType::Text);
  EXPECT_EQ(vInfos[3].type, ColumnType::Timestamp);
}

TEST_F(SqliteAccessorTest, DescribeMissingTableOrColumn) {
  SqliteAccessor sa(_upDb->path(), 1);

  TableRef trMissing = itemsTable({"name"});
  trMissing.sTablePath = "nope";
  EXPECT_THROW(sa.describe(trMissing), SchemaMismatchError);

  try {
    sa.describe(itemsTable({"colour"}));
    FAIL() << "expected SchemaMismatchError";
  } catch (const SchemaMismatchError& ex) {
    EXPECT_EQ(ex._sErrorCode, "missing_column");
  }
}

TEST_F(SqliteAccessorTest, BoundsAndCount) {
  SqliteAccessor sa(_upDb->path(), 2);
  TableRef tr = itemsTable({"name"});
  EXPECT_FALSE(sa.bounds(tr).has_value());

  fillSequence(*_upDb, 10, 110);
  auto oBounds = sa.bounds(tr);
  ASSERT_TRUE(oBounds.has_value());
  EXPECT_EQ(std::get<int64_t>(oBounds->keyMin), 10);
  EXPECT_EQ(std::get<int64_t>(oBounds->keyMax), 109);

  EXPECT_EQ(sa.count(tr, range(10, 20)), 10);
  EXPECT_EQ(sa.count(tr, range(0, 10)), 0);
  EXPECT_EQ(sa.count(tr, range(100, std::nullopt)), 10);
}

TEST_F(SqliteAccessorTest, RowsAreNormalizedAndOrdered) {
  _upDb->exec(
      "INSERT INTO items VALUES "
      "(3, 'c', '7', 0.25, '2024-03-01T12:00:00Z', 'true', "
      "'0F8FAD5B-D9CB-469F-A165-70867728950E'),"
      "(1, 'a', 1.5, 2, '2024-03-01', 0, NULL),"
      "(2, NULL, NULL, NULL, NULL, NULL, NULL)");

  SqliteAccessor sa(_upDb->path(), 1);
  TableRef tr = itemsTable({"name", "price", "ratio", "created", "flag", "uid"});
  tr.vColumnInfos = {{"name", ColumnType::Text, 0},         {"price", ColumnType::Decimal, 2},
                     {"ratio", ColumnType::Decimal, 3},     {"created", ColumnType::Timestamp, 0},
                     {"flag", ColumnType::Boolean, 0},      {"uid", ColumnType::Uuid, 0}};

  const auto vRows = sa.rows(tr, range(0, std::nullopt));
  ASSERT_EQ(vRows.size(), 3u);
  EXPECT_EQ(std::get<int64_t>(vRows[0].key), 1);
  EXPECT_EQ(std::get<int64_t>(vRows[2].key), 3);

  EXPECT_EQ(vRows[0].vValues[1], "1.50");
  EXPECT_EQ(vRows[0].vValues[2], "2.000");
  EXPECT_EQ(vRows[0].vValues[3], "2024-03-01 00:00:00.000000");
  EXPECT_EQ(vRows[0].vValues[4], "0");
  EXPECT_FALSE(vRows[0].vValues[5].has_value());

  for (const auto& oValue : vRows[1].vValues) EXPECT_FALSE(oValue.has_value());

  EXPECT_EQ(vRows[2].vValues[1], "7.00");
  EXPECT_EQ(vRows[2].vValues[2], "0.250");
  EXPECT_EQ(vRows[2].vValues[3], "2024-03-01 12:00:00.000000");
  EXPECT_EQ(vRows[2].vValues[4], "1");
  EXPECT_EQ(vRows[2].vValues[5], "0f8fad5b-d9cb-469f-a165-70867728950e");
}

TEST_F(SqliteAccessorTest, IntegersComparedAsBooleanRenderZeroOrOne) {
  _upDb->exec(
      "INSERT INTO items (id, flag) VALUES (1, 5), (2, 0), (3, -3), (4, 'true'), (5, NULL)");
  SqliteAccessor sa(_upDb->path(), 1);
  TableRef tr = itemsTable({"flag"});
  tr.vColumnInfos = {{"flag", ColumnType::Boolean, 0}};

  const auto vRows = sa.rows(tr, range(1, std::nullopt));
  ASSERT_EQ(vRows.size(), 5u);
  EXPECT_EQ(vRows[0].vValues[0], "1");
  EXPECT_EQ(vRows[1].vValues[0], "0");
  EXPECT_EQ(vRows[2].vValues[0], "1");
  EXPECT_EQ(vRows[3].vValues[0], "1");
  EXPECT_FALSE(vRows[4].vValues[0].has_value());
}

TEST_F(SqliteAccessorTest, RowsWithoutAgreedColumnsAreRejected) {
  fillSequence(*_upDb, 0, 5);
  SqliteAccessor sa(_upDb->path(), 1);
  EXPECT_THROW(sa.rows(itemsTable({"name"}), range(0, 5)), QueryError);
}

TEST_F(SqliteAccessorTest, ChecksumMatchesRowHashOfRows) {
  fillSequence(*_upDb, 0, 200);
  SqliteAccessor sa(_upDb->path(), 1);
  TableRef tr = itemsTable({"name"});
  tr.vColumnInfos = {{"name", ColumnType::Text, 0}};

  ChecksumAccumulator ca;
  for (const auto& rw : sa.rows(tr, range(50, 150))) {
    ca.addRow(KeyCodec::toString(rw.key, KeyType::Integer), rw.vValues);
  }
  EXPECT_EQ(sa.checksum(tr, range(50, 150)), ca.value());
  EXPECT_EQ(sa.checksum(tr, range(500, 600)), "0");
  EXPECT_NE(sa.checksum(tr, range(50, 150)), sa.checksum(tr, range(50, 151)));
}

TEST_F(SqliteAccessorTest, StringKeysUseBinaryOrder) {
  _upDb->exec("CREATE TABLE words (w TEXT PRIMARY KEY, n INTEGER)");
  _upDb->exec("INSERT INTO words VALUES ('b', 1), ('B', 2), ('a', 3), ('ab', 4)");

  SqliteAccessor sa(_upDb->path(), 1);
  TableRef tr;
  tr.sTablePath = "words";
  tr.sKeyColumn = "w";
  tr.keyType = KeyType::String;
  tr.vColumns = {"n"};
  tr.vColumnInfos = {{"n", ColumnType::Integer, 0}};

  const auto vRows = sa.rows(tr, KeyRange{Key{std::string("")}, std::nullopt});
  ASSERT_EQ(vRows.size(), 4u);
  EXPECT_EQ(std::get<std::string>(vRows[0].key), "B");
  EXPECT_EQ(std::get<std::string>(vRows[1].key), "a");
  EXPECT_EQ(std::get<std::string>(vRows[2].key), "ab");
  EXPECT_EQ(std::get<std::string>(vRows[3].key), "b");

  EXPECT_EQ(sa.count(tr, KeyRange{Key{std::string("a")}, Key{std::string("b")}}), 2);
}

TEST_F(SqliteAccessorTest, MissingDatabaseFileIsReported) {
  EXPECT_THROW(SqliteAccessor("/nonexistent/dir/xdiff.db", 1), QueryError);
}

TEST_F(SqliteAccessorTest, EngineDiffsTwoDatabases) {
  ScratchDb dbRight(std::string("right_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
  _upDb->exec("DROP TABLE items");
  _upDb->exec("CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT)");
  dbRight.exec("CREATE TABLE items (id INTEGER PRIMARY KEY, name VARCHAR(40))");
  fillSequence(*_upDb, 1, 3001);
  fillSequence(dbRight, 1, 3001);
  dbRight.exec("UPDATE items SET name = 'renamed' WHERE id = 1234");
  dbRight.exec("DELETE FROM items WHERE id = 2500");
  dbRight.exec("INSERT INTO items (id, name) VALUES (3001, 'new')");

  SqliteAccessor saLeft(_upDb->path(), 2);
  SqliteAccessor saRight(dbRight.path(), 2);

  xdiff::core::DiffOptions dop;
  dop.iBisectionFactor = 8;
  dop.iBisectionThreshold = 64;
  dop.iThreads = 4;
  xdiff::core::BisectionEngine be(saLeft, saRight, dop);
  auto upStream = be.diff(itemsTable({"name"}), itemsTable({"name"}));

  std::vector<DiffRecord> vRecords;
  for (const auto& dr : *upStream) vRecords.push_back(dr);
  std::sort(vRecords.begin(), vRecords.end(),
            [](const DiffRecord& a, const DiffRecord& b) { return a.key < b.key; });
  upStream->wait();
  ASSERT_EQ(upStream->state(), xdiff::core::StreamState::Completed);

  ASSERT_EQ(vRecords.size(), 3u);
  EXPECT_EQ(std::get<int64_t>(vRecords[0].key), 1234);
  EXPECT_EQ(vRecords[0].kind, DiffKind::Changed);
  EXPECT_EQ(vRecords[0].vRightValues[0], "renamed");
  EXPECT_EQ(std::get<int64_t>(vRecords[1].key), 2500);
  EXPECT_EQ(vRecords[1].kind, DiffKind::Removed);
  EXPECT_EQ(std::get<int64_t>(vRecords[2].key), 3001);
  EXPECT_EQ(vRecords[2].kind, DiffKind::Added);

  const auto ds = upStream->stats();
  EXPECT_EQ(ds.iLeftRows, 3000);
  EXPECT_EQ(ds.iRightRows, 3000);
  EXPECT_LT(ds.iLeftRowsDownloaded, 3000);
}

namespace {

TableRef eventsTable() {
  TableRef tr;
  tr.sTablePath = "events";
  tr.sKeyColumn = "ts";
  tr.keyType = KeyType::Timestamp;
  tr.vColumns = {"v"};
  return tr;
}

}  // namespace

TEST_F(SqliteAccessorTest, NumericTimestampKeysAreRejected) {
  _upDb->exec("CREATE TABLE events (ts DATETIME PRIMARY KEY, v TEXT)");
  _upDb->exec("INSERT INTO events VALUES (1700000000, 'a'), (1700000001, 'b')");

  SqliteAccessor sa(_upDb->path(), 1);
  try {
    sa.bounds(eventsTable());
    FAIL() << "expected SchemaMismatchError";
  } catch (const SchemaMismatchError& ex) {
    EXPECT_EQ(ex._sErrorCode, "timestamp_key_not_canonical");
  }

  _upDb->exec("DELETE FROM events");
  _upDb->exec("INSERT INTO events VALUES ('2023-11-14 22:13:20', 'a')");
  EXPECT_THROW(sa.bounds(eventsTable()), SchemaMismatchError);
}

TEST_F(SqliteAccessorTest, EngineFailsOnNumericTimestampKeys) {
  ScratchDb dbRight(std::string("right_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
  _upDb->exec("CREATE TABLE events (ts DATETIME PRIMARY KEY, v TEXT)");
  dbRight.exec("CREATE TABLE events (ts DATETIME PRIMARY KEY, v TEXT)");
  _upDb->exec("INSERT INTO events VALUES (1700000000, 'a'), (1700000001, 'b')");
  dbRight.exec("INSERT INTO events VALUES (1700000000, 'a'), (1700000001, 'c')");

  SqliteAccessor saLeft(_upDb->path(), 1);
  SqliteAccessor saRight(dbRight.path(), 1);
  xdiff::core::DiffOptions dop;
  dop.iThreads = 2;
  xdiff::core::BisectionEngine be(saLeft, saRight, dop);
  auto upStream = be.diff(eventsTable(), eventsTable());

  EXPECT_THROW(upStream->next(), SchemaMismatchError);
  EXPECT_EQ(upStream->state(), xdiff::core::StreamState::Failed);
}

TEST_F(SqliteAccessorTest, EngineDiffsCanonicalTimestampKeys) {
  ScratchDb dbRight(std::string("right_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
  _upDb->exec("CREATE TABLE events (ts DATETIME PRIMARY KEY, v TEXT)");
  dbRight.exec("CREATE TABLE events (ts DATETIME PRIMARY KEY, v TEXT)");
  _upDb->exec(
      "INSERT INTO events VALUES ('2023-11-14 22:13:20.000000', 'a'), "
      "('2023-11-14 22:13:21.000000', 'b')");
  dbRight.exec(
      "INSERT INTO events VALUES ('2023-11-14 22:13:20.000000', 'a'), "
      "('2023-11-14 22:13:21.000000', 'c')");

  SqliteAccessor saLeft(_upDb->path(), 1);
  SqliteAccessor saRight(dbRight.path(), 1);
  EXPECT_EQ(saLeft.count(eventsTable(), KeyRange{Key{KeyCodec::parseTimestamp(
                                                     "2023-11-14 22:13:20")},
                                                 std::nullopt}),
            2);

  xdiff::core::DiffOptions dop;
  dop.iThreads = 2;
  xdiff::core::BisectionEngine be(saLeft, saRight, dop);
  auto upStream = be.diff(eventsTable(), eventsTable());

  std::vector<DiffRecord> vRecords;
  for (const auto& dr : *upStream) vRecords.push_back(dr);
  upStream->wait();
  ASSERT_EQ(upStream->state(), xdiff::core::StreamState::Completed);
  ASSERT_EQ(vRecords.size(), 1u);
  EXPECT_EQ(vRecords[0].kind, DiffKind::Changed);
  EXPECT_EQ(KeyCodec::toString(vRecords[0].key, KeyType::Timestamp),
            "2023-11-14 22:13:21.000000");
  EXPECT_EQ(vRecords[0].vLeftValues[0], "b");
  EXPECT_EQ(vRecords[0].vRightValues[0], "c");
}

TEST_F(SqliteAccessorTest, FactorySelectsBackendByScheme) {
  auto upAccessor = xdiff::dal::AccessorFactory::create("sqlite://" + _upDb->path(), 1);
  EXPECT_EQ(upAccessor->name(), "sqlite");

  try {
    xdiff::dal::AccessorFactory::create("mysql://localhost/db", 1);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& ex) {
    EXPECT_EQ(ex._sErrorCode, "unsupported_database");
  }
  EXPECT_THROW(xdiff::dal::AccessorFactory::create("sqlite://", 1), ConfigError);
}
