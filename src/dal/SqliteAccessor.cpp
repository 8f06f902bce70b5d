#include "dal/SqliteAccessor.hpp"

#include "common/Errors.hpp"
#include "common/KeyCodec.hpp"
#include "common/Logger.hpp"
#include "common/RowHash.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <unordered_map>

namespace xdiff::dal {

using common::ColumnInfo;
using common::ColumnType;
using common::KeyType;

namespace {

constexpr int kDefaultScale = 6;
constexpr int kBusyTimeoutMs = 5000;

class StmtGuard {
 public:
  explicit StmtGuard(sqlite3_stmt* pStmt) : _pStmt(pStmt) {}
  ~StmtGuard() {
    if (_pStmt) sqlite3_finalize(_pStmt);
  }
  StmtGuard(const StmtGuard&) = delete;
  StmtGuard& operator=(const StmtGuard&) = delete;
  sqlite3_stmt* get() const { return _pStmt; }

 private:
  sqlite3_stmt* _pStmt;
};

std::string quoteIdentifier(const std::string& sName) {
  std::string sOut = "\"";
  for (char c : sName) {
    if (c == '"') sOut += '"';
    sOut += c;
  }
  sOut += '"';
  return sOut;
}

std::string quoteTablePath(const std::string& sPath) {
  const auto uDot = sPath.find('.');
  if (uDot == std::string::npos) return quoteIdentifier(sPath);
  return quoteIdentifier(sPath.substr(0, uDot)) + "." + quoteIdentifier(sPath.substr(uDot + 1));
}

std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string columnText(sqlite3_stmt* pStmt, int iCol) {
  const auto* pText = reinterpret_cast<const char*>(sqlite3_column_text(pStmt, iCol));
  if (!pText) return {};
  return std::string(pText, static_cast<size_t>(sqlite3_column_bytes(pStmt, iCol)));
}

std::string formatFixed(double dValue, int iScale) {
  char szBuf[64];
  std::snprintf(szBuf, sizeof(szBuf), "%.*f", iScale, dValue);
  std::string sOut = szBuf;
  // "-0.00" renders as "0.00" on the server side
  if (sOut[0] == '-' && sOut.find_first_not_of("-0.") == std::string::npos) {
    sOut.erase(0, 1);
  }
  return sOut;
}

std::string normalizeNumeric(sqlite3_stmt* pStmt, int iCol, int iScale) {
  switch (sqlite3_column_type(pStmt, iCol)) {
    case SQLITE_INTEGER: {
      std::string sOut = std::to_string(sqlite3_column_int64(pStmt, iCol));
      if (iScale > 0) sOut += "." + std::string(static_cast<size_t>(iScale), '0');
      return sOut;
    }
    case SQLITE_FLOAT: return formatFixed(sqlite3_column_double(pStmt, iCol), iScale);
    default: {
      const std::string sText = columnText(pStmt, iCol);
      try {
        return formatFixed(std::stod(sText), iScale);
      } catch (const std::exception&) {
        return sText;
      }
    }
  }
}

std::string normalizeTimestamp(sqlite3_stmt* pStmt, int iCol) {
  switch (sqlite3_column_type(pStmt, iCol)) {
    case SQLITE_INTEGER:
      return common::KeyCodec::formatTimestamp(sqlite3_column_int64(pStmt, iCol) * 1'000'000);
    case SQLITE_FLOAT:
      return common::KeyCodec::formatTimestamp(
          std::llround(sqlite3_column_double(pStmt, iCol) * 1'000'000.0));
    default:
      return common::KeyCodec::formatTimestamp(
          common::KeyCodec::parseTimestamp(columnText(pStmt, iCol)));
  }
}

/// Render one column with the agreed normalization. nullopt for NULL.
std::optional<std::string> normalizeValue(sqlite3_stmt* pStmt, int iCol,
                                          const ColumnInfo& ciColumn) {
  if (sqlite3_column_type(pStmt, iCol) == SQLITE_NULL) return std::nullopt;

  switch (ciColumn.type) {
    case ColumnType::Integer:
      if (sqlite3_column_type(pStmt, iCol) == SQLITE_FLOAT) {
        return std::to_string(std::llround(sqlite3_column_double(pStmt, iCol)));
      }
      return columnText(pStmt, iCol);
    case ColumnType::Decimal:
    case ColumnType::Float: return normalizeNumeric(pStmt, iCol, ciColumn.iScale);
    case ColumnType::Timestamp: return normalizeTimestamp(pStmt, iCol);
    case ColumnType::Uuid: return toLower(columnText(pStmt, iCol));
    case ColumnType::Boolean: {
      if (sqlite3_column_type(pStmt, iCol) == SQLITE_TEXT) {
        const std::string sText = toLower(columnText(pStmt, iCol));
        return (sText == "true" || sText == "t" || sText == "1") ? "1" : "0";
      }
      return sqlite3_column_int64(pStmt, iCol) != 0 ? "1" : "0";
    }
    case ColumnType::Text:
    case ColumnType::Unknown: return columnText(pStmt, iCol);
  }
  return columnText(pStmt, iCol);
}

common::Key readKey(sqlite3_stmt* pStmt, int iCol, const common::TableRef& trTable) {
  const int iType = sqlite3_column_type(pStmt, iCol);
  switch (trTable.keyType) {
    case KeyType::Integer:
      if (iType == SQLITE_INTEGER) {
        return common::Key{static_cast<int64_t>(sqlite3_column_int64(pStmt, iCol))};
      }
      break;
    case KeyType::Decimal:
      if (iType == SQLITE_INTEGER || iType == SQLITE_FLOAT) {
        return common::Key{common::KeyCodec::parseDecimal(
            normalizeNumeric(pStmt, iCol, trTable.iKeyScale), trTable.iKeyScale)};
      }
      break;
    case KeyType::Timestamp: {
      // Range bounds are bound as canonical text. Numbers sort below any text
      // and other spellings sort apart from it, so only the canonical form works.
      const std::string sCanonical =
          iType == SQLITE_TEXT ? common::KeyCodec::formatTimestamp(
                                     common::KeyCodec::parseTimestamp(columnText(pStmt, iCol)))
                               : std::string();
      if (iType != SQLITE_TEXT || sCanonical != columnText(pStmt, iCol)) {
        throw common::SchemaMismatchError(
            "timestamp_key_not_canonical",
            "Timestamp key " + trTable.sKeyColumn + " in " + trTable.sTablePath +
                " must be stored as 'YYYY-MM-DD HH:MM:SS.ffffff' text");
      }
      return common::Key{common::KeyCodec::parseTimestamp(sCanonical)};
    }
    case KeyType::Uuid:
    case KeyType::String: break;
  }
  return common::KeyCodec::parse(columnText(pStmt, iCol), trTable.keyType, trTable.iKeyScale);
}

void bindKey(sqlite3_stmt* pStmt, int iIndex, const common::Key& key,
             const common::TableRef& trTable) {
  if (trTable.keyType == KeyType::Integer) {
    sqlite3_bind_int64(pStmt, iIndex, std::get<int64_t>(key));
    return;
  }
  const std::string sText = common::KeyCodec::toString(key, trTable.keyType, trTable.iKeyScale);
  sqlite3_bind_text(pStmt, iIndex, sText.c_str(), static_cast<int>(sText.size()),
                    SQLITE_TRANSIENT);
}

/// Key column expression; strings always compare with memcmp order.
std::string keyColumn(const common::TableRef& trTable) {
  const std::string sKey = quoteIdentifier(trTable.sKeyColumn);
  return trTable.keyType == KeyType::String ? sKey + " COLLATE BINARY" : sKey;
}

std::string rangePredicate(const common::TableRef& trTable, const common::KeyRange& krRange) {
  const std::string sKey = keyColumn(trTable);
  std::string sSql = " WHERE " + sKey + " >= ?1";
  if (krRange.oKeyEnd) sSql += " AND " + sKey + " < ?2";
  return sSql;
}

void bindRange(sqlite3_stmt* pStmt, const common::TableRef& trTable,
               const common::KeyRange& krRange) {
  bindKey(pStmt, 1, krRange.keyStart, trTable);
  if (krRange.oKeyEnd) bindKey(pStmt, 2, *krRange.oKeyEnd, trTable);
}

}  // namespace

// ── Lease ──────────────────────────────────────────────────────────────────

SqliteAccessor::Lease::Lease(SqliteAccessor& saOwner)
    : _saOwner(saOwner), _pDb(saOwner.acquire()) {}

SqliteAccessor::Lease::~Lease() { _saOwner.release(_pDb); }

// ── SqliteAccessor ─────────────────────────────────────────────────────────

SqliteAccessor::SqliteAccessor(const std::string& sPath, int iPoolSize) : _sPath(sPath) {
  auto spLog = common::Logger::get();
  spLog->info("Opening SQLite database: path={}, connections={}", _sPath, iPoolSize);

  for (int i = 0; i < iPoolSize; ++i) {
    sqlite3* pDb = nullptr;
    const int iRc = sqlite3_open_v2(_sPath.c_str(), &pDb,
                                    SQLITE_OPEN_READONLY | SQLITE_OPEN_URI | SQLITE_OPEN_NOMUTEX,
                                    nullptr);
    if (iRc != SQLITE_OK) {
      const std::string sMsg = pDb ? sqlite3_errmsg(pDb) : sqlite3_errstr(iRc);
      sqlite3_close(pDb);
      for (sqlite3* pOpen : _vAll) sqlite3_close(pOpen);
      throw common::QueryError("open_failed", "Cannot open SQLite database " + _sPath + ": " + sMsg);
    }
    sqlite3_busy_timeout(pDb, kBusyTimeoutMs);
    _vAll.push_back(pDb);
  }
  _vAvailable = _vAll;
}

SqliteAccessor::~SqliteAccessor() {
  std::lock_guard<std::mutex> lock(_mtx);
  for (sqlite3* pDb : _vAll) sqlite3_close(pDb);
  _vAll.clear();
  _vAvailable.clear();
}

std::string SqliteAccessor::name() const { return "sqlite"; }

sqlite3* SqliteAccessor::acquire() {
  std::unique_lock<std::mutex> lock(_mtx);
  _cv.wait(lock, [this] { return !_vAvailable.empty(); });
  sqlite3* pDb = _vAvailable.back();
  _vAvailable.pop_back();
  return pDb;
}

void SqliteAccessor::release(sqlite3* pDb) {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.push_back(pDb);
  _cv.notify_one();
}

void SqliteAccessor::raise(sqlite3* pDb, int iRc, const char* pOperation) const {
  const std::string sMsg = std::string(pOperation) + ": " + sqlite3_errmsg(pDb);
  switch (iRc & 0xFF) {
    case SQLITE_INTERRUPT:
      if (_bCancelling.load()) {
        throw common::CancelledError(std::string(pOperation) + " interrupted by cancellation");
      }
      throw common::TransientQueryError("interrupted", sMsg);
    case SQLITE_BUSY:
    case SQLITE_LOCKED: throw common::TransientQueryError("database_busy", sMsg);
    default: throw common::QueryError("sqlite_error", sMsg);
  }
}

ColumnInfo SqliteAccessor::classify(const std::string& sName, const std::string& sDeclType) {
  const std::string sType = toUpper(sDeclType);
  auto fnHas = [&sType](const char* pNeedle) { return sType.find(pNeedle) != std::string::npos; };

  ColumnInfo ci{sName, ColumnType::Unknown, 0};
  if (fnHas("UUID")) {
    ci.type = ColumnType::Uuid;
  } else if (fnHas("BOOL")) {
    ci.type = ColumnType::Boolean;
  } else if (fnHas("INT")) {
    ci.type = ColumnType::Integer;
  } else if (fnHas("CHAR") || fnHas("CLOB") || fnHas("TEXT")) {
    ci.type = ColumnType::Text;
  } else if (fnHas("REAL") || fnHas("FLOA") || fnHas("DOUB")) {
    ci.type = ColumnType::Float;
    ci.iScale = kDefaultScale;
  } else if (fnHas("DEC") || fnHas("NUMERIC")) {
    ci.type = ColumnType::Decimal;
    ci.iScale = kDefaultScale;
    // DECIMAL(p,s)
    const auto uComma = sType.find(',');
    const auto uClose = sType.find(')');
    if (uComma != std::string::npos && uClose != std::string::npos && uClose > uComma) {
      try {
        ci.iScale = std::stoi(sType.substr(uComma + 1, uClose - uComma - 1));
      } catch (const std::exception&) {
        ci.iScale = kDefaultScale;
      }
    }
  } else if (fnHas("DATE") || fnHas("TIME")) {
    ci.type = ColumnType::Timestamp;
  }
  return ci;
}

std::vector<ColumnInfo> SqliteAccessor::describe(const common::TableRef& trTable) {
  Lease lease(*this);

  const auto uDot = trTable.sTablePath.find('.');
  const std::string sPragma =
      uDot == std::string::npos
          ? "PRAGMA table_info(" + quoteIdentifier(trTable.sTablePath) + ")"
          : "PRAGMA " + quoteIdentifier(trTable.sTablePath.substr(0, uDot)) + ".table_info(" +
                quoteIdentifier(trTable.sTablePath.substr(uDot + 1)) + ")";

  sqlite3_stmt* pStmt = nullptr;
  int iRc = sqlite3_prepare_v2(lease.get(), sPragma.c_str(), -1, &pStmt, nullptr);
  StmtGuard sg(pStmt);
  if (iRc != SQLITE_OK) raise(lease.get(), iRc, "describe");

  std::unordered_map<std::string, ColumnInfo> mColumns;
  while ((iRc = sqlite3_step(sg.get())) == SQLITE_ROW) {
    const std::string sName = columnText(sg.get(), 1);
    mColumns.emplace(sName, classify(sName, columnText(sg.get(), 2)));
  }
  if (iRc != SQLITE_DONE) raise(lease.get(), iRc, "describe");

  if (mColumns.empty()) {
    throw common::SchemaMismatchError("missing_table", "Table not found: " + trTable.sTablePath);
  }

  std::vector<ColumnInfo> vInfos;
  auto fnLookup = [&](const std::string& sColumn) {
    auto it = mColumns.find(sColumn);
    if (it == mColumns.end()) {
      throw common::SchemaMismatchError(
          "missing_column", "Column '" + sColumn + "' not found in " + trTable.sTablePath);
    }
    vInfos.push_back(it->second);
  };
  fnLookup(trTable.sKeyColumn);
  for (const auto& sColumn : trTable.vColumns) {
    fnLookup(sColumn);
  }
  return vInfos;
}

std::optional<common::KeyBounds> SqliteAccessor::bounds(const common::TableRef& trTable) {
  Lease lease(*this);
  const std::string sKey = keyColumn(trTable);
  const std::string sSql = "SELECT min(" + sKey + "), max(" + sKey + ") FROM " +
                           quoteTablePath(trTable.sTablePath);

  sqlite3_stmt* pStmt = nullptr;
  int iRc = sqlite3_prepare_v2(lease.get(), sSql.c_str(), -1, &pStmt, nullptr);
  StmtGuard sg(pStmt);
  if (iRc != SQLITE_OK) raise(lease.get(), iRc, "bounds");

  iRc = sqlite3_step(sg.get());
  if (iRc != SQLITE_ROW) raise(lease.get(), iRc, "bounds");

  if (sqlite3_column_type(sg.get(), 0) == SQLITE_NULL) return std::nullopt;
  return common::KeyBounds{readKey(sg.get(), 0, trTable), readKey(sg.get(), 1, trTable)};
}

int64_t SqliteAccessor::count(const common::TableRef& trTable, const common::KeyRange& krRange) {
  Lease lease(*this);
  const std::string sSql = "SELECT count(*) FROM " + quoteTablePath(trTable.sTablePath) +
                           rangePredicate(trTable, krRange);

  sqlite3_stmt* pStmt = nullptr;
  int iRc = sqlite3_prepare_v2(lease.get(), sSql.c_str(), -1, &pStmt, nullptr);
  StmtGuard sg(pStmt);
  if (iRc != SQLITE_OK) raise(lease.get(), iRc, "count");
  bindRange(sg.get(), trTable, krRange);

  iRc = sqlite3_step(sg.get());
  if (iRc != SQLITE_ROW) raise(lease.get(), iRc, "count");
  return sqlite3_column_int64(sg.get(), 0);
}

void SqliteAccessor::scanRange(const common::TableRef& trTable, const common::KeyRange& krRange,
                               const std::function<void(common::Row&&)>& fnRow) {
  requireColumnInfos(trTable);
  Lease lease(*this);

  std::string sSql = "SELECT " + quoteIdentifier(trTable.sKeyColumn);
  for (const auto& sColumn : trTable.vColumns) {
    sSql += ", " + quoteIdentifier(sColumn);
  }
  sSql += " FROM " + quoteTablePath(trTable.sTablePath) + rangePredicate(trTable, krRange) +
          " ORDER BY " + keyColumn(trTable);

  sqlite3_stmt* pStmt = nullptr;
  int iRc = sqlite3_prepare_v2(lease.get(), sSql.c_str(), -1, &pStmt, nullptr);
  StmtGuard sg(pStmt);
  if (iRc != SQLITE_OK) raise(lease.get(), iRc, "scan");
  bindRange(sg.get(), trTable, krRange);

  while ((iRc = sqlite3_step(sg.get())) == SQLITE_ROW) {
    common::Row rw;
    rw.key = readKey(sg.get(), 0, trTable);
    rw.vValues.reserve(trTable.vColumns.size());
    for (size_t i = 0; i < trTable.vColumns.size(); ++i) {
      rw.vValues.push_back(
          normalizeValue(sg.get(), static_cast<int>(i) + 1, trTable.vColumnInfos[i]));
    }
    fnRow(std::move(rw));
  }
  if (iRc != SQLITE_DONE) raise(lease.get(), iRc, "scan");
}

common::Checksum SqliteAccessor::checksum(const common::TableRef& trTable,
                                          const common::KeyRange& krRange) {
  common::ChecksumAccumulator ca;
  scanRange(trTable, krRange, [&](common::Row&& rw) {
    ca.addRow(common::KeyCodec::toString(rw.key, trTable.keyType, trTable.iKeyScale),
              rw.vValues);
  });
  return ca.value();
}

std::vector<common::Row> SqliteAccessor::rows(const common::TableRef& trTable,
                                              const common::KeyRange& krRange) {
  std::vector<common::Row> vRows;
  scanRange(trTable, krRange, [&vRows](common::Row&& rw) { vRows.push_back(std::move(rw)); });
  return vRows;
}

void SqliteAccessor::cancel() {
  _bCancelling.store(true);
  common::Logger::get()->debug("Interrupting in-flight SQLite statements");
  std::lock_guard<std::mutex> lock(_mtx);
  for (sqlite3* pDb : _vAll) {
    // Idle connections are unaffected by sqlite3_interrupt
    if (std::find(_vAvailable.begin(), _vAvailable.end(), pDb) == _vAvailable.end()) {
      sqlite3_interrupt(pDb);
    }
  }
}

}  // namespace xdiff::dal
