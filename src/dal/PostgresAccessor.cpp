#include "dal/PostgresAccessor.hpp"

#include "common/Errors.hpp"
#include "common/KeyCodec.hpp"
#include "common/Logger.hpp"
#include "common/RowHash.hpp"

#include <unordered_map>

namespace xdiff::dal {

using common::ColumnInfo;
using common::ColumnType;
using common::KeyType;

namespace {

constexpr int kMd5HexDigits = 32;
constexpr int kDefaultFloatScale = 6;
constexpr const char* kTimestampFormat = "'YYYY-MM-DD HH24:MI:SS.US'";

/// Splits "schema.table" into its parts. A single part has an empty schema.
std::pair<std::string, std::string> splitTablePath(const std::string& sPath) {
  const auto uDot = sPath.find('.');
  if (uDot == std::string::npos) return {std::string{}, sPath};
  return {sPath.substr(0, uDot), sPath.substr(uDot + 1)};
}

}  // namespace

PostgresAccessor::PostgresAccessor(const std::string& sDbUrl, int iPoolSize)
    : _cpPool(sDbUrl, iPoolSize, "SET TIME ZONE 'UTC'") {}

PostgresAccessor::~PostgresAccessor() = default;

std::string PostgresAccessor::name() const { return "postgresql"; }

template <typename F>
auto PostgresAccessor::guarded(const char* pOperation, F&& fnQuery) -> decltype(fnQuery()) {
  try {
    return fnQuery();
  } catch (const pqxx::query_cancelled& ex) {
    if (_bCancelling.load()) {
      throw common::CancelledError(std::string(pOperation) + " interrupted by cancellation");
    }
    throw common::TransientQueryError("query_cancelled",
                                      std::string(pOperation) + ": " + ex.what());
  } catch (const pqxx::transaction_rollback& ex) {
    throw common::TransientQueryError("transaction_rollback",
                                      std::string(pOperation) + ": " + ex.what());
  } catch (const pqxx::broken_connection& ex) {
    throw common::TransientQueryError("broken_connection",
                                      std::string(pOperation) + ": " + ex.what());
  } catch (const pqxx::sql_error& ex) {
    throw common::QueryError("sql_error", std::string(pOperation) + ": " + ex.what() +
                                              " [query: " + ex.query() + "]");
  } catch (const pqxx::failure& ex) {
    throw common::QueryError("pqxx_failure", std::string(pOperation) + ": " + ex.what());
  }
}

ColumnInfo PostgresAccessor::classify(const std::string& sName, const std::string& sDataType,
                                      int iNumericScale) {
  ColumnInfo ci{sName, ColumnType::Unknown, 0};
  if (sDataType == "smallint" || sDataType == "integer" || sDataType == "bigint") {
    ci.type = ColumnType::Integer;
  } else if (sDataType == "numeric" || sDataType == "decimal") {
    ci.type = ColumnType::Decimal;
    ci.iScale = iNumericScale >= 0 ? iNumericScale : kDefaultFloatScale;
  } else if (sDataType == "real" || sDataType == "double precision") {
    ci.type = ColumnType::Float;
    ci.iScale = kDefaultFloatScale;
  } else if (sDataType == "text" || sDataType == "character varying" ||
             sDataType == "character" || sDataType == "citext" || sDataType == "name") {
    ci.type = ColumnType::Text;
  } else if (sDataType.rfind("timestamp", 0) == 0 || sDataType == "date") {
    ci.type = ColumnType::Timestamp;
  } else if (sDataType == "uuid") {
    ci.type = ColumnType::Uuid;
  } else if (sDataType == "boolean") {
    ci.type = ColumnType::Boolean;
  }
  return ci;
}

std::string PostgresAccessor::keyExpression(const std::string& sQuotedKey,
                                            const common::TableRef& trTable) {
  switch (trTable.keyType) {
    case KeyType::Integer: return sQuotedKey + "::text";
    case KeyType::Decimal:
      return "round(" + sQuotedKey + "::numeric, " + std::to_string(trTable.iKeyScale) +
             ")::text";
    case KeyType::Timestamp:
      return "to_char(" + sQuotedKey + "::timestamp, " + kTimestampFormat + ")";
    case KeyType::Uuid: return "lower(" + sQuotedKey + "::text)";
    case KeyType::String: return sQuotedKey + "::text";
  }
  return sQuotedKey + "::text";
}

std::string PostgresAccessor::valueExpression(const std::string& sQuotedColumn,
                                              const ColumnInfo& ciColumn) {
  switch (ciColumn.type) {
    case ColumnType::Decimal:
    case ColumnType::Float:
      return "round(" + sQuotedColumn + "::numeric, " + std::to_string(ciColumn.iScale) +
             ")::text";
    case ColumnType::Timestamp:
      return "to_char(" + sQuotedColumn + "::timestamp, " + kTimestampFormat + ")";
    case ColumnType::Uuid: return "lower(" + sQuotedColumn + "::text)";
    case ColumnType::Boolean:
      // Any non-zero integer and any true spelling renders as 1.
      return "CASE WHEN " + sQuotedColumn + " IS NULL THEN NULL WHEN lower(" + sQuotedColumn +
             "::text) IN ('true', 't', '1') OR " + sQuotedColumn +
             "::text ~ '^-?0*[1-9][0-9]*$' THEN '1' ELSE '0' END";
    case ColumnType::Integer:
    case ColumnType::Text:
    case ColumnType::Unknown: return sQuotedColumn + "::text";
  }
  return sQuotedColumn + "::text";
}

std::string PostgresAccessor::quoteTablePath(pqxx::connection& conn,
                                             const std::string& sPath) const {
  const auto [sSchema, sTable] = splitTablePath(sPath);
  if (sSchema.empty()) return conn.quote_name(sTable);
  return conn.quote_name(sSchema) + "." + conn.quote_name(sTable);
}

std::string PostgresAccessor::rangePredicate(const std::string& sQuotedKey,
                                             const common::TableRef& trTable,
                                             const common::KeyRange& krRange,
                                             pqxx::params& pParams) const {
  // String keys compare bytewise so both engines agree on ordering
  const bool bBytewise = trTable.keyType == KeyType::String;
  const std::string sLhs = bBytewise ? sQuotedKey + " COLLATE \"C\"" : sQuotedKey;

  pParams.append(
      common::KeyCodec::toString(krRange.keyStart, trTable.keyType, trTable.iKeyScale));
  // Parameters are sent untyped; the server infers the key column's type
  std::string sSql = " WHERE " + sLhs + " >= $1";
  if (krRange.oKeyEnd) {
    pParams.append(
        common::KeyCodec::toString(*krRange.oKeyEnd, trTable.keyType, trTable.iKeyScale));
    sSql += " AND " + sLhs + " < $2";
  }
  return sSql;
}

std::vector<ColumnInfo> PostgresAccessor::describe(const common::TableRef& trTable) {
  return guarded("describe", [&]() {
    const auto [sSchema, sTable] = splitTablePath(trTable.sTablePath);

    auto cg = _cpPool.checkout();
    pqxx::read_transaction txn(*cg);
    pqxx::result result;
    if (sSchema.empty()) {
      result = txn.exec(
          "SELECT column_name, data_type, COALESCE(numeric_scale, -1) "
          "FROM information_schema.columns "
          "WHERE table_schema = current_schema() AND table_name = $1",
          pqxx::params{sTable});
    } else {
      result = txn.exec(
          "SELECT column_name, data_type, COALESCE(numeric_scale, -1) "
          "FROM information_schema.columns "
          "WHERE table_schema = $1 AND table_name = $2",
          pqxx::params{sSchema, sTable});
    }
    txn.commit();

    if (result.empty()) {
      throw common::SchemaMismatchError("missing_table",
                                        "Table not found: " + trTable.sTablePath);
    }

    std::unordered_map<std::string, ColumnInfo> mColumns;
    for (const auto& row : result) {
      auto sName = row[0].as<std::string>();
      mColumns.emplace(sName, classify(sName, row[1].as<std::string>(), row[2].as<int>()));
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
  });
}

std::optional<common::KeyBounds> PostgresAccessor::bounds(const common::TableRef& trTable) {
  return guarded("bounds", [&]() -> std::optional<common::KeyBounds> {
    auto cg = _cpPool.checkout();
    const std::string sKey = cg->quote_name(trTable.sKeyColumn);
    const std::string sOrderKey =
        trTable.keyType == KeyType::String ? sKey + " COLLATE \"C\"" : sKey;

    pqxx::read_transaction txn(*cg);
    auto row = txn.exec("SELECT " + keyExpression("min(" + sOrderKey + ")", trTable) + ", " +
                        keyExpression("max(" + sOrderKey + ")", trTable) + " FROM " +
                        quoteTablePath(*cg, trTable.sTablePath))
                   .one_row();
    txn.commit();

    if (row[0].is_null() || row[1].is_null()) return std::nullopt;
    return common::KeyBounds{
        common::KeyCodec::parse(row[0].as<std::string>(), trTable.keyType, trTable.iKeyScale),
        common::KeyCodec::parse(row[1].as<std::string>(), trTable.keyType, trTable.iKeyScale),
    };
  });
}

int64_t PostgresAccessor::count(const common::TableRef& trTable,
                                const common::KeyRange& krRange) {
  return guarded("count", [&]() {
    auto cg = _cpPool.checkout();
    pqxx::params pParams;
    const std::string sSql = "SELECT count(*) FROM " + quoteTablePath(*cg, trTable.sTablePath) +
                             rangePredicate(cg->quote_name(trTable.sKeyColumn), trTable,
                                            krRange, pParams);

    pqxx::read_transaction txn(*cg);
    auto row = txn.exec(sSql, pParams).one_row();
    txn.commit();
    return row[0].as<int64_t>();
  });
}

common::Checksum PostgresAccessor::checksum(const common::TableRef& trTable,
                                            const common::KeyRange& krRange) {
  requireColumnInfos(trTable);
  return guarded("checksum", [&]() {
    auto cg = _cpPool.checkout();
    const std::string sKey = cg->quote_name(trTable.sKeyColumn);

    std::string sConcat = "concat_ws('" + std::string(common::kFieldSeparator) + "', " +
                          keyExpression(sKey, trTable);
    for (size_t i = 0; i < trTable.vColumns.size(); ++i) {
      sConcat += ", coalesce(" +
                 valueExpression(cg->quote_name(trTable.vColumns[i]), trTable.vColumnInfos[i]) +
                 ", '" + common::kNullMarker + "')";
    }
    sConcat += ")";

    const std::string sRowHash =
        "('x' || substring(md5(" + sConcat + "), " +
        std::to_string(1 + kMd5HexDigits - common::kChecksumHexDigits) + "))::bit(" +
        std::to_string(common::kChecksumHexDigits * 4) + ")::bigint - " +
        std::to_string(common::kChecksumOffset);

    pqxx::params pParams;
    const std::string sSql = "SELECT coalesce(sum(" + sRowHash + "), 0)::text FROM " +
                             quoteTablePath(*cg, trTable.sTablePath) +
                             rangePredicate(sKey, trTable, krRange, pParams);

    pqxx::read_transaction txn(*cg);
    auto row = txn.exec(sSql, pParams).one_row();
    txn.commit();
    return row[0].as<std::string>();
  });
}

std::vector<common::Row> PostgresAccessor::rows(const common::TableRef& trTable,
                                                const common::KeyRange& krRange) {
  requireColumnInfos(trTable);
  return guarded("rows", [&]() {
    auto cg = _cpPool.checkout();
    const std::string sKey = cg->quote_name(trTable.sKeyColumn);

    std::string sSelect = "SELECT " + keyExpression(sKey, trTable);
    for (size_t i = 0; i < trTable.vColumns.size(); ++i) {
      sSelect +=
          ", " + valueExpression(cg->quote_name(trTable.vColumns[i]), trTable.vColumnInfos[i]);
    }

    pqxx::params pParams;
    const std::string sOrderKey =
        trTable.keyType == KeyType::String ? sKey + " COLLATE \"C\"" : sKey;
    const std::string sSql = sSelect + " FROM " + quoteTablePath(*cg, trTable.sTablePath) +
                             rangePredicate(sKey, trTable, krRange, pParams) + " ORDER BY " +
                             sOrderKey;

    pqxx::read_transaction txn(*cg);
    auto result = txn.exec(sSql, pParams);
    txn.commit();

    std::vector<common::Row> vRows;
    vRows.reserve(result.size());
    for (const auto& row : result) {
      common::Row rw;
      rw.key = common::KeyCodec::parse(row[0].as<std::string>(), trTable.keyType,
                                       trTable.iKeyScale);
      rw.vValues.reserve(trTable.vColumns.size());
      for (int i = 1; i < static_cast<int>(row.size()); ++i) {
        if (row[i].is_null()) {
          rw.vValues.emplace_back(std::nullopt);
        } else {
          rw.vValues.emplace_back(row[i].as<std::string>());
        }
      }
      vRows.push_back(std::move(rw));
    }
    return vRows;
  });
}

void PostgresAccessor::cancel() {
  _bCancelling.store(true);
  common::Logger::get()->debug("Cancelling in-flight PostgreSQL queries");
  _cpPool.cancelAll();
}

}  // namespace xdiff::dal
