#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "dal/ConnectionPool.hpp"
#include "dal/ITableAccessor.hpp"

namespace xdiff::dal {

/// PostgreSQL backend. Counts, checksums and normalization run server-side;
/// only rows of small mismatching ranges travel over the wire.
/// Class abbreviation: pa
class PostgresAccessor : public ITableAccessor {
 public:
  PostgresAccessor(const std::string& sDbUrl, int iPoolSize);
  ~PostgresAccessor() override;

  std::string name() const override;
  std::vector<common::ColumnInfo> describe(const common::TableRef& trTable) override;
  std::optional<common::KeyBounds> bounds(const common::TableRef& trTable) override;
  int64_t count(const common::TableRef& trTable, const common::KeyRange& krRange) override;
  common::Checksum checksum(const common::TableRef& trTable,
                            const common::KeyRange& krRange) override;
  std::vector<common::Row> rows(const common::TableRef& trTable,
                                const common::KeyRange& krRange) override;
  void cancel() override;

  /// SQL rendering the key column in canonical KeyCodec form.
  static std::string keyExpression(const std::string& sQuotedKey, const common::TableRef& trTable);

  /// SQL rendering one compared column with the agreed normalization.
  static std::string valueExpression(const std::string& sQuotedColumn,
                                     const common::ColumnInfo& ciColumn);

  /// Map an information_schema data_type to a column category.
  static common::ColumnInfo classify(const std::string& sName, const std::string& sDataType,
                                     int iNumericScale);

 private:
  /// Quote a possibly schema-qualified table path.
  std::string quoteTablePath(pqxx::connection& conn, const std::string& sPath) const;

  /// " WHERE key >= $1 [AND key < $2]" with parameters appended to pParams.
  std::string rangePredicate(const std::string& sQuotedKey, const common::TableRef& trTable,
                             const common::KeyRange& krRange, pqxx::params& pParams) const;

  /// Run fnQuery and map pqxx failures onto the common error taxonomy.
  template <typename F>
  auto guarded(const char* pOperation, F&& fnQuery) -> decltype(fnQuery());

  ConnectionPool _cpPool;
  std::atomic<bool> _bCancelling{false};
};

}  // namespace xdiff::dal
