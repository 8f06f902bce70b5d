#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "common/Types.hpp"

namespace xdiff::dal {

/// Pure abstract interface for all database backends.
///
/// Range-scoped operations honor the half-open KeyRange and reflect a
/// consistent snapshot per call. Implementations are shared read-only by all
/// concurrent work items and must be thread-safe.
///
/// Values are rendered with the agreed normalization in
/// TableRef::vColumnInfos, so both sides produce identical text for equal
/// data. Transient failures throw common::TransientQueryError; everything
/// else throws common::QueryError.
class ITableAccessor {
 public:
  virtual ~ITableAccessor() = default;

  /// Backend identity for logs, e.g. "postgresql" or "sqlite".
  virtual std::string name() const = 0;

  /// Column types of the key column and every compared column, in the order
  /// key first, then TableRef::vColumns. Throws SchemaMismatchError for a
  /// missing table or column.
  virtual std::vector<common::ColumnInfo> describe(const common::TableRef& trTable) = 0;

  /// Min and max key, or nullopt for an empty table.
  virtual std::optional<common::KeyBounds> bounds(const common::TableRef& trTable) = 0;

  virtual int64_t count(const common::TableRef& trTable, const common::KeyRange& krRange) = 0;

  virtual common::Checksum checksum(const common::TableRef& trTable,
                                    const common::KeyRange& krRange) = 0;

  /// Rows strictly increasing by key.
  virtual std::vector<common::Row> rows(const common::TableRef& trTable,
                                        const common::KeyRange& krRange) = 0;

  /// Best-effort interruption of queries currently in flight.
  virtual void cancel() = 0;
};

/// Value-rendering operations need the agreed normalization for every
/// compared column.
inline void requireColumnInfos(const common::TableRef& trTable) {
  if (trTable.vColumnInfos.size() != trTable.vColumns.size()) {
    throw common::QueryError("missing_column_infos",
                             "no agreed normalization for the compared columns of " +
                                 trTable.sTablePath);
  }
}

}  // namespace xdiff::dal
