#pragma once

#include <utility>
#include <vector>

#include "common/Types.hpp"

namespace xdiff::core {

/// Agrees on one normalization per compared column so that both sides render
/// equal data as identical text.
///
/// Inputs are what ITableAccessor::describe reported (key column first, then
/// the compared columns). Numeric columns agree as Integer when both sides
/// are integers, otherwise as Decimal with the smaller scale. Text pairs with
/// Uuid, Timestamp and Unknown; Boolean pairs with Integer. Anything else
/// throws SchemaMismatchError, as does a key column incompatible with the
/// configured key type.
/// Class abbreviation: N/A (static interface)
class SchemaMatcher {
 public:
  /// Agreed ColumnInfos for the compared columns of each side, each carrying
  /// that side's column name.
  static std::pair<std::vector<common::ColumnInfo>, std::vector<common::ColumnInfo>> agree(
      const common::TableRef& trLeft, const std::vector<common::ColumnInfo>& vLeft,
      const common::TableRef& trRight, const std::vector<common::ColumnInfo>& vRight);

  /// Agreed type of one column pair. Throws SchemaMismatchError.
  static common::ColumnInfo agreeColumn(const common::ColumnInfo& ciLeft,
                                        const common::ColumnInfo& ciRight);

  static bool keyColumnFits(common::KeyType keyType, common::ColumnType columnType);
};

}  // namespace xdiff::core
