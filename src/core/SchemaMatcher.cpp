#include "core/SchemaMatcher.hpp"

#include <algorithm>
#include <string>

#include "common/Errors.hpp"

namespace xdiff::core {

using common::ColumnInfo;
using common::ColumnType;
using common::KeyType;

namespace {

bool isNumeric(ColumnType type) {
  return type == ColumnType::Integer || type == ColumnType::Decimal || type == ColumnType::Float;
}

bool isEither(const ColumnInfo& ciA, const ColumnInfo& ciB, ColumnType typeX, ColumnType typeY) {
  return (ciA.type == typeX && ciB.type == typeY) || (ciA.type == typeY && ciB.type == typeX);
}

void checkShape(const common::TableRef& trTable, const std::vector<ColumnInfo>& vInfos,
                const char* pSide) {
  if (vInfos.size() != trTable.vColumns.size() + 1) {
    throw common::SchemaMismatchError(
        "column_count", std::string(pSide) + " table " + trTable.sTablePath + " described " +
                            std::to_string(vInfos.size()) + " columns, expected " +
                            std::to_string(trTable.vColumns.size() + 1));
  }
  if (!SchemaMatcher::keyColumnFits(trTable.keyType, vInfos.front().type)) {
    throw common::SchemaMismatchError(
        "key_type_mismatch", std::string(pSide) + " key column " + trTable.sTablePath + "." +
                                 trTable.sKeyColumn + " has type " +
                                 common::toString(vInfos.front().type) +
                                 ", which cannot hold " + common::toString(trTable.keyType) +
                                 " keys");
  }
}

}  // namespace

bool SchemaMatcher::keyColumnFits(KeyType keyType, ColumnType columnType) {
  switch (keyType) {
    case KeyType::Integer:
      return columnType == ColumnType::Integer;
    case KeyType::Decimal:
      return columnType == ColumnType::Decimal || columnType == ColumnType::Integer;
    case KeyType::Uuid:
      return columnType == ColumnType::Uuid || columnType == ColumnType::Text;
    case KeyType::Timestamp:
      return columnType == ColumnType::Timestamp || columnType == ColumnType::Text;
    case KeyType::String:
      return columnType == ColumnType::Text || columnType == ColumnType::Uuid ||
             columnType == ColumnType::Unknown;
  }
  return false;
}

ColumnInfo SchemaMatcher::agreeColumn(const ColumnInfo& ciLeft, const ColumnInfo& ciRight) {
  ColumnInfo ci{ciLeft.sName, ciLeft.type, 0};

  if (isNumeric(ciLeft.type) && isNumeric(ciRight.type)) {
    if (ciLeft.type == ColumnType::Integer && ciRight.type == ColumnType::Integer) {
      ci.type = ColumnType::Integer;
      return ci;
    }
    ci.type = ColumnType::Decimal;
    if (ciLeft.type == ColumnType::Integer) {
      ci.iScale = ciRight.iScale;
    } else if (ciRight.type == ColumnType::Integer) {
      ci.iScale = ciLeft.iScale;
    } else {
      ci.iScale = std::min(ciLeft.iScale, ciRight.iScale);
    }
    return ci;
  }

  if (ciLeft.type == ciRight.type) {
    ci.type = ciLeft.type == ColumnType::Unknown ? ColumnType::Text : ciLeft.type;
    return ci;
  }
  if (isEither(ciLeft, ciRight, ColumnType::Text, ColumnType::Uuid)) {
    ci.type = ColumnType::Uuid;
    return ci;
  }
  if (isEither(ciLeft, ciRight, ColumnType::Text, ColumnType::Timestamp)) {
    ci.type = ColumnType::Timestamp;
    return ci;
  }
  if (isEither(ciLeft, ciRight, ColumnType::Text, ColumnType::Unknown)) {
    ci.type = ColumnType::Text;
    return ci;
  }
  if (isEither(ciLeft, ciRight, ColumnType::Boolean, ColumnType::Integer)) {
    ci.type = ColumnType::Boolean;
    return ci;
  }

  throw common::SchemaMismatchError(
      "column_type_mismatch", "column " + ciLeft.sName + " (" + common::toString(ciLeft.type) +
                                  ") cannot be compared with column " + ciRight.sName + " (" +
                                  common::toString(ciRight.type) + ")");
}

std::pair<std::vector<ColumnInfo>, std::vector<ColumnInfo>> SchemaMatcher::agree(
    const common::TableRef& trLeft, const std::vector<ColumnInfo>& vLeft,
    const common::TableRef& trRight, const std::vector<ColumnInfo>& vRight) {
  if (trLeft.keyType != trRight.keyType) {
    throw common::SchemaMismatchError("key_type_mismatch",
                                      "both tables must use the same key type");
  }
  if (trLeft.vColumns.size() != trRight.vColumns.size()) {
    throw common::SchemaMismatchError("column_count",
                                      "both tables must compare the same number of columns");
  }
  checkShape(trLeft, vLeft, "left");
  checkShape(trRight, vRight, "right");

  std::pair<std::vector<ColumnInfo>, std::vector<ColumnInfo>> prAgreed;
  for (size_t i = 1; i < vLeft.size(); ++i) {
    ColumnInfo ci = agreeColumn(vLeft[i], vRight[i]);
    ColumnInfo ciRight = ci;
    ci.sName = vLeft[i].sName;
    ciRight.sName = vRight[i].sName;
    prAgreed.first.push_back(std::move(ci));
    prAgreed.second.push_back(std::move(ciRight));
  }
  return prAgreed;
}

}  // namespace xdiff::core
