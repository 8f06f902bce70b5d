#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace xdiff::common {

/// Semantic type of a table's ordering key.
enum class KeyType { Integer, Decimal, Uuid, Timestamp, String };

/// 128-bit UUID key, ordered as an unsigned big-endian number.
/// Class abbreviation: uu
struct Uuid {
  uint64_t uHigh = 0;
  uint64_t uLow = 0;

  bool operator==(const Uuid& other) const {
    return uHigh == other.uHigh && uLow == other.uLow;
  }
  bool operator!=(const Uuid& other) const { return !(*this == other); }
  bool operator<(const Uuid& other) const {
    return uHigh != other.uHigh ? uHigh < other.uHigh : uLow < other.uLow;
  }
};

/// A key value. Integer keys, decimal keys (unscaled by the key scale) and
/// timestamp keys (microseconds since the Unix epoch) use int64_t.
using Key = std::variant<int64_t, Uuid, std::string>;

/// Half-open key interval [keyStart, oKeyEnd). An empty oKeyEnd marks an
/// unbounded end, used when no successor of the table maximum exists.
/// Class abbreviation: kr
struct KeyRange {
  Key keyStart;
  std::optional<Key> oKeyEnd;

  bool contains(const Key& key) const {
    if (key < keyStart) return false;
    return !oKeyEnd || key < *oKeyEnd;
  }
  bool isUnbounded() const { return !oKeyEnd.has_value(); }
};

/// Inclusive bounds of the keys present in a table.
/// Class abbreviation: kb
struct KeyBounds {
  Key keyMin;
  Key keyMax;
};

/// Normalized column type category, used to agree on a text rendering of
/// each compared column on both sides.
enum class ColumnType { Integer, Decimal, Float, Text, Timestamp, Uuid, Boolean, Unknown };

/// Column description reported by an accessor.
/// Class abbreviation: ci
struct ColumnInfo {
  std::string sName;
  ColumnType type = ColumnType::Unknown;
  int iScale = 0;  // Decimal/Float: digits kept after the decimal point
};

/// One side's table as seen by a diff run. Immutable once the run starts.
/// Class abbreviation: tr
struct TableRef {
  std::string sTablePath;
  std::string sKeyColumn = "id";
  KeyType keyType = KeyType::Integer;
  int iKeyScale = 0;
  std::vector<std::string> vColumns;
  // Agreed normalization for vColumns, same order. Filled during run init.
  std::vector<ColumnInfo> vColumnInfos;
};

/// Normalized column values of one row. std::nullopt stands for SQL NULL.
using RowValues = std::vector<std::optional<std::string>>;

/// One fetched row, keyed.
/// Class abbreviation: rw
struct Row {
  Key key;
  RowValues vValues;
};

/// Range checksum: the exact sum of 60-bit row hashes, as decimal text.
using Checksum = std::string;

/// Which table a record refers to.
enum class DiffSide { Left, Right };

enum class DiffKind { Added, Removed, Changed };

/// A single row-level difference.
/// Removed rows carry vLeftValues, Added rows vRightValues, Changed both.
/// Class abbreviation: dr
struct DiffRecord {
  DiffKind kind = DiffKind::Changed;
  DiffSide side = DiffSide::Left;
  Key key;
  RowValues vLeftValues;
  RowValues vRightValues;

  static DiffRecord added(Key key, RowValues vValues) {
    return DiffRecord{DiffKind::Added, DiffSide::Right, std::move(key), {}, std::move(vValues)};
  }
  static DiffRecord removed(Key key, RowValues vValues) {
    return DiffRecord{DiffKind::Removed, DiffSide::Left, std::move(key), std::move(vValues), {}};
  }
  static DiffRecord changed(Key key, RowValues vLeft, RowValues vRight) {
    return DiffRecord{DiffKind::Changed, DiffSide::Left, std::move(key), std::move(vLeft),
                      std::move(vRight)};
  }
};

/// Counters collected during one diff run.
/// Class abbreviation: ds
struct DiffStats {
  int64_t iLeftRows = 0;
  int64_t iRightRows = 0;
  int64_t iAdded = 0;
  int64_t iRemoved = 0;
  int64_t iChanged = 0;
  int64_t iSegmentsCompared = 0;
  int64_t iSegmentsMatched = 0;
  int64_t iExactDiffs = 0;
  int64_t iLeftRowsDownloaded = 0;
  int64_t iRightRowsDownloaded = 0;
  int64_t iLeftQueries = 0;
  int64_t iRightQueries = 0;
  int iMaxDepthReached = 0;
  std::vector<std::string> vFailedRanges;
};

KeyType keyTypeFromString(const std::string& sName);
std::string toString(KeyType keyType);
std::string toString(ColumnType columnType);
std::string toString(DiffKind kind);

}  // namespace xdiff::common
