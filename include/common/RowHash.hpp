#pragma once

#include <cstdint>
#include <string>

#include "common/Types.hpp"

namespace xdiff::common {

/// Hex digits of the MD5 digest kept per row. 15 digits = 60 bits, so a
/// signed 64-bit SUM cannot overflow on the database side for small ranges
/// and arbitrary-precision SUM stays exact for large ones.
constexpr int kChecksumHexDigits = 15;

/// Subtracted from each row hash to center the values around zero.
constexpr int64_t kChecksumOffset = (int64_t{1} << 59) - 1;

/// Text that separates normalized fields in the hashed row string.
constexpr const char* kFieldSeparator = "|";

/// Stands in for SQL NULL in the hashed row string.
constexpr const char* kNullMarker = "\\N";

/// Per-row hash and range checksum shared by all client-side checksum code.
/// The server-side SQL in PostgresAccessor computes the same value:
///   md5(concat_ws('|', key, coalesce(c1, '\N'), ...)), last 15 hex digits,
///   as an unsigned integer, minus kChecksumOffset, summed exactly.
/// Class abbreviation: N/A (static interface)
class RowHash {
 public:
  /// Build the hashed row string from the key text and column values.
  static std::string rowString(const std::string& sKeyText, const RowValues& vValues);

  /// Hash one row string.
  static int64_t hash(const std::string& sRow);
};

/// Exact running sum of row hashes.
/// Class abbreviation: ca
class ChecksumAccumulator {
 public:
  void add(int64_t iRowHash);
  void addRow(const std::string& sKeyText, const RowValues& vValues);

  int64_t rows() const { return _iRows; }

  /// Decimal text of the sum; "0" for an empty range.
  Checksum value() const;

 private:
  using Int128 = __int128;

  Int128 _i128Sum = 0;
  int64_t _iRows = 0;
};

}  // namespace xdiff::common
