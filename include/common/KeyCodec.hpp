#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "common/Types.hpp"

namespace xdiff::common {

/// Conversions between key values and their canonical text form, plus the
/// range helpers every component shares.
///
/// Canonical text forms (identical to what accessors render in SQL):
///   integer    "-42"
///   decimal    "12.50"  (always iScale fractional digits)
///   uuid       "0f8fad5b-d9cb-469f-a165-70867728950e"
///   timestamp  "2024-03-01 12:00:00.000000" (UTC, microseconds)
///   string     verbatim
/// Class abbreviation: N/A (static interface)
class KeyCodec {
 public:
  /// Parse a key from text. Throws QueryError on malformed input.
  static Key parse(const std::string& sText, KeyType keyType, int iScale = 0);

  /// Render a key in canonical form.
  static std::string toString(const Key& key, KeyType keyType, int iScale = 0);

  /// Smallest convenient key strictly greater than keyMax, used as the
  /// exclusive end of a range covering keyMax. For numeric keys this is the
  /// exact successor; nullopt when keyMax is the largest representable value.
  static std::optional<Key> exclusiveUpperBound(const Key& keyMax, KeyType keyType);

  /// Build a range, rejecting degenerate ones with InvalidRangeError.
  static KeyRange makeRange(Key keyStart, std::optional<Key> oKeyEnd);

  /// Human-readable "[start, end)" form used in logs and errors.
  static std::string describe(const KeyRange& krRange, KeyType keyType, int iScale = 0);

  /// Microseconds since the Unix epoch from a timestamp literal.
  /// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS[.f]" with ' ' or 'T' and an
  /// optional "Z" or "+HH[:MM]" / "-HH[:MM]" offset.
  static int64_t parseTimestamp(const std::string& sText);

  static std::string formatTimestamp(int64_t iMicros);

  /// Render an unscaled decimal with iScale fractional digits.
  static std::string formatDecimal(int64_t iUnscaled, int iScale);

  /// Unscaled value of a decimal literal. Extra fractional digits must be zero.
  static int64_t parseDecimal(const std::string& sText, int iScale);
};

}  // namespace xdiff::common
