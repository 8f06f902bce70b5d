#include "common/Types.hpp"

#include "common/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace xdiff::common {

KeyType keyTypeFromString(const std::string& sName) {
  std::string sLower = sName;
  std::transform(sLower.begin(), sLower.end(), sLower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (sLower == "integer" || sLower == "int") return KeyType::Integer;
  if (sLower == "decimal" || sLower == "numeric") return KeyType::Decimal;
  if (sLower == "uuid") return KeyType::Uuid;
  if (sLower == "timestamp") return KeyType::Timestamp;
  if (sLower == "string" || sLower == "text") return KeyType::String;

  throw ConfigError("invalid_key_type",
                    "Unknown key type '" + sName +
                        "' (expected integer, decimal, uuid, timestamp or string)");
}

std::string toString(KeyType keyType) {
  switch (keyType) {
    case KeyType::Integer: return "integer";
    case KeyType::Decimal: return "decimal";
    case KeyType::Uuid: return "uuid";
    case KeyType::Timestamp: return "timestamp";
    case KeyType::String: return "string";
  }
  return "unknown";
}

std::string toString(ColumnType columnType) {
  switch (columnType) {
    case ColumnType::Integer: return "integer";
    case ColumnType::Decimal: return "decimal";
    case ColumnType::Float: return "float";
    case ColumnType::Text: return "text";
    case ColumnType::Timestamp: return "timestamp";
    case ColumnType::Uuid: return "uuid";
    case ColumnType::Boolean: return "boolean";
    case ColumnType::Unknown: return "unknown";
  }
  return "unknown";
}

std::string toString(DiffKind kind) {
  switch (kind) {
    case DiffKind::Added: return "added";
    case DiffKind::Removed: return "removed";
    case DiffKind::Changed: return "changed";
  }
  return "unknown";
}

}  // namespace xdiff::common
