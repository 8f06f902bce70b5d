#include "common/KeyCodec.hpp"

#include "common/Errors.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>

namespace xdiff::common {

namespace {

constexpr int64_t kMicrosPerSecond = 1'000'000;

[[noreturn]] void throwMalformed(const std::string& sWhat, const std::string& sText) {
  throw QueryError("malformed_key", "Malformed " + sWhat + " key value: '" + sText + "'");
}

int64_t parseInteger(const std::string& sText) {
  if (sText.empty()) throwMalformed("integer", sText);
  size_t uPos = 0;
  int64_t iValue = 0;
  try {
    iValue = std::stoll(sText, &uPos);
  } catch (const std::exception&) {
    throwMalformed("integer", sText);
  }
  if (uPos != sText.size()) throwMalformed("integer", sText);
  return iValue;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

Uuid parseUuid(const std::string& sText) {
  Uuid uu;
  int iDigits = 0;
  for (char c : sText) {
    if (c == '-') continue;
    const int iNibble = hexValue(c);
    if (iNibble < 0 || iDigits >= 32) throwMalformed("uuid", sText);
    if (iDigits < 16) {
      uu.uHigh = (uu.uHigh << 4) | static_cast<uint64_t>(iNibble);
    } else {
      uu.uLow = (uu.uLow << 4) | static_cast<uint64_t>(iNibble);
    }
    ++iDigits;
  }
  if (iDigits != 32) throwMalformed("uuid", sText);
  return uu;
}

std::string formatUuid(const Uuid& uu) {
  static const char* kHex = "0123456789abcdef";
  std::string sOut;
  sOut.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) sOut.push_back('-');
    const uint64_t uWord = i < 16 ? uu.uHigh : uu.uLow;
    const int iShift = (15 - (i % 16)) * 4;
    sOut.push_back(kHex[(uWord >> iShift) & 0xF]);
  }
  return sOut;
}

int64_t pow10(int iScale) {
  int64_t iResult = 1;
  for (int i = 0; i < iScale; ++i) iResult *= 10;
  return iResult;
}

/// Reads exactly iCount digits at uPos. Returns -1 on failure.
int readDigits(const std::string& sText, size_t& uPos, int iCount) {
  if (uPos + static_cast<size_t>(iCount) > sText.size()) return -1;
  int iValue = 0;
  for (int i = 0; i < iCount; ++i) {
    const char c = sText[uPos + static_cast<size_t>(i)];
    if (!std::isdigit(static_cast<unsigned char>(c))) return -1;
    iValue = iValue * 10 + (c - '0');
  }
  uPos += static_cast<size_t>(iCount);
  return iValue;
}

}  // namespace

int64_t KeyCodec::parseDecimal(const std::string& sText, int iScale) {
  if (sText.empty()) throwMalformed("decimal", sText);

  size_t uPos = 0;
  bool bNegative = false;
  if (sText[0] == '-' || sText[0] == '+') {
    bNegative = sText[0] == '-';
    uPos = 1;
  }

  const int64_t iLimit = std::numeric_limits<int64_t>::max();
  int64_t iUnscaled = 0;
  bool bAnyDigit = false;
  while (uPos < sText.size() && std::isdigit(static_cast<unsigned char>(sText[uPos]))) {
    const int iDigit = sText[uPos] - '0';
    if (iUnscaled > (iLimit - iDigit) / 10) throwMalformed("decimal", sText);
    iUnscaled = iUnscaled * 10 + iDigit;
    bAnyDigit = true;
    ++uPos;
  }

  int iFraction = 0;
  if (uPos < sText.size() && sText[uPos] == '.') {
    ++uPos;
    while (uPos < sText.size() && std::isdigit(static_cast<unsigned char>(sText[uPos]))) {
      const int iDigit = sText[uPos] - '0';
      if (iFraction < iScale) {
        if (iUnscaled > (iLimit - iDigit) / 10) throwMalformed("decimal", sText);
        iUnscaled = iUnscaled * 10 + iDigit;
        ++iFraction;
      } else if (iDigit != 0) {
        throwMalformed("decimal", sText);
      }
      bAnyDigit = true;
      ++uPos;
    }
  }
  if (!bAnyDigit || uPos != sText.size()) throwMalformed("decimal", sText);

  for (; iFraction < iScale; ++iFraction) {
    if (iUnscaled > iLimit / 10) throwMalformed("decimal", sText);
    iUnscaled *= 10;
  }
  return bNegative ? -iUnscaled : iUnscaled;
}

std::string KeyCodec::formatDecimal(int64_t iUnscaled, int iScale) {
  const bool bNegative = iUnscaled < 0;
  // Magnitude as unsigned so INT64_MIN does not overflow
  const uint64_t uMagnitude =
      bNegative ? static_cast<uint64_t>(-(iUnscaled + 1)) + 1 : static_cast<uint64_t>(iUnscaled);

  std::string sOut = bNegative ? "-" : "";
  if (iScale <= 0) {
    return sOut + std::to_string(uMagnitude);
  }

  const auto uDivisor = static_cast<uint64_t>(pow10(iScale));
  std::ostringstream oss;
  oss << (uMagnitude / uDivisor) << '.' << std::setw(iScale) << std::setfill('0')
      << (uMagnitude % uDivisor);
  return sOut + oss.str();
}

int64_t KeyCodec::parseTimestamp(const std::string& sText) {
  using namespace std::chrono;

  size_t uPos = 0;
  const int iYear = readDigits(sText, uPos, 4);
  if (iYear < 0 || uPos >= sText.size() || sText[uPos++] != '-') throwMalformed("timestamp", sText);
  const int iMonth = readDigits(sText, uPos, 2);
  if (iMonth < 0 || uPos >= sText.size() || sText[uPos++] != '-') throwMalformed("timestamp", sText);
  const int iDay = readDigits(sText, uPos, 2);
  if (iDay < 0) throwMalformed("timestamp", sText);

  const year_month_day ymd{year{iYear}, month{static_cast<unsigned>(iMonth)},
                           day{static_cast<unsigned>(iDay)}};
  if (!ymd.ok()) throwMalformed("timestamp", sText);

  int64_t iMicros = duration_cast<microseconds>(sys_days{ymd}.time_since_epoch()).count();
  if (uPos == sText.size()) return iMicros;

  if (sText[uPos] != ' ' && sText[uPos] != 'T') throwMalformed("timestamp", sText);
  ++uPos;
  const int iHour = readDigits(sText, uPos, 2);
  if (iHour < 0 || iHour > 23 || uPos >= sText.size() || sText[uPos++] != ':') {
    throwMalformed("timestamp", sText);
  }
  const int iMinute = readDigits(sText, uPos, 2);
  if (iMinute < 0 || iMinute > 59 || uPos >= sText.size() || sText[uPos++] != ':') {
    throwMalformed("timestamp", sText);
  }
  const int iSecond = readDigits(sText, uPos, 2);
  if (iSecond < 0 || iSecond > 60) throwMalformed("timestamp", sText);

  iMicros += (static_cast<int64_t>(iHour) * 3600 + iMinute * 60 + iSecond) * kMicrosPerSecond;

  if (uPos < sText.size() && sText[uPos] == '.') {
    ++uPos;
    int64_t iFraction = 0;
    int iDigits = 0;
    while (uPos < sText.size() && std::isdigit(static_cast<unsigned char>(sText[uPos]))) {
      // Digits past microseconds are truncated
      if (iDigits < 6) {
        iFraction = iFraction * 10 + (sText[uPos] - '0');
        ++iDigits;
      }
      ++uPos;
    }
    if (iDigits == 0) throwMalformed("timestamp", sText);
    for (; iDigits < 6; ++iDigits) iFraction *= 10;
    iMicros += iFraction;
  }

  if (uPos == sText.size()) return iMicros;

  if (sText[uPos] == 'Z' && uPos + 1 == sText.size()) return iMicros;

  if (sText[uPos] == '+' || sText[uPos] == '-') {
    const int iSign = sText[uPos] == '-' ? -1 : 1;
    ++uPos;
    const int iOffsetHours = readDigits(sText, uPos, 2);
    int iOffsetMinutes = 0;
    if (iOffsetHours < 0) throwMalformed("timestamp", sText);
    if (uPos < sText.size()) {
      if (sText[uPos] == ':') ++uPos;
      iOffsetMinutes = readDigits(sText, uPos, 2);
      if (iOffsetMinutes < 0) throwMalformed("timestamp", sText);
    }
    if (uPos != sText.size()) throwMalformed("timestamp", sText);
    // Local time = UTC + offset
    iMicros -= iSign * (static_cast<int64_t>(iOffsetHours) * 3600 + iOffsetMinutes * 60) *
               kMicrosPerSecond;
    return iMicros;
  }

  throwMalformed("timestamp", sText);
}

std::string KeyCodec::formatTimestamp(int64_t iMicros) {
  using namespace std::chrono;

  const sys_time<microseconds> tp{microseconds{iMicros}};
  const auto tpDays = floor<days>(tp);
  const year_month_day ymd{tpDays};
  const hh_mm_ss<microseconds> hms{tp - tpDays};

  char szBuf[48];
  std::snprintf(szBuf, sizeof(szBuf), "%04d-%02u-%02u %02d:%02d:%02d.%06lld",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()),
                static_cast<long long>(hms.subseconds().count()));
  return szBuf;
}

Key KeyCodec::parse(const std::string& sText, KeyType keyType, int iScale) {
  switch (keyType) {
    case KeyType::Integer: return Key{parseInteger(sText)};
    case KeyType::Decimal: return Key{parseDecimal(sText, iScale)};
    case KeyType::Uuid: return Key{parseUuid(sText)};
    case KeyType::Timestamp: return Key{parseTimestamp(sText)};
    case KeyType::String: return Key{sText};
  }
  throwMalformed("unknown", sText);
}

std::string KeyCodec::toString(const Key& key, KeyType keyType, int iScale) {
  if (const auto* pString = std::get_if<std::string>(&key)) {
    return *pString;
  }
  if (const auto* pUuid = std::get_if<Uuid>(&key)) {
    return formatUuid(*pUuid);
  }
  const int64_t iValue = std::get<int64_t>(key);
  switch (keyType) {
    case KeyType::Decimal: return formatDecimal(iValue, iScale);
    case KeyType::Timestamp: return formatTimestamp(iValue);
    default: return std::to_string(iValue);
  }
}

std::optional<Key> KeyCodec::exclusiveUpperBound(const Key& keyMax, KeyType /*keyType*/) {
  if (const auto* pString = std::get_if<std::string>(&keyMax)) {
    // No key sorts between s and s + "\x01" except ones embedding NUL bytes
    return Key{*pString + '\x01'};
  }
  if (const auto* pUuid = std::get_if<Uuid>(&keyMax)) {
    Uuid uuNext = *pUuid;
    if (++uuNext.uLow == 0) {
      if (++uuNext.uHigh == 0) return std::nullopt;
    }
    return Key{uuNext};
  }
  const int64_t iValue = std::get<int64_t>(keyMax);
  if (iValue == std::numeric_limits<int64_t>::max()) return std::nullopt;
  return Key{iValue + 1};
}

KeyRange KeyCodec::makeRange(Key keyStart, std::optional<Key> oKeyEnd) {
  if (oKeyEnd && !(keyStart < *oKeyEnd)) {
    throw InvalidRangeError("degenerate_range",
                            "Key range start must be strictly below its end");
  }
  return KeyRange{std::move(keyStart), std::move(oKeyEnd)};
}

std::string KeyCodec::describe(const KeyRange& krRange, KeyType keyType, int iScale) {
  std::string sOut = "[" + toString(krRange.keyStart, keyType, iScale) + ", ";
  sOut += krRange.oKeyEnd ? toString(*krRange.oKeyEnd, keyType, iScale) : std::string("+inf");
  sOut += ")";
  return sOut;
}

}  // namespace xdiff::common
