#include "core/RangePartitioner.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

#include "common/Errors.hpp"

namespace xdiff::core {

using common::Key;
using common::KeyRange;
using common::KeyType;

namespace {

constexpr int kStringDigits = 8;
constexpr unsigned kStringRadix = 128;
constexpr uint64_t kSignBit = uint64_t{1} << 63;

bool isInt64Key(KeyType keyType) {
  return keyType == KeyType::Integer || keyType == KeyType::Decimal ||
         keyType == KeyType::Timestamp;
}

template <typename T>
const T& keyAs(const Key& key) {
  const T* pValue = std::get_if<T>(&key);
  if (pValue == nullptr) {
    throw common::InvalidRangeError("key_type_mismatch",
                                    "range key does not match the configured key type");
  }
  return *pValue;
}

/// True when byte uPos of sText starts a UTF-8 character (or is the end).
bool isCharBoundary(const std::string& sText, size_t uPos) {
  if (uPos >= sText.size()) return true;
  return (static_cast<unsigned char>(sText[uPos]) & 0xC0) != 0x80;
}

/// Base-128 numeral of the kStringDigits bytes after uOffset, bytes above
/// 0x7F clamped to 0x7F, missing bytes read as 0.
uint64_t stringOrdinal(const std::string& sText, size_t uOffset) {
  uint64_t uValue = 0;
  for (int i = 0; i < kStringDigits; ++i) {
    const size_t uPos = uOffset + i;
    unsigned uDigit = 0;
    if (uPos < sText.size()) {
      uDigit = std::min<unsigned>(static_cast<unsigned char>(sText[uPos]), kStringRadix - 1);
    }
    uValue = uValue * kStringRadix + uDigit;
  }
  return uValue;
}

std::string stringFromOrdinal(const std::string& sPrefix, uint64_t uValue) {
  std::string sDigits(kStringDigits, '\0');
  for (int i = kStringDigits - 1; i >= 0; --i) {
    sDigits[i] = static_cast<char>(uValue % kStringRadix);
    uValue /= kStringRadix;
  }
  while (!sDigits.empty() && sDigits.back() == '\0') sDigits.pop_back();
  std::replace(sDigits.begin(), sDigits.end(), '\0', '\x01');
  return sPrefix + sDigits;
}

}  // namespace

RangePartitioner::RangePartitioner(KeyType keyType, int iFactor)
    : _keyType(keyType), _iFactor(iFactor) {
  if (_iFactor < 2) {
    throw common::ConfigError("invalid_bisection_factor",
                              "bisection factor must be >= 2 (got " + std::to_string(iFactor) +
                                  ")");
  }
}

std::vector<RangePartitioner::Ordinal> RangePartitioner::interpolate(Ordinal oLo,
                                                                     Ordinal oHi) const {
  std::vector<Ordinal> vPoints;
  if (oHi <= oLo) return vPoints;

  const Ordinal oSpan = oHi - oLo;
  const Ordinal oParts = std::min<Ordinal>(static_cast<Ordinal>(_iFactor), oSpan);
  const Ordinal oStep = oSpan / oParts;
  const Ordinal oRemainder = oSpan % oParts;

  for (Ordinal i = 1; i < oParts; ++i) {
    vPoints.push_back(oLo + oStep * i + oRemainder * i / oParts);
  }
  return vPoints;
}

std::vector<Key> RangePartitioner::numericBoundaries(const KeyRange& krRange) const {
  std::vector<Key> vKeys;
  if (isInt64Key(_keyType)) {
    auto toOrdinal = [](int64_t iValue) {
      return static_cast<Ordinal>(static_cast<uint64_t>(iValue) ^ kSignBit);
    };
    const Ordinal oLo = toOrdinal(keyAs<int64_t>(krRange.keyStart));
    const Ordinal oHi = krRange.oKeyEnd ? toOrdinal(keyAs<int64_t>(*krRange.oKeyEnd))
                                        : Ordinal{1} << 64;
    for (Ordinal oPoint : interpolate(oLo, oHi)) {
      vKeys.emplace_back(static_cast<int64_t>(static_cast<uint64_t>(oPoint) ^ kSignBit));
    }
    return vKeys;
  }

  auto toOrdinal = [](const common::Uuid& uuValue) {
    return (static_cast<Ordinal>(uuValue.uHigh) << 64) | uuValue.uLow;
  };
  const Ordinal oLo = toOrdinal(keyAs<common::Uuid>(krRange.keyStart));
  // The maximum UUID itself falls into the last, unbounded sub-range.
  const Ordinal oHi = krRange.oKeyEnd ? toOrdinal(keyAs<common::Uuid>(*krRange.oKeyEnd))
                                      : ~Ordinal{0};
  for (Ordinal oPoint : interpolate(oLo, oHi)) {
    vKeys.emplace_back(
        common::Uuid{static_cast<uint64_t>(oPoint >> 64), static_cast<uint64_t>(oPoint)});
  }
  return vKeys;
}

std::vector<Key> RangePartitioner::stringBoundaries(const KeyRange& krRange) const {
  const std::string& sStart = keyAs<std::string>(krRange.keyStart);

  std::string sPrefix;
  uint64_t uLo = 0;
  uint64_t uHi = 0;
  if (krRange.oKeyEnd) {
    const std::string& sEnd = keyAs<std::string>(*krRange.oKeyEnd);
    size_t uCommon = 0;
    while (uCommon < sStart.size() && uCommon < sEnd.size() && sStart[uCommon] == sEnd[uCommon]) {
      ++uCommon;
    }
    while (uCommon > 0 && !isCharBoundary(sStart, uCommon)) --uCommon;
    sPrefix = sStart.substr(0, uCommon);
    uLo = stringOrdinal(sStart, uCommon);
    uHi = stringOrdinal(sEnd, uCommon);
  } else {
    uLo = stringOrdinal(sStart, 0);
    uHi = stringOrdinal(std::string(kStringDigits, '\x7f'), 0) + 1;
  }

  std::vector<std::string> vCandidates;
  for (Ordinal oPoint : interpolate(uLo, uHi)) {
    vCandidates.push_back(stringFromOrdinal(sPrefix, static_cast<uint64_t>(oPoint)));
  }

  std::sort(vCandidates.begin(), vCandidates.end());
  vCandidates.erase(std::unique(vCandidates.begin(), vCandidates.end()), vCandidates.end());

  std::vector<Key> vKeys;
  for (auto& sCandidate : vCandidates) {
    if (sCandidate <= sStart) continue;
    if (krRange.oKeyEnd && sCandidate >= std::get<std::string>(*krRange.oKeyEnd)) continue;
    vKeys.emplace_back(std::move(sCandidate));
  }
  return vKeys;
}

std::vector<KeyRange> RangePartitioner::split(const KeyRange& krRange) const {
  const std::vector<Key> vBoundaries = _keyType == KeyType::String
                                           ? stringBoundaries(krRange)
                                           : numericBoundaries(krRange);

  std::vector<KeyRange> vRanges;
  vRanges.reserve(vBoundaries.size() + 1);
  Key keyStart = krRange.keyStart;
  for (const auto& keyBoundary : vBoundaries) {
    vRanges.push_back(KeyRange{keyStart, keyBoundary});
    keyStart = keyBoundary;
  }
  vRanges.push_back(KeyRange{keyStart, krRange.oKeyEnd});
  return vRanges;
}

}  // namespace xdiff::core
