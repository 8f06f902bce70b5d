#include "common/RowHash.hpp"

#include "common/Errors.hpp"

#include <openssl/evp.h>
#include <openssl/md5.h>

#include <algorithm>

namespace xdiff::common {

std::string RowHash::rowString(const std::string& sKeyText, const RowValues& vValues) {
  std::string sRow = sKeyText;
  for (const auto& oValue : vValues) {
    sRow += kFieldSeparator;
    sRow += oValue ? *oValue : std::string(kNullMarker);
  }
  return sRow;
}

int64_t RowHash::hash(const std::string& sRow) {
  unsigned char vDigest[EVP_MAX_MD_SIZE];
  unsigned int uDigestLen = 0;
  if (EVP_Digest(sRow.data(), sRow.size(), vDigest, &uDigestLen, EVP_md5(), nullptr) != 1 ||
      uDigestLen != MD5_DIGEST_LENGTH) {
    throw QueryError("hash_failed", "EVP_Digest(md5) failed");
  }

  // Last 15 hex digits = low 60 bits of the trailing 8 digest bytes
  uint64_t uTail = 0;
  for (unsigned int i = uDigestLen - 8; i < uDigestLen; ++i) {
    uTail = (uTail << 8) | vDigest[i];
  }
  constexpr uint64_t kMask = (uint64_t{1} << (kChecksumHexDigits * 4)) - 1;
  return static_cast<int64_t>(uTail & kMask) - kChecksumOffset;
}

void ChecksumAccumulator::add(int64_t iRowHash) {
  _i128Sum += iRowHash;
  ++_iRows;
}

void ChecksumAccumulator::addRow(const std::string& sKeyText, const RowValues& vValues) {
  add(RowHash::hash(RowHash::rowString(sKeyText, vValues)));
}

Checksum ChecksumAccumulator::value() const {
  if (_i128Sum == 0) return "0";

  const bool bNegative = _i128Sum < 0;
  Int128 i128Rest = _i128Sum;
  std::string sDigits;
  while (i128Rest != 0) {
    int iDigit = static_cast<int>(i128Rest % 10);
    sDigits.push_back(static_cast<char>('0' + (iDigit < 0 ? -iDigit : iDigit)));
    i128Rest /= 10;
  }
  if (bNegative) sDigits.push_back('-');
  std::reverse(sDigits.begin(), sDigits.end());
  return sDigits;
}

}  // namespace xdiff::common
