#include "output/TextFormatter.hpp"

#include <algorithm>
#include <cstdio>

#include "common/KeyCodec.hpp"

namespace xdiff::output {

namespace {

constexpr const char* kNullText = "NULL";

std::string formatPercent(double dValue) {
  char szBuf[32];
  std::snprintf(szBuf, sizeof(szBuf), "%.2f", dValue);
  return szBuf;
}

}  // namespace

TextFormatter::TextFormatter(std::ostream& osOut, bool bStats)
    : _osOut(osOut), _bStats(bStats) {}

void TextFormatter::begin(const common::TableRef& trLeft, const common::TableRef& /*trRight*/) {
  _keyType = trLeft.keyType;
  _iKeyScale = trLeft.iKeyScale;
}

std::string TextFormatter::formatRow(const std::string& sKey, const common::RowValues& vValues) {
  std::string sOut = "(" + sKey;
  for (const auto& oValue : vValues) {
    sOut += ", ";
    sOut += oValue ? *oValue : kNullText;
  }
  sOut += ")";
  return sOut;
}

void TextFormatter::write(const common::DiffRecord& drRecord) {
  const std::string sKey = common::KeyCodec::toString(drRecord.key, _keyType, _iKeyScale);
  switch (drRecord.kind) {
    case common::DiffKind::Removed:
      _osOut << "- " << formatRow(sKey, drRecord.vLeftValues) << "\n";
      break;
    case common::DiffKind::Added:
      _osOut << "+ " << formatRow(sKey, drRecord.vRightValues) << "\n";
      break;
    case common::DiffKind::Changed:
      _osOut << "- " << formatRow(sKey, drRecord.vLeftValues) << "\n";
      _osOut << "+ " << formatRow(sKey, drRecord.vRightValues) << "\n";
      break;
  }
}

void TextFormatter::finish(const common::DiffStats& dsStats, core::StreamState state) {
  if (state == core::StreamState::Cancelled) {
    _osOut << "# diff cancelled, report is incomplete\n";
  } else if (state == core::StreamState::Failed) {
    _osOut << "# diff failed, report is incomplete\n";
  }

  if (_bStats) {
    const int64_t iUnchanged =
        std::max<int64_t>(0, dsStats.iLeftRows - dsStats.iRemoved - dsStats.iChanged);
    const int64_t iLargest = std::max(dsStats.iLeftRows, dsStats.iRightRows);
    const double dDiffPercent =
        iLargest == 0 ? 0.0 : 100.0 * (1.0 - static_cast<double>(iUnchanged) / iLargest);

    _osOut << "\n"
           << dsStats.iLeftRows << " rows in table A\n"
           << dsStats.iRightRows << " rows in table B\n"
           << dsStats.iRemoved << " rows exclusive to table A (not present in B)\n"
           << dsStats.iAdded << " rows exclusive to table B (not present in A)\n"
           << dsStats.iChanged << " rows updated\n"
           << iUnchanged << " rows unchanged\n"
           << formatPercent(dDiffPercent) << "% difference score\n"
           << "\nExtra-Info:\n"
           << "  segments_compared = " << dsStats.iSegmentsCompared << "\n"
           << "  segments_matched = " << dsStats.iSegmentsMatched << "\n"
           << "  exact_diffs = " << dsStats.iExactDiffs << "\n"
           << "  max_depth = " << dsStats.iMaxDepthReached << "\n"
           << "  rows_downloaded = " << dsStats.iLeftRowsDownloaded << " / "
           << dsStats.iRightRowsDownloaded << "\n"
           << "  queries = " << dsStats.iLeftQueries << " / " << dsStats.iRightQueries << "\n";
  }

  for (const auto& sRange : dsStats.vFailedRanges) {
    _osOut << "# skipped range " << sRange << "\n";
  }
  _osOut.flush();
}

}  // namespace xdiff::output
