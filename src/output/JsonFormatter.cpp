#include "output/JsonFormatter.hpp"

#include <algorithm>
#include <sstream>

#include "common/KeyCodec.hpp"

namespace xdiff::output {

using nlohmann::ordered_json;

namespace {

ordered_json optionalValue(const std::optional<std::string>& oValue) {
  return oValue ? ordered_json(*oValue) : ordered_json(nullptr);
}

/// "db.schema.table" → ["db", "schema", "table"]
ordered_json tablePath(const std::string& sPath) {
  ordered_json jPath = ordered_json::array();
  std::istringstream iss(sPath);
  std::string sPart;
  while (std::getline(iss, sPart, '.')) {
    jPath.push_back(sPart);
  }
  return jPath;
}

const char* statusText(core::StreamState state) {
  switch (state) {
    case core::StreamState::Completed:
      return "success";
    case core::StreamState::Cancelled:
      return "cancelled";
    case core::StreamState::Failed:
      return "failed";
    case core::StreamState::Running:
      return "running";
  }
  return "unknown";
}

}  // namespace

JsonFormatter::JsonFormatter(std::ostream& osOut, bool bStats)
    : _osOut(osOut), _bStats(bStats) {}

void JsonFormatter::begin(const common::TableRef& trLeft, const common::TableRef& trRight) {
  _trLeft = trLeft;
  _trRight = trRight;
  _vColumnDiffCounts.assign(trLeft.vColumns.size(), 0);
}

ordered_json JsonFormatter::exclusiveRow(const common::TableRef& trTable, const std::string& sKey,
                                         const common::RowValues& vValues) const {
  ordered_json jRow = ordered_json::object();
  jRow[trTable.sKeyColumn] = {{"isPK", true}, {"value", sKey}};
  for (size_t i = 0; i < vValues.size() && i < trTable.vColumns.size(); ++i) {
    jRow[trTable.vColumns[i]] = {{"isPK", false}, {"value", optionalValue(vValues[i])}};
  }
  return jRow;
}

ordered_json JsonFormatter::changedRow(const std::string& sKey,
                                       const common::DiffRecord& drRecord) {
  ordered_json jRow = ordered_json::object();
  jRow[_trLeft.sKeyColumn] = {
      {"isPK", true}, {"dataset1", sKey}, {"dataset2", sKey}, {"isDiff", false}};

  const size_t uColumns = std::min(drRecord.vLeftValues.size(), drRecord.vRightValues.size());
  for (size_t i = 0; i < uColumns && i < _trLeft.vColumns.size(); ++i) {
    const bool bDiff = drRecord.vLeftValues[i] != drRecord.vRightValues[i];
    if (bDiff) ++_vColumnDiffCounts[i];
    jRow[_trLeft.vColumns[i]] = {{"isPK", false},
                                 {"dataset1", optionalValue(drRecord.vLeftValues[i])},
                                 {"dataset2", optionalValue(drRecord.vRightValues[i])},
                                 {"isDiff", bDiff}};
  }
  return jRow;
}

void JsonFormatter::write(const common::DiffRecord& drRecord) {
  const std::string sKey =
      common::KeyCodec::toString(drRecord.key, _trLeft.keyType, _trLeft.iKeyScale);
  switch (drRecord.kind) {
    case common::DiffKind::Removed:
      _jExclusiveLeft.push_back(exclusiveRow(_trLeft, sKey, drRecord.vLeftValues));
      break;
    case common::DiffKind::Added:
      _jExclusiveRight.push_back(exclusiveRow(_trRight, sKey, drRecord.vRightValues));
      break;
    case common::DiffKind::Changed:
      _jChanged.push_back(changedRow(sKey, drRecord));
      break;
  }
}

ordered_json JsonFormatter::document(const common::DiffStats& dsStats,
                                     core::StreamState state) const {
  const bool bIdentical =
      _jExclusiveLeft.empty() && _jExclusiveRight.empty() && _jChanged.empty();

  ordered_json jDoc;
  jDoc["version"] = kVersion;
  jDoc["status"] = statusText(state);
  jDoc["result"] = bIdentical ? "identical" : "different";
  jDoc["dataset1"] = tablePath(_trLeft.sTablePath);
  jDoc["dataset2"] = tablePath(_trRight.sTablePath);
  jDoc["rows"] = {{"exclusive", {{"dataset1", _jExclusiveLeft}, {"dataset2", _jExclusiveRight}}},
                  {"diff", _jChanged}};

  if (_bStats) {
    const int64_t iUnchanged =
        std::max<int64_t>(0, dsStats.iLeftRows - dsStats.iRemoved - dsStats.iChanged);
    ordered_json jDiffCounts = ordered_json::object();
    for (size_t i = 0; i < _vColumnDiffCounts.size(); ++i) {
      if (_vColumnDiffCounts[i] > 0) jDiffCounts[_trLeft.vColumns[i]] = _vColumnDiffCounts[i];
    }
    jDoc["summary"] = {
        {"rows",
         {{"total", {{"dataset1", dsStats.iLeftRows}, {"dataset2", dsStats.iRightRows}}},
          {"exclusive", {{"dataset1", dsStats.iRemoved}, {"dataset2", dsStats.iAdded}}},
          {"updated", dsStats.iChanged},
          {"unchanged", iUnchanged}}},
        {"stats",
         {{"diffCounts", jDiffCounts},
          {"segmentsCompared", dsStats.iSegmentsCompared},
          {"exactDiffs", dsStats.iExactDiffs},
          {"maxDepth", dsStats.iMaxDepthReached},
          {"rowsDownloaded",
           {{"dataset1", dsStats.iLeftRowsDownloaded},
            {"dataset2", dsStats.iRightRowsDownloaded}}}}},
        {"failedRanges", dsStats.vFailedRanges}};
  } else {
    jDoc["summary"] = nullptr;
  }
  jDoc["columns"] = nullptr;
  return jDoc;
}

void JsonFormatter::finish(const common::DiffStats& dsStats, core::StreamState state) {
  _osOut << document(dsStats, state).dump(2) << "\n";
  _osOut.flush();
}

}  // namespace xdiff::output
