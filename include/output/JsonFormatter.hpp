#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "output/IDiffFormatter.hpp"

namespace xdiff::output {

/// Collects the records of a run and writes one JSON result document on
/// finish():
///   {"version", "status", "result", "dataset1", "dataset2",
///    "rows": {"exclusive": {"dataset1": [...], "dataset2": [...]}, "diff": [...]},
///    "summary", "columns"}
/// Exclusive rows map each column to {"isPK", "value"}; changed rows map each
/// column to {"isPK", "dataset1", "dataset2", "isDiff"}.
/// Class abbreviation: jf
class JsonFormatter : public IDiffFormatter {
 public:
  static constexpr const char* kVersion = "1.0.0";

  JsonFormatter(std::ostream& osOut, bool bStats);

  void begin(const common::TableRef& trLeft, const common::TableRef& trRight) override;
  void write(const common::DiffRecord& drRecord) override;
  void finish(const common::DiffStats& dsStats, core::StreamState state) override;

  /// The document finish() writes.
  nlohmann::ordered_json document(const common::DiffStats& dsStats,
                                  core::StreamState state) const;

 private:
  nlohmann::ordered_json exclusiveRow(const common::TableRef& trTable, const std::string& sKey,
                                      const common::RowValues& vValues) const;
  nlohmann::ordered_json changedRow(const std::string& sKey,
                                    const common::DiffRecord& drRecord);

  std::ostream& _osOut;
  bool _bStats;
  common::TableRef _trLeft;
  common::TableRef _trRight;

  nlohmann::ordered_json _jExclusiveLeft = nlohmann::ordered_json::array();
  nlohmann::ordered_json _jExclusiveRight = nlohmann::ordered_json::array();
  nlohmann::ordered_json _jChanged = nlohmann::ordered_json::array();
  std::vector<int64_t> _vColumnDiffCounts;
};

}  // namespace xdiff::output
