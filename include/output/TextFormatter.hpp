#pragma once

#include <ostream>
#include <string>

#include "output/IDiffFormatter.hpp"

namespace xdiff::output {

/// Line-oriented report:
///   - (key, v1, v2)   row only in the left table, or its old values
///   + (key, v1, v2)   row only in the right table, or its new values
/// followed by an optional summary block.
/// Class abbreviation: tf
class TextFormatter : public IDiffFormatter {
 public:
  TextFormatter(std::ostream& osOut, bool bStats);

  void begin(const common::TableRef& trLeft, const common::TableRef& trRight) override;
  void write(const common::DiffRecord& drRecord) override;
  void finish(const common::DiffStats& dsStats, core::StreamState state) override;

  /// "(key, v1, NULL)" for one side of a record.
  static std::string formatRow(const std::string& sKey, const common::RowValues& vValues);

 private:
  std::ostream& _osOut;
  bool _bStats;
  common::KeyType _keyType = common::KeyType::Integer;
  int _iKeyScale = 0;
};

}  // namespace xdiff::output
