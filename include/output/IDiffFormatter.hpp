#pragma once

#include "common/Types.hpp"
#include "core/DiffStream.hpp"

namespace xdiff::output {

/// Renders the records of one diff run as a report.
/// begin() once, write() per record, finish() once after the stream ends.
class IDiffFormatter {
 public:
  virtual ~IDiffFormatter() = default;

  virtual void begin(const common::TableRef& trLeft, const common::TableRef& trRight) = 0;
  virtual void write(const common::DiffRecord& drRecord) = 0;
  virtual void finish(const common::DiffStats& dsStats, core::StreamState state) = 0;
};

}  // namespace xdiff::output
