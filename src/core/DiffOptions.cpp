#include "core/DiffOptions.hpp"

#include <string>

#include "common/Errors.hpp"

namespace xdiff::core {

void DiffOptions::validate() const {
  if (iBisectionFactor < 2) {
    throw common::ConfigError("invalid_bisection_factor",
                              "bisection factor must be >= 2 (got " +
                                  std::to_string(iBisectionFactor) + ")");
  }
  if (iBisectionThreshold < 1) {
    throw common::ConfigError("invalid_bisection_threshold",
                              "bisection threshold must be >= 1 (got " +
                                  std::to_string(iBisectionThreshold) + ")");
  }
  if (iMaxDepth < 1) {
    throw common::ConfigError("invalid_max_depth",
                              "max depth must be >= 1 (got " + std::to_string(iMaxDepth) + ")");
  }
  if (iThreads < 0 || iLeftMaxInFlight < 1 || iRightMaxInFlight < 1) {
    throw common::ConfigError("invalid_concurrency",
                              "thread count must be >= 0 and per-side limits >= 1");
  }
  if (iMaxRetries < 0 || durRetryBackoff.count() < 0 || durRetryBackoffMax < durRetryBackoff) {
    throw common::ConfigError("invalid_retry", "retry settings out of range");
  }
  if (uStreamCapacity == 0) {
    throw common::ConfigError("invalid_stream_capacity", "stream capacity must be >= 1");
  }
}

}  // namespace xdiff::core
