#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace xdiff::common {

/// Base error for all application-level exceptions.
/// Carries the process exit code and a machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iExitCode;
  std::string _sErrorCode;

  explicit AppError(int iExitCode, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iExitCode(iExitCode),
        _sErrorCode(std::move(sCode)) {}
};

/// Exit 2: invalid or missing configuration.
struct ConfigError : AppError {
  explicit ConfigError(std::string sCode, std::string sMsg)
      : AppError(2, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 3: compared columns cannot be normalized identically on both sides.
/// Raised during run init, before any bisection work.
struct SchemaMismatchError : AppError {
  explicit SchemaMismatchError(std::string sCode, std::string sMsg)
      : AppError(3, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 4: backend query failed and retrying will not help.
struct QueryError : AppError {
  explicit QueryError(std::string sCode, std::string sMsg)
      : AppError(4, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 4: network blip, timeout or lock conflict. Retried with backoff.
struct TransientQueryError : AppError {
  explicit TransientQueryError(std::string sCode, std::string sMsg)
      : AppError(4, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 4: a key range with start >= end.
struct InvalidRangeError : AppError {
  explicit InvalidRangeError(std::string sCode, std::string sMsg)
      : AppError(4, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 4: an accessor returned rows that are not strictly increasing by key.
struct OrderingError : AppError {
  explicit OrderingError(std::string sCode, std::string sMsg)
      : AppError(4, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 5: a work item failed for good. Names the range and operation.
struct SegmentFailedError : AppError {
  std::string _sRange;
  std::string _sOperation;

  explicit SegmentFailedError(std::string sRange, std::string sOperation, std::string sCause)
      : AppError(5, "segment_failed",
                 "Operation '" + sOperation + "' failed for range " + sRange + ": " + sCause),
        _sRange(std::move(sRange)),
        _sOperation(std::move(sOperation)) {}
};

/// Thrown inside a run to unwind work that observed cancellation.
/// Never surfaced to stream consumers as a failure.
struct CancelledError : AppError {
  explicit CancelledError(std::string sMsg)
      : AppError(0, "cancelled", std::move(sMsg)) {}
};

}  // namespace xdiff::common
