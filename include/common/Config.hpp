#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace xdiff::common {

/// Environment variable loader for the xdiff executable.
/// Loads all XDIFF_* variables into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sDb1Url;  // postgresql://... or sqlite://<path>
  std::string sDb2Url;
  std::string sTable1;
  std::string sTable2;  // defaults to sTable1

  // ── Key and columns ───────────────────────────────────────────────────
  std::string sKeyColumn = "id";
  KeyType keyType = KeyType::Integer;
  int iKeyScale = 0;
  std::vector<std::string> vColumns;

  // ── Bisection ─────────────────────────────────────────────────────────
  int iBisectionFactor = 10;
  int64_t iBisectionThreshold = 16384;
  int iMaxDepth = 16;

  // ── Concurrency ───────────────────────────────────────────────────────
  int iThreads = 0;  // 0 = std::thread::hardware_concurrency()
  int iDb1PoolSize = 4;
  int iDb2PoolSize = 4;

  // ── Retry ─────────────────────────────────────────────────────────────
  int iMaxRetries = 3;
  int iRetryBackoffMs = 100;
  int iRetryBackoffMaxMs = 5000;
  bool bSkipFailedSegments = false;

  // ── Output ────────────────────────────────────────────────────────────
  std::string sOutputFormat = "text";  // text | json
  bool bStats = false;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for XDIFF_DB1_URL and XDIFF_DB2_URL.
  /// Throws ConfigError on missing required vars or invalid constraints.
  static Config load();

  /// Split a comma-separated column list, trimming blanks.
  static std::vector<std::string> splitColumns(const std::string& sList);

 private:
  /// Read an env var with optional _FILE fallback for URLs with credentials.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as int64 with a default value.
  static int64_t getEnvInt64(const char* pVarName, int64_t iDefault);

  /// Read an env var as bool (true/false/1/0), default false.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace xdiff::common
