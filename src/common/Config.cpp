#include "common/Config.hpp"

#include "common/Errors.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace xdiff::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t uPos = 0;
    const int iValue = std::stoi(sValue, &uPos);
    if (uPos == sValue.size()) return iValue;
  } catch (const std::exception&) {
    // reported below
  }
  throw ConfigError("invalid_integer",
                    std::string("Invalid integer value for ") + pVarName + ": " + sValue);
}

int64_t Config::getEnvInt64(const char* pVarName, int64_t iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t uPos = 0;
    const int64_t iValue = std::stoll(sValue, &uPos);
    if (uPos == sValue.size()) return iValue;
  } catch (const std::exception&) {
    // reported below
  }
  throw ConfigError("invalid_integer",
                    std::string("Invalid integer value for ") + pVarName + ": " + sValue);
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

std::string Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  // Try _FILE fallback
  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw ConfigError("missing_variable",
                      std::string("Required variable not set: neither ") + pVarName + " nor " +
                          sFileVar + " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw ConfigError("unreadable_file", "Cannot open file specified by " + sFileVar + ": " +
                                             sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw ConfigError("empty_file", "File is empty: " + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

std::vector<std::string> Config::splitColumns(const std::string& sList) {
  std::vector<std::string> vColumns;
  std::istringstream iss(sList);
  std::string sItem;
  while (std::getline(iss, sItem, ',')) {
    const auto uFirst = sItem.find_first_not_of(" \t");
    if (uFirst == std::string::npos) continue;
    const auto uLast = sItem.find_last_not_of(" \t");
    vColumns.push_back(sItem.substr(uFirst, uLast - uFirst + 1));
  }
  return vColumns;
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sDb1Url = loadSecret("XDIFF_DB1_URL");
  cfg.sDb2Url = loadSecret("XDIFF_DB2_URL");

  cfg.sTable1 = getEnv("XDIFF_TABLE1");
  if (cfg.sTable1.empty()) {
    throw ConfigError("missing_variable",
                      "Required environment variable XDIFF_TABLE1 is not set");
  }
  cfg.sTable2 = getEnv("XDIFF_TABLE2");
  if (cfg.sTable2.empty()) {
    cfg.sTable2 = cfg.sTable1;
  }

  // ── Optional vars with defaults ────────────────────────────────────────
  const std::string sKeyColumn = getEnv("XDIFF_KEY_COLUMN");
  if (!sKeyColumn.empty()) {
    cfg.sKeyColumn = sKeyColumn;
  }
  const std::string sKeyType = getEnv("XDIFF_KEY_TYPE");
  if (!sKeyType.empty()) {
    cfg.keyType = keyTypeFromString(sKeyType);
  }
  cfg.iKeyScale = getEnvInt("XDIFF_KEY_SCALE", 0);
  cfg.vColumns = splitColumns(getEnv("XDIFF_COLUMNS"));

  cfg.iBisectionFactor = getEnvInt("XDIFF_BISECTION_FACTOR", 10);
  cfg.iBisectionThreshold = getEnvInt64("XDIFF_BISECTION_THRESHOLD", 16384);
  cfg.iMaxDepth = getEnvInt("XDIFF_MAX_DEPTH", 16);

  cfg.iThreads = getEnvInt("XDIFF_THREADS", 0);
  cfg.iDb1PoolSize = getEnvInt("XDIFF_DB1_POOL_SIZE", 4);
  cfg.iDb2PoolSize = getEnvInt("XDIFF_DB2_POOL_SIZE", 4);

  cfg.iMaxRetries = getEnvInt("XDIFF_MAX_RETRIES", 3);
  cfg.iRetryBackoffMs = getEnvInt("XDIFF_RETRY_BACKOFF_MS", 100);
  cfg.iRetryBackoffMaxMs = getEnvInt("XDIFF_RETRY_BACKOFF_MAX_MS", 5000);
  cfg.bSkipFailedSegments = getEnvBool("XDIFF_SKIP_FAILED_SEGMENTS", false);

  const std::string sFormat = getEnv("XDIFF_OUTPUT_FORMAT");
  if (!sFormat.empty()) {
    cfg.sOutputFormat = sFormat;
  }
  cfg.bStats = getEnvBool("XDIFF_STATS", false);

  const std::string sLogLevel = getEnv("XDIFF_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.sKeyColumn.empty()) {
    throw ConfigError("invalid_key_column", "XDIFF_KEY_COLUMN must not be empty");
  }

  if (cfg.iKeyScale < 0 || cfg.iKeyScale > 18) {
    throw ConfigError("invalid_key_scale",
                      "XDIFF_KEY_SCALE must be within 0..18 (got " +
                          std::to_string(cfg.iKeyScale) + ")");
  }

  if (cfg.iBisectionFactor < 2) {
    throw ConfigError("invalid_bisection_factor",
                      "XDIFF_BISECTION_FACTOR must be >= 2 (got " +
                          std::to_string(cfg.iBisectionFactor) + ")");
  }

  if (cfg.iBisectionThreshold < 1) {
    throw ConfigError("invalid_bisection_threshold",
                      "XDIFF_BISECTION_THRESHOLD must be >= 1 (got " +
                          std::to_string(cfg.iBisectionThreshold) + ")");
  }

  if (cfg.iMaxDepth < 1) {
    throw ConfigError("invalid_max_depth", "XDIFF_MAX_DEPTH must be >= 1 (got " +
                                               std::to_string(cfg.iMaxDepth) + ")");
  }

  if (cfg.iThreads < 0 || cfg.iDb1PoolSize < 1 || cfg.iDb2PoolSize < 1) {
    throw ConfigError("invalid_concurrency",
                      "XDIFF_THREADS must be >= 0 and pool sizes must be >= 1");
  }

  if (cfg.iMaxRetries < 0 || cfg.iRetryBackoffMs < 0 ||
      cfg.iRetryBackoffMaxMs < cfg.iRetryBackoffMs) {
    throw ConfigError("invalid_retry",
                      "XDIFF_MAX_RETRIES and XDIFF_RETRY_BACKOFF_MS must be >= 0 and "
                      "XDIFF_RETRY_BACKOFF_MAX_MS must be >= XDIFF_RETRY_BACKOFF_MS");
  }

  if (cfg.sOutputFormat != "text" && cfg.sOutputFormat != "json") {
    throw ConfigError("invalid_output_format",
                      "XDIFF_OUTPUT_FORMAT must be 'text' or 'json' (got '" +
                          cfg.sOutputFormat + "')");
  }

  return cfg;
}

}  // namespace xdiff::common
