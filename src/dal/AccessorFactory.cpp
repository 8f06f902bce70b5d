#include "dal/AccessorFactory.hpp"

#include "common/Errors.hpp"
#include "dal/PostgresAccessor.hpp"
#include "dal/SqliteAccessor.hpp"

namespace xdiff::dal {

namespace {

bool startsWith(const std::string& sText, const std::string& sPrefix) {
  return sText.rfind(sPrefix, 0) == 0;
}

}  // namespace

std::unique_ptr<ITableAccessor> AccessorFactory::create(const std::string& sUrl, int iPoolSize) {
  if (startsWith(sUrl, "postgres://") || startsWith(sUrl, "postgresql://")) {
    return std::make_unique<PostgresAccessor>(sUrl, iPoolSize);
  }

  const std::string sSqlitePrefix = "sqlite://";
  if (startsWith(sUrl, sSqlitePrefix)) {
    const std::string sPath = sUrl.substr(sSqlitePrefix.size());
    if (sPath.empty()) {
      throw common::ConfigError("invalid_url", "SQLite URL has no database path: " + sUrl);
    }
    return std::make_unique<SqliteAccessor>(sPath, iPoolSize);
  }

  const auto uScheme = sUrl.find("://");
  throw common::ConfigError(
      "unsupported_database",
      "Unsupported database URL scheme '" +
          (uScheme == std::string::npos ? sUrl : sUrl.substr(0, uScheme)) +
          "' (expected postgresql:// or sqlite://)");
}

}  // namespace xdiff::dal
