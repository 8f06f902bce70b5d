#pragma once

#include <memory>
#include <string>

#include "dal/ITableAccessor.hpp"

namespace xdiff::dal {

/// Creates concrete ITableAccessor instances by URL scheme.
///   postgres://..., postgresql://...  → PostgresAccessor
///   sqlite://<path>                   → SqliteAccessor
class AccessorFactory {
 public:
  static std::unique_ptr<ITableAccessor> create(const std::string& sUrl, int iPoolSize);
};

}  // namespace xdiff::dal
