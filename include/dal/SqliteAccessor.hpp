#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "dal/ITableAccessor.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace xdiff::dal {

/// SQLite backend over a small pool of read-only connections.
/// SQLite has no MD5, so checksums are computed client-side with
/// common::RowHash while scanning the range; nothing leaves the process.
/// Timestamp keys must be stored as "YYYY-MM-DD HH:MM:SS.ffffff" text so that
/// range predicates compare correctly.
/// Class abbreviation: sa
class SqliteAccessor : public ITableAccessor {
 public:
  SqliteAccessor(const std::string& sPath, int iPoolSize);
  ~SqliteAccessor() override;

  SqliteAccessor(const SqliteAccessor&) = delete;
  SqliteAccessor& operator=(const SqliteAccessor&) = delete;

  std::string name() const override;
  std::vector<common::ColumnInfo> describe(const common::TableRef& trTable) override;
  std::optional<common::KeyBounds> bounds(const common::TableRef& trTable) override;
  int64_t count(const common::TableRef& trTable, const common::KeyRange& krRange) override;
  common::Checksum checksum(const common::TableRef& trTable,
                            const common::KeyRange& krRange) override;
  std::vector<common::Row> rows(const common::TableRef& trTable,
                                const common::KeyRange& krRange) override;
  void cancel() override;

  /// Map a declared column type to a column category using SQLite's
  /// affinity rules plus UUID/BOOL/DATE/TIME name hints.
  static common::ColumnInfo classify(const std::string& sName, const std::string& sDeclType);

 private:
  /// RAII checkout of one pooled connection.
  class Lease {
   public:
    explicit Lease(SqliteAccessor& saOwner);
    ~Lease();
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    sqlite3* get() const { return _pDb; }

   private:
    SqliteAccessor& _saOwner;
    sqlite3* _pDb;
  };

  sqlite3* acquire();
  void release(sqlite3* pDb);

  /// Prepare, bind the range and step through every row in key order.
  void scanRange(const common::TableRef& trTable, const common::KeyRange& krRange,
                 const std::function<void(common::Row&&)>& fnRow);

  /// Throw the error matching a failed sqlite3 call.
  [[noreturn]] void raise(sqlite3* pDb, int iRc, const char* pOperation) const;

  std::string _sPath;
  std::vector<sqlite3*> _vAll;
  std::vector<sqlite3*> _vAvailable;
  std::mutex _mtx;
  std::condition_variable _cv;
  std::atomic<bool> _bCancelling{false};
};

}  // namespace xdiff::dal
