#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <pqxx/pqxx>

namespace xdiff::dal {

class ConnectionPool;

/// RAII guard for checked-out database connections.
/// Returns the connection to the pool on destruction.
/// Class abbreviation: cg
class ConnectionGuard {
 public:
  ConnectionGuard(ConnectionPool& cpPool, std::shared_ptr<pqxx::connection> spConn);
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard& operator=(ConnectionGuard&& other) noexcept;

  pqxx::connection& operator*();
  pqxx::connection* operator->();

 private:
  ConnectionPool* _pPool;
  std::shared_ptr<pqxx::connection> _spConn;
};

/// Fixed-size pool of pqxx::connection objects, one pool per diff side.
/// Thread-safe via std::mutex + std::condition_variable.
/// Blocks on exhaustion with configurable timeout.
/// Class abbreviation: cp
class ConnectionPool {
 public:
  /// sSessionSetup runs once on every new connection (e.g. SET TIME ZONE).
  ConnectionPool(const std::string& sDbUrl, int iPoolSize, std::string sSessionSetup = {},
                 std::chrono::seconds durCheckoutTimeout = std::chrono::seconds(30));
  ~ConnectionPool();

  /// Check out a connection. Blocks if all connections are in use.
  ConnectionGuard checkout();

  /// Return a connection to the pool. Called by ConnectionGuard destructor.
  void returnConnection(std::shared_ptr<pqxx::connection> spConn);

  /// Send a cancel request for every query running on a checked-out connection.
  void cancelAll();

  /// Get the pool size.
  int size() const { return _iPoolSize; }

 private:
  std::shared_ptr<pqxx::connection> connect();

  /// Validate a connection with a lightweight query.
  bool validate(pqxx::connection& conn);

  std::vector<std::shared_ptr<pqxx::connection>> _vAvailable;
  std::vector<std::shared_ptr<pqxx::connection>> _vCheckedOut;
  std::mutex _mtx;
  std::condition_variable _cv;
  std::string _sDbUrl;
  std::string _sSessionSetup;
  int _iPoolSize;
  std::chrono::seconds _durCheckoutTimeout;
};

}  // namespace xdiff::dal
