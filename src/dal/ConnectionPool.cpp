#include "dal/ConnectionPool.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <chrono>

namespace xdiff::dal {

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() {
  if (_spConn && _pPool) {
    _pPool->returnConnection(std::move(_spConn));
  }
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(other._pPool), _spConn(std::move(other._spConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    if (_spConn && _pPool) {
      _pPool->returnConnection(std::move(_spConn));
    }
    _pPool = other._pPool;
    _spConn = std::move(other._spConn);
    other._pPool = nullptr;
  }
  return *this;
}

pqxx::connection& ConnectionGuard::operator*() { return *_spConn; }
pqxx::connection* ConnectionGuard::operator->() { return _spConn.get(); }

// ── ConnectionPool ─────────────────────────────────────────────────────────

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::string sSessionSetup,
                               std::chrono::seconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl),
      _sSessionSetup(std::move(sSessionSetup)),
      _iPoolSize(iPoolSize),
      _durCheckoutTimeout(durCheckoutTimeout) {
  auto spLog = common::Logger::get();
  spLog->info("Initializing connection pool: size={}, url={}",
              _iPoolSize, _sDbUrl.substr(0, _sDbUrl.find('@')));

  _vAvailable.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    _vAvailable.push_back(connect());
  }

  spLog->info("Connection pool ready: {} connections established", _iPoolSize);
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.clear();
  _vCheckedOut.clear();
}

std::shared_ptr<pqxx::connection> ConnectionPool::connect() {
  std::shared_ptr<pqxx::connection> spConn;
  try {
    spConn = std::make_shared<pqxx::connection>(_sDbUrl);
  } catch (const pqxx::broken_connection& ex) {
    throw common::TransientQueryError("connect_failed",
                                      std::string("Failed to open database connection: ") +
                                          ex.what());
  }
  if (!spConn->is_open()) {
    throw common::TransientQueryError("connect_failed", "Failed to open database connection");
  }
  if (!_sSessionSetup.empty()) {
    pqxx::nontransaction ntx(*spConn);
    ntx.exec(_sSessionSetup);
  }
  return spConn;
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  const auto bAvailable = _cv.wait_for(lock, _durCheckoutTimeout, [this] {
    return !_vAvailable.empty();
  });

  if (!bAvailable) {
    throw common::TransientQueryError(
        "pool_exhausted", "Connection pool exhausted: timeout waiting for available connection");
  }

  auto spConn = std::move(_vAvailable.back());
  _vAvailable.pop_back();
  lock.unlock();

  // Validate connection with a lightweight query
  if (!validate(*spConn)) {
    common::Logger::get()->warn("Stale connection detected, reconnecting");
    try {
      spConn = connect();
    } catch (const common::TransientQueryError&) {
      // Keep the pool at full size; the caller retries
      returnConnection(std::move(spConn));
      throw;
    }
  }

  lock.lock();
  _vCheckedOut.push_back(spConn);
  lock.unlock();

  return ConnectionGuard(*this, std::move(spConn));
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  std::lock_guard<std::mutex> lock(_mtx);
  std::erase(_vCheckedOut, spConn);
  _vAvailable.push_back(std::move(spConn));
  _cv.notify_one();
}

void ConnectionPool::cancelAll() {
  std::lock_guard<std::mutex> lock(_mtx);
  for (auto& spConn : _vCheckedOut) {
    try {
      spConn->cancel_query();
    } catch (const std::exception& ex) {
      common::Logger::get()->warn("Cancel request failed: {}", ex.what());
    }
  }
}

bool ConnectionPool::validate(pqxx::connection& conn) {
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1").one_row();
    return true;
  } catch (const std::exception& ex) {
    common::Logger::get()->debug("Connection validation failed: {}", ex.what());
    return false;
  }
}

}  // namespace xdiff::dal
