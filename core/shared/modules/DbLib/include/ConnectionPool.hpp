#ifndef DBLIB_CONNECTION_POOL_HPP
#define DBLIB_CONNECTION_POOL_HPP

/**
 * @file ConnectionPool.hpp
 * @brief Fixed-size SQLite connection pool with a degraded fallback
 * @details
 * Every connection (pooled or transient) is opened with
 * journal_mode=WAL, synchronous=NORMAL, cache_size, foreign_keys=ON and a
 * busy timeout. When the pool is empty a transient connection is opened,
 * used once, and closed; callers do not see an error for that case.
 *
 * ":memory:" is opened as a memdb URI unique to this pool, so
 * pooled and transient connections all see the same in-memory database for
 * as long as the pool holds at least one connection.
 */

#include "DatabaseTypes.hpp"
#include "DbExport.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <utility>
#include <vector>

namespace DbLib {

class DBLIB_API ConnectionPool {
public:
  ConnectionPool();
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool &) = delete;
  ConnectionPool &operator=(const ConnectionPool &) = delete;

  /**
   * @brief Open pool_size connections.
   * @return false if not a single connection could be opened
   */
  bool initialize(const PoolConfig &config, IDbLogger *logger = nullptr);
  void shutdown();

  bool isInitialized() const { return initialized_.load(); }

  /**
   * @brief Run fn(sqlite3*) on a pooled (or transient) connection.
   * @details The connection goes back to the pool even if fn throws.
   * @throws DatabaseException if no connection can be obtained at all
   */
  template <typename Fn>
  auto withConnection(Fn &&fn) -> decltype(fn(std::declval<sqlite3 *>())) {
    Lease lease(*this);
    return fn(lease.get());
  }

  size_t available() const;
  size_t size() const;
  uint64_t degradedCount() const { return degraded_count_.load(); }
  const PoolConfig &getConfig() const { return config_; }
  /// 실제 sqlite3_open_v2 에 넘기는 경로 (in-memory 면 file: URI)
  const std::string &openPath() const { return open_path_; }

private:
  class Lease {
  public:
    explicit Lease(ConnectionPool &pool) : pool_(pool), pooled_(false) {
      db_ = pool_.acquire(pooled_);
    }
    ~Lease() { pool_.release(db_, pooled_); }
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;

    sqlite3 *get() const { return db_; }

  private:
    ConnectionPool &pool_;
    sqlite3 *db_;
    bool pooled_;
  };

  sqlite3 *acquire(bool &pooled);
  void release(sqlite3 *db, bool pooled);

  sqlite3 *openConnection();
  void configureConnection(sqlite3 *db);
  void log(int level, const std::string &message);

  PoolConfig config_;
  std::string open_path_;
  int open_flags_;
  IDbLogger *logger_;

  mutable std::mutex mutex_;
  std::vector<sqlite3 *> idle_;
  size_t opened_;
  std::atomic<bool> initialized_;
  std::atomic<uint64_t> degraded_count_;
};

} // namespace DbLib

#endif // DBLIB_CONNECTION_POOL_HPP
