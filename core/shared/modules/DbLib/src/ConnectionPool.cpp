#include "ConnectionPool.hpp"
#include "SqliteStatement.hpp"

namespace DbLib {

namespace {
std::atomic<uint64_t> g_memory_pool_seq{0};

bool IsMemoryPath(const std::string &path) {
  return path == ":memory:" || path.empty();
}
} // namespace

ConnectionPool::ConnectionPool()
    : open_flags_(0), logger_(nullptr), opened_(0), initialized_(false), degraded_count_(0) {}

ConnectionPool::~ConnectionPool() { shutdown(); }

bool ConnectionPool::initialize(const PoolConfig &config, IDbLogger *logger) {
  shutdown();

  std::lock_guard<std::mutex> lock(mutex_);
  config_ = config;
  logger_ = logger;

  open_flags_ = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
  if (IsMemoryPath(config_.sqlite_path)) {
    // 연결마다 별도 DB 가 되지 않도록 풀 단위 memdb 이름을 붙인다.
    // "/" 로 시작하는 memdb 이름은 프로세스 안에서 공유되고 일반 잠금을 쓴다.
    open_path_ = "file:/dblib_mem_" + std::to_string(++g_memory_pool_seq) +
                 "?vfs=memdb";
    open_flags_ |= SQLITE_OPEN_URI;
  } else {
    open_path_ = config_.sqlite_path;
  }

  int target = config_.pool_size > 0 ? config_.pool_size : 1;
  log(1, "Opening SQLite pool (" + std::to_string(target) +
             " connections): " + config_.sqlite_path);

  for (int i = 0; i < target; ++i) {
    sqlite3 *db = openConnection();
    if (!db)
      continue;
    idle_.push_back(db);
  }
  opened_ = idle_.size();

  if (opened_ == 0) {
    log(3, "Failed to open any SQLite connection: " + config_.sqlite_path);
    return false;
  }
  if (opened_ < static_cast<size_t>(target)) {
    log(2, "SQLite pool opened " + std::to_string(opened_) + " of " +
               std::to_string(target) + " connections");
  }

  initialized_.store(true);
  return true;
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (sqlite3 *db : idle_) {
    sqlite3_close(db);
  }
  idle_.clear();
  opened_ = 0;
  initialized_.store(false);
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

size_t ConnectionPool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return opened_;
}

sqlite3 *ConnectionPool::acquire(bool &pooled) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_.load()) {
      throw DatabaseException("connection pool is not initialized",
                              SQLITE_MISUSE);
    }
    if (!idle_.empty()) {
      sqlite3 *db = idle_.back();
      idle_.pop_back();
      pooled = true;
      return db;
    }
  }

  // 풀 고갈: 일회성 연결로 처리 (degraded mode)
  degraded_count_++;
  log(2, "Connection pool exhausted, opening transient connection");
  sqlite3 *db = openConnection();
  if (!db) {
    throw DatabaseException("failed to open transient connection: " +
                                config_.sqlite_path,
                            SQLITE_CANTOPEN);
  }
  pooled = false;
  return db;
}

void ConnectionPool::release(sqlite3 *db, bool pooled) {
  if (!db)
    return;

  if (pooled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_.load()) {
      idle_.push_back(db);
      return;
    }
  }
  sqlite3_close(db);
}

sqlite3 *ConnectionPool::openConnection() {
  sqlite3 *db = nullptr;
  int result = sqlite3_open_v2(open_path_.c_str(), &db, open_flags_, nullptr);
  if (result != SQLITE_OK) {
    std::string error_msg = db ? sqlite3_errmsg(db) : "out of memory";
    log(3, "SQLite connection failed: " + error_msg);
    if (db)
      sqlite3_close(db);
    return nullptr;
  }

  try {
    configureConnection(db);
  } catch (const DatabaseException &e) {
    log(3, std::string("SQLite configuration failed: ") + e.what());
    sqlite3_close(db);
    return nullptr;
  }
  return db;
}

void ConnectionPool::configureConnection(sqlite3 *db) {
  // 1. Set busy timeout (wait for locks)
  sqlite3_busy_timeout(db, config_.busy_timeout_ms);

  // 2. WAL for concurrent readers; in-memory databases report "memory"
  ExecuteSql(db, "PRAGMA journal_mode=WAL;");

  // 3. synchronous NORMAL is safe with WAL
  ExecuteSql(db, "PRAGMA synchronous=NORMAL;");
  ExecuteSql(db, "PRAGMA cache_size=" + std::to_string(config_.cache_size) +
                     ";");
  ExecuteSql(db, "PRAGMA foreign_keys=ON;");
}

void ConnectionPool::log(int level, const std::string &message) {
  if (logger_) {
    logger_->log("database", level, message);
  }
}

} // namespace DbLib
