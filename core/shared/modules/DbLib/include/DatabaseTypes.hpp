#ifndef DBLIB_DATABASE_TYPES_HPP
#define DBLIB_DATABASE_TYPES_HPP

/**
 * @file DatabaseTypes.hpp
 * @brief Generic Database Type Definitions for DbLib
 */

#include "DbExport.hpp"

#include <stdexcept>
#include <string>

// Matro conflict prevention
#ifdef max
#undef max
#endif
#ifdef min
#undef min
#endif

namespace DbLib {

/**
 * @brief Logger interface for DbLib
 * @details level: 0=DEBUG, 1=INFO, 2=WARN, 3=ERROR
 */
class DBLIB_API IDbLogger {
public:
  virtual ~IDbLogger() = default;
  virtual void log(const std::string &category, int level,
                   const std::string &message) = 0;
};

/**
 * @brief SQLite connection pool settings
 */
struct DBLIB_API PoolConfig {
  std::string sqlite_path = "devicewatch.db";
  int pool_size = 5;
  int busy_timeout_ms = 5000;
  int cache_size = 10000; // PRAGMA cache_size (pages)
};

/**
 * @brief Error raised by DbLib for any SQLite failure
 */
class DBLIB_API DatabaseException : public std::runtime_error {
public:
  DatabaseException(const std::string &message, int sqlite_code = 0)
      : std::runtime_error(message), sqlite_code_(sqlite_code) {}

  int sqliteCode() const { return sqlite_code_; }

private:
  int sqlite_code_;
};

} // namespace DbLib

#endif // DBLIB_DATABASE_TYPES_HPP
