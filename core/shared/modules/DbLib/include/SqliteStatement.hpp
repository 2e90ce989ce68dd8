#ifndef DBLIB_SQLITE_STATEMENT_HPP
#define DBLIB_SQLITE_STATEMENT_HPP

/**
 * @file SqliteStatement.hpp
 * @brief RAII wrapper around sqlite3_stmt
 */

#include "DatabaseTypes.hpp"
#include "DbExport.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>

namespace DbLib {

class DBLIB_API SqliteStatement {
public:
  /// @throws DatabaseException if the statement cannot be prepared
  SqliteStatement(sqlite3 *db, const std::string &sql);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement &) = delete;
  SqliteStatement &operator=(const SqliteStatement &) = delete;

  // 1-based parameter index
  SqliteStatement &bindText(int index, const std::string &value);
  SqliteStatement &bindDouble(int index, double value);
  SqliteStatement &bindInt64(int index, int64_t value);
  SqliteStatement &bindBool(int index, bool value);
  SqliteStatement &bindNull(int index);

  /**
   * @brief Advance the statement.
   * @return true when a row is available, false when done
   * @throws DatabaseException on any other result code
   */
  bool step();

  /// Run to completion, returning sqlite3_changes()
  int execute();

  void reset();

  // 0-based column index
  std::string columnText(int column) const;
  double columnDouble(int column) const;
  int64_t columnInt64(int column) const;
  bool columnBool(int column) const { return columnInt64(column) != 0; }
  bool columnIsNull(int column) const;

private:
  void check(int rc, const char *what);

  sqlite3 *db_;
  sqlite3_stmt *stmt_;
  std::string sql_;
};

/// Execute one or more SQL statements without results
/// @throws DatabaseException on failure
DBLIB_API void ExecuteSql(sqlite3 *db, const std::string &sql);

/**
 * @brief BEGIN IMMEDIATE / COMMIT guard; rolls back unless commit() ran
 */
class DBLIB_API SqliteTransaction {
public:
  explicit SqliteTransaction(sqlite3 *db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction &) = delete;
  SqliteTransaction &operator=(const SqliteTransaction &) = delete;

  void commit();

private:
  sqlite3 *db_;
  bool done_;
};

} // namespace DbLib

#endif // DBLIB_SQLITE_STATEMENT_HPP
