#include "SqliteStatement.hpp"

namespace DbLib {

SqliteStatement::SqliteStatement(sqlite3 *db, const std::string &sql)
    : db_(db), stmt_(nullptr), sql_(sql) {
  if (!db_) {
    throw DatabaseException("no database connection", SQLITE_MISUSE);
  }
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "prepare failed: " + std::string(sqlite3_errmsg(db_)) +
                      " in query: " + sql.substr(0, 100);
    if (stmt_) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
    throw DatabaseException(msg, rc);
  }
}

SqliteStatement::~SqliteStatement() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

void SqliteStatement::check(int rc, const char *what) {
  if (rc != SQLITE_OK) {
    throw DatabaseException(std::string(what) + " failed: " +
                                sqlite3_errmsg(db_) +
                                " in query: " + sql_.substr(0, 100),
                            rc);
  }
}

SqliteStatement &SqliteStatement::bindText(int index,
                                           const std::string &value) {
  check(sqlite3_bind_text(stmt_, index, value.c_str(),
                          static_cast<int>(value.size()), SQLITE_TRANSIENT),
        "bind_text");
  return *this;
}

SqliteStatement &SqliteStatement::bindDouble(int index, double value) {
  check(sqlite3_bind_double(stmt_, index, value), "bind_double");
  return *this;
}

SqliteStatement &SqliteStatement::bindInt64(int index, int64_t value) {
  check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)),
        "bind_int64");
  return *this;
}

SqliteStatement &SqliteStatement::bindBool(int index, bool value) {
  return bindInt64(index, value ? 1 : 0);
}

SqliteStatement &SqliteStatement::bindNull(int index) {
  check(sqlite3_bind_null(stmt_, index), "bind_null");
  return *this;
}

bool SqliteStatement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW)
    return true;
  if (rc == SQLITE_DONE)
    return false;
  throw DatabaseException("step failed: " + std::string(sqlite3_errmsg(db_)) +
                              " in query: " + sql_.substr(0, 100),
                          rc);
}

int SqliteStatement::execute() {
  while (step()) {
  }
  return sqlite3_changes(db_);
}

void SqliteStatement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

std::string SqliteStatement::columnText(int column) const {
  const unsigned char *text = sqlite3_column_text(stmt_, column);
  if (!text)
    return "";
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

double SqliteStatement::columnDouble(int column) const {
  return sqlite3_column_double(stmt_, column);
}

int64_t SqliteStatement::columnInt64(int column) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

bool SqliteStatement::columnIsNull(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

// ========================================================================
// Free helpers
// ========================================================================

void ExecuteSql(sqlite3 *db, const std::string &sql) {
  char *error_msg = nullptr;
  int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error_msg);
  if (rc != SQLITE_OK) {
    std::string error_str =
        error_msg ? std::string(error_msg) : "Unknown SQLite error";
    if (error_msg)
      sqlite3_free(error_msg);
    throw DatabaseException("SQLite error: " + error_str +
                                " in query: " + sql.substr(0, 100),
                            rc);
  }
}

SqliteTransaction::SqliteTransaction(sqlite3 *db) : db_(db), done_(false) {
  ExecuteSql(db_, "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!done_) {
    // 롤백 실패는 연결이 이미 닫힌 경우뿐이므로 결과를 무시한다
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::commit() {
  ExecuteSql(db_, "COMMIT;");
  done_ = true;
}

} // namespace DbLib
