#pragma once

#include <sqlite3.h>

#include <chrono>
#include <stdexcept>
#include <string>

namespace sqlvet::store {

/// Raised by the store layer for any SQLite failure.
/// MUST carry the SQLite result code and the connection's error message.
class StoreError : public std::runtime_error {
 public:
  StoreError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}
  int code() const { return code_; }

 private:
  int code_;
};

enum class OpenMode { ReadOnly, ReadWrite, ReadWriteCreate };

/// Owns one sqlite3 handle for its lifetime.
/// MUST NOT create a database file unless opened with ReadWriteCreate.
/// Not copyable; each validation call opens its own connection.
class Connection {
 public:
  Connection(const std::string& path, OpenMode mode);
  ~Connection();
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  /// Runs one or more statements that return no rows.
  /// MUST throw StoreError with the SQLite message on failure.
  void exec(const std::string& sql);
  void set_busy_timeout(int timeout_ms);
  std::string last_error() const;
  sqlite3* handle() const { return db_; }

 private:
  sqlite3* db_ = nullptr;
};

/// Wraps a prepared statement and finalizes it on destruction.
/// MUST reject SQL with more than one statement.
class PreparedStatement {
 public:
  PreparedStatement(Connection& conn, const std::string& sql);
  ~PreparedStatement();
  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;

  /// Advances to the next row; returns false once the statement is done.
  /// MUST throw StoreError on any other result code.
  bool step();
  int column_count() const;
  std::string column_name(int index) const;
  bool column_is_null(int index) const;
  /// Renders a cell as text; NULL becomes "NULL" and blobs become X'..' hex.
  std::string column_text(int index) const;
  int column_int(int index) const;

 private:
  Connection& conn_;
  sqlite3_stmt* stmt_ = nullptr;
};

/// Opens a transaction that is never committed.
/// MUST roll back on every exit path; the destructor rolls back without throwing
/// when rollback() was not reached.
class ScopedTransaction {
 public:
  explicit ScopedTransaction(Connection& conn);
  ~ScopedTransaction();
  ScopedTransaction(const ScopedTransaction&) = delete;
  ScopedTransaction& operator=(const ScopedTransaction&) = delete;

  /// Rolls back now and reports failure as StoreError.
  void rollback();

 private:
  Connection& conn_;
  bool finished_ = false;
};

/// Interrupts statements on a connection once a wall-clock budget is spent.
/// Installs a progress handler for its lifetime; timeout_ms <= 0 disables it.
class StatementDeadline {
 public:
  StatementDeadline(Connection& conn, int timeout_ms);
  ~StatementDeadline();
  StatementDeadline(const StatementDeadline&) = delete;
  StatementDeadline& operator=(const StatementDeadline&) = delete;

  bool expired() const { return expired_; }
  int timeout_ms() const { return timeout_ms_; }

 private:
  static int on_progress(void* self);

  Connection& conn_;
  int timeout_ms_;
  std::chrono::steady_clock::time_point deadline_;
  bool expired_ = false;
};

/// Quotes an identifier with double quotes, doubling embedded quotes.
std::string quote_identifier(const std::string& name);

}  // namespace sqlvet::store
