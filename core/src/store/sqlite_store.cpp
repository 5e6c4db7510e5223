#include "sqlite_store.h"

#include <cstdio>

namespace sqlvet::store {

namespace {

int open_flags(OpenMode mode) {
  switch (mode) {
    case OpenMode::ReadOnly:
      return SQLITE_OPEN_READONLY;
    case OpenMode::ReadWrite:
      return SQLITE_OPEN_READWRITE;
    case OpenMode::ReadWriteCreate:
      return SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  }
  return SQLITE_OPEN_READONLY;
}

/// Returns true when the remainder of a SQL string holds only whitespace, ';', and comments.
bool only_trivia(const char* p) {
  while (*p != '\0') {
    if (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r' || *p == '\f' || *p == ';') {
      ++p;
    } else if (p[0] == '-' && p[1] == '-') {
      while (*p != '\0' && *p != '\n') ++p;
    } else if (p[0] == '/' && p[1] == '*') {
      p += 2;
      while (*p != '\0' && !(p[0] == '*' && p[1] == '/')) ++p;
      if (*p != '\0') p += 2;
    } else {
      return false;
    }
  }
  return true;
}

}  // namespace

Connection::Connection(const std::string& path, OpenMode mode) {
  int rc = sqlite3_open_v2(path.c_str(), &db_, open_flags(mode), nullptr);
  if (rc != SQLITE_OK) {
    std::string error = "Failed to open database: ";
    error += db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError(rc, error);
  }
}

Connection::~Connection() {
  if (db_) {
    sqlite3_close_v2(db_);
  }
}

void Connection::exec(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string message = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw StoreError(rc, message);
  }
}

void Connection::set_busy_timeout(int timeout_ms) {
  int rc = sqlite3_busy_timeout(db_, timeout_ms > 0 ? timeout_ms : 0);
  if (rc != SQLITE_OK) {
    throw StoreError(rc, last_error());
  }
}

std::string Connection::last_error() const {
  return db_ ? sqlite3_errmsg(db_) : "no connection";
}

PreparedStatement::PreparedStatement(Connection& conn, const std::string& sql) : conn_(conn) {
  const char* tail = nullptr;
  int rc = sqlite3_prepare_v2(conn_.handle(), sql.c_str(), static_cast<int>(sql.size()), &stmt_, &tail);
  if (rc != SQLITE_OK) {
    throw StoreError(rc, conn_.last_error());
  }
  if (stmt_ == nullptr) {
    throw StoreError(SQLITE_MISUSE, "No SQL statement to execute");
  }
  if (tail != nullptr && !only_trivia(tail)) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw StoreError(SQLITE_MISUSE, "You can only execute one statement at a time.");
  }
}

PreparedStatement::~PreparedStatement() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

bool PreparedStatement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw StoreError(rc, conn_.last_error());
}

int PreparedStatement::column_count() const {
  return sqlite3_column_count(stmt_);
}

std::string PreparedStatement::column_name(int index) const {
  const char* name = sqlite3_column_name(stmt_, index);
  return name ? name : "";
}

bool PreparedStatement::column_is_null(int index) const {
  return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

std::string PreparedStatement::column_text(int index) const {
  switch (sqlite3_column_type(stmt_, index)) {
    case SQLITE_NULL:
      return "NULL";
    case SQLITE_BLOB: {
      const auto* bytes = static_cast<const unsigned char*>(sqlite3_column_blob(stmt_, index));
      int size = sqlite3_column_bytes(stmt_, index);
      std::string out = "X'";
      char buf[3];
      for (int i = 0; i < size; ++i) {
        std::snprintf(buf, sizeof(buf), "%02X", bytes[i]);
        out += buf;
      }
      out += "'";
      return out;
    }
    default: {
      // SQLite renders integers and reals itself, matching its own CLI output.
      const unsigned char* text = sqlite3_column_text(stmt_, index);
      return text ? reinterpret_cast<const char*>(text) : "";
    }
  }
}

int PreparedStatement::column_int(int index) const {
  return sqlite3_column_int(stmt_, index);
}

ScopedTransaction::ScopedTransaction(Connection& conn) : conn_(conn) {
  conn_.exec("BEGIN");
}

ScopedTransaction::~ScopedTransaction() {
  if (finished_ || sqlite3_get_autocommit(conn_.handle()) != 0) return;
  // Unwinding: errors have nowhere to go, and closing the connection discards the transaction.
  sqlite3_exec(conn_.handle(), "ROLLBACK", nullptr, nullptr, nullptr);
}

void ScopedTransaction::rollback() {
  if (finished_) return;
  finished_ = true;
  if (sqlite3_get_autocommit(conn_.handle()) != 0) return;
  conn_.exec("ROLLBACK");
}

StatementDeadline::StatementDeadline(Connection& conn, int timeout_ms)
    : conn_(conn), timeout_ms_(timeout_ms) {
  if (timeout_ms_ <= 0) return;
  deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
  sqlite3_progress_handler(conn_.handle(), 1000, &StatementDeadline::on_progress, this);
}

StatementDeadline::~StatementDeadline() {
  if (timeout_ms_ > 0) {
    sqlite3_progress_handler(conn_.handle(), 0, nullptr, nullptr);
  }
}

int StatementDeadline::on_progress(void* self) {
  auto* deadline = static_cast<StatementDeadline*>(self);
  if (std::chrono::steady_clock::now() < deadline->deadline_) return 0;
  deadline->expired_ = true;
  return 1;
}

std::string quote_identifier(const std::string& name) {
  std::string out = "\"";
  for (char c : name) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

}  // namespace sqlvet::store
