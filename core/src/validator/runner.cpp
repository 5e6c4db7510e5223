#include "sqlvet/sqlvet.h"

#include "../store/sqlite_store.h"
#include "validator_internal.h"

namespace sqlvet {

/// Executes a query for real once it has passed validation.
/// MUST use a read-only connection and MUST return no rows for a failing verdict.
/// Inputs are validator/SQL/row cap; outputs are QueryOutcome with store read side effects.
QueryOutcome run_validated_query(const Validator& validator, const std::string& sql, size_t max_rows) {
  QueryOutcome outcome;
  outcome.verdict = validator.validate(sql);
  if (!outcome.verdict.passed) return outcome;

  const ValidatorOptions& options = validator.options();
  try {
    store::Connection conn(options.db_path, store::OpenMode::ReadOnly);
    conn.set_busy_timeout(options.timeout_ms);
    store::StatementDeadline deadline(conn, options.timeout_ms);
    try {
      store::PreparedStatement stmt(conn, sql);
      for (int i = 0; i < stmt.column_count(); ++i) {
        outcome.columns.push_back(stmt.column_name(i));
      }
      while (stmt.step()) {
        if (max_rows > 0 && outcome.rows.size() >= max_rows) {
          outcome.truncated = true;
          break;
        }
        std::vector<std::string> row;
        row.reserve(outcome.columns.size());
        for (int i = 0; i < stmt.column_count(); ++i) {
          row.push_back(stmt.column_text(i));
        }
        outcome.rows.push_back(std::move(row));
      }
    } catch (const store::StoreError& e) {
      if (!deadline.expired()) throw;
      throw store::StoreError(e.code(), validator_internal::timeout_message(options.timeout_ms));
    }
  } catch (const store::StoreError& e) {
    outcome.verdict.passed = false;
    outcome.verdict.stage = Stage::Execution;
    outcome.verdict.message = std::string("Execution failed: Runtime error: ") + e.what();
    outcome.verdict.stages.push_back(
        {Stage::Execution, CheckResult{false, std::string("Runtime error: ") + e.what()}});
    outcome.columns.clear();
    outcome.rows.clear();
    outcome.truncated = false;
  }
  return outcome;
}

}  // namespace sqlvet
