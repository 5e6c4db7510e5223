#include "validator_internal.h"

#include "../store/sqlite_store.h"

namespace sqlvet::validator_internal {

std::string timeout_message(int timeout_ms) {
  return "interrupted (exceeded " + std::to_string(timeout_ms) + " ms timeout)";
}

/// Probes a statement against the live store without keeping any effect.
/// MUST roll back on success, on store errors, and on timeouts alike.
/// Inputs are SQL and validator options; side effects are confined to the rolled-back transaction.
CheckResult check_execution(const std::string& sql, const ValidatorOptions& options) {
  try {
    store::Connection conn(options.db_path,
                           options.read_only ? store::OpenMode::ReadOnly : store::OpenMode::ReadWrite);
    conn.set_busy_timeout(options.timeout_ms);
    store::ScopedTransaction txn(conn);
    {
      store::StatementDeadline deadline(conn, options.timeout_ms);
      try {
        store::PreparedStatement stmt(conn, sql);
        while (stmt.step()) {
        }
      } catch (const store::StoreError& e) {
        if (!deadline.expired()) throw;
        throw store::StoreError(e.code(), timeout_message(options.timeout_ms));
      }
    }
    txn.rollback();
    return CheckResult{true, "Executed successfully"};
  } catch (const store::StoreError& e) {
    return CheckResult{false, std::string("Runtime error: ") + e.what()};
  }
}

}  // namespace sqlvet::validator_internal
