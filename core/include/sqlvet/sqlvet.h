#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace sqlvet {

/// Selects the SQL grammar variant accepted by the parser.
/// MUST match the store being validated against for the execution probe to be meaningful.
enum class Dialect { Sqlite, Postgres, Generic };

/// Returns the lowercase config/CLI spelling of a dialect.
std::string dialect_name(Dialect dialect);
/// Parses a dialect name case-insensitively.
/// MUST return false and leave out untouched for unknown names.
bool parse_dialect(const std::string& raw, Dialect& out);

/// Describes one reflected column for schema listings.
struct ColumnInfo {
  std::string name;
  std::string declared_type;
};

/// Immutable snapshot of the table and column names known to a store.
/// MUST keep the flat column set consistent with table_columns; semantic checks
/// use the flat sets and never qualify a column by its table.
/// Inputs are reflected names; side effects are none once built.
struct SchemaCatalog {
  std::set<std::string> tables;
  std::set<std::string> columns;
  std::map<std::string, std::vector<ColumnInfo>> table_columns;

  /// Registers a table and its columns in every index.
  void add_table(const std::string& name, const std::vector<ColumnInfo>& table_cols);
  /// Looks up a table name ignoring ASCII case.
  bool has_table(const std::string& name) const;
  /// Looks up a column name ignoring ASCII case.
  bool has_column(const std::string& name) const;

 private:
  std::set<std::string> folded_tables_;
  std::set<std::string> folded_columns_;
};

/// Raised when a catalog cannot be reflected from the store.
/// MUST be treated as fatal for validator construction; no partial catalog exists.
class SchemaUnavailable : public std::runtime_error {
 public:
  explicit SchemaUnavailable(const std::string& message) : std::runtime_error(message) {}
};

/// Reflects every base table and column of a SQLite database.
/// MUST open the file read-only and MUST throw SchemaUnavailable on any failure.
/// allowed_tables, when non-empty, restricts the catalog to the listed tables.
SchemaCatalog reflect_schema(const std::string& db_path,
                             const std::set<std::string>& allowed_tables = {});

/// Identifies the pipeline stage that produced a verdict.
enum class Stage { Safety, Semantic, Execution };

/// Returns the display name used in verdict messages ("Safety", ...).
const char* stage_name(Stage stage);

/// Outcome of a single stage: ok plus a human-readable reason.
struct CheckResult {
  bool ok = false;
  std::string reason;
};

/// One stage's result as recorded during a validation run.
struct StageOutcome {
  Stage stage = Stage::Safety;
  CheckResult result;
};

/// Final pass/fail result of one validation run.
/// MUST be fully populated; failing messages read "<Stage> failed: <detail>".
struct Verdict {
  bool passed = false;
  Stage stage = Stage::Safety;
  std::string message;
  /// Stages that ran, in order; the last one decided the verdict.
  std::vector<StageOutcome> stages;
};

/// Names a query references, split by how the semantic check treats them.
struct ReferenceSets {
  std::set<std::string> select_aliases;
  std::set<std::string> cte_names;
  std::set<std::string> cte_columns;
  std::set<std::string> used_tables;
  std::set<std::string> real_columns;
};

/// Parses a query and extracts its reference sets without consulting a catalog.
/// MUST return false with a parse error message when the query cannot be parsed.
bool describe_references(const std::string& sql,
                         Dialect dialect,
                         ReferenceSets& out,
                         std::string& error);

/// Settings for a validator bound to one SQLite database.
struct ValidatorOptions {
  std::string db_path;
  Dialect dialect = Dialect::Sqlite;
  /// Upper bound for the execution probe; 0 disables the deadline.
  int timeout_ms = 5000;
  std::set<std::string> allowed_tables;
  /// Opens probe connections read-only in addition to the rollback guard.
  bool read_only = true;
};

/// Gates untrusted SQL through safety, schema, and rolled-back execution checks.
/// MUST reflect the catalog on construction and MUST throw SchemaUnavailable on failure.
/// validate() is safe to call concurrently; each call opens its own connection.
class Validator {
 public:
  explicit Validator(ValidatorOptions options);

  /// Runs Safety, Semantic, and Execution in order and stops at the first failure.
  /// MUST never throw for bad input; every failure becomes a Verdict.
  Verdict validate(const std::string& sql) const;

  /// Structural statement-kind check with a keyword fallback for unparseable input.
  CheckResult check_safety(const std::string& sql) const;
  /// Cross-checks referenced tables and columns against the current catalog.
  CheckResult check_semantics(const std::string& sql) const;
  /// Executes the statement inside a transaction that is always rolled back.
  CheckResult check_execution(const std::string& sql) const;

  /// Reflects a fresh catalog and swaps it in atomically.
  /// MUST leave the previous catalog in place when reflection throws.
  void refresh_catalog();
  std::shared_ptr<const SchemaCatalog> catalog() const;
  const ValidatorOptions& options() const { return options_; }

 private:
  ValidatorOptions options_;
  mutable std::mutex catalog_mutex_;
  std::shared_ptr<const SchemaCatalog> catalog_;
};

/// Result of executing a query after validation.
struct QueryOutcome {
  Verdict verdict;
  std::vector<std::string> columns;
  /// Cells are rendered as text; SQL NULL becomes "NULL".
  std::vector<std::vector<std::string>> rows;
  bool truncated = false;
};

/// Validates a query and, only when it passes, executes it for real on a read-only connection.
/// MUST NOT touch the store beyond the probe when validation fails.
/// max_rows of 0 fetches every row.
QueryOutcome run_validated_query(const Validator& validator, const std::string& sql, size_t max_rows);

}  // namespace sqlvet
