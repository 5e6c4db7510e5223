#include "sqlvet/sqlvet.h"

#include <exception>
#include <utility>

#include "../util/string_util.h"
#include "validator_internal.h"

namespace sqlvet {

namespace {

/// Runs a stage and converts any escaping exception into a failing result.
/// MUST keep validate() total: no exception leaves the pipeline.
template <typename Fn>
CheckResult guarded(const char* prefix, Fn&& stage) {
  try {
    return stage();
  } catch (const std::exception& e) {
    return CheckResult{false, std::string(prefix) + e.what()};
  }
}

Verdict failed(Stage stage, const std::string& reason, std::vector<StageOutcome> stages) {
  Verdict verdict;
  verdict.passed = false;
  verdict.stage = stage;
  verdict.message = std::string(stage_name(stage)) + " failed: " + reason;
  verdict.stages = std::move(stages);
  return verdict;
}

}  // namespace

std::string dialect_name(Dialect dialect) {
  switch (dialect) {
    case Dialect::Sqlite: return "sqlite";
    case Dialect::Postgres: return "postgres";
    case Dialect::Generic: return "generic";
  }
  return "sqlite";
}

bool parse_dialect(const std::string& raw, Dialect& out) {
  std::string value = util::to_lower(util::trim_ws(raw));
  if (value == "sqlite" || value == "sqlite3") {
    out = Dialect::Sqlite;
    return true;
  }
  if (value == "postgres" || value == "postgresql") {
    out = Dialect::Postgres;
    return true;
  }
  if (value == "generic" || value == "ansi") {
    out = Dialect::Generic;
    return true;
  }
  return false;
}

const char* stage_name(Stage stage) {
  switch (stage) {
    case Stage::Safety: return "Safety";
    case Stage::Semantic: return "Semantic";
    case Stage::Execution: return "Execution";
  }
  return "Safety";
}

Validator::Validator(ValidatorOptions options) : options_(std::move(options)) {
  catalog_ = std::make_shared<const SchemaCatalog>(
      reflect_schema(options_.db_path, options_.allowed_tables));
}

/// Runs the three stages in order over a single parse of the input.
/// MUST stop at the first failing stage; later stages never touch the store.
Verdict Validator::validate(const std::string& sql) const {
  ParseResult parsed = parse_sql(sql, options_.dialect);
  std::vector<StageOutcome> stages;

  CheckResult safety = guarded("Safety error: ", [&]() {
    return validator_internal::check_safety(parsed, sql);
  });
  stages.push_back({Stage::Safety, safety});
  if (!safety.ok) return failed(Stage::Safety, safety.reason, std::move(stages));

  std::shared_ptr<const SchemaCatalog> snapshot = catalog();
  CheckResult semantic = guarded("Semantic error: ", [&]() {
    return validator_internal::check_semantics(parsed, *snapshot);
  });
  stages.push_back({Stage::Semantic, semantic});
  if (!semantic.ok) return failed(Stage::Semantic, semantic.reason, std::move(stages));

  CheckResult execution = guarded("Runtime error: ", [&]() {
    return validator_internal::check_execution(sql, options_);
  });
  stages.push_back({Stage::Execution, execution});
  if (!execution.ok) return failed(Stage::Execution, execution.reason, std::move(stages));

  Verdict verdict;
  verdict.passed = true;
  verdict.stage = Stage::Execution;
  verdict.message = "All validations passed";
  verdict.stages = std::move(stages);
  return verdict;
}

CheckResult Validator::check_safety(const std::string& sql) const {
  return guarded("Safety error: ", [&]() {
    return validator_internal::check_safety(parse_sql(sql, options_.dialect), sql);
  });
}

CheckResult Validator::check_semantics(const std::string& sql) const {
  std::shared_ptr<const SchemaCatalog> snapshot = catalog();
  return guarded("Semantic error: ", [&]() {
    return validator_internal::check_semantics(parse_sql(sql, options_.dialect), *snapshot);
  });
}

CheckResult Validator::check_execution(const std::string& sql) const {
  return guarded("Runtime error: ", [&]() {
    return validator_internal::check_execution(sql, options_);
  });
}

void Validator::refresh_catalog() {
  // Reflect outside the lock; a failure leaves the current snapshot untouched.
  auto fresh = std::make_shared<const SchemaCatalog>(
      reflect_schema(options_.db_path, options_.allowed_tables));
  std::lock_guard<std::mutex> lock(catalog_mutex_);
  catalog_ = std::move(fresh);
}

std::shared_ptr<const SchemaCatalog> Validator::catalog() const {
  std::lock_guard<std::mutex> lock(catalog_mutex_);
  return catalog_;
}

bool describe_references(const std::string& sql, Dialect dialect, ReferenceSets& out,
                         std::string& error) {
  ParseResult parsed = parse_sql(sql, dialect);
  if (parsed.error.has_value()) {
    error = parsed.error->message;
    return false;
  }
  out = validator_internal::collect_references(*parsed.statement->root);
  return true;
}

}  // namespace sqlvet
