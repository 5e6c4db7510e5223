#include "test_harness.h"

#include <thread>

#include "sqlvet/sqlvet.h"
#include "test_utils.h"

namespace {

sqlvet::ValidatorOptions options_for(const TempDatabase& db) {
  sqlvet::ValidatorOptions options;
  options.db_path = db.path();
  return options;
}

void test_valid_select_passes() {
  TempDatabase db("validator_pass");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  sqlvet::Verdict verdict =
      validator.validate("SELECT country, AVG(value) FROM readings GROUP BY country");
  expect_true(verdict.passed, "aggregate select passes");
  expect_true(verdict.stage == sqlvet::Stage::Execution, "passing verdict reports the last stage");
  expect_eq(verdict.message, "All validations passed", "passing message");
}

void test_drop_fails_at_safety() {
  TempDatabase db("validator_drop");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  sqlvet::Verdict verdict = validator.validate("DROP TABLE readings");
  expect_true(!verdict.passed, "drop rejected");
  expect_true(verdict.stage == sqlvet::Stage::Safety, "rejected by safety");
  expect_eq(verdict.message, "Safety failed: Unsafe: Drop operation detected", "drop message");
  expect_eq(static_cast<size_t>(db.count_rows("readings")), 3, "table still present");
}

void test_unknown_column_fails_at_semantic() {
  TempDatabase db("validator_column");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  sqlvet::Verdict verdict = validator.validate("SELECT bogus_col FROM readings");
  expect_true(!verdict.passed, "unknown column rejected");
  expect_true(verdict.stage == sqlvet::Stage::Semantic, "rejected by semantic");
  expect_eq(verdict.message, "Semantic failed: Missing columns: bogus_col", "column message");

  verdict = validator.validate("SELECT * FROM ghosts");
  expect_eq(verdict.message, "Semantic failed: Missing tables: ghosts", "table message");
}

void test_parse_failure_reaches_semantic() {
  TempDatabase db("validator_parse");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  sqlvet::Verdict verdict = validator.validate("SELECT FROM readings");
  expect_true(verdict.stage == sqlvet::Stage::Semantic, "keyword fallback lets it through safety");
  expect_eq(verdict.message, "Semantic failed: Parse failed: Expected expression", "parse message");

  verdict = validator.validate("SELECT updated_at FROM");
  expect_true(verdict.stage == sqlvet::Stage::Safety, "harmful keyword inside broken input");
  expect_eq(verdict.message, "Safety failed: Unsafe: Harmful keyword detected", "keyword message");
}

void test_runtime_failure_fails_at_execution() {
  TempDatabase db("validator_runtime");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  sqlvet::Verdict verdict = validator.validate("SELECT no_such_fn(value) FROM readings");
  expect_true(verdict.stage == sqlvet::Stage::Execution, "store rejects unknown function");
  expect_eq(verdict.message, "Execution failed: Runtime error: no such function: no_such_fn",
            "runtime message");
}

void test_compound_query_fails_at_safety() {
  TempDatabase db("validator_compound");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  sqlvet::Verdict verdict =
      validator.validate("SELECT country FROM readings UNION SELECT city FROM readings");
  expect_true(!verdict.passed, "compound root rejected");
  expect_eq(verdict.message, "Safety failed: Unsafe: Non-SELECT statement", "compound message");
}

void test_verdict_records_stages() {
  TempDatabase db("validator_stages");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));

  sqlvet::Verdict passed = validator.validate("SELECT city FROM readings");
  expect_eq(passed.stages.size(), 3, "every stage recorded");
  if (passed.stages.size() == 3) {
    expect_true(passed.stages[0].stage == sqlvet::Stage::Safety, "safety first");
    expect_eq(passed.stages[0].result.reason, "Safe - SELECT only", "safety reason");
    expect_eq(passed.stages[1].result.reason, "Schema valid", "semantic reason");
    expect_true(passed.stages[2].stage == sqlvet::Stage::Execution, "execution last");
    expect_eq(passed.stages[2].result.reason, "Executed successfully", "execution reason");
  }

  sqlvet::Verdict semantic = validator.validate("SELECT bogus_col FROM readings");
  expect_eq(semantic.stages.size(), 2, "pipeline stops after semantic");
  if (semantic.stages.size() == 2) {
    expect_true(!semantic.stages[1].result.ok, "deciding stage failed");
    expect_eq(semantic.stages[1].result.reason, "Missing columns: bogus_col", "semantic detail");
  }

  sqlvet::Verdict safety = validator.validate("DROP TABLE readings");
  expect_eq(safety.stages.size(), 1, "pipeline stops after safety");
}

void test_validation_is_repeatable() {
  TempDatabase db("validator_repeat");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  const char* queries[] = {
      "SELECT city FROM readings",
      "DELETE FROM readings",
      "SELECT nope FROM readings",
  };
  for (const char* sql : queries) {
    sqlvet::Verdict first = validator.validate(sql);
    sqlvet::Verdict second = validator.validate(sql);
    expect_true(first.passed == second.passed, std::string("same outcome for ") + sql);
    expect_eq(first.message, second.message, std::string("same message for ") + sql);
  }
  expect_eq(static_cast<size_t>(db.count_rows("readings")), 3, "no rows touched");
}

void test_concurrent_validation() {
  TempDatabase db("validator_threads");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  const size_t kThreads = 4;
  const size_t kRounds = 10;
  std::vector<std::vector<sqlvet::Verdict>> results(kThreads);
  std::vector<std::thread> workers;
  for (size_t t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t]() {
      for (size_t i = 0; i < kRounds; ++i) {
        const char* sql = (i % 2 == 0) ? "SELECT city, value FROM readings WHERE value > 9"
                                       : "UPDATE readings SET value = 0";
        results[t].push_back(validator.validate(sql));
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  for (size_t t = 0; t < kThreads; ++t) {
    expect_eq(results[t].size(), kRounds, "every round produced a verdict");
    for (size_t i = 0; i < results[t].size(); ++i) {
      bool expect_pass = (i % 2 == 0);
      expect_true(results[t][i].passed == expect_pass, "verdict independent of other threads");
    }
  }
}

void test_refresh_catalog_picks_up_new_tables() {
  TempDatabase db("validator_refresh");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  db.exec("CREATE TABLE notes (id INTEGER PRIMARY KEY, label TEXT);");
  sqlvet::Verdict before = validator.validate("SELECT label FROM notes");
  expect_eq(before.message, "Semantic failed: Missing tables: notes", "stale catalog");
  validator.refresh_catalog();
  sqlvet::Verdict after = validator.validate("SELECT label FROM notes");
  expect_true(after.passed, "refreshed catalog knows the new table");
}

void test_allow_list_limits_visible_tables() {
  TempDatabase db("validator_allow");
  seed_air_quality(db);
  sqlvet::ValidatorOptions options = options_for(db);
  options.allowed_tables = {"readings"};
  sqlvet::Validator validator(options);
  sqlvet::Verdict verdict = validator.validate("SELECT name FROM stations");
  expect_eq(verdict.message, "Semantic failed: Missing tables: stations", "hidden table rejected");
}

void test_missing_database_throws() {
  sqlvet::ValidatorOptions options;
  options.db_path = "/nonexistent/sqlvet/nothing.db";
  bool threw = false;
  try {
    sqlvet::Validator validator(options);
  } catch (const sqlvet::SchemaUnavailable&) {
    threw = true;
  }
  expect_true(threw, "construction fails without a catalog");
}

}  // namespace

void register_validator_tests(std::vector<TestCase>& tests) {
  tests.push_back({"validator_valid_select_passes", test_valid_select_passes});
  tests.push_back({"validator_drop_fails_at_safety", test_drop_fails_at_safety});
  tests.push_back({"validator_unknown_column_fails_at_semantic", test_unknown_column_fails_at_semantic});
  tests.push_back({"validator_parse_failure_reaches_semantic", test_parse_failure_reaches_semantic});
  tests.push_back({"validator_runtime_failure_fails_at_execution", test_runtime_failure_fails_at_execution});
  tests.push_back({"validator_compound_query_fails_at_safety", test_compound_query_fails_at_safety});
  tests.push_back({"validator_verdict_records_stages", test_verdict_records_stages});
  tests.push_back({"validator_validation_is_repeatable", test_validation_is_repeatable});
  tests.push_back({"validator_concurrent_validation", test_concurrent_validation});
  tests.push_back({"validator_refresh_catalog_picks_up_new_tables",
                   test_refresh_catalog_picks_up_new_tables});
  tests.push_back({"validator_allow_list_limits_visible_tables", test_allow_list_limits_visible_tables});
  tests.push_back({"validator_missing_database_throws", test_missing_database_throws});
}
