#include "test_harness.h"

#include "sqlvet/sqlvet.h"
#include "test_utils.h"

namespace {

sqlvet::ValidatorOptions options_for(const TempDatabase& db) {
  sqlvet::ValidatorOptions options;
  options.db_path = db.path();
  return options;
}

void test_select_executes() {
  TempDatabase db("exec_select");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  auto res = validator.check_execution("SELECT city FROM readings WHERE value > 10");
  expect_true(res.ok, "select executes");
  expect_eq(res.reason, "Executed successfully", "execution reason");
}

void test_runtime_error_reported() {
  TempDatabase db("exec_error");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  auto res = validator.check_execution("SELECT no_such_column FROM readings");
  expect_true(!res.ok, "store rejects unknown column");
  expect_eq(res.reason, "Runtime error: no such column: no_such_column", "store message kept");
}

void test_write_is_rolled_back() {
  TempDatabase db("exec_rollback");
  seed_air_quality(db);
  sqlvet::ValidatorOptions options = options_for(db);
  options.read_only = false;
  sqlvet::Validator validator(options);
  auto insert = validator.check_execution(
      "INSERT INTO readings (country, city, value) VALUES ('DE', 'Berlin', 5.0)");
  expect_true(insert.ok, "insert probe runs on a writable connection");
  expect_eq(static_cast<size_t>(db.count_rows("readings")), 3, "insert rolled back");
  auto remove = validator.check_execution("DELETE FROM stations");
  expect_true(remove.ok, "delete probe runs");
  expect_eq(static_cast<size_t>(db.count_rows("stations")), 2, "delete rolled back");
}

void test_read_only_connection_refuses_writes() {
  TempDatabase db("exec_readonly");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  auto res = validator.check_execution("DELETE FROM stations");
  expect_true(!res.ok, "read-only probe refuses writes");
  expect_true(res.reason.rfind("Runtime error: ", 0) == 0, "write refusal is a runtime error");
  expect_eq(static_cast<size_t>(db.count_rows("stations")), 2, "rows untouched");
}

void test_failed_probe_leaves_store_usable() {
  TempDatabase db("exec_reuse");
  seed_air_quality(db);
  sqlvet::ValidatorOptions options = options_for(db);
  options.read_only = false;
  sqlvet::Validator validator(options);
  auto bad = validator.check_execution("INSERT INTO readings (nope) VALUES (1)");
  expect_true(!bad.ok, "bad insert fails");
  auto good = validator.check_execution("INSERT INTO readings (country) VALUES ('IT')");
  expect_true(good.ok, "next probe begins a fresh transaction");
  expect_eq(static_cast<size_t>(db.count_rows("readings")), 3, "no rows persisted");
}

void test_timeout_interrupts_runaway_query() {
  TempDatabase db("exec_timeout");
  seed_air_quality(db);
  sqlvet::ValidatorOptions options = options_for(db);
  options.timeout_ms = 100;
  sqlvet::Validator validator(options);
  auto res = validator.check_execution(
      "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) SELECT COUNT(*) FROM c");
  expect_true(!res.ok, "runaway recursive CTE interrupted");
  expect_eq(res.reason, "Runtime error: interrupted (exceeded 100 ms timeout)", "timeout message");
}

void test_multiple_statements_rejected() {
  TempDatabase db("exec_multi");
  seed_air_quality(db);
  sqlvet::Validator validator(options_for(db));
  auto res = validator.check_execution("SELECT 1; SELECT 2");
  expect_true(!res.ok, "second statement rejected by the store layer");
  expect_eq(res.reason, "Runtime error: You can only execute one statement at a time.",
            "multi statement message");
  auto trailing = validator.check_execution("SELECT 1; -- done\n");
  expect_true(trailing.ok, "trailing semicolon and comment allowed");
}

}  // namespace

void register_execution_tests(std::vector<TestCase>& tests) {
  tests.push_back({"execution_select_executes", test_select_executes});
  tests.push_back({"execution_runtime_error_reported", test_runtime_error_reported});
  tests.push_back({"execution_write_is_rolled_back", test_write_is_rolled_back});
  tests.push_back({"execution_read_only_connection_refuses_writes",
                   test_read_only_connection_refuses_writes});
  tests.push_back({"execution_failed_probe_leaves_store_usable", test_failed_probe_leaves_store_usable});
  tests.push_back({"execution_timeout_interrupts_runaway_query", test_timeout_interrupts_runaway_query});
  tests.push_back({"execution_multiple_statements_rejected", test_multiple_statements_rejected});
}
