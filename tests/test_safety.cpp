#include "test_harness.h"

#include "validator/validator_internal.h"

namespace {

sqlvet::CheckResult safety(const std::string& sql) {
  return sqlvet::validator_internal::check_safety(sqlvet::parse_sql(sql, sqlvet::Dialect::Sqlite), sql);
}

void test_select_is_safe() {
  auto res = safety("SELECT country, AVG(value) AS avg_value FROM readings GROUP BY country");
  expect_true(res.ok, "aggregate select is safe");
  expect_eq(res.reason, "Safe - SELECT only", "select reason");
  expect_true(safety("WITH c AS (SELECT 1 AS x) SELECT x FROM c").ok, "CTE select is safe");
}

void test_compound_root_is_not_select() {
  const char* compounds[] = {
      "SELECT country FROM readings UNION SELECT city FROM readings",
      "SELECT a FROM t UNION ALL SELECT b FROM u",
      "SELECT a FROM t EXCEPT SELECT b FROM u",
  };
  for (const char* sql : compounds) {
    auto res = safety(sql);
    expect_true(!res.ok, std::string("compound root rejected: ") + sql);
    expect_eq(res.reason, "Unsafe: Non-SELECT statement", std::string("compound reason: ") + sql);
  }
  expect_true(safety("SELECT x FROM (SELECT a AS x FROM t UNION SELECT b FROM u)").ok,
              "compound subquery under a SELECT root is safe");
}

void test_mutations_name_their_kind() {
  struct Case {
    const char* sql;
    const char* reason;
  };
  const Case cases[] = {
      {"DROP TABLE readings", "Unsafe: Drop operation detected"},
      {"CREATE TABLE x (a INT)", "Unsafe: Create operation detected"},
      {"ALTER TABLE readings ADD COLUMN x INT", "Unsafe: Alter operation detected"},
      {"TRUNCATE TABLE readings", "Unsafe: Truncate operation detected"},
      {"RENAME TABLE readings TO r2", "Unsafe: Rename operation detected"},
      {"DELETE FROM readings", "Unsafe: Delete operation detected"},
      {"INSERT INTO readings (country) VALUES ('US')", "Unsafe: Insert operation detected"},
      {"UPDATE readings SET value = 0", "Unsafe: Update operation detected"},
  };
  for (const auto& c : cases) {
    auto res = safety(c.sql);
    expect_true(!res.ok, std::string("rejects ") + c.sql);
    expect_eq(res.reason, c.reason, c.sql);
  }
}

void test_nested_mutation_is_found() {
  auto res = safety("WITH gone AS (DELETE FROM readings RETURNING *) SELECT * FROM gone");
  expect_true(!res.ok, "delete inside CTE rejected");
  expect_eq(res.reason, "Unsafe: Delete operation detected", "nested delete reason");
}

void test_non_select_commands() {
  auto pragma = safety("PRAGMA table_info(readings)");
  expect_true(!pragma.ok, "pragma rejected");
  expect_eq(pragma.reason, "Unsafe: Non-SELECT statement", "pragma reason");
  auto attach = safety("ATTACH DATABASE 'other.db' AS other");
  expect_eq(attach.reason, "Unsafe: Non-SELECT statement", "attach reason");
  auto values = safety("VALUES (1)");
  expect_eq(values.reason, "Unsafe: Non-SELECT statement", "bare VALUES reason");
}

void test_empty_input() {
  auto res = safety("");
  expect_true(!res.ok, "empty input rejected");
  expect_eq(res.reason, "Unsafe: Parse failed - empty result", "empty reason");
  expect_eq(safety("  ;\n-- only a comment").reason, "Unsafe: Parse failed - empty result",
            "comment-only input reason");
}

void test_keyword_fallback() {
  auto harmful = safety("SELECT 1; drop table readings");
  expect_true(!harmful.ok, "second statement with DROP rejected");
  expect_eq(harmful.reason, "Unsafe: Harmful keyword detected", "fallback harmful reason");

  auto clean = safety("SELECT FROM WHERE");
  expect_true(clean.ok, "unparseable text without keywords passes provisionally");
  expect_eq(clean.reason, "Safe - Keyword check passed", "fallback pass reason");

  // Substring match: an identifier containing a keyword trips the fallback.
  auto substring = safety("SELECT updated_at FROM");
  expect_true(!substring.ok, "fallback matches substrings");

  auto parsed = safety("SELECT updated_at FROM readings");
  expect_true(parsed.ok, "parsed queries are not keyword scanned");
}

}  // namespace

void register_safety_tests(std::vector<TestCase>& tests) {
  tests.push_back({"safety_select_is_safe", test_select_is_safe});
  tests.push_back({"safety_compound_root_is_not_select", test_compound_root_is_not_select});
  tests.push_back({"safety_mutations_name_their_kind", test_mutations_name_their_kind});
  tests.push_back({"safety_nested_mutation_is_found", test_nested_mutation_is_found});
  tests.push_back({"safety_non_select_commands", test_non_select_commands});
  tests.push_back({"safety_empty_input", test_empty_input});
  tests.push_back({"safety_keyword_fallback", test_keyword_fallback});
}
