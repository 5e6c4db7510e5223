#include "test_harness.h"

#include <nlohmann/json.hpp>

#include "cli_utils.h"
#include "render/duckbox_renderer.h"
#include "ui/color.h"

namespace {

sqlvet::Verdict failing_verdict() {
  sqlvet::Verdict verdict;
  verdict.passed = false;
  verdict.stage = sqlvet::Stage::Semantic;
  verdict.message = "Semantic failed: Missing columns: bogus_col";
  verdict.stages.push_back({sqlvet::Stage::Safety, sqlvet::CheckResult{true, "Safe - SELECT only"}});
  verdict.stages.push_back({sqlvet::Stage::Semantic, sqlvet::CheckResult{false, "Missing columns: bogus_col"}});
  return verdict;
}

void test_verdict_json() {
  using nlohmann::json;
  json parsed = json::parse(sqlvet::cli::build_verdict_json(failing_verdict()));
  expect_true(parsed["passed"] == false, "passed flag");
  expect_eq(parsed["stage"].get<std::string>(), "Semantic", "stage name");
  expect_eq(parsed["message"].get<std::string>(), "Semantic failed: Missing columns: bogus_col",
            "message");
  expect_eq(parsed["stages"].size(), 2, "stages that ran");
  expect_eq(parsed["stages"][1]["stage"].get<std::string>(), "Semantic", "deciding stage");
  expect_true(parsed["stages"][1]["ok"] == false, "deciding stage failed");
  expect_eq(parsed["stages"][1]["reason"].get<std::string>(), "Missing columns: bogus_col", "stage reason");
}

void test_references_json() {
  using nlohmann::json;
  sqlvet::ReferenceSets refs;
  refs.used_tables = {"stations", "readings"};
  refs.real_columns = {"city"};
  json parsed = json::parse(sqlvet::cli::build_references_json(refs));
  expect_eq(parsed["used_tables"].size(), 2, "two tables");
  expect_eq(parsed["used_tables"][0].get<std::string>(), "readings", "sorted names");
  expect_true(parsed["cte_names"].is_array() && parsed["cte_names"].empty(), "empty set is []");
}

void test_rows_json() {
  using nlohmann::json;
  sqlvet::QueryOutcome outcome;
  outcome.verdict.passed = true;
  outcome.verdict.stage = sqlvet::Stage::Execution;
  outcome.verdict.message = "All validations passed";
  outcome.columns = {"city", "value"};
  outcome.rows = {{"Denver", "12.5"}, {"Austin", "NULL"}};
  outcome.truncated = true;
  json parsed = json::parse(sqlvet::cli::build_rows_json(outcome));
  expect_true(parsed["verdict"]["passed"] == true, "verdict nested");
  expect_eq(parsed["columns"][1].get<std::string>(), "value", "column order");
  expect_eq(parsed["rows"][1][1].get<std::string>(), "NULL", "cells are text");
  expect_true(parsed["truncated"] == true, "truncation flag");
}

void test_format_verdict() {
  expect_eq(sqlvet::cli::format_verdict(failing_verdict(), false),
            "FAIL [Semantic]: Semantic failed: Missing columns: bogus_col", "failing line");
  sqlvet::Verdict passed;
  passed.passed = true;
  passed.stage = sqlvet::Stage::Execution;
  passed.message = "All validations passed";
  expect_eq(sqlvet::cli::format_verdict(passed, false), "PASS: All validations passed", "passing line");
}

void test_format_references() {
  sqlvet::ReferenceSets refs;
  refs.select_aliases = {"avg_value"};
  refs.used_tables = {"readings"};
  refs.real_columns = {"value", "country"};
  expect_eq(sqlvet::cli::format_references(refs),
            "select_aliases: avg_value\n"
            "cte_names: (none)\n"
            "cte_columns: (none)\n"
            "used_tables: readings\n"
            "real_columns: country, value",
            "reference lines");
}

void test_format_schema() {
  sqlvet::SchemaCatalog catalog;
  expect_eq(sqlvet::cli::format_schema(catalog), "(no tables)", "empty catalog");
  catalog.add_table("stations", {{"id", "INTEGER"}, {"name", ""}});
  catalog.add_table("readings", {{"value", "REAL"}});
  expect_eq(sqlvet::cli::format_schema(catalog),
            "readings\n"
            "  value REAL\n"
            "stations\n"
            "  id INTEGER\n"
            "  name",
            "tables sorted with columns in order");
}

void test_format_sources() {
  sqlvet::cli::AppConfig config;
  expect_eq(sqlvet::cli::format_sources(config), "(no data sources configured)", "no sources");
  config.default_source = "air";
  sqlvet::cli::DataSourceConfig air;
  air.id = "air";
  air.path = "/data/air.db";
  sqlvet::cli::DataSourceConfig archive;
  archive.id = "archive";
  archive.path = "/data/archive.sqlite";
  archive.discovered = true;
  config.sources.emplace(air.id, air);
  config.sources.emplace(archive.id, archive);
  expect_eq(sqlvet::cli::format_sources(config),
            "* air      /data/air.db\n"
            "  archive  /data/archive.sqlite (discovered)",
            "aligned source list");
}

std::string last_line(const std::string& text) {
  size_t pos = text.rfind('\n');
  return pos == std::string::npos ? text : text.substr(pos + 1);
}

void test_duckbox_layout() {
  sqlvet::QueryOutcome outcome;
  outcome.verdict.passed = true;
  outcome.verdict.stage = sqlvet::Stage::Execution;
  outcome.verdict.message = "All validations passed";
  outcome.columns = {"city", "value"};
  outcome.rows = {{"Paris", "20.1"}, {"Denver", "NULL"}};
  sqlvet::render::DuckboxOptions options;
  expect_eq(sqlvet::render::render_duckbox(outcome, options),
            "┌────────┬───────┐\n"
            "│ city   │ value │\n"
            "├────────┼───────┤\n"
            "│ Paris  │  20.1 │\n"
            "│ Denver │ NULL  │\n"
            "└────────┴───────┘\n"
            "2 rows | All validations passed",
            "numbers right-aligned, text left-aligned, verdict in footer");
}

void test_duckbox_row_summary() {
  sqlvet::QueryOutcome outcome;
  outcome.columns = {"id"};
  outcome.rows = {{"1"}, {"2"}, {"3"}};
  sqlvet::render::DuckboxOptions options;
  options.max_rows = 0;
  expect_eq(last_line(sqlvet::render::render_duckbox(outcome, options)), "3 rows", "all rows drawn");
  options.max_rows = 2;
  expect_eq(last_line(sqlvet::render::render_duckbox(outcome, options)), "2 rows shown of 3",
            "renderer cap reported");
  options.max_rows = 0;
  outcome.truncated = true;
  expect_eq(last_line(sqlvet::render::render_duckbox(outcome, options)), "3 rows, more available",
            "fetch cap reported");
  outcome.rows = {{"1"}};
  outcome.truncated = false;
  expect_eq(last_line(sqlvet::render::render_duckbox(outcome, options)), "1 row", "singular");

  sqlvet::QueryOutcome empty;
  expect_eq(sqlvet::render::render_duckbox(empty, options), "(no columns)", "no columns");
}

void test_duckbox_null_and_clipped_cells() {
  using sqlvet::cli::kColor;
  sqlvet::QueryOutcome outcome;
  outcome.columns = {"city"};
  outcome.rows = {{"Reykjavik"}, {"NULL"}};
  sqlvet::render::DuckboxOptions options;
  options.max_cell_width = 5;
  options.color = true;
  std::string out = sqlvet::render::render_duckbox(outcome, options);
  expect_true(out.find("│ Reyk… │") != std::string::npos, "long cell clipped with ellipsis");
  expect_true(out.find(std::string(kColor.dim) + "NULL " + kColor.reset) != std::string::npos,
              "NULL cell dimmed");
  expect_true(out.find(std::string(kColor.bold) + "city " + kColor.reset) != std::string::npos,
              "header bolded");
}

void test_duckbox_failing_verdict() {
  sqlvet::QueryOutcome outcome;
  outcome.verdict = failing_verdict();
  sqlvet::render::DuckboxOptions options;
  expect_eq(sqlvet::render::render_duckbox(outcome, options),
            "No rows: Semantic failed: Missing columns: bogus_col", "rejected query has no table");
}

void test_colorize_json_disabled() {
  std::string json = "{\n  \"passed\": true\n}";
  expect_eq(sqlvet::cli::colorize_json(json, false), json, "disabled coloring is identity");
  expect_true(sqlvet::cli::colorize_json(json, true) != json, "enabled coloring adds escapes");
}

}  // namespace

void register_cli_utils_tests(std::vector<TestCase>& tests) {
  tests.push_back({"cli_utils_verdict_json", test_verdict_json});
  tests.push_back({"cli_utils_references_json", test_references_json});
  tests.push_back({"cli_utils_rows_json", test_rows_json});
  tests.push_back({"cli_utils_format_verdict", test_format_verdict});
  tests.push_back({"cli_utils_format_references", test_format_references});
  tests.push_back({"cli_utils_format_schema", test_format_schema});
  tests.push_back({"cli_utils_format_sources", test_format_sources});
  tests.push_back({"cli_utils_duckbox_layout", test_duckbox_layout});
  tests.push_back({"cli_utils_duckbox_row_summary", test_duckbox_row_summary});
  tests.push_back({"cli_utils_duckbox_null_and_clipped_cells", test_duckbox_null_and_clipped_cells});
  tests.push_back({"cli_utils_duckbox_failing_verdict", test_duckbox_failing_verdict});
  tests.push_back({"cli_utils_colorize_json_disabled", test_colorize_json_disabled});
}
