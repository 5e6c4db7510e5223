#include "test_harness.h"

#include "cli_args.h"

namespace {

bool parse(std::vector<std::string> args, sqlvet::cli::CliOptions& options, std::string& error) {
  args.insert(args.begin(), "sqlvet");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return sqlvet::cli::parse_cli_args(static_cast<int>(argv.size()), argv.data(), options, error);
}

std::string parse_error(const std::vector<std::string>& args) {
  sqlvet::cli::CliOptions options;
  std::string error;
  bool ok = parse(args, options, error);
  expect_true(!ok, "arguments rejected");
  return error;
}

void test_parses_flags() {
  sqlvet::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--db", "air.db", "--query", "SELECT 1", "--dialect", "postgres",
                   "--timeout-ms=250", "--mode", "json", "--run", "--max-rows", "5", "-v"},
                  options, error);
  expect_true(ok, "flags accepted: " + error);
  expect_eq(options.db_path, "air.db", "db path");
  expect_eq(options.query, "SELECT 1", "query");
  expect_true(options.dialect.has_value() && *options.dialect == sqlvet::Dialect::Postgres, "dialect");
  expect_true(options.timeout_ms.has_value() && *options.timeout_ms == 250, "inline timeout");
  expect_eq(options.output_mode, "json", "mode");
  expect_true(options.run, "run");
  expect_eq(options.max_rows, 5, "max rows");
  expect_true(options.verbose, "verbose");
}

void test_defaults() {
  sqlvet::cli::CliOptions options;
  std::string error;
  expect_true(parse({"--source", "air", "--schema"}, options, error), "source flags accepted");
  expect_eq(options.source, "air", "source id");
  expect_true(options.schema, "schema");
  expect_true(!options.dialect.has_value(), "dialect left to config");
  expect_true(!options.timeout_ms.has_value(), "timeout left to config");
  expect_eq(options.output_mode, "plain", "plain by default");
  expect_eq(options.max_rows, 40, "default row cap");
  expect_true(options.color, "color on by default");
}

void test_color_disabled() {
  sqlvet::cli::CliOptions options;
  std::string error;
  expect_true(parse({"--color=disabled", "--list-sources"}, options, error), "accepted");
  expect_true(!options.color, "color off");
  expect_true(options.list_sources, "list sources");
}

void test_rejects_bad_values() {
  expect_eq(parse_error({"--dialect", "oracle"}),
            "Invalid --dialect value (use sqlite|postgres|generic)", "unknown dialect");
  expect_eq(parse_error({"--mode", "csv"}), "Invalid --mode value (use plain|json)", "unknown mode");
  expect_eq(parse_error({"--max-rows", "-1"}),
            "Invalid --max-rows value (use a non-negative integer)", "negative rows");
  expect_eq(parse_error({"--timeout-ms=soon"}),
            "Invalid --timeout-ms value (use a non-negative integer)", "non-numeric timeout");
  expect_eq(parse_error({"--db"}), "Missing value for --db", "missing value");
  expect_eq(parse_error({"--run=yes"}), "Flag --run does not take a value", "value on a switch");
  expect_eq(parse_error({"--bogus"}), "Unknown argument: --bogus", "unknown flag");
}

void test_rejects_conflicts() {
  expect_eq(parse_error({"--query", "SELECT 1", "--query-file", "q.sql"}),
            "Use either --query or --query-file, not both", "two query inputs");
  expect_eq(parse_error({"--db", "a.db", "--source", "air"}),
            "Use either --db or --source, not both", "two databases");
}

void test_failed_parse_leaves_options() {
  sqlvet::cli::CliOptions options;
  options.db_path = "keep.db";
  std::string error;
  expect_true(!parse({"--db", "other.db", "--bogus"}, options, error), "rejected");
  expect_eq(options.db_path, "keep.db", "options untouched on failure");
}

}  // namespace

void register_cli_args_tests(std::vector<TestCase>& tests) {
  tests.push_back({"cli_args_parses_flags", test_parses_flags});
  tests.push_back({"cli_args_defaults", test_defaults});
  tests.push_back({"cli_args_color_disabled", test_color_disabled});
  tests.push_back({"cli_args_rejects_bad_values", test_rejects_bad_values});
  tests.push_back({"cli_args_rejects_conflicts", test_rejects_conflicts});
  tests.push_back({"cli_args_failed_parse_leaves_options", test_failed_parse_leaves_options});
}
