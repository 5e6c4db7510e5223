#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

#include <unistd.h>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "render/duckbox_renderer.h"
#include "sqlvet/sqlvet.h"
#include "ui/color.h"

namespace {

using sqlvet::cli::kColor;

constexpr int kExitPassed = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage = 2;

void print_error(const std::string& message, bool color) {
  if (color) std::cerr << kColor.red;
  std::cerr << "Error: " << message;
  if (color) std::cerr << kColor.reset;
  std::cerr << std::endl;
}

void log_verbose(bool enabled, bool color, const std::string& tag, const std::string& message) {
  if (!enabled) return;
  if (color) std::cerr << kColor.dim;
  std::cerr << "[" << tag << "] " << message;
  if (color) std::cerr << kColor.reset;
  std::cerr << std::endl;
}

const char* stage_tag(sqlvet::Stage stage) {
  switch (stage) {
    case sqlvet::Stage::Safety: return "safety";
    case sqlvet::Stage::Semantic: return "semantic";
    case sqlvet::Stage::Execution: return "execution";
  }
  return "safety";
}

/// Prints one line per stage the verdict recorded, in pipeline order.
void log_stages(const sqlvet::Verdict& verdict, bool enabled, bool color) {
  for (const auto& outcome : verdict.stages) {
    log_verbose(enabled, color, stage_tag(outcome.stage),
                std::string(outcome.result.ok ? "ok: " : "failed: ") + outcome.result.reason);
  }
}

void print_json(const std::string& json, bool color) {
  std::cout << sqlvet::cli::colorize_json(json, color) << std::endl;
}

/// Picks the database from --db, --source, or the configured default source.
/// MUST apply CLI overrides last so flags beat config values.
bool resolve_validator_options(const sqlvet::cli::CliOptions& options,
                               const sqlvet::cli::AppConfig& config,
                               sqlvet::ValidatorOptions& out,
                               std::string& error) {
  if (!options.db_path.empty()) {
    out = sqlvet::ValidatorOptions{};
    out.db_path = options.db_path;
    out.dialect = config.dialect;
    out.timeout_ms = config.timeout_ms;
  } else {
    std::string id = options.source.empty() ? config.default_source : options.source;
    if (id.empty()) {
      error = "No database given (use --db <path> or --source <id>)";
      return false;
    }
    const sqlvet::cli::DataSourceConfig* source = sqlvet::cli::find_source(config, id);
    if (source == nullptr) {
      error = "Unknown source: " + id;
      return false;
    }
    out = sqlvet::cli::make_validator_options(config, *source);
  }
  if (options.dialect.has_value()) {
    out.dialect = *options.dialect;
  }
  if (options.timeout_ms.has_value()) {
    out.timeout_ms = *options.timeout_ms;
  }
  return true;
}

std::string load_query(const sqlvet::cli::CliOptions& options) {
  if (!options.query.empty()) return options.query;
  if (!options.query_file.empty()) return sqlvet::cli::read_file(options.query_file);
  return sqlvet::cli::read_stdin();
}

}  // namespace

int main(int argc, char** argv) {
  using namespace sqlvet::cli;

  if (argc == 1) {
    print_startup_help(std::cout);
    return kExitPassed;
  }

  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    print_error(arg_error, isatty(fileno(stderr)) != 0);
    print_help(std::cerr);
    return kExitUsage;
  }
  if (options.show_help) {
    print_help(std::cout);
    return kExitPassed;
  }
  if (!isatty(fileno(stdout))) {
    options.color = false;
  }
  const bool json_mode = options.output_mode == "json";

  try {
    AppConfig config;
    std::string config_error;
    std::string config_path = resolve_config_path(options.config_path);
    bool loaded = load_config(config_path, config, config_error);
    if (!loaded && !config_error.empty()) {
      print_error(config_error, options.color);
      return kExitUsage;
    }
    if (!loaded && !options.config_path.empty()) {
      print_error("Config file not found: " + config_path, options.color);
      return kExitUsage;
    }
    log_verbose(options.verbose, options.color, "config",
                loaded ? "loaded " + config_path : "no config at " + config_path);
    if (!discover_sources(config, config_error)) {
      print_error(config_error, options.color);
      return kExitUsage;
    }

    if (options.list_sources) {
      if (json_mode) {
        print_json(build_sources_json(config), options.color);
      } else {
        std::cout << format_sources(config) << std::endl;
      }
      return kExitPassed;
    }

    sqlvet::ValidatorOptions validator_options;
    std::string resolve_error;
    if (!resolve_validator_options(options, config, validator_options, resolve_error)) {
      print_error(resolve_error, options.color);
      return kExitUsage;
    }
    log_verbose(options.verbose, options.color, "source",
                validator_options.db_path + " (dialect " + sqlvet::dialect_name(validator_options.dialect) +
                    ", timeout " + std::to_string(validator_options.timeout_ms) + " ms" +
                    (validator_options.read_only ? ", read-only" : "") + ")");

    if (options.references) {
      std::string sql = load_query(options);
      sqlvet::ReferenceSets refs;
      std::string parse_error;
      if (!sqlvet::describe_references(sql, validator_options.dialect, refs, parse_error)) {
        print_error("Parse failed: " + parse_error, options.color);
        return kExitRejected;
      }
      if (json_mode) {
        print_json(build_references_json(refs), options.color);
      } else {
        std::cout << format_references(refs) << std::endl;
      }
      return kExitPassed;
    }

    sqlvet::Validator validator(validator_options);
    log_verbose(options.verbose, options.color, "catalog",
                "reflected " + std::to_string(validator.catalog()->tables.size()) + " table(s)");

    if (options.schema) {
      auto catalog = validator.catalog();
      if (json_mode) {
        print_json(build_schema_json(*catalog), options.color);
      } else {
        std::cout << format_schema(*catalog) << std::endl;
      }
      return kExitPassed;
    }

    std::string sql = load_query(options);

    if (options.run) {
      sqlvet::QueryOutcome outcome = sqlvet::run_validated_query(validator, sql, options.max_rows);
      log_stages(outcome.verdict, options.verbose, options.color);
      if (json_mode) {
        print_json(build_rows_json(outcome), options.color);
      } else if (outcome.verdict.passed) {
        sqlvet::render::DuckboxOptions render_options;
        render_options.max_rows = options.max_rows;
        render_options.color = options.color;
        std::cout << sqlvet::render::render_duckbox(outcome, render_options) << std::endl;
      } else {
        std::cout << format_verdict(outcome.verdict, options.color) << std::endl;
      }
      return outcome.verdict.passed ? kExitPassed : kExitRejected;
    }

    sqlvet::Verdict verdict = validator.validate(sql);
    log_stages(verdict, options.verbose, options.color);
    if (json_mode) {
      print_json(build_verdict_json(verdict), options.color);
    } else {
      std::cout << format_verdict(verdict, options.color) << std::endl;
    }
    return verdict.passed ? kExitPassed : kExitRejected;
  } catch (const std::exception& ex) {
    print_error(ex.what(), options.color);
    return kExitUsage;
  }
}
