#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

#include "sqlvet/sqlvet.h"

namespace sqlvet::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// MUST keep defaults consistent with CLI behavior and MUST validate after parsing.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string db_path;
  std::string query;
  std::string query_file;
  std::string source;
  std::string config_path;
  /// Unset values fall back to the data source, then the [validator] defaults.
  std::optional<Dialect> dialect;
  std::optional<int> timeout_ms;
  std::string output_mode = "plain";
  bool run = false;
  size_t max_rows = 40;
  bool references = false;
  bool schema = false;
  bool list_sources = false;
  bool color = true;
  bool verbose = false;
  bool show_help = false;
};

/// Prints the brief startup help shown when no arguments are provided.
/// MUST remain user-facing and MUST not throw on stream failures.
void print_startup_help(std::ostream& os);
/// Prints the full help text for explicit --help.
/// MUST remain accurate to supported flags and MUST not throw on stream failures.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on unknown flags, missing values, unknown dialects or modes,
/// and non-numeric counts.
/// Inputs are argc/argv; outputs are options/error with no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace sqlvet::cli
