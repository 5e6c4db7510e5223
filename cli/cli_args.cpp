#include "cli_args.h"

#include <cctype>
#include <string>

namespace sqlvet::cli {

namespace {

bool parse_count(const std::string& raw, long long& out) {
  if (raw.empty()) return false;
  long long value = 0;
  for (char c : raw) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
    if (value > 2147483647LL) return false;
  }
  out = value;
  return true;
}

/// Splits "--flag=value" forms so both spellings share one code path.
bool split_inline_value(std::string& arg, std::string& value) {
  if (arg.rfind("--", 0) != 0) return false;
  size_t eq = arg.find('=');
  if (eq == std::string::npos) return false;
  value = arg.substr(eq + 1);
  arg = arg.substr(0, eq);
  return true;
}

}  // namespace

void print_startup_help(std::ostream& os) {
  os << "sqlvet - validate untrusted SQL against a SQLite database\n\n";
  os << "Usage:\n";
  os << "  sqlvet --db <path> --query <sql>\n";
  os << "  sqlvet --db <path> --query-file <file>\n";
  os << "  sqlvet --source <id> [--config <path>] --query <sql>\n";
  os << "  sqlvet --db <path> --run --query <sql>\n";
  os << "  sqlvet --db <path> --schema\n";
  os << "  sqlvet --list-sources\n\n";
  os << "Notes:\n";
  os << "  - If neither --query nor --query-file is given, SQL is read from stdin.\n";
  os << "  - Exit status is 0 when the query passed, 1 when it was rejected, 2 on errors.\n";
  os << "  - Validation never changes the database: every probe is rolled back.\n\n";
  os << "Examples:\n";
  os << "  sqlvet --db ./data/air.db --query \"SELECT country FROM readings\"\n";
  os << "  sqlvet --db ./data/air.db --mode json --query \"DROP TABLE readings\"\n";
  os << "  echo \"SELECT city, AVG(value) FROM readings GROUP BY city\" | sqlvet --db ./data/air.db --run\n";
}

void print_help(std::ostream& os) {
  os << "Usage: sqlvet --db <path> --query <sql>\n";
  os << "       sqlvet --db <path> --query-file <file>\n";
  os << "       sqlvet --source <id> [--config <path>]\n";
  os << "       sqlvet --dialect sqlite|postgres|generic\n";
  os << "       sqlvet --timeout-ms <n>\n";
  os << "       sqlvet --mode plain|json\n";
  os << "       sqlvet --run [--max-rows <n>]\n";
  os << "       sqlvet --references\n";
  os << "       sqlvet --schema\n";
  os << "       sqlvet --list-sources\n";
  os << "       sqlvet --verbose\n";
  os << "       sqlvet --color=disabled\n";
  os << "If neither --query nor --query-file is given, SQL is read from stdin.\n";
  os << "The config file defaults to $SQLVET_CONFIG, then $XDG_CONFIG_HOME/sqlvet/config.toml,\n";
  os << "then ~/.config/sqlvet/config.toml.\n";
  os << "--max-rows 0 prints every row.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--color=disabled") {
      parsed.color = false;
      continue;
    }
    std::string inline_value;
    bool has_inline = split_inline_value(arg, inline_value);
    auto take_value = [&](std::string& out) {
      if (has_inline) {
        out = inline_value;
        return true;
      }
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      out = argv[++i];
      return true;
    };
    auto reject_inline = [&]() {
      if (!has_inline) return true;
      error = "Flag " + arg + " does not take a value";
      return false;
    };

    std::string value;
    if (arg == "--db") {
      if (!take_value(parsed.db_path)) return false;
    } else if (arg == "--query") {
      if (!take_value(parsed.query)) return false;
    } else if (arg == "--query-file") {
      if (!take_value(parsed.query_file)) return false;
    } else if (arg == "--source") {
      if (!take_value(parsed.source)) return false;
    } else if (arg == "--config") {
      if (!take_value(parsed.config_path)) return false;
    } else if (arg == "--dialect") {
      if (!take_value(value)) return false;
      Dialect dialect = Dialect::Sqlite;
      if (!parse_dialect(value, dialect)) {
        error = "Invalid --dialect value (use sqlite|postgres|generic)";
        return false;
      }
      parsed.dialect = dialect;
    } else if (arg == "--timeout-ms") {
      if (!take_value(value)) return false;
      long long timeout = 0;
      if (!parse_count(value, timeout)) {
        error = "Invalid --timeout-ms value (use a non-negative integer)";
        return false;
      }
      parsed.timeout_ms = static_cast<int>(timeout);
    } else if (arg == "--mode") {
      if (!take_value(value)) return false;
      if (value != "plain" && value != "json") {
        // WHY: an unknown mode would silently fall back and break scripted consumers.
        error = "Invalid --mode value (use plain|json)";
        return false;
      }
      parsed.output_mode = value;
    } else if (arg == "--max-rows") {
      if (!take_value(value)) return false;
      long long rows = 0;
      if (!parse_count(value, rows)) {
        error = "Invalid --max-rows value (use a non-negative integer)";
        return false;
      }
      parsed.max_rows = static_cast<size_t>(rows);
    } else if (arg == "--run") {
      if (!reject_inline()) return false;
      parsed.run = true;
    } else if (arg == "--references") {
      if (!reject_inline()) return false;
      parsed.references = true;
    } else if (arg == "--schema") {
      if (!reject_inline()) return false;
      parsed.schema = true;
    } else if (arg == "--list-sources") {
      if (!reject_inline()) return false;
      parsed.list_sources = true;
    } else if (arg == "--verbose" || arg == "-v") {
      if (!reject_inline()) return false;
      parsed.verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      if (!reject_inline()) return false;
      parsed.show_help = true;
    } else {
      error = std::string("Unknown argument: ") + argv[i];
      return false;
    }
  }
  if (!parsed.query.empty() && !parsed.query_file.empty()) {
    error = "Use either --query or --query-file, not both";
    return false;
  }
  if (!parsed.db_path.empty() && !parsed.source.empty()) {
    error = "Use either --db or --source, not both";
    return false;
  }
  options = parsed;
  return true;
}

}  // namespace sqlvet::cli
