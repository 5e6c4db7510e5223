#include "cli_utils.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "ui/color.h"

namespace sqlvet::cli {

namespace {

std::string join_set(const std::set<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) out += ", ";
    out += name;
  }
  return out.empty() ? "(none)" : out;
}

nlohmann::json verdict_to_json(const Verdict& verdict) {
  using nlohmann::json;
  json stages = json::array();
  for (const auto& outcome : verdict.stages) {
    stages.push_back({{"stage", stage_name(outcome.stage)},
                      {"ok", outcome.result.ok},
                      {"reason", outcome.result.reason}});
  }
  json out = json::object();
  out["passed"] = verdict.passed;
  out["stage"] = stage_name(verdict.stage);
  out["message"] = verdict.message;
  out["stages"] = stages;
  return out;
}

}  // namespace

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string read_stdin() {
  std::ostringstream buffer;
  buffer << std::cin.rdbuf();
  return buffer.str();
}

std::string colorize_json(const std::string& input, bool enable) {
  if (!enable) return input;
  std::string out;
  out.reserve(input.size() * 2);
  bool in_string = false;
  bool escape = false;
  for (size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
        out += '"';
        out += kColor.reset;
        continue;
      }
      out += c;
      continue;
    }

    if (c == '"') {
      in_string = true;
      out += kColor.green;
      out += '"';
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
      out += kColor.cyan;
      while (i < input.size() &&
             (std::isdigit(static_cast<unsigned char>(input[i])) || input[i] == '.' || input[i] == '-' ||
              input[i] == 'e' || input[i] == 'E' || input[i] == '+')) {
        out += input[i++];
      }
      --i;
      out += kColor.reset;
      continue;
    }

    if (input.compare(i, 4, "true") == 0 || input.compare(i, 5, "false") == 0) {
      size_t len = input.compare(i, 4, "true") == 0 ? 4 : 5;
      out += kColor.yellow;
      out.append(input, i, len);
      out += kColor.reset;
      i += len - 1;
      continue;
    }

    if (input.compare(i, 4, "null") == 0) {
      out += kColor.magenta;
      out.append(input, i, 4);
      out += kColor.reset;
      i += 3;
      continue;
    }

    if (c == '{' || c == '}' || c == '[' || c == ']' || c == ':' || c == ',') {
      out += kColor.dim;
      out += c;
      out += kColor.reset;
      continue;
    }

    out += c;
  }
  return out;
}

std::string build_verdict_json(const Verdict& verdict) {
  return verdict_to_json(verdict).dump(2);
}

std::string build_references_json(const ReferenceSets& refs) {
  using nlohmann::json;
  json out = json::object();
  out["select_aliases"] = refs.select_aliases;
  out["cte_names"] = refs.cte_names;
  out["cte_columns"] = refs.cte_columns;
  out["used_tables"] = refs.used_tables;
  out["real_columns"] = refs.real_columns;
  return out.dump(2);
}

std::string build_schema_json(const SchemaCatalog& catalog) {
  using nlohmann::json;
  json tables = json::object();
  for (const auto& entry : catalog.table_columns) {
    json cols = json::array();
    for (const auto& col : entry.second) {
      cols.push_back({{"name", col.name}, {"type", col.declared_type}});
    }
    tables[entry.first] = cols;
  }
  json out = json::object();
  out["tables"] = tables;
  return out.dump(2);
}

std::string build_rows_json(const QueryOutcome& outcome) {
  using nlohmann::json;
  json rows = json::array();
  for (const auto& row : outcome.rows) {
    rows.push_back(row);
  }
  json out = json::object();
  out["verdict"] = verdict_to_json(outcome.verdict);
  out["columns"] = outcome.columns;
  out["rows"] = rows;
  out["truncated"] = outcome.truncated;
  return out.dump(2);
}

std::string build_sources_json(const AppConfig& config) {
  using nlohmann::json;
  json sources = json::array();
  for (const auto& entry : config.sources) {
    const DataSourceConfig& source = entry.second;
    ValidatorOptions options = make_validator_options(config, source);
    json obj = json::object();
    obj["id"] = source.id;
    obj["path"] = source.path;
    obj["dialect"] = dialect_name(options.dialect);
    obj["timeout_ms"] = options.timeout_ms;
    obj["read_only"] = options.read_only;
    obj["allowed_tables"] = source.allowed_tables;
    obj["discovered"] = source.discovered;
    obj["default"] = source.id == config.default_source;
    sources.push_back(obj);
  }
  return sources.dump(2);
}

std::string format_verdict(const Verdict& verdict, bool color) {
  std::ostringstream oss;
  if (verdict.passed) {
    if (color) oss << kColor.green;
    oss << "PASS";
    if (color) oss << kColor.reset;
    oss << ": " << verdict.message;
  } else {
    if (color) oss << kColor.red;
    oss << "FAIL [" << stage_name(verdict.stage) << "]";
    if (color) oss << kColor.reset;
    oss << ": " << verdict.message;
  }
  return oss.str();
}

std::string format_references(const ReferenceSets& refs) {
  std::ostringstream oss;
  oss << "select_aliases: " << join_set(refs.select_aliases) << "\n";
  oss << "cte_names: " << join_set(refs.cte_names) << "\n";
  oss << "cte_columns: " << join_set(refs.cte_columns) << "\n";
  oss << "used_tables: " << join_set(refs.used_tables) << "\n";
  oss << "real_columns: " << join_set(refs.real_columns);
  return oss.str();
}

std::string format_schema(const SchemaCatalog& catalog) {
  if (catalog.table_columns.empty()) return "(no tables)";
  std::ostringstream oss;
  for (const auto& entry : catalog.table_columns) {
    oss << entry.first << "\n";
    for (const auto& col : entry.second) {
      oss << "  " << col.name;
      if (!col.declared_type.empty()) {
        oss << " " << col.declared_type;
      }
      oss << "\n";
    }
  }
  std::string out = oss.str();
  if (!out.empty() && out.back() == '\n') out.pop_back();
  return out;
}

std::string format_sources(const AppConfig& config) {
  if (config.sources.empty()) return "(no data sources configured)";
  size_t width = 0;
  for (const auto& entry : config.sources) {
    width = std::max(width, entry.first.size());
  }
  std::ostringstream oss;
  bool first = true;
  for (const auto& entry : config.sources) {
    if (!first) oss << "\n";
    first = false;
    const DataSourceConfig& source = entry.second;
    oss << (source.id == config.default_source ? "* " : "  ");
    oss << source.id << std::string(width - source.id.size() + 2, ' ') << source.path;
    if (source.discovered) oss << " (discovered)";
  }
  return oss.str();
}

}  // namespace sqlvet::cli
