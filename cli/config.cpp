#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

#include "util/string_util.h"

namespace sqlvet::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = util::to_lower(raw);
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

/// Accepts 0 so a config can disable the execution deadline.
bool parse_timeout(const std::string& raw, int& out) {
  if (raw.empty()) return false;
  long long value = 0;
  for (char c : raw) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
    if (value > 2147483647LL) return false;
  }
  out = static_cast<int>(value);
  return true;
}

std::string unquote(const std::string& raw, bool& ok) {
  std::string trimmed = util::trim_ws(raw);
  if (trimmed.empty()) {
    ok = false;
    return {};
  }
  if (trimmed.front() == '"' || trimmed.front() == '\'') {
    if (trimmed.size() < 2 || trimmed.back() != trimmed.front()) {
      ok = false;
      return {};
    }
    ok = true;
    return trimmed.substr(1, trimmed.size() - 2);
  }
  ok = true;
  return trimmed;
}

/// Reads either a TOML array of strings or a comma-separated string.
bool parse_name_list(const std::string& raw, std::set<std::string>& out) {
  std::string body = util::trim_ws(raw);
  if (body.empty()) return false;
  if (body.front() == '[') {
    if (body.back() != ']') return false;
    body = body.substr(1, body.size() - 2);
  } else {
    bool ok = false;
    body = unquote(body, ok);
    if (!ok) return false;
  }
  out.clear();
  size_t start = 0;
  while (start <= body.size()) {
    size_t comma = body.find(',', start);
    std::string item = util::trim_ws(body.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
    if (!item.empty()) {
      bool ok = false;
      std::string name = unquote(item, ok);
      if (!ok || name.empty()) return false;
      out.insert(name);
    }
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return true;
}

std::string expand_user_path(const std::string& raw) {
  if (raw.empty()) return raw;
  if (raw[0] == '~') {
    std::string home = get_env("HOME");
    if (home.empty()) return raw;
    if (raw.size() == 1) return home;
    if (raw[1] == '/') {
      return home + raw.substr(1);
    }
  }
  if (raw.rfind("$HOME/", 0) == 0) {
    std::string home = get_env("HOME");
    if (!home.empty()) {
      return home + raw.substr(5);
    }
  }
  return raw;
}

std::string resolve_relative(const std::string& raw, const std::filesystem::path& base_dir) {
  std::filesystem::path path(expand_user_path(raw));
  if (path.is_relative() && !base_dir.empty()) {
    path = base_dir / path;
  }
  return path.lexically_normal().string();
}

bool is_database_file(const std::filesystem::path& path) {
  std::string ext = util::to_lower(path.extension().string());
  return ext == ".db" || ext == ".sqlite" || ext == ".sqlite3";
}

std::string line_error(const std::string& key, size_t line_no) {
  return "Invalid " + key + " at line " + std::to_string(line_no);
}

}  // namespace

std::string resolve_config_path(const std::string& explicit_path) {
  if (!explicit_path.empty()) {
    return expand_user_path(explicit_path);
  }
  std::string override = get_env("SQLVET_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "sqlvet" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "sqlvet" / "config.toml").string();
  }
  return "sqlvet.config.toml";
}

bool load_config(const std::string& path, AppConfig& out, std::string& error) {
  out = AppConfig{};
  if (path.empty()) return false;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  const std::filesystem::path base_dir = std::filesystem::path(path).parent_path();
  AppConfig parsed;
  std::string section;
  std::string source_id;
  std::map<std::string, size_t> source_lines;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = util::trim_ws(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
      source_id.clear();
      if (section.rfind("sources.", 0) == 0) {
        bool ok = false;
        source_id = unquote(section.substr(8), ok);
        if (!ok || source_id.empty()) {
          error = "Invalid source section at line " + std::to_string(line_no);
          return false;
        }
        auto& source = parsed.sources[source_id];
        source.id = source_id;
        source_lines.emplace(source_id, line_no);
      }
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
      error = "Expected key = value at line " + std::to_string(line_no);
      return false;
    }
    std::string key = util::trim_ws(trimmed.substr(0, eq));
    std::string value = util::trim_ws(trimmed.substr(eq + 1));
    if (key.empty()) continue;
    std::string full_key = section.empty() ? key : section + "." + key;
    bool ok = false;
    if (section == "validator") {
      if (key == "dialect") {
        std::string parsed_value = unquote(value, ok);
        if (!ok || !parse_dialect(parsed_value, parsed.dialect)) {
          error = line_error(full_key, line_no);
          return false;
        }
      } else if (key == "timeout_ms") {
        if (!parse_timeout(value, parsed.timeout_ms)) {
          error = line_error(full_key, line_no);
          return false;
        }
      } else if (key == "default_source") {
        parsed.default_source = unquote(value, ok);
        if (!ok) {
          error = line_error(full_key, line_no);
          return false;
        }
      } else if (key == "data_dir") {
        std::string parsed_value = unquote(value, ok);
        if (!ok) {
          error = line_error(full_key, line_no);
          return false;
        }
        parsed.data_dir = resolve_relative(parsed_value, base_dir);
      }
    } else if (!source_id.empty()) {
      auto& source = parsed.sources[source_id];
      if (key == "path") {
        std::string parsed_value = unquote(value, ok);
        if (!ok || parsed_value.empty()) {
          error = line_error(full_key, line_no);
          return false;
        }
        source.path = resolve_relative(parsed_value, base_dir);
      } else if (key == "dialect") {
        std::string parsed_value = unquote(value, ok);
        Dialect dialect = Dialect::Sqlite;
        if (!ok || !parse_dialect(parsed_value, dialect)) {
          error = line_error(full_key, line_no);
          return false;
        }
        source.dialect = dialect;
      } else if (key == "timeout_ms") {
        int timeout = 0;
        if (!parse_timeout(value, timeout)) {
          error = line_error(full_key, line_no);
          return false;
        }
        source.timeout_ms = timeout;
      } else if (key == "allowed_tables") {
        if (!parse_name_list(value, source.allowed_tables)) {
          error = line_error(full_key, line_no);
          return false;
        }
      } else if (key == "read_only") {
        bool flag = true;
        if (!parse_bool(value, flag)) {
          error = line_error(full_key, line_no);
          return false;
        }
        source.read_only = flag;
      }
    }
  }
  for (const auto& entry : parsed.sources) {
    if (entry.second.path.empty()) {
      error = "Missing path for source '" + entry.first + "' declared at line " +
              std::to_string(source_lines[entry.first]);
      return false;
    }
  }
  out = std::move(parsed);
  return true;
}

bool discover_sources(AppConfig& config, std::string& error) {
  if (config.data_dir.empty()) return true;
  std::error_code ec;
  if (!std::filesystem::is_directory(config.data_dir, ec)) {
    error = "Data directory not found: " + config.data_dir;
    return false;
  }
  std::vector<std::filesystem::path> found;
  for (std::filesystem::directory_iterator it(config.data_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    if (is_database_file(it->path())) {
      found.push_back(it->path());
    }
  }
  if (ec) {
    error = "Failed to scan data directory " + config.data_dir + ": " + ec.message();
    return false;
  }
  std::sort(found.begin(), found.end());
  for (const auto& path : found) {
    std::string id = path.stem().string();
    if (config.sources.count(id) > 0) continue;
    DataSourceConfig source;
    source.id = id;
    source.path = path.string();
    source.discovered = true;
    config.sources.emplace(id, std::move(source));
  }
  return true;
}

const DataSourceConfig* find_source(const AppConfig& config, const std::string& id) {
  auto it = config.sources.find(id);
  if (it == config.sources.end()) return nullptr;
  return &it->second;
}

ValidatorOptions make_validator_options(const AppConfig& config, const DataSourceConfig& source) {
  ValidatorOptions options;
  options.db_path = source.path;
  options.dialect = source.dialect.value_or(config.dialect);
  options.timeout_ms = source.timeout_ms.value_or(config.timeout_ms);
  options.allowed_tables = source.allowed_tables;
  options.read_only = source.read_only.value_or(true);
  return options;
}

}  // namespace sqlvet::cli
