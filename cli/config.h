#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>

#include "sqlvet/sqlvet.h"

namespace sqlvet::cli {

/// One database the CLI can validate against, keyed by its id.
/// Unset optionals inherit the [validator] defaults.
struct DataSourceConfig {
  std::string id;
  std::string path;
  std::optional<Dialect> dialect;
  std::optional<int> timeout_ms;
  std::set<std::string> allowed_tables;
  std::optional<bool> read_only;
  /// True when the source came from scanning data_dir rather than a [sources.<id>] table.
  bool discovered = false;
};

/// Settings read from config.toml.
struct AppConfig {
  Dialect dialect = Dialect::Sqlite;
  int timeout_ms = 5000;
  std::string default_source;
  std::string data_dir;
  std::map<std::string, DataSourceConfig> sources;
};

/// Resolves the config file location.
/// MUST prefer the explicit path, then SQLVET_CONFIG, then XDG_CONFIG_HOME, then HOME.
std::string resolve_config_path(const std::string& explicit_path);
/// Loads a TOML-subset config file into out.
/// MUST return false with an empty error when the file does not exist, and false with
/// a line-numbered error for malformed values.
/// Relative paths inside the file resolve against the file's directory.
bool load_config(const std::string& path, AppConfig& out, std::string& error);
/// Adds every .db/.sqlite/.sqlite3 file under data_dir as a source named by its stem.
/// MUST NOT replace sources declared explicitly in the config file.
bool discover_sources(AppConfig& config, std::string& error);
/// Looks up a source by id; returns nullptr when unknown.
const DataSourceConfig* find_source(const AppConfig& config, const std::string& id);
/// Builds validator settings for a source, applying config defaults.
ValidatorOptions make_validator_options(const AppConfig& config, const DataSourceConfig& source);

}  // namespace sqlvet::cli
