#include "test_utils.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <unistd.h>

#include "store/sqlite_store.h"

namespace {

std::string unique_name(const std::string& stem, const std::string& ext) {
  static std::atomic<int> counter{0};
  return "sqlvet_" + stem + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ext;
}

}  // namespace

TempDatabase::TempDatabase(const std::string& stem) {
  path_ = (std::filesystem::temp_directory_path() / unique_name(stem, ".db")).string();
  sqlvet::store::Connection conn(path_, sqlvet::store::OpenMode::ReadWriteCreate);
}

TempDatabase::~TempDatabase() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  std::filesystem::remove(path_ + "-journal", ec);
}

void TempDatabase::exec(const std::string& sql) const {
  sqlvet::store::Connection conn(path_, sqlvet::store::OpenMode::ReadWrite);
  conn.exec(sql);
}

long long TempDatabase::count_rows(const std::string& table) const {
  sqlvet::store::Connection conn(path_, sqlvet::store::OpenMode::ReadOnly);
  sqlvet::store::PreparedStatement stmt(conn, "SELECT COUNT(*) FROM " + sqlvet::store::quote_identifier(table));
  if (!stmt.step()) return -1;
  return stmt.column_int(0);
}

void seed_air_quality(const TempDatabase& db) {
  db.exec(
      "CREATE TABLE readings (id INTEGER PRIMARY KEY, country TEXT, city TEXT, value REAL, "
      "recorded_at TEXT);"
      "CREATE TABLE stations (id INTEGER PRIMARY KEY, name TEXT, country TEXT, active INTEGER);"
      "INSERT INTO readings (country, city, value, recorded_at) VALUES "
      "('US', 'Denver', 12.5, '2024-01-01'), "
      "('US', 'Austin', 8.0, '2024-01-02'), "
      "('FR', 'Paris', 20.1, '2024-01-01');"
      "INSERT INTO stations (name, country, active) VALUES ('north', 'US', 1), ('south', 'FR', 0);");
}

std::string write_temp_file(const std::string& name, const std::string& content) {
  std::filesystem::path path = std::filesystem::temp_directory_path() / unique_name(name, ".tmp");
  std::ofstream out(path, std::ios::binary);
  out << content;
  return path.string();
}

std::string make_temp_dir(const std::string& name) {
  std::filesystem::path path = std::filesystem::temp_directory_path() / unique_name(name, "");
  std::filesystem::create_directories(path);
  return path.string();
}
