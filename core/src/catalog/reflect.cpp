#include "sqlvet/sqlvet.h"

#include <vector>

#include "../store/sqlite_store.h"
#include "../util/string_util.h"

namespace sqlvet {

namespace {

std::vector<std::string> list_tables(store::Connection& conn) {
  std::vector<std::string> names;
  store::PreparedStatement stmt(
      conn,
      "SELECT name FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%' "
      "ORDER BY name");
  while (stmt.step()) {
    names.push_back(stmt.column_text(0));
  }
  return names;
}

std::vector<ColumnInfo> list_columns(store::Connection& conn, const std::string& table) {
  std::vector<ColumnInfo> cols;
  store::PreparedStatement stmt(conn, "PRAGMA table_info(" + store::quote_identifier(table) + ")");
  // table_info rows: cid, name, type, notnull, dflt_value, pk
  while (stmt.step()) {
    ColumnInfo col;
    col.name = stmt.column_text(1);
    col.declared_type = stmt.column_is_null(2) ? "" : stmt.column_text(2);
    cols.push_back(col);
  }
  return cols;
}

}  // namespace

/// Reflects base tables and their columns from a read-only connection.
/// MUST return a complete catalog or throw SchemaUnavailable; partial results never escape.
SchemaCatalog reflect_schema(const std::string& db_path, const std::set<std::string>& allowed_tables) {
  std::set<std::string> allowed;
  for (const auto& name : allowed_tables) {
    allowed.insert(util::to_lower(name));
  }
  try {
    store::Connection conn(db_path, store::OpenMode::ReadOnly);
    SchemaCatalog catalog;
    for (const auto& table : list_tables(conn)) {
      if (!allowed.empty() && allowed.count(util::to_lower(table)) == 0) continue;
      catalog.add_table(table, list_columns(conn, table));
    }
    return catalog;
  } catch (const store::StoreError& e) {
    std::string message = e.what();
    if (message.rfind("Failed to open database", 0) != 0) {
      message = "Schema reflection failed: " + message;
    }
    throw SchemaUnavailable(message);
  }
}

}  // namespace sqlvet
