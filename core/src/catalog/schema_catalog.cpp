#include "sqlvet/sqlvet.h"

#include "../util/string_util.h"

namespace sqlvet {

void SchemaCatalog::add_table(const std::string& name, const std::vector<ColumnInfo>& table_cols) {
  tables.insert(name);
  folded_tables_.insert(util::to_lower(name));
  for (const auto& col : table_cols) {
    columns.insert(col.name);
    folded_columns_.insert(util::to_lower(col.name));
  }
  table_columns[name] = table_cols;
}

bool SchemaCatalog::has_table(const std::string& name) const {
  return folded_tables_.count(util::to_lower(name)) > 0;
}

bool SchemaCatalog::has_column(const std::string& name) const {
  return folded_columns_.count(util::to_lower(name)) > 0;
}

}  // namespace sqlvet
