#include "validator_internal.h"

#include "../ast_walk.h"
#include "../util/string_util.h"

namespace sqlvet::validator_internal {

namespace {

/// Adds the names of aliased projections of one SELECT.
/// MUST only look at the SELECT's own projection list, never at nested queries.
void collect_output_aliases(const Node& select, std::set<std::string>& out) {
  const Node* projections = child_of_kind(select, NodeKind::Projections);
  if (projections == nullptr) return;
  for (const auto& item : projections->children) {
    if (item->kind == NodeKind::Alias) out.insert(item->name);
  }
}

/// Returns the SELECT that names a query's output columns: the query itself, or the
/// leftmost branch of a compound query.
const Node* leading_select(const Node& query) {
  const Node* cur = &query;
  while (cur != nullptr && (cur->kind == NodeKind::SetOperation || cur->kind == NodeKind::Subquery)) {
    const Node* next = nullptr;
    for (const auto& child : cur->children) {
      if (child->kind != NodeKind::With) {
        next = child.get();
        break;
      }
    }
    cur = next;
  }
  if (cur == nullptr || cur->kind != NodeKind::Select) return nullptr;
  return cur;
}

std::set<std::string> fold_names(const std::set<std::string>& names) {
  std::set<std::string> out;
  for (const auto& name : names) {
    out.insert(util::to_lower(name));
  }
  return out;
}

}  // namespace

ReferenceSets collect_references(const Node& root) {
  ReferenceSets refs;
  for (const Node* cte : find_all(root, NodeKind::Cte)) {
    refs.cte_names.insert(cte->name);
    refs.cte_columns.insert(cte->column_names.begin(), cte->column_names.end());
    if (cte->children.empty()) continue;
    const Node* body = leading_select(*cte->children.front());
    if (body != nullptr) collect_output_aliases(*body, refs.cte_columns);
  }

  for (const Node* select : find_all(root, NodeKind::Select)) {
    collect_output_aliases(*select, refs.select_aliases);
  }

  std::set<std::string> local = fold_names(refs.select_aliases);
  for (const auto& name : fold_names(refs.cte_columns)) {
    local.insert(name);
  }
  for (const Node* column : find_all(root, NodeKind::Column)) {
    if (local.count(util::to_lower(column->name)) > 0) continue;
    if (!column->alias.empty()) continue;
    // Anything under an Alias is part of a renamed projection, not a bare read.
    if (find_ancestor(*column, NodeKind::Alias) != nullptr) continue;
    refs.real_columns.insert(column->name);
  }

  std::set<std::string> ctes = fold_names(refs.cte_names);
  for (const Node* table : find_all(root, NodeKind::Table)) {
    if (table->qualifier.empty() && ctes.count(util::to_lower(table->name)) > 0) continue;
    refs.used_tables.insert(table->name);
  }
  return refs;
}

/// Compares reference sets with the catalog using ASCII case-insensitive names.
/// MUST report missing tables before missing columns, each list sorted.
CheckResult check_references(const ReferenceSets& refs, const SchemaCatalog& catalog) {
  std::set<std::string> missing_tables;
  for (const auto& table : refs.used_tables) {
    if (!catalog.has_table(table)) missing_tables.insert(table);
  }
  if (!missing_tables.empty()) {
    return CheckResult{false, "Missing tables: " + util::join_names(missing_tables)};
  }
  std::set<std::string> missing_columns;
  for (const auto& column : refs.real_columns) {
    if (!catalog.has_column(column)) missing_columns.insert(column);
  }
  if (!missing_columns.empty()) {
    return CheckResult{false, "Missing columns: " + util::join_names(missing_columns)};
  }
  return CheckResult{true, "Schema valid"};
}

CheckResult check_semantics(const ParseResult& parsed, const SchemaCatalog& catalog) {
  if (parsed.error.has_value()) {
    return CheckResult{false, "Parse failed: " + parsed.error->message};
  }
  return check_references(collect_references(*parsed.statement->root), catalog);
}

}  // namespace sqlvet::validator_internal
