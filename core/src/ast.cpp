#include "ast.h"

#include <sstream>

#include "ast_walk.h"

namespace sqlvet {

NodePtr make_node(NodeKind kind, size_t start) {
  auto node = std::make_unique<Node>();
  node->kind = kind;
  node->span = Span{start, start};
  return node;
}

NodePtr make_node(NodeKind kind, std::string name, size_t start) {
  auto node = make_node(kind, start);
  node->name = std::move(name);
  return node;
}

Node& add_child(Node& parent, NodePtr child) {
  child->parent = &parent;
  parent.children.push_back(std::move(child));
  return *parent.children.back();
}

const char* node_kind_name(NodeKind kind) {
  switch (kind) {
    case NodeKind::Select: return "Select";
    case NodeKind::SetOperation: return "SetOperation";
    case NodeKind::With: return "With";
    case NodeKind::Cte: return "Cte";
    case NodeKind::Subquery: return "Subquery";
    case NodeKind::Values: return "Values";
    case NodeKind::DistinctOn: return "DistinctOn";
    case NodeKind::Projections: return "Projections";
    case NodeKind::From: return "From";
    case NodeKind::Join: return "Join";
    case NodeKind::Where: return "Where";
    case NodeKind::GroupBy: return "GroupBy";
    case NodeKind::Having: return "Having";
    case NodeKind::WindowClause: return "WindowClause";
    case NodeKind::OrderBy: return "OrderBy";
    case NodeKind::Ordered: return "Ordered";
    case NodeKind::Limit: return "Limit";
    case NodeKind::Offset: return "Offset";
    case NodeKind::Alias: return "Alias";
    case NodeKind::Column: return "Column";
    case NodeKind::Star: return "Star";
    case NodeKind::Literal: return "Literal";
    case NodeKind::Parameter: return "Parameter";
    case NodeKind::Function: return "Function";
    case NodeKind::Window: return "Window";
    case NodeKind::Filter: return "Filter";
    case NodeKind::Unary: return "Unary";
    case NodeKind::Binary: return "Binary";
    case NodeKind::Between: return "Between";
    case NodeKind::InList: return "InList";
    case NodeKind::Case: return "Case";
    case NodeKind::When: return "When";
    case NodeKind::Cast: return "Cast";
    case NodeKind::Collate: return "Collate";
    case NodeKind::Exists: return "Exists";
    case NodeKind::Tuple: return "Tuple";
    case NodeKind::Table: return "Table";
    case NodeKind::TableFunction: return "TableFunction";
    case NodeKind::Insert: return "Insert";
    case NodeKind::Update: return "Update";
    case NodeKind::Delete: return "Delete";
    case NodeKind::Create: return "Create";
    case NodeKind::Alter: return "Alter";
    case NodeKind::Drop: return "Drop";
    case NodeKind::Truncate: return "Truncate";
    case NodeKind::Rename: return "Rename";
    case NodeKind::Command: return "Command";
    case NodeKind::Assignment: return "Assignment";
    case NodeKind::Returning: return "Returning";
  }
  return "Unknown";
}

const char* statement_kind_name(StatementKind kind) {
  switch (kind) {
    case StatementKind::Select: return "Select";
    case StatementKind::Insert: return "Insert";
    case StatementKind::Update: return "Update";
    case StatementKind::Delete: return "Delete";
    case StatementKind::Create: return "Create";
    case StatementKind::Alter: return "Alter";
    case StatementKind::Drop: return "Drop";
    case StatementKind::Truncate: return "Truncate";
    case StatementKind::Rename: return "Rename";
    case StatementKind::Other: return "Other";
  }
  return "Other";
}

StatementKind classify_statement(const Node& root) {
  struct Probe {
    NodeKind node;
    StatementKind statement;
  };
  static const Probe kMutations[] = {
      {NodeKind::Drop, StatementKind::Drop},
      {NodeKind::Create, StatementKind::Create},
      {NodeKind::Alter, StatementKind::Alter},
      {NodeKind::Truncate, StatementKind::Truncate},
      {NodeKind::Rename, StatementKind::Rename},
      {NodeKind::Delete, StatementKind::Delete},
      {NodeKind::Insert, StatementKind::Insert},
      {NodeKind::Update, StatementKind::Update},
  };
  for (const auto& probe : kMutations) {
    if (find_first(root, probe.node) != nullptr) return probe.statement;
  }
  // Only a bare SELECT root is read-only; compound and parenthesized roots are Other.
  if (root.kind == NodeKind::Select) {
    return StatementKind::Select;
  }
  return StatementKind::Other;
}

namespace {

void dump_node(const Node& node, size_t depth, std::ostringstream& oss) {
  oss << std::string(depth * 2, ' ') << node_kind_name(node.kind);
  if (!node.name.empty()) oss << " name=" << node.name;
  if (!node.qualifier.empty()) oss << " qualifier=" << node.qualifier;
  if (!node.alias.empty()) oss << " alias=" << node.alias;
  if (!node.modifier.empty()) oss << " modifier=" << node.modifier;
  if (!node.column_names.empty()) {
    oss << " columns=(";
    for (size_t i = 0; i < node.column_names.size(); ++i) {
      if (i > 0) oss << ",";
      oss << node.column_names[i];
    }
    oss << ")";
  }
  oss << "\n";
  for (const auto& child : node.children) {
    dump_node(*child, depth + 1, oss);
  }
}

}  // namespace

std::string dump_tree(const Node& root) {
  std::ostringstream oss;
  dump_node(root, 0, oss);
  return oss.str();
}

}  // namespace sqlvet
