#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace sqlvet {

struct Span {
  size_t start = 0;
  size_t end = 0;
};

/// Tags every AST node; traversals select nodes by kind.
/// MUST stay in sync with node_kind_name() for debug dumps.
enum class NodeKind {
  // Queries
  Select,
  SetOperation,
  With,
  Cte,
  Subquery,
  Values,
  // Query clauses
  DistinctOn,
  Projections,
  From,
  Join,
  Where,
  GroupBy,
  Having,
  WindowClause,
  OrderBy,
  Ordered,
  Limit,
  Offset,
  // Expressions
  Alias,
  Column,
  Star,
  Literal,
  Parameter,
  Function,
  Window,
  Filter,
  Unary,
  Binary,
  Between,
  InList,
  Case,
  When,
  Cast,
  Collate,
  Exists,
  Tuple,
  // Relations
  Table,
  TableFunction,
  // Statements
  Insert,
  Update,
  Delete,
  Create,
  Alter,
  Drop,
  Truncate,
  Rename,
  Command,
  Assignment,
  Returning
};

struct Node;
using NodePtr = std::unique_ptr<Node>;

/// A single AST node. The payload fields are interpreted per kind:
///   name        identifier, alias name, function/operator/type name, literal text,
///               set operator, or the object kind of DDL (TABLE, VIEW, ...)
///   qualifier   table qualifier of Column/Star, schema of Table
///   alias       relation alias of Table/Subquery/TableFunction
///   modifier    DISTINCT/ALL, RECURSIVE, ASC/DESC, NOT, join type details
///   column_names  CTE column list, INSERT target columns, JOIN USING list
/// Nodes are heap-allocated and never moved by value so parent links stay valid.
struct Node {
  NodeKind kind = NodeKind::Literal;
  std::string name;
  std::string qualifier;
  std::string alias;
  std::string modifier;
  std::vector<std::string> column_names;
  std::vector<NodePtr> children;
  Node* parent = nullptr;
  Span span;
};

NodePtr make_node(NodeKind kind, size_t start);
NodePtr make_node(NodeKind kind, std::string name, size_t start);
/// Appends child to parent and links child->parent.
Node& add_child(Node& parent, NodePtr child);

const char* node_kind_name(NodeKind kind);

/// Structural classification of a parsed statement.
enum class StatementKind {
  Select,
  Insert,
  Update,
  Delete,
  Create,
  Alter,
  Drop,
  Truncate,
  Rename,
  Other
};

const char* statement_kind_name(StatementKind kind);

/// A parsed statement owned by the validation call that produced it.
struct Statement {
  StatementKind kind = StatementKind::Other;
  NodePtr root;
  std::string text;
};

/// Classifies a tree by full search: DDL first (Drop, Create, Alter, Truncate, Rename),
/// then DML (Delete, Insert, Update), then Select when the root is a query.
/// MUST search every descendant so nested mutations are never missed.
StatementKind classify_statement(const Node& root);

/// Renders an indented tree dump for tests and debugging.
std::string dump_tree(const Node& root);

}  // namespace sqlvet
