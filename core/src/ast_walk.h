#pragma once

#include <functional>
#include <vector>

#include "ast.h"

namespace sqlvet {

using NodePredicate = std::function<bool(const Node&)>;

/// Visits root and every descendant in pre-order (document order).
/// MUST visit each node exactly once and MUST NOT mutate the tree.
void walk(const Node& root, const std::function<void(const Node&)>& visit);

/// Collects root and every descendant for which pred returns true, in pre-order.
/// This is the single traversal shared by the CTE, alias, and reference collectors.
std::vector<const Node*> find_all(const Node& root, const NodePredicate& pred);
std::vector<const Node*> find_all(const Node& root, NodeKind kind);

/// Returns the first node of a kind in pre-order, or nullptr.
const Node* find_first(const Node& root, NodeKind kind);

/// Returns the nearest proper ancestor of a kind, or nullptr.
const Node* find_ancestor(const Node& node, NodeKind kind);

/// Returns the first direct child of a kind, or nullptr.
const Node* child_of_kind(const Node& node, NodeKind kind);

}  // namespace sqlvet
