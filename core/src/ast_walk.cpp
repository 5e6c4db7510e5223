#include "ast_walk.h"

namespace sqlvet {

void walk(const Node& root, const std::function<void(const Node&)>& visit) {
  // Explicit stack: adversarial queries can nest deeply enough to matter.
  std::vector<const Node*> stack;
  stack.push_back(&root);
  while (!stack.empty()) {
    const Node* node = stack.back();
    stack.pop_back();
    visit(*node);
    for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
      if (*it) stack.push_back(it->get());
    }
  }
}

std::vector<const Node*> find_all(const Node& root, const NodePredicate& pred) {
  std::vector<const Node*> out;
  walk(root, [&](const Node& node) {
    if (pred(node)) out.push_back(&node);
  });
  return out;
}

std::vector<const Node*> find_all(const Node& root, NodeKind kind) {
  return find_all(root, [kind](const Node& node) { return node.kind == kind; });
}

const Node* find_first(const Node& root, NodeKind kind) {
  std::vector<const Node*> stack;
  stack.push_back(&root);
  while (!stack.empty()) {
    const Node* node = stack.back();
    stack.pop_back();
    if (node->kind == kind) return node;
    for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
      if (*it) stack.push_back(it->get());
    }
  }
  return nullptr;
}

const Node* find_ancestor(const Node& node, NodeKind kind) {
  for (const Node* cur = node.parent; cur != nullptr; cur = cur->parent) {
    if (cur->kind == kind) return cur;
  }
  return nullptr;
}

const Node* child_of_kind(const Node& node, NodeKind kind) {
  for (const auto& child : node.children) {
    if (child && child->kind == kind) return child.get();
  }
  return nullptr;
}

}  // namespace sqlvet
