#include "parser_internal.h"

#include "../util/string_util.h"

namespace sqlvet {

/// Parses FROM followed by its relation list.
/// MUST produce a From node whose first child is the leading relation and whose
/// remaining children are Join nodes in source order.
bool Parser::parse_from(NodePtr& out) {
  auto node = make_node(NodeKind::From, current_.pos);
  advance();
  if (!parse_join_chain(*node)) return false;
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses relation (join relation [ON expr | USING (cols)])* into from.
/// Comma joins are recorded as Join nodes named ",".
bool Parser::parse_join_chain(Node& from) {
  NodePtr first;
  if (!parse_table_ref(first)) return false;
  add_child(from, std::move(first));
  while (true) {
    size_t start = current_.pos;
    std::string join_type;
    if (current_.type == TokenType::Comma) {
      advance();
      join_type = ",";
    } else {
      std::string words;
      if (current_.type == TokenType::KeywordNatural) {
        words += "NATURAL ";
        advance();
      }
      if (current_.type == TokenType::KeywordLeft || current_.type == TokenType::KeywordRight ||
          current_.type == TokenType::KeywordFull) {
        words += util::to_upper(current_.text);
        advance();
        if (current_.type == TokenType::KeywordOuter) {
          words += " OUTER";
          advance();
        }
        words += " ";
      } else if (current_.type == TokenType::KeywordInner ||
                 current_.type == TokenType::KeywordCross) {
        words += util::to_upper(current_.text) + " ";
        advance();
      }
      if (current_.type != TokenType::KeywordJoin) {
        if (!words.empty()) return set_error("Expected JOIN");
        break;
      }
      advance();
      join_type = words + "JOIN";
    }
    auto join = make_node(NodeKind::Join, join_type, start);
    NodePtr relation;
    if (!parse_table_ref(relation)) return false;
    add_child(*join, std::move(relation));
    if (current_.type == TokenType::KeywordOn) {
      advance();
      NodePtr cond;
      if (!parse_expr(cond)) return false;
      add_child(*join, std::move(cond));
    } else if (current_.type == TokenType::KeywordUsing) {
      advance();
      if (!parse_name_list(join->column_names)) return false;
    }
    finish(*join);
    add_child(from, std::move(join));
  }
  return true;
}

/// Parses one relation: a table, a table-valued function, a subquery, or a
/// parenthesized join group (kept as a nested From node).
bool Parser::parse_table_ref(NodePtr& out) {
  DepthScope scope(depth_);
  if (too_deep()) return false;
  match_word("LATERAL");
  size_t start = current_.pos;
  if (current_.type == TokenType::LParen) {
    advance();
    if (is_query_start()) {
      auto node = make_node(NodeKind::Subquery, start);
      NodePtr inner;
      if (!parse_query(inner)) return false;
      add_child(*node, std::move(inner));
      if (!consume(TokenType::RParen, "Expected ) to close subquery")) return false;
      if (!parse_relation_alias(*node)) return false;
      finish(*node);
      out = std::move(node);
      return true;
    }
    auto group = make_node(NodeKind::From, start);
    if (!parse_join_chain(*group)) return false;
    if (!consume(TokenType::RParen, "Expected ) to close join group")) return false;
    if (!parse_relation_alias(*group)) return false;
    finish(*group);
    out = std::move(group);
    return true;
  }

  std::string qualifier;
  std::string name;
  if (!parse_qualified_name(qualifier, name, "Expected table name or subquery")) return false;
  NodePtr node;
  if (current_.type == TokenType::LParen) {
    node = make_node(NodeKind::TableFunction, name, start);
    node->qualifier = qualifier;
    advance();
    if (current_.type != TokenType::RParen) {
      if (!parse_expr_list(*node)) return false;
    }
    if (!consume(TokenType::RParen, "Expected ) after table function arguments")) return false;
  } else {
    node = make_node(NodeKind::Table, name, start);
    node->qualifier = qualifier;
  }
  if (!parse_relation_alias(*node)) return false;
  if (dialect_ == Dialect::Sqlite) {
    if (match_word("INDEXED")) {
      if (!consume(TokenType::KeywordBy, "Expected BY after INDEXED")) return false;
      std::string index;
      if (!parse_name(index, "Expected index name after INDEXED BY")) return false;
    } else if (current_.type == TokenType::KeywordNot && peek().type == TokenType::Identifier &&
               util::to_upper(peek().text) == "INDEXED") {
      advance();
      advance();
    }
  }
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses [AS] alias [(column, ...)] after a relation.
/// MUST NOT treat clause-introducing words as aliases.
bool Parser::parse_relation_alias(Node& relation) {
  if (current_.type == TokenType::KeywordAs) {
    advance();
    if (!parse_name(relation.alias, "Expected alias after AS")) return false;
  } else if ((current_.type == TokenType::Identifier && !is_word("INDEXED")) ||
             current_.type == TokenType::QuotedIdentifier) {
    relation.alias = current_.text;
    advance();
  } else {
    return true;
  }
  if (current_.type == TokenType::LParen) {
    return parse_name_list(relation.column_names);
  }
  return true;
}

/// Parses the target of a data-modifying or DDL statement: [schema.]name [AS alias].
bool Parser::parse_target_table(NodePtr& out) {
  size_t start = current_.pos;
  std::string qualifier;
  std::string name;
  if (!parse_qualified_name(qualifier, name, "Expected table name")) return false;
  auto node = make_node(NodeKind::Table, name, start);
  node->qualifier = qualifier;
  if (current_.type == TokenType::KeywordAs) {
    advance();
    if (!parse_name(node->alias, "Expected alias after AS")) return false;
  }
  finish(*node);
  out = std::move(node);
  return true;
}

}  // namespace sqlvet
