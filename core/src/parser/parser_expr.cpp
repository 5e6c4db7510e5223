#include "parser_internal.h"

#include "../util/string_util.h"

namespace sqlvet {

namespace {

NodePtr make_binary(const std::string& op, NodePtr left, NodePtr right) {
  auto node = make_node(NodeKind::Binary, op, left->span.start);
  node->span.end = right->span.end;
  add_child(*node, std::move(left));
  add_child(*node, std::move(right));
  return node;
}

NodePtr make_unary(const std::string& op, NodePtr operand, size_t start) {
  auto node = make_node(NodeKind::Unary, op, start);
  node->span.end = operand->span.end;
  add_child(*node, std::move(operand));
  return node;
}

bool is_pattern_word(const std::string& upper) {
  return upper == "GLOB" || upper == "REGEXP" || upper == "MATCH";
}

bool is_typed_literal_prefix(const std::string& upper) {
  return upper == "DATE" || upper == "TIME" || upper == "TIMESTAMP" || upper == "INTERVAL";
}

bool is_niladic_function(const std::string& upper) {
  return upper == "CURRENT_DATE" || upper == "CURRENT_TIME" || upper == "CURRENT_TIMESTAMP";
}

}  // namespace

/// Parses a full expression with OR as the loosest operator.
/// MUST bound nesting depth so deeply parenthesized input fails cleanly.
bool Parser::parse_expr(NodePtr& out) {
  DepthScope scope(depth_);
  if (too_deep()) return false;
  return parse_or_expr(out);
}

/// Parses an expression with OR precedence.
/// MUST build Binary nodes in left-associative order.
bool Parser::parse_or_expr(NodePtr& out) {
  NodePtr left;
  if (!parse_and_expr(left)) return false;
  while (current_.type == TokenType::KeywordOr) {
    advance();
    NodePtr right;
    if (!parse_and_expr(right)) return false;
    left = make_binary("OR", std::move(left), std::move(right));
  }
  out = std::move(left);
  return true;
}

/// Parses an expression with AND precedence.
/// MUST build Binary nodes in left-associative order.
bool Parser::parse_and_expr(NodePtr& out) {
  NodePtr left;
  if (!parse_not_expr(left)) return false;
  while (current_.type == TokenType::KeywordAnd) {
    advance();
    NodePtr right;
    if (!parse_not_expr(right)) return false;
    left = make_binary("AND", std::move(left), std::move(right));
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_not_expr(NodePtr& out) {
  if (current_.type != TokenType::KeywordNot) {
    return parse_cmp_expr(out);
  }
  DepthScope scope(depth_);
  if (too_deep()) return false;
  size_t start = current_.pos;
  advance();
  NodePtr operand;
  if (!parse_not_expr(operand)) return false;
  out = make_unary("NOT", std::move(operand), start);
  return true;
}

/// Parses equality, IS, IN, LIKE-family, BETWEEN, and NULL tests.
/// MUST bind BETWEEN bounds tighter than AND so "a BETWEEN 1 AND 2 AND b" splits correctly.
bool Parser::parse_cmp_expr(NodePtr& out) {
  NodePtr left;
  if (!parse_rel_expr(left)) return false;
  while (true) {
    if (current_.type == TokenType::Equal || current_.type == TokenType::NotEqual) {
      std::string op = current_.text;
      advance();
      NodePtr right;
      if (!parse_rel_expr(right)) return false;
      left = make_binary(op, std::move(left), std::move(right));
      continue;
    }
    if (current_.type == TokenType::KeywordIs) {
      advance();
      std::string op = "IS";
      if (current_.type == TokenType::KeywordNot) {
        op += " NOT";
        advance();
      }
      if (current_.type == TokenType::KeywordDistinct) {
        advance();
        if (!consume(TokenType::KeywordFrom, "Expected FROM after IS DISTINCT")) return false;
        op += " DISTINCT FROM";
      }
      NodePtr right;
      if (!parse_rel_expr(right)) return false;
      left = make_binary(op, std::move(left), std::move(right));
      continue;
    }
    if (is_word("ISNULL") || is_word("NOTNULL")) {
      std::string op = util::to_upper(current_.text);
      size_t start = left->span.start;
      advance();
      left = make_unary(op, std::move(left), start);
      finish(*left);
      continue;
    }

    bool negated = false;
    if (current_.type == TokenType::KeywordNot) {
      Token next = peek();
      bool continues = next.type == TokenType::KeywordIn || next.type == TokenType::KeywordLike ||
                       next.type == TokenType::KeywordIlike ||
                       next.type == TokenType::KeywordBetween ||
                       next.type == TokenType::KeywordNull ||
                       (next.type == TokenType::Identifier &&
                        is_pattern_word(util::to_upper(next.text)));
      if (!continues) break;
      advance();
      negated = true;
      if (current_.type == TokenType::KeywordNull) {
        size_t start = left->span.start;
        advance();
        left = make_unary("NOTNULL", std::move(left), start);
        finish(*left);
        continue;
      }
    }

    if (current_.type == TokenType::KeywordIn) {
      auto in = make_node(NodeKind::InList, "IN", left->span.start);
      if (negated) in->modifier = "NOT";
      advance();
      add_child(*in, std::move(left));
      if (!parse_in_rhs(*in)) return false;
      finish(*in);
      left = std::move(in);
      continue;
    }
    if (current_.type == TokenType::KeywordLike || current_.type == TokenType::KeywordIlike ||
        (current_.type == TokenType::Identifier && is_pattern_word(util::to_upper(current_.text)))) {
      std::string op = util::to_upper(current_.text);
      advance();
      NodePtr pattern;
      if (!parse_rel_expr(pattern)) return false;
      left = make_binary(op, std::move(left), std::move(pattern));
      if (negated) left->modifier = "NOT";
      if (current_.type == TokenType::KeywordEscape) {
        advance();
        NodePtr escape;
        if (!parse_rel_expr(escape)) return false;
        add_child(*left, std::move(escape));
      }
      finish(*left);
      continue;
    }
    if (current_.type == TokenType::KeywordBetween) {
      auto between = make_node(NodeKind::Between, "BETWEEN", left->span.start);
      if (negated) between->modifier = "NOT";
      advance();
      add_child(*between, std::move(left));
      NodePtr low;
      if (!parse_rel_expr(low)) return false;
      add_child(*between, std::move(low));
      if (!consume(TokenType::KeywordAnd, "Expected AND in BETWEEN")) return false;
      NodePtr high;
      if (!parse_rel_expr(high)) return false;
      add_child(*between, std::move(high));
      finish(*between);
      left = std::move(between);
      continue;
    }
    if (negated) {
      return set_error("Expected IN, LIKE, or BETWEEN after NOT");
    }
    break;
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_rel_expr(NodePtr& out) {
  NodePtr left;
  if (!parse_bit_expr(left)) return false;
  while (current_.type == TokenType::Less || current_.type == TokenType::LessEqual ||
         current_.type == TokenType::Greater || current_.type == TokenType::GreaterEqual) {
    std::string op = current_.text;
    advance();
    NodePtr right;
    if (!parse_bit_expr(right)) return false;
    left = make_binary(op, std::move(left), std::move(right));
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_bit_expr(NodePtr& out) {
  NodePtr left;
  if (!parse_add_expr(left)) return false;
  while (current_.type == TokenType::ShiftLeft || current_.type == TokenType::ShiftRight ||
         current_.type == TokenType::Ampersand || current_.type == TokenType::Pipe) {
    std::string op = current_.text;
    advance();
    NodePtr right;
    if (!parse_add_expr(right)) return false;
    left = make_binary(op, std::move(left), std::move(right));
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_add_expr(NodePtr& out) {
  NodePtr left;
  if (!parse_mul_expr(left)) return false;
  while (current_.type == TokenType::Plus || current_.type == TokenType::Minus) {
    std::string op = current_.text;
    advance();
    NodePtr right;
    if (!parse_mul_expr(right)) return false;
    left = make_binary(op, std::move(left), std::move(right));
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_mul_expr(NodePtr& out) {
  NodePtr left;
  if (!parse_concat_expr(left)) return false;
  while (current_.type == TokenType::Star || current_.type == TokenType::Slash ||
         current_.type == TokenType::Percent) {
    std::string op = current_.text;
    advance();
    NodePtr right;
    if (!parse_concat_expr(right)) return false;
    left = make_binary(op, std::move(left), std::move(right));
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_concat_expr(NodePtr& out) {
  NodePtr left;
  if (!parse_unary_expr(left)) return false;
  while (current_.type == TokenType::Concat || current_.type == TokenType::Arrow) {
    std::string op = current_.text;
    advance();
    NodePtr right;
    if (!parse_unary_expr(right)) return false;
    left = make_binary(op, std::move(left), std::move(right));
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_unary_expr(NodePtr& out) {
  if (current_.type != TokenType::Minus && current_.type != TokenType::Plus &&
      current_.type != TokenType::Tilde) {
    return parse_postfix_expr(out);
  }
  DepthScope scope(depth_);
  if (too_deep()) return false;
  std::string op = current_.text;
  size_t start = current_.pos;
  advance();
  NodePtr operand;
  if (!parse_unary_expr(operand)) return false;
  out = make_unary(op, std::move(operand), start);
  return true;
}

/// Parses a primary followed by COLLATE or postgres :: casts.
bool Parser::parse_postfix_expr(NodePtr& out) {
  NodePtr expr;
  if (!parse_primary(expr)) return false;
  while (true) {
    if (current_.type == TokenType::KeywordCollate) {
      advance();
      std::string collation;
      if (current_.type == TokenType::String) {
        collation = current_.text;
        advance();
      } else if (!parse_name(collation, "Expected collation name after COLLATE")) {
        return false;
      }
      auto node = make_node(NodeKind::Collate, collation, expr->span.start);
      add_child(*node, std::move(expr));
      finish(*node);
      expr = std::move(node);
      continue;
    }
    if (current_.type == TokenType::DoubleColon) {
      if (dialect_ != Dialect::Postgres) {
        return set_error("Unexpected '::' outside the postgres dialect");
      }
      advance();
      std::string type;
      if (!parse_type_name(type, false)) return false;
      auto node = make_node(NodeKind::Cast, type, expr->span.start);
      node->modifier = "::";
      add_child(*node, std::move(expr));
      finish(*node);
      expr = std::move(node);
      continue;
    }
    break;
  }
  out = std::move(expr);
  return true;
}

/// Parses literals, parameters, column references, calls, subqueries, and
/// parenthesized expressions or row values.
bool Parser::parse_primary(NodePtr& out) {
  size_t start = current_.pos;
  switch (current_.type) {
    case TokenType::Number:
    case TokenType::String:
    case TokenType::Blob: {
      auto node = make_node(NodeKind::Literal, current_.text, start);
      node->modifier = current_.type == TokenType::Number   ? "number"
                       : current_.type == TokenType::String ? "string"
                                                            : "blob";
      advance();
      finish(*node);
      out = std::move(node);
      return true;
    }
    case TokenType::Parameter: {
      auto node = make_node(NodeKind::Parameter, current_.text, start);
      advance();
      finish(*node);
      out = std::move(node);
      return true;
    }
    case TokenType::KeywordNull:
    case TokenType::KeywordDefault: {
      auto node = make_node(NodeKind::Literal, util::to_upper(current_.text), start);
      node->modifier = current_.type == TokenType::KeywordNull ? "null" : "default";
      advance();
      finish(*node);
      out = std::move(node);
      return true;
    }
    case TokenType::KeywordCase:
      return parse_case(out);
    case TokenType::KeywordCast:
      return parse_cast(out);
    case TokenType::KeywordExists: {
      auto node = make_node(NodeKind::Exists, start);
      advance();
      size_t sub_start = current_.pos;
      if (!consume(TokenType::LParen, "Expected ( after EXISTS")) return false;
      auto subquery = make_node(NodeKind::Subquery, sub_start);
      NodePtr inner;
      if (!parse_query(inner)) return false;
      add_child(*subquery, std::move(inner));
      if (!consume(TokenType::RParen, "Expected ) to close EXISTS subquery")) return false;
      finish(*subquery);
      add_child(*node, std::move(subquery));
      finish(*node);
      out = std::move(node);
      return true;
    }
    case TokenType::LParen: {
      advance();
      if (is_query_start()) {
        auto node = make_node(NodeKind::Subquery, start);
        NodePtr inner;
        if (!parse_query(inner)) return false;
        add_child(*node, std::move(inner));
        if (!consume(TokenType::RParen, "Expected ) to close subquery")) return false;
        finish(*node);
        out = std::move(node);
        return true;
      }
      NodePtr first;
      if (!parse_expr(first)) return false;
      if (current_.type != TokenType::Comma) {
        if (!consume(TokenType::RParen, "Expected ) to close expression")) return false;
        out = std::move(first);
        return true;
      }
      auto tuple = make_node(NodeKind::Tuple, start);
      add_child(*tuple, std::move(first));
      while (current_.type == TokenType::Comma) {
        advance();
        NodePtr item;
        if (!parse_expr(item)) return false;
        add_child(*tuple, std::move(item));
      }
      if (!consume(TokenType::RParen, "Expected ) to close row value")) return false;
      finish(*tuple);
      out = std::move(tuple);
      return true;
    }
    case TokenType::KeywordLeft:
    case TokenType::KeywordRight:
      if (peek().type == TokenType::LParen) return parse_function_call(out);
      return set_error("Expected expression");
    case TokenType::Identifier: {
      if (peek().type == TokenType::LParen) return parse_function_call(out);
      std::string upper = util::to_upper(current_.text);
      if (upper == "TRUE" || upper == "FALSE") {
        auto node = make_node(NodeKind::Literal, upper, start);
        node->modifier = "boolean";
        advance();
        finish(*node);
        out = std::move(node);
        return true;
      }
      if (is_niladic_function(upper)) {
        auto node = make_node(NodeKind::Function, upper, start);
        advance();
        finish(*node);
        out = std::move(node);
        return true;
      }
      if (is_typed_literal_prefix(upper) && peek().type == TokenType::String) {
        auto node = make_node(NodeKind::Cast, upper, start);
        advance();
        auto literal = make_node(NodeKind::Literal, current_.text, current_.pos);
        literal->modifier = "string";
        advance();
        finish(*literal);
        add_child(*node, std::move(literal));
        finish(*node);
        out = std::move(node);
        return true;
      }
      return parse_column_ref(out);
    }
    case TokenType::QuotedIdentifier:
      return parse_column_ref(out);
    default:
      break;
  }
  return set_error("Expected expression");
}

/// Parses name(.name)* with an optional trailing .*; every part but the last is the qualifier.
bool Parser::parse_column_ref(NodePtr& out) {
  size_t start = current_.pos;
  std::vector<std::string> parts;
  std::string part;
  if (!parse_name(part, "Expected column name")) return false;
  parts.push_back(part);
  while (current_.type == TokenType::Dot) {
    advance();
    if (current_.type == TokenType::Star) {
      auto star = make_node(NodeKind::Star, "*", start);
      for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) star->qualifier += ".";
        star->qualifier += parts[i];
      }
      advance();
      finish(*star);
      out = std::move(star);
      return true;
    }
    if (!parse_name(part, "Expected column name after '.'")) return false;
    parts.push_back(part);
  }
  auto node = make_node(NodeKind::Column, parts.back(), start);
  for (size_t i = 0; i + 1 < parts.size(); ++i) {
    if (i > 0) node->qualifier += ".";
    node->qualifier += parts[i];
  }
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses name([DISTINCT] args | *) [FILTER (WHERE ...)] [OVER window].
/// MUST keep FILTER and OVER as children so column references inside them are visited.
bool Parser::parse_function_call(NodePtr& out) {
  auto node = make_node(NodeKind::Function, current_.text, current_.pos);
  advance();
  if (!consume(TokenType::LParen, "Expected ( after function name")) return false;
  if (current_.type == TokenType::Star) {
    add_child(*node, make_node(NodeKind::Star, "*", current_.pos));
    advance();
  } else if (current_.type != TokenType::RParen) {
    if (current_.type == TokenType::KeywordDistinct) {
      node->modifier = "DISTINCT";
      advance();
    } else if (current_.type == TokenType::KeywordAll) {
      advance();
    }
    if (!parse_expr_list(*node)) return false;
    if (current_.type == TokenType::KeywordOrder) {
      NodePtr order;
      if (!parse_order_by(order)) return false;
      add_child(*node, std::move(order));
    }
  }
  if (!consume(TokenType::RParen, "Expected ) after function arguments")) return false;

  if (is_word("FILTER") && peek().type == TokenType::LParen) {
    auto filter = make_node(NodeKind::Filter, current_.pos);
    advance();
    advance();
    if (!consume(TokenType::KeywordWhere, "Expected WHERE in FILTER clause")) return false;
    NodePtr cond;
    if (!parse_expr(cond)) return false;
    add_child(*filter, std::move(cond));
    if (!consume(TokenType::RParen, "Expected ) after FILTER clause")) return false;
    finish(*filter);
    add_child(*node, std::move(filter));
  }
  if (current_.type == TokenType::KeywordOver) {
    auto window = make_node(NodeKind::Window, current_.pos);
    advance();
    if (current_.type == TokenType::LParen) {
      advance();
      if (!parse_window_spec(*window)) return false;
      if (!consume(TokenType::RParen, "Expected ) after window specification")) return false;
    } else if (!parse_name(window->name, "Expected window name or ( after OVER")) {
      return false;
    }
    finish(*window);
    add_child(*node, std::move(window));
  }
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses CASE [operand] WHEN ... THEN ... [ELSE ...] END.
/// The optional operand is the first child and the ELSE result the last; both sit beside When nodes.
bool Parser::parse_case(NodePtr& out) {
  auto node = make_node(NodeKind::Case, current_.pos);
  advance();
  if (current_.type != TokenType::KeywordWhen) {
    NodePtr operand;
    if (!parse_expr(operand)) return false;
    add_child(*node, std::move(operand));
  }
  if (current_.type != TokenType::KeywordWhen) {
    return set_error("Expected WHEN in CASE expression");
  }
  while (current_.type == TokenType::KeywordWhen) {
    auto when = make_node(NodeKind::When, current_.pos);
    advance();
    NodePtr cond;
    if (!parse_expr(cond)) return false;
    if (!consume(TokenType::KeywordThen, "Expected THEN after WHEN condition")) return false;
    NodePtr result;
    if (!parse_expr(result)) return false;
    add_child(*when, std::move(cond));
    add_child(*when, std::move(result));
    finish(*when);
    add_child(*node, std::move(when));
  }
  if (current_.type == TokenType::KeywordElse) {
    advance();
    NodePtr otherwise;
    if (!parse_expr(otherwise)) return false;
    add_child(*node, std::move(otherwise));
  }
  if (!consume(TokenType::KeywordEnd, "Expected END to close CASE expression")) return false;
  finish(*node);
  out = std::move(node);
  return true;
}

bool Parser::parse_cast(NodePtr& out) {
  size_t start = current_.pos;
  advance();
  if (!consume(TokenType::LParen, "Expected ( after CAST")) return false;
  NodePtr expr;
  if (!parse_expr(expr)) return false;
  if (!consume(TokenType::KeywordAs, "Expected AS in CAST")) return false;
  std::string type;
  if (!parse_type_name(type, true)) return false;
  if (!consume(TokenType::RParen, "Expected ) to close CAST")) return false;
  auto node = make_node(NodeKind::Cast, type, start);
  add_child(*node, std::move(expr));
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses the right side of IN: a subquery, a value list (possibly empty), or a
/// bare table name as SQLite allows.
bool Parser::parse_in_rhs(Node& in_node) {
  if (current_.type == TokenType::LParen) {
    size_t start = current_.pos;
    advance();
    if (is_query_start()) {
      auto subquery = make_node(NodeKind::Subquery, start);
      NodePtr inner;
      if (!parse_query(inner)) return false;
      add_child(*subquery, std::move(inner));
      if (!consume(TokenType::RParen, "Expected ) to close IN subquery")) return false;
      finish(*subquery);
      add_child(in_node, std::move(subquery));
      return true;
    }
    if (current_.type != TokenType::RParen) {
      if (!parse_expr_list(in_node)) return false;
    }
    return consume(TokenType::RParen, "Expected ) to close IN list");
  }
  if (current_.type == TokenType::Identifier || current_.type == TokenType::QuotedIdentifier) {
    size_t start = current_.pos;
    std::string qualifier;
    std::string name;
    if (!parse_qualified_name(qualifier, name, "Expected table name after IN")) return false;
    NodePtr table;
    if (current_.type == TokenType::LParen) {
      table = make_node(NodeKind::TableFunction, name, start);
      advance();
      if (current_.type != TokenType::RParen) {
        if (!parse_expr_list(*table)) return false;
      }
      if (!consume(TokenType::RParen, "Expected ) after table function arguments")) return false;
    } else {
      table = make_node(NodeKind::Table, name, start);
    }
    table->qualifier = qualifier;
    finish(*table);
    add_child(in_node, std::move(table));
    return true;
  }
  return set_error("Expected ( after IN");
}

/// Parses a type name such as INTEGER, VARCHAR(10), or DOUBLE PRECISION.
/// multi_word accepts any run of words (inside CAST); otherwise only known
/// two-word types are joined so a following alias is not swallowed.
bool Parser::parse_type_name(std::string& out, bool multi_word) {
  if (!parse_name(out, "Expected type name")) return false;
  std::string upper = util::to_upper(out);
  if (multi_word) {
    while (current_.type == TokenType::Identifier) {
      out += " " + current_.text;
      advance();
    }
  } else if ((upper == "DOUBLE" && is_word("PRECISION")) ||
             ((upper == "CHARACTER" || upper == "CHAR") && is_word("VARYING"))) {
    out += " " + current_.text;
    advance();
  }
  if (current_.type == TokenType::LParen) {
    out += "(";
    advance();
    while (current_.type != TokenType::RParen) {
      if (current_.type != TokenType::Number && current_.type != TokenType::Comma &&
          current_.type != TokenType::Minus && current_.type != TokenType::Plus &&
          current_.type != TokenType::Identifier) {
        return set_error("Expected ) to close type arguments");
      }
      out += current_.text;
      advance();
    }
    out += ")";
    advance();
  }
  return true;
}

bool Parser::parse_expr_list(Node& parent) {
  while (true) {
    NodePtr expr;
    if (!parse_expr(expr)) return false;
    add_child(parent, std::move(expr));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  return true;
}

}  // namespace sqlvet
