#include "parser_internal.h"

#include "../util/string_util.h"

namespace sqlvet {

/// Parses [WITH ...] followed by a compound SELECT with ORDER BY/LIMIT, or a data-modifying
/// statement when the WITH clause feeds one.
/// MUST attach the WITH clause as the first child of the statement it prefixes.
bool Parser::parse_query(NodePtr& out) {
  DepthScope scope(depth_);
  if (too_deep()) return false;
  NodePtr with;
  if (current_.type == TokenType::KeywordWith) {
    if (!parse_with(with)) return false;
  }
  NodePtr body;
  if (with && is_dml_start()) {
    bool ok = false;
    if (current_.type == TokenType::KeywordUpdate) {
      ok = parse_update(body);
    } else if (current_.type == TokenType::KeywordDelete) {
      ok = parse_delete(body);
    } else {
      ok = parse_insert(body);
    }
    if (!ok) return false;
  } else {
    if (!parse_compound(body)) return false;
    if (current_.type == TokenType::KeywordOrder) {
      NodePtr order;
      if (!parse_order_by(order)) return false;
      add_child(*body, std::move(order));
    }
    if (!parse_limit_offset(*body)) return false;
  }
  if (with) {
    body->span.start = with->span.start;
    prepend_child(*body, std::move(with));
  }
  finish(*body);
  out = std::move(body);
  return true;
}

bool Parser::parse_with(NodePtr& out) {
  auto node = make_node(NodeKind::With, current_.pos);
  advance();
  if (match_word("RECURSIVE")) {
    node->modifier = "RECURSIVE";
  }
  while (true) {
    NodePtr cte;
    if (!parse_cte(cte)) return false;
    add_child(*node, std::move(cte));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses name [(columns)] AS [[NOT] MATERIALIZED] (body).
/// The body may be a data-modifying statement; it is kept in the tree so a
/// mutation hidden inside a CTE is still found by classification.
bool Parser::parse_cte(NodePtr& out) {
  size_t start = current_.pos;
  std::string name;
  if (!parse_name(name, "Expected CTE name")) return false;
  auto node = make_node(NodeKind::Cte, name, start);
  if (current_.type == TokenType::LParen) {
    if (!parse_name_list(node->column_names)) return false;
  }
  if (!consume(TokenType::KeywordAs, "Expected AS after CTE name")) return false;
  if (current_.type == TokenType::KeywordNot) {
    advance();
    if (!consume_word("MATERIALIZED", "Expected MATERIALIZED after NOT")) return false;
    node->modifier = "NOT MATERIALIZED";
  } else if (match_word("MATERIALIZED")) {
    node->modifier = "MATERIALIZED";
  }
  if (!consume(TokenType::LParen, "Expected ( to start CTE body")) return false;
  NodePtr body;
  bool ok = false;
  if (current_.type == TokenType::KeywordUpdate) {
    ok = parse_update(body);
  } else if (current_.type == TokenType::KeywordDelete) {
    ok = parse_delete(body);
  } else if (current_.type == TokenType::KeywordInsert || is_word("REPLACE")) {
    ok = parse_insert(body);
  } else {
    ok = parse_query(body);
  }
  if (!ok) return false;
  add_child(*node, std::move(body));
  if (!consume(TokenType::RParen, "Expected ) to close CTE body")) return false;
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses SELECT cores joined by UNION/INTERSECT/EXCEPT, left-associative.
bool Parser::parse_compound(NodePtr& out) {
  NodePtr left;
  if (!parse_compound_operand(left)) return false;
  while (current_.type == TokenType::KeywordUnion ||
         current_.type == TokenType::KeywordIntersect ||
         current_.type == TokenType::KeywordExcept) {
    auto op = make_node(NodeKind::SetOperation, util::to_upper(current_.text), left->span.start);
    advance();
    if (current_.type == TokenType::KeywordAll) {
      op->modifier = "ALL";
      advance();
    } else if (current_.type == TokenType::KeywordDistinct) {
      op->modifier = "DISTINCT";
      advance();
    }
    NodePtr right;
    if (!parse_compound_operand(right)) return false;
    add_child(*op, std::move(left));
    add_child(*op, std::move(right));
    finish(*op);
    left = std::move(op);
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_compound_operand(NodePtr& out) {
  if (current_.type == TokenType::KeywordSelect) {
    return parse_select_core(out);
  }
  if (current_.type == TokenType::KeywordValues) {
    return parse_values(out);
  }
  if (current_.type == TokenType::LParen) {
    auto node = make_node(NodeKind::Subquery, current_.pos);
    advance();
    NodePtr inner;
    if (!parse_query(inner)) return false;
    if (!consume(TokenType::RParen, "Expected ) to close subquery")) return false;
    add_child(*node, std::move(inner));
    finish(*node);
    out = std::move(node);
    return true;
  }
  return set_error("Expected SELECT");
}

/// Parses one SELECT core up to, but not including, ORDER BY/LIMIT or a set operator.
/// MUST keep clause nodes in source order under the Select node.
bool Parser::parse_select_core(NodePtr& out) {
  auto node = make_node(NodeKind::Select, current_.pos);
  advance();
  if (current_.type == TokenType::KeywordDistinct) {
    advance();
    if (dialect_ == Dialect::Postgres && current_.type == TokenType::KeywordOn) {
      auto distinct_on = make_node(NodeKind::DistinctOn, current_.pos);
      advance();
      if (!consume(TokenType::LParen, "Expected ( after DISTINCT ON")) return false;
      if (!parse_expr_list(*distinct_on)) return false;
      if (!consume(TokenType::RParen, "Expected ) after DISTINCT ON list")) return false;
      finish(*distinct_on);
      add_child(*node, std::move(distinct_on));
    }
    node->modifier = "DISTINCT";
  } else if (current_.type == TokenType::KeywordAll) {
    advance();
    node->modifier = "ALL";
  }

  auto projections = make_node(NodeKind::Projections, current_.pos);
  if (!parse_projections(*projections)) return false;
  finish(*projections);
  add_child(*node, std::move(projections));

  if (current_.type == TokenType::KeywordFrom) {
    NodePtr from;
    if (!parse_from(from)) return false;
    add_child(*node, std::move(from));
  }
  if (current_.type == TokenType::KeywordWhere) {
    auto where = make_node(NodeKind::Where, current_.pos);
    advance();
    NodePtr cond;
    if (!parse_expr(cond)) return false;
    add_child(*where, std::move(cond));
    finish(*where);
    add_child(*node, std::move(where));
  }
  if (current_.type == TokenType::KeywordGroup) {
    auto group = make_node(NodeKind::GroupBy, current_.pos);
    advance();
    if (!consume(TokenType::KeywordBy, "Expected BY after GROUP")) return false;
    if (!parse_expr_list(*group)) return false;
    finish(*group);
    add_child(*node, std::move(group));
  }
  if (current_.type == TokenType::KeywordHaving) {
    auto having = make_node(NodeKind::Having, current_.pos);
    advance();
    NodePtr cond;
    if (!parse_expr(cond)) return false;
    add_child(*having, std::move(cond));
    finish(*having);
    add_child(*node, std::move(having));
  }
  if (current_.type == TokenType::KeywordWindow) {
    NodePtr windows;
    if (!parse_window_clause(windows)) return false;
    add_child(*node, std::move(windows));
  }
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses VALUES (row), (row), ... into a Values node of Tuple rows.
bool Parser::parse_values(NodePtr& out) {
  auto node = make_node(NodeKind::Values, current_.pos);
  advance();
  while (true) {
    auto row = make_node(NodeKind::Tuple, current_.pos);
    if (!consume(TokenType::LParen, "Expected ( to start VALUES row")) return false;
    if (!parse_expr_list(*row)) return false;
    if (!consume(TokenType::RParen, "Expected ) to close VALUES row")) return false;
    finish(*row);
    add_child(*node, std::move(row));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  finish(*node);
  out = std::move(node);
  return true;
}

bool Parser::parse_projections(Node& projections) {
  if (!parse_projection(projections)) return false;
  while (current_.type == TokenType::Comma) {
    advance();
    if (!parse_projection(projections)) return false;
  }
  return true;
}

/// Parses one projection, wrapping it in an Alias node when it is renamed.
/// MUST accept aliases with or without AS; a bare alias is any identifier that
/// follows a complete expression.
bool Parser::parse_projection(Node& projections) {
  if (current_.type == TokenType::Star) {
    auto star = make_node(NodeKind::Star, "*", current_.pos);
    advance();
    finish(*star);
    add_child(projections, std::move(star));
    return true;
  }
  NodePtr expr;
  if (!parse_expr(expr)) return false;
  std::string alias;
  bool has_alias = false;
  if (current_.type == TokenType::KeywordAs) {
    advance();
    if (current_.type == TokenType::String) {
      alias = current_.text;
      advance();
    } else if (!parse_name(alias, "Expected alias after AS")) {
      return false;
    }
    has_alias = true;
  } else if (current_.type == TokenType::Identifier ||
             current_.type == TokenType::QuotedIdentifier) {
    alias = current_.text;
    advance();
    has_alias = true;
  }
  if (!has_alias) {
    add_child(projections, std::move(expr));
    return true;
  }
  auto node = make_node(NodeKind::Alias, alias, expr->span.start);
  add_child(*node, std::move(expr));
  finish(*node);
  add_child(projections, std::move(node));
  return true;
}

bool Parser::parse_order_by(NodePtr& out) {
  auto node = make_node(NodeKind::OrderBy, current_.pos);
  advance();
  if (!consume(TokenType::KeywordBy, "Expected BY after ORDER")) return false;
  while (true) {
    auto term = make_node(NodeKind::Ordered, current_.pos);
    NodePtr expr;
    if (!parse_expr(expr)) return false;
    add_child(*term, std::move(expr));
    if (current_.type == TokenType::KeywordAsc || current_.type == TokenType::KeywordDesc) {
      term->modifier = util::to_upper(current_.text);
      advance();
    }
    if (match_word("NULLS")) {
      std::string placement = util::to_upper(current_.text);
      if (!match_word("FIRST") && !match_word("LAST")) {
        return set_error("Expected FIRST or LAST after NULLS");
      }
      if (!term->modifier.empty()) term->modifier += " ";
      term->modifier += "NULLS " + placement;
    }
    finish(*term);
    add_child(*node, std::move(term));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses LIMIT/OFFSET in either order, including SQLite's LIMIT offset, count form.
/// MUST reject a repeated LIMIT or OFFSET clause.
bool Parser::parse_limit_offset(Node& query) {
  bool saw_limit = false;
  bool saw_offset = false;
  while (true) {
    if (current_.type == TokenType::KeywordLimit && !saw_limit) {
      saw_limit = true;
      auto limit = make_node(NodeKind::Limit, current_.pos);
      advance();
      NodePtr count;
      if (current_.type == TokenType::KeywordAll) {
        count = make_node(NodeKind::Literal, "ALL", current_.pos);
        advance();
      } else if (!parse_expr(count)) {
        return false;
      }
      if (current_.type == TokenType::Comma && !saw_offset) {
        advance();
        saw_offset = true;
        auto offset = make_node(NodeKind::Offset, count->span.start);
        add_child(*offset, std::move(count));
        finish(*offset);
        if (!parse_expr(count)) return false;
        add_child(*limit, std::move(count));
        finish(*limit);
        add_child(query, std::move(limit));
        add_child(query, std::move(offset));
        continue;
      }
      add_child(*limit, std::move(count));
      finish(*limit);
      add_child(query, std::move(limit));
      continue;
    }
    if (current_.type == TokenType::KeywordOffset && !saw_offset) {
      saw_offset = true;
      auto offset = make_node(NodeKind::Offset, current_.pos);
      advance();
      NodePtr skip;
      if (!parse_expr(skip)) return false;
      add_child(*offset, std::move(skip));
      finish(*offset);
      add_child(query, std::move(offset));
      continue;
    }
    break;
  }
  if (current_.type == TokenType::KeywordLimit || current_.type == TokenType::KeywordOffset) {
    return set_error("Duplicate " + util::to_upper(current_.text) + " clause");
  }
  return true;
}

bool Parser::parse_window_clause(NodePtr& out) {
  auto node = make_node(NodeKind::WindowClause, current_.pos);
  advance();
  while (true) {
    size_t start = current_.pos;
    std::string name;
    if (!parse_name(name, "Expected window name")) return false;
    if (!consume(TokenType::KeywordAs, "Expected AS after window name")) return false;
    if (!consume(TokenType::LParen, "Expected ( to start window definition")) return false;
    auto window = make_node(NodeKind::Window, start);
    window->alias = name;
    if (!parse_window_spec(*window)) return false;
    if (!consume(TokenType::RParen, "Expected ) to close window definition")) return false;
    finish(*window);
    add_child(*node, std::move(window));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses the inside of a window specification: [base] [PARTITION BY] [ORDER BY] [frame].
/// Partition expressions become direct children; the frame clause is skipped.
bool Parser::parse_window_spec(Node& window) {
  if (current_.type == TokenType::Identifier && !is_word("PARTITION") && !is_word("ROWS") &&
      !is_word("RANGE") && !is_word("GROUPS")) {
    window.name = current_.text;
    advance();
  }
  if (match_word("PARTITION")) {
    if (!consume(TokenType::KeywordBy, "Expected BY after PARTITION")) return false;
    if (!parse_expr_list(window)) return false;
  }
  if (current_.type == TokenType::KeywordOrder) {
    NodePtr order;
    if (!parse_order_by(order)) return false;
    add_child(window, std::move(order));
  }
  if (is_word("ROWS") || is_word("RANGE") || is_word("GROUPS")) {
    window.modifier = util::to_upper(current_.text);
    advance();
    if (!skip_clause(nullptr)) return false;
  }
  return true;
}

}  // namespace sqlvet
