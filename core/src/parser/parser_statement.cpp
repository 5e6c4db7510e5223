#include "parser_internal.h"

#include "../util/string_util.h"

namespace sqlvet {

namespace {

bool is_create_modifier(const std::string& upper) {
  return upper == "TEMP" || upper == "TEMPORARY" || upper == "UNIQUE" || upper == "VIRTUAL" ||
         upper == "MATERIALIZED" || upper == "UNLOGGED";
}

bool stop_at_returning(const Token& token) {
  return token.type == TokenType::KeywordReturning;
}

}  // namespace

/// Parses INSERT [OR action] INTO ... / REPLACE INTO ... with VALUES, SELECT, or DEFAULT VALUES.
/// Upsert clauses are skipped; the Insert node alone decides classification.
bool Parser::parse_insert(NodePtr& out) {
  auto node = make_node(NodeKind::Insert, current_.pos);
  if (is_word("REPLACE")) {
    node->modifier = "REPLACE";
    advance();
  } else {
    advance();
    if (current_.type == TokenType::KeywordOr) {
      advance();
      if (current_.type != TokenType::Identifier) {
        return set_error("Expected conflict action after INSERT OR");
      }
      node->modifier = "OR " + util::to_upper(current_.text);
      advance();
    }
  }
  if (!consume(TokenType::KeywordInto, "Expected INTO after INSERT")) return false;
  NodePtr target;
  if (!parse_target_table(target)) return false;
  add_child(*node, std::move(target));
  if (current_.type == TokenType::LParen) {
    if (!parse_name_list(node->column_names)) return false;
  }
  if (current_.type == TokenType::KeywordDefault) {
    advance();
    if (!consume(TokenType::KeywordValues, "Expected VALUES after DEFAULT")) return false;
    node->name = "DEFAULT VALUES";
  } else {
    if (!is_query_start() && current_.type != TokenType::LParen) {
      return set_error("Expected VALUES or SELECT in INSERT");
    }
    NodePtr source;
    if (!parse_query(source)) return false;
    add_child(*node, std::move(source));
  }
  if (current_.type == TokenType::KeywordOn) {
    if (!skip_clause(stop_at_returning)) return false;
  }
  if (current_.type == TokenType::KeywordReturning) {
    NodePtr returning;
    if (!parse_returning(returning)) return false;
    add_child(*node, std::move(returning));
  }
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses UPDATE [OR action] table SET assignments [FROM] [WHERE] [RETURNING] [ORDER BY/LIMIT].
bool Parser::parse_update(NodePtr& out) {
  auto node = make_node(NodeKind::Update, current_.pos);
  advance();
  if (current_.type == TokenType::KeywordOr) {
    advance();
    if (current_.type != TokenType::Identifier) {
      return set_error("Expected conflict action after UPDATE OR");
    }
    node->modifier = "OR " + util::to_upper(current_.text);
    advance();
  }
  NodePtr target;
  if (!parse_target_table(target)) return false;
  add_child(*node, std::move(target));
  if (!consume(TokenType::KeywordSet, "Expected SET in UPDATE")) return false;
  while (true) {
    auto assignment = make_node(NodeKind::Assignment, current_.pos);
    if (current_.type == TokenType::LParen) {
      if (!parse_name_list(assignment->column_names)) return false;
    } else if (!parse_name(assignment->name, "Expected column name in SET")) {
      return false;
    }
    if (!consume(TokenType::Equal, "Expected = in SET assignment")) return false;
    NodePtr value;
    if (!parse_expr(value)) return false;
    add_child(*assignment, std::move(value));
    finish(*assignment);
    add_child(*node, std::move(assignment));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
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
  if (current_.type == TokenType::KeywordReturning) {
    NodePtr returning;
    if (!parse_returning(returning)) return false;
    add_child(*node, std::move(returning));
  }
  if (current_.type == TokenType::KeywordOrder) {
    NodePtr order;
    if (!parse_order_by(order)) return false;
    add_child(*node, std::move(order));
  }
  if (!parse_limit_offset(*node)) return false;
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses DELETE FROM table [USING ...] [WHERE] [RETURNING] [ORDER BY/LIMIT].
bool Parser::parse_delete(NodePtr& out) {
  auto node = make_node(NodeKind::Delete, current_.pos);
  advance();
  if (!consume(TokenType::KeywordFrom, "Expected FROM after DELETE")) return false;
  NodePtr target;
  if (!parse_target_table(target)) return false;
  add_child(*node, std::move(target));
  if (current_.type == TokenType::KeywordUsing) {
    auto from = make_node(NodeKind::From, current_.pos);
    advance();
    if (!parse_join_chain(*from)) return false;
    finish(*from);
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
  if (current_.type == TokenType::KeywordReturning) {
    NodePtr returning;
    if (!parse_returning(returning)) return false;
    add_child(*node, std::move(returning));
  }
  if (current_.type == TokenType::KeywordOrder) {
    NodePtr order;
    if (!parse_order_by(order)) return false;
    add_child(*node, std::move(order));
  }
  if (!parse_limit_offset(*node)) return false;
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses CREATE [OR REPLACE] [modifiers] <object> [IF NOT EXISTS] name ...
/// Node name is the object kind; CREATE TABLE/VIEW ... AS keeps its query as a child.
bool Parser::parse_create(NodePtr& out) {
  auto node = make_node(NodeKind::Create, current_.pos);
  advance();
  if (current_.type == TokenType::KeywordOr) {
    advance();
    if (!consume_word("REPLACE", "Expected REPLACE after CREATE OR")) return false;
    node->modifier = "OR REPLACE";
  }
  while (current_.type == TokenType::Identifier && is_create_modifier(util::to_upper(current_.text))) {
    if (!node->modifier.empty()) node->modifier += " ";
    node->modifier += util::to_upper(current_.text);
    advance();
  }
  if (current_.type != TokenType::KeywordTable && current_.type != TokenType::Identifier) {
    return set_error("Expected object type after CREATE");
  }
  node->name = util::to_upper(current_.text);
  advance();
  if (match_word("IF")) {
    if (!consume(TokenType::KeywordNot, "Expected NOT after IF")) return false;
    if (!consume(TokenType::KeywordExists, "Expected EXISTS after IF NOT")) return false;
  }
  size_t start = current_.pos;
  std::string qualifier;
  std::string name;
  if (!parse_qualified_name(qualifier, name, "Expected name after CREATE " + node->name)) return false;
  auto target = make_node(NodeKind::Table, name, start);
  target->qualifier = qualifier;
  finish(*target);
  add_child(*node, std::move(target));

  if (node->name == "TRIGGER") {
    if (!skip_trigger_body()) return false;
  } else if (node->name == "TABLE" || node->name == "VIEW") {
    if (current_.type == TokenType::LParen) {
      if (node->name == "VIEW") {
        if (!parse_name_list(node->column_names)) return false;
      } else {
        advance();
        if (!skip_clause(nullptr)) return false;
        if (!consume(TokenType::RParen, "Expected ) to close column definitions")) return false;
      }
    }
    if (current_.type == TokenType::KeywordAs) {
      advance();
      NodePtr query;
      if (!parse_query(query)) return false;
      add_child(*node, std::move(query));
    }
    if (!skip_clause(nullptr)) return false;
  } else if (!skip_clause(nullptr)) {
    return false;
  }
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses ALTER <object> name ...; for tables, RENAME and DROP COLUMN actions
/// become Rename/Drop children so the nested change is visible in the tree.
bool Parser::parse_alter(NodePtr& out) {
  auto node = make_node(NodeKind::Alter, current_.pos);
  advance();
  if (current_.type != TokenType::KeywordTable && current_.type != TokenType::Identifier) {
    return set_error("Expected object type after ALTER");
  }
  node->name = util::to_upper(current_.text);
  advance();
  if (match_word("IF")) {
    if (!consume(TokenType::KeywordExists, "Expected EXISTS after IF")) return false;
  }
  size_t start = current_.pos;
  std::string qualifier;
  std::string name;
  if (!parse_qualified_name(qualifier, name, "Expected name after ALTER " + node->name)) return false;
  auto target = make_node(NodeKind::Table, name, start);
  target->qualifier = qualifier;
  finish(*target);
  add_child(*node, std::move(target));

  if (node->name == "TABLE" && current_.type == TokenType::KeywordRename) {
    auto rename = make_node(NodeKind::Rename, current_.pos);
    advance();
    if (match_word("TO")) {
      if (!parse_name(rename->name, "Expected new table name after RENAME TO")) return false;
    } else {
      match_word("COLUMN");
      std::string from;
      std::string to;
      if (!parse_name(from, "Expected column name after RENAME")) return false;
      if (!consume_word("TO", "Expected TO in RENAME COLUMN")) return false;
      if (!parse_name(to, "Expected new column name after TO")) return false;
      rename->modifier = "COLUMN";
      rename->column_names = {from, to};
    }
    finish(*rename);
    add_child(*node, std::move(rename));
  } else if (node->name == "TABLE" && current_.type == TokenType::KeywordDrop) {
    auto drop = make_node(NodeKind::Drop, "COLUMN", current_.pos);
    advance();
    match_word("COLUMN");
    if (match_word("IF")) {
      if (!consume(TokenType::KeywordExists, "Expected EXISTS after IF")) return false;
    }
    std::string column;
    if (!parse_name(column, "Expected column name after DROP")) return false;
    drop->column_names.push_back(column);
    finish(*drop);
    add_child(*node, std::move(drop));
  }
  if (!skip_clause(nullptr)) return false;
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses DROP <object> [IF EXISTS] name [, name ...] [CASCADE | RESTRICT].
bool Parser::parse_drop(NodePtr& out) {
  auto node = make_node(NodeKind::Drop, current_.pos);
  advance();
  if (current_.type != TokenType::KeywordTable && current_.type != TokenType::Identifier) {
    return set_error("Expected object type after DROP");
  }
  node->name = util::to_upper(current_.text);
  advance();
  if (match_word("IF")) {
    if (!consume(TokenType::KeywordExists, "Expected EXISTS after IF")) return false;
  }
  while (true) {
    size_t start = current_.pos;
    std::string qualifier;
    std::string name;
    if (!parse_qualified_name(qualifier, name, "Expected name after DROP " + node->name)) {
      return false;
    }
    auto target = make_node(NodeKind::Table, name, start);
    target->qualifier = qualifier;
    finish(*target);
    add_child(*node, std::move(target));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  if (!skip_clause(nullptr)) return false;
  finish(*node);
  out = std::move(node);
  return true;
}

bool Parser::parse_truncate(NodePtr& out) {
  auto node = make_node(NodeKind::Truncate, current_.pos);
  advance();
  if (current_.type == TokenType::KeywordTable) {
    advance();
  }
  match_word("ONLY");
  while (true) {
    NodePtr target;
    if (!parse_target_table(target)) return false;
    add_child(*node, std::move(target));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  if (!skip_clause(nullptr)) return false;
  finish(*node);
  out = std::move(node);
  return true;
}

/// Parses RENAME TABLE a TO b [, c TO d]; other RENAME forms are kept opaque.
bool Parser::parse_rename(NodePtr& out) {
  auto node = make_node(NodeKind::Rename, current_.pos);
  advance();
  if (current_.type != TokenType::KeywordTable) {
    if (!skip_clause(nullptr)) return false;
    finish(*node);
    out = std::move(node);
    return true;
  }
  node->name = "TABLE";
  advance();
  while (true) {
    NodePtr from;
    if (!parse_target_table(from)) return false;
    add_child(*node, std::move(from));
    if (!consume_word("TO", "Expected TO in RENAME TABLE")) return false;
    NodePtr to;
    if (!parse_target_table(to)) return false;
    add_child(*node, std::move(to));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  finish(*node);
  out = std::move(node);
  return true;
}

bool Parser::parse_returning(NodePtr& out) {
  auto node = make_node(NodeKind::Returning, current_.pos);
  advance();
  if (!parse_projections(*node)) return false;
  finish(*node);
  out = std::move(node);
  return true;
}

/// Skips a trigger header and its BEGIN ... END body, which may hold several statements.
/// MUST match END against nested CASE expressions.
bool Parser::skip_trigger_body() {
  while (!is_word("BEGIN")) {
    if (current_.type == TokenType::End) return set_error("Expected BEGIN in CREATE TRIGGER");
    if (current_.type == TokenType::Invalid) return set_error(current_.text);
    advance();
  }
  advance();
  size_t case_depth = 0;
  while (true) {
    if (current_.type == TokenType::End) return set_error("Expected END to close trigger body");
    if (current_.type == TokenType::Invalid) return set_error(current_.text);
    if (current_.type == TokenType::KeywordCase) {
      ++case_depth;
    } else if (current_.type == TokenType::KeywordEnd) {
      if (case_depth == 0) {
        advance();
        return true;
      }
      --case_depth;
    }
    advance();
  }
}

}  // namespace sqlvet
