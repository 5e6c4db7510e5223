#include "parser_internal.h"

#include "../util/string_util.h"

namespace sqlvet {

/// Constructs a parser for a given query input.
/// MUST immediately read the first token to initialize state.
Parser::Parser(const std::string& input, Dialect dialect) : lexer_(input, dialect), dialect_(dialect) {
  advance();
}

/// Parses a full statement and returns either a Statement or a ParseError.
/// MUST consume all tokens or report an unexpected trailing token.
ParseResult Parser::parse() {
  if (current_.type == TokenType::Invalid) {
    set_error(current_.text);
    return error_result();
  }
  while (current_.type == TokenType::Semicolon) {
    advance();
  }
  if (current_.type == TokenType::End) {
    ParseError err;
    err.kind = ParseError::Kind::Empty;
    err.message = "Empty query";
    err.position = current_.pos;
    ParseResult res;
    res.error = err;
    return res;
  }
  NodePtr root;
  if (!parse_statement(root)) return error_result();
  while (current_.type == TokenType::Semicolon) {
    advance();
  }
  if (current_.type != TokenType::End) {
    // WHY: a second statement would run unchecked by the store's single-statement prepare.
    set_error("Unexpected token after statement");
    return error_result();
  }
  ParseResult res;
  Statement statement;
  statement.kind = classify_statement(*root);
  statement.root = std::move(root);
  res.statement = std::move(statement);
  return res;
}

/// Dispatches on the leading token to the statement-specific parser.
/// MUST produce a dedicated node for every mutating statement so classification is structural.
bool Parser::parse_statement(NodePtr& out) {
  DepthScope scope(depth_);
  if (too_deep()) return false;
  switch (current_.type) {
    case TokenType::KeywordSelect:
    case TokenType::KeywordValues:
    case TokenType::KeywordWith:
    case TokenType::LParen:
      return parse_query(out);
    case TokenType::KeywordInsert:
      return parse_insert(out);
    case TokenType::KeywordUpdate:
      return parse_update(out);
    case TokenType::KeywordDelete:
      return parse_delete(out);
    case TokenType::KeywordCreate:
      return parse_create(out);
    case TokenType::KeywordAlter:
      return parse_alter(out);
    case TokenType::KeywordDrop:
      return parse_drop(out);
    case TokenType::KeywordTruncate:
      return parse_truncate(out);
    case TokenType::KeywordRename:
      return parse_rename(out);
    case TokenType::KeywordSet:
    case TokenType::KeywordEnd:
      return parse_command(out);
    case TokenType::Identifier:
      break;
    default:
      return set_error("Expected statement");
  }
  if (is_word("REPLACE")) {
    return parse_insert(out);
  }
  if (is_word("EXPLAIN")) {
    auto node = make_node(NodeKind::Command, "EXPLAIN", current_.pos);
    advance();
    if (match_word("QUERY")) {
      if (!consume_word("PLAN", "Expected PLAN after EXPLAIN QUERY")) return false;
      node->modifier = "QUERY PLAN";
    }
    NodePtr inner;
    if (!parse_statement(inner)) return false;
    add_child(*node, std::move(inner));
    finish(*node);
    out = std::move(node);
    return true;
  }
  return parse_command(out);
}

/// Parses a non-query command (PRAGMA, ATTACH, VACUUM, BEGIN, ...) as an opaque node.
/// MUST consume the command up to the statement terminator.
bool Parser::parse_command(NodePtr& out) {
  auto node = make_node(NodeKind::Command, util::to_upper(current_.text), current_.pos);
  advance();
  if (!skip_clause(nullptr)) return false;
  finish(*node);
  out = std::move(node);
  return true;
}

ParseResult parse_sql(const std::string& input, Dialect dialect) {
  Parser parser(input, dialect);
  ParseResult res = parser.parse();
  if (res.statement.has_value()) {
    res.statement->text = input;
  }
  return res;
}

}  // namespace sqlvet
