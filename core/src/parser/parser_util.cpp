#include "parser_internal.h"

#include "../util/string_util.h"

namespace sqlvet {

/// Parses a bare or delimited identifier.
/// MUST reject keywords and literals so clause boundaries stay unambiguous.
bool Parser::parse_name(std::string& out, const std::string& message) {
  if (current_.type != TokenType::Identifier && current_.type != TokenType::QuotedIdentifier) {
    return set_error(message);
  }
  out = current_.text;
  advance();
  return true;
}

/// Parses name or schema.name; qualifier stays empty for unqualified names.
bool Parser::parse_qualified_name(std::string& qualifier, std::string& name,
                                  const std::string& message) {
  std::string first;
  if (!parse_name(first, message)) return false;
  if (current_.type != TokenType::Dot) {
    qualifier.clear();
    name = first;
    return true;
  }
  advance();
  qualifier = first;
  return parse_name(name, "Expected name after '.'");
}

/// Parses a parenthesized, comma-separated identifier list such as USING (a, b).
bool Parser::parse_name_list(std::vector<std::string>& out) {
  if (!consume(TokenType::LParen, "Expected (")) return false;
  while (true) {
    std::string name;
    if (!parse_name(name, "Expected column name")) return false;
    out.push_back(name);
    if (current_.type == TokenType::Comma) {
      advance();
      continue;
    }
    break;
  }
  return consume(TokenType::RParen, "Expected ) after column list");
}

bool Parser::skip_clause(const std::function<bool(const Token&)>& stop_at) {
  size_t depth = 0;
  while (true) {
    switch (current_.type) {
      case TokenType::Invalid:
        return set_error(current_.text);
      case TokenType::End:
        if (depth > 0) return set_error("Expected ) before end of input");
        return true;
      case TokenType::LParen:
        ++depth;
        break;
      case TokenType::RParen:
        if (depth == 0) return true;
        --depth;
        break;
      case TokenType::Semicolon:
        if (depth == 0) return true;
        break;
      default:
        if (depth == 0 && stop_at && stop_at(current_)) return true;
        break;
    }
    advance();
  }
}

/// Tests whether the current token is the given contextual (non-reserved) word.
bool Parser::is_word(const char* word) const {
  return current_.type == TokenType::Identifier && util::to_upper(current_.text) == word;
}

bool Parser::match_word(const char* word) {
  if (!is_word(word)) return false;
  advance();
  return true;
}

bool Parser::consume_word(const char* word, const std::string& message) {
  if (!match_word(word)) return set_error(message);
  return true;
}

bool Parser::is_query_start() const {
  return current_.type == TokenType::KeywordSelect || current_.type == TokenType::KeywordValues ||
         current_.type == TokenType::KeywordWith;
}

bool Parser::is_dml_start() const {
  return current_.type == TokenType::KeywordInsert || current_.type == TokenType::KeywordUpdate ||
         current_.type == TokenType::KeywordDelete || is_word("REPLACE");
}

/// Consumes a token of the expected type or sets a parse error.
/// MUST advance the token stream on success.
/// Inputs are token type/message; outputs are success or error.
bool Parser::consume(TokenType type, const std::string& message) {
  if (current_.type != type) {
    return set_error(message);
  }
  advance();
  return true;
}

/// Records the first parse error for reporting.
/// MUST preserve the earliest error; a lexical error replaces the parser's message.
/// Inputs are error message; outputs are false with stored error.
bool Parser::set_error(const std::string& message) {
  if (error_.has_value()) return false;
  ParseError err;
  err.kind = ParseError::Kind::Syntax;
  err.message = current_.type == TokenType::Invalid ? current_.text : message;
  err.position = current_.pos;
  error_ = err;
  return false;
}

/// Produces a ParseResult using the recorded error.
/// MUST return an empty statement with the stored error.
ParseResult Parser::error_result() {
  ParseResult res;
  res.error = error_;
  return res;
}

/// Advances to the next token in the input stream.
/// MUST be called after consuming tokens to keep state in sync.
void Parser::advance() {
  if (has_peek_) {
    current_ = peek_;
    has_peek_ = false;
    return;
  }
  current_ = lexer_.next();
}

/// Peeks one token ahead without consuming it.
/// MUST preserve current_ and return a cached lookahead.
Token Parser::peek() {
  if (!has_peek_) {
    peek_ = lexer_.next();
    has_peek_ = true;
  }
  return peek_;
}

void Parser::finish(Node& node) const {
  node.span.end = current_.pos;
}

void Parser::prepend_child(Node& parent, NodePtr child) {
  child->parent = &parent;
  parent.children.insert(parent.children.begin(), std::move(child));
}

bool Parser::too_deep() {
  if (depth_ <= kMaxDepth) return false;
  set_error("Query nesting exceeds limit");
  return true;
}

}  // namespace sqlvet
