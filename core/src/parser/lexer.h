#pragma once

#include <string>

#include "sqlvet/sqlvet.h"
#include "tokens.h"

namespace sqlvet {

/// Tokenizes SQL input into a stream for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
/// Inputs are query strings; outputs are tokens with position metadata.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  Lexer(const std::string& input, Dialect dialect);
  /// Produces the next token, skipping whitespace and comments.
  /// MUST advance the cursor and MUST return End at input exhaustion.
  /// Malformed input yields an Invalid token whose text describes the problem.
  Token next();

 private:
  /// Lexes a single-quoted string literal, folding '' escapes.
  Token lex_string();
  /// Lexes a delimited identifier ("x", `x`, [x]) up to the closing delimiter.
  Token lex_quoted_identifier(char close);
  /// Lexes identifiers and recognizes reserved keywords case-insensitively.
  Token lex_identifier_or_keyword();
  /// Lexes integer, decimal, exponent, and hex numeric literals.
  Token lex_number();
  /// Lexes ?, ?NNN, :name, @name, and $name/$N parameters.
  Token lex_parameter();
  /// Skips whitespace, -- line comments, and /* */ block comments.
  /// MUST report an unterminated block comment through comment_error_.
  void skip_ws_and_comments();
  static bool is_ident_start(char c);
  static bool is_ident_char(char c);

  const std::string& input_;
  Dialect dialect_;
  size_t pos_ = 0;
  bool comment_error_ = false;
};

}  // namespace sqlvet
