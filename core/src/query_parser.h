#pragma once

#include <optional>
#include <string>

#include "ast.h"
#include "sqlvet/sqlvet.h"

namespace sqlvet {

/// Describes a parse failure with a message and byte position.
/// MUST report positions relative to the original input string.
/// Empty marks input with no statement at all (whitespace, comments, bare ;).
struct ParseError {
  enum class Kind { Empty, Syntax };
  Kind kind = Kind::Syntax;
  std::string message;
  size_t position = 0;
};

/// Wraps either a parsed Statement or a ParseError.
/// MUST contain exactly one of statement or error.
struct ParseResult {
  std::optional<Statement> statement;
  std::optional<ParseError> error;
};

/// Parses exactly one SQL statement into a classified AST.
/// MUST return errors without throwing on invalid syntax.
/// Inputs are query text and dialect; outputs are ParseResult with optional error.
ParseResult parse_sql(const std::string& input, Dialect dialect);

}  // namespace sqlvet
