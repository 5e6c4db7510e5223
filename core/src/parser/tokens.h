#pragma once

#include <cstddef>
#include <string>

namespace sqlvet {

/// Enumerates lexical tokens produced by the SQL lexer.
/// MUST remain consistent with parser expectations and keyword mapping.
/// Only reserved words get keyword tokens; contextual words (RECURSIVE, FILTER,
/// PRAGMA, ...) stay Identifier and are matched by the parser on their text.
enum class TokenType {
  Identifier,
  QuotedIdentifier,
  String,
  Number,
  Blob,
  Parameter,
  Comma,
  Dot,
  LParen,
  RParen,
  Semicolon,
  Star,
  Plus,
  Minus,
  Slash,
  Percent,
  Concat,
  Arrow,
  Equal,
  NotEqual,
  Less,
  LessEqual,
  Greater,
  GreaterEqual,
  ShiftLeft,
  ShiftRight,
  Ampersand,
  Pipe,
  Tilde,
  DoubleColon,
  End,
  Invalid,
  KeywordSelect,
  KeywordFrom,
  KeywordWhere,
  KeywordGroup,
  KeywordBy,
  KeywordHaving,
  KeywordOrder,
  KeywordLimit,
  KeywordOffset,
  KeywordUnion,
  KeywordIntersect,
  KeywordExcept,
  KeywordAll,
  KeywordDistinct,
  KeywordAs,
  KeywordOn,
  KeywordUsing,
  KeywordJoin,
  KeywordInner,
  KeywordLeft,
  KeywordRight,
  KeywordFull,
  KeywordOuter,
  KeywordCross,
  KeywordNatural,
  KeywordWith,
  KeywordAnd,
  KeywordOr,
  KeywordNot,
  KeywordIn,
  KeywordIs,
  KeywordNull,
  KeywordLike,
  KeywordIlike,
  KeywordBetween,
  KeywordExists,
  KeywordCase,
  KeywordWhen,
  KeywordThen,
  KeywordElse,
  KeywordEnd,
  KeywordCast,
  KeywordCollate,
  KeywordEscape,
  KeywordValues,
  KeywordInsert,
  KeywordUpdate,
  KeywordDelete,
  KeywordSet,
  KeywordInto,
  KeywordCreate,
  KeywordAlter,
  KeywordDrop,
  KeywordTruncate,
  KeywordRename,
  KeywordTable,
  KeywordReturning,
  KeywordAsc,
  KeywordDesc,
  KeywordWindow,
  KeywordOver,
  KeywordDefault
};

/// Represents a single token with source text and position metadata.
/// MUST track byte positions to support precise error reporting.
/// Quoted identifiers and strings carry their unquoted, unescaped text.
struct Token {
  TokenType type = TokenType::End;
  std::string text;
  size_t pos = 0;
};

}  // namespace sqlvet
