#include "lexer.h"

#include <cctype>

#include "../util/string_util.h"

namespace sqlvet {

namespace {

struct KeywordEntry {
  const char* word;
  TokenType type;
};

const KeywordEntry kKeywords[] = {
    {"SELECT", TokenType::KeywordSelect},
    {"FROM", TokenType::KeywordFrom},
    {"WHERE", TokenType::KeywordWhere},
    {"GROUP", TokenType::KeywordGroup},
    {"BY", TokenType::KeywordBy},
    {"HAVING", TokenType::KeywordHaving},
    {"ORDER", TokenType::KeywordOrder},
    {"LIMIT", TokenType::KeywordLimit},
    {"OFFSET", TokenType::KeywordOffset},
    {"UNION", TokenType::KeywordUnion},
    {"INTERSECT", TokenType::KeywordIntersect},
    {"EXCEPT", TokenType::KeywordExcept},
    {"ALL", TokenType::KeywordAll},
    {"DISTINCT", TokenType::KeywordDistinct},
    {"AS", TokenType::KeywordAs},
    {"ON", TokenType::KeywordOn},
    {"USING", TokenType::KeywordUsing},
    {"JOIN", TokenType::KeywordJoin},
    {"INNER", TokenType::KeywordInner},
    {"LEFT", TokenType::KeywordLeft},
    {"RIGHT", TokenType::KeywordRight},
    {"FULL", TokenType::KeywordFull},
    {"OUTER", TokenType::KeywordOuter},
    {"CROSS", TokenType::KeywordCross},
    {"NATURAL", TokenType::KeywordNatural},
    {"WITH", TokenType::KeywordWith},
    {"AND", TokenType::KeywordAnd},
    {"OR", TokenType::KeywordOr},
    {"NOT", TokenType::KeywordNot},
    {"IN", TokenType::KeywordIn},
    {"IS", TokenType::KeywordIs},
    {"NULL", TokenType::KeywordNull},
    {"LIKE", TokenType::KeywordLike},
    {"BETWEEN", TokenType::KeywordBetween},
    {"EXISTS", TokenType::KeywordExists},
    {"CASE", TokenType::KeywordCase},
    {"WHEN", TokenType::KeywordWhen},
    {"THEN", TokenType::KeywordThen},
    {"ELSE", TokenType::KeywordElse},
    {"END", TokenType::KeywordEnd},
    {"CAST", TokenType::KeywordCast},
    {"COLLATE", TokenType::KeywordCollate},
    {"ESCAPE", TokenType::KeywordEscape},
    {"VALUES", TokenType::KeywordValues},
    {"INSERT", TokenType::KeywordInsert},
    {"UPDATE", TokenType::KeywordUpdate},
    {"DELETE", TokenType::KeywordDelete},
    {"SET", TokenType::KeywordSet},
    {"INTO", TokenType::KeywordInto},
    {"CREATE", TokenType::KeywordCreate},
    {"ALTER", TokenType::KeywordAlter},
    {"DROP", TokenType::KeywordDrop},
    {"TRUNCATE", TokenType::KeywordTruncate},
    {"RENAME", TokenType::KeywordRename},
    {"TABLE", TokenType::KeywordTable},
    {"RETURNING", TokenType::KeywordReturning},
    {"ASC", TokenType::KeywordAsc},
    {"DESC", TokenType::KeywordDesc},
    {"WINDOW", TokenType::KeywordWindow},
    {"OVER", TokenType::KeywordOver},
    {"DEFAULT", TokenType::KeywordDefault},
};

}  // namespace

Lexer::Lexer(const std::string& input, Dialect dialect) : input_(input), dialect_(dialect) {}

Token Lexer::next() {
  skip_ws_and_comments();
  if (comment_error_) {
    comment_error_ = false;
    return Token{TokenType::Invalid, "Unterminated block comment", pos_};
  }
  if (pos_ >= input_.size()) {
    return Token{TokenType::End, "", pos_};
  }

  size_t start = pos_;
  char c = input_[pos_];
  char n = pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';

  auto single = [&](TokenType type) {
    ++pos_;
    return Token{type, std::string(1, c), start};
  };
  auto pair = [&](TokenType type) {
    pos_ += 2;
    return Token{type, input_.substr(start, 2), start};
  };

  switch (c) {
    case ',': return single(TokenType::Comma);
    case '(': return single(TokenType::LParen);
    case ')': return single(TokenType::RParen);
    case ';': return single(TokenType::Semicolon);
    case '*': return single(TokenType::Star);
    case '+': return single(TokenType::Plus);
    case '/': return single(TokenType::Slash);
    case '%': return single(TokenType::Percent);
    case '&': return single(TokenType::Ampersand);
    case '~': return single(TokenType::Tilde);
    case '-':
      if (n == '>') {
        if (pos_ + 2 < input_.size() && input_[pos_ + 2] == '>') {
          pos_ += 3;
          return Token{TokenType::Arrow, "->>", start};
        }
        return pair(TokenType::Arrow);
      }
      return single(TokenType::Minus);
    case '|':
      if (n == '|') return pair(TokenType::Concat);
      return single(TokenType::Pipe);
    case '=':
      if (n == '=') return pair(TokenType::Equal);
      return single(TokenType::Equal);
    case '!':
      if (n == '=') return pair(TokenType::NotEqual);
      break;
    case '<':
      if (n == '>') return pair(TokenType::NotEqual);
      if (n == '=') return pair(TokenType::LessEqual);
      if (n == '<') return pair(TokenType::ShiftLeft);
      return single(TokenType::Less);
    case '>':
      if (n == '=') return pair(TokenType::GreaterEqual);
      if (n == '>') return pair(TokenType::ShiftRight);
      return single(TokenType::Greater);
    case ':':
      if (n == ':') return pair(TokenType::DoubleColon);
      if (is_ident_char(n)) return lex_parameter();
      break;
    case '?':
    case '@':
    case '$':
      return lex_parameter();
    case '\'':
      return lex_string();
    case '"':
      return lex_quoted_identifier('"');
    case '`':
      if (dialect_ != Dialect::Postgres) return lex_quoted_identifier('`');
      break;
    case '[':
      if (dialect_ == Dialect::Sqlite) return lex_quoted_identifier(']');
      break;
    case '.':
      if (std::isdigit(static_cast<unsigned char>(n))) return lex_number();
      return single(TokenType::Dot);
    default:
      break;
  }

  if ((c == 'x' || c == 'X') && n == '\'') {
    ++pos_;
    Token blob = lex_string();
    if (blob.type == TokenType::String) {
      blob.type = TokenType::Blob;
      blob.text = "X'" + blob.text + "'";
    }
    blob.pos = start;
    return blob;
  }
  if (std::isdigit(static_cast<unsigned char>(c))) {
    return lex_number();
  }
  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }

  ++pos_;
  return Token{TokenType::Invalid, std::string("Unexpected character '") + c + "'", start};
}

Token Lexer::lex_string() {
  size_t start = pos_;
  ++pos_;
  std::string out;
  while (pos_ < input_.size()) {
    char c = input_[pos_++];
    if (c == '\'') {
      if (pos_ < input_.size() && input_[pos_] == '\'') {
        out.push_back('\'');
        ++pos_;
        continue;
      }
      return Token{TokenType::String, out, start};
    }
    out.push_back(c);
  }
  return Token{TokenType::Invalid, "Unterminated string literal", start};
}

Token Lexer::lex_quoted_identifier(char close) {
  size_t start = pos_;
  ++pos_;
  std::string out;
  while (pos_ < input_.size()) {
    char c = input_[pos_++];
    if (c == close) {
      // Doubled delimiters escape themselves, except for ] which cannot nest.
      if (close != ']' && pos_ < input_.size() && input_[pos_] == close) {
        out.push_back(close);
        ++pos_;
        continue;
      }
      return Token{TokenType::QuotedIdentifier, out, start};
    }
    out.push_back(c);
  }
  return Token{TokenType::Invalid, "Unterminated quoted identifier", start};
}

Token Lexer::lex_identifier_or_keyword() {
  size_t start = pos_;
  while (pos_ < input_.size() && is_ident_char(input_[pos_])) {
    ++pos_;
  }
  std::string out = input_.substr(start, pos_ - start);
  std::string upper = util::to_upper(out);
  for (const auto& entry : kKeywords) {
    if (upper == entry.word) return Token{entry.type, out, start};
  }
  if (dialect_ == Dialect::Postgres && upper == "ILIKE") {
    return Token{TokenType::KeywordIlike, out, start};
  }
  return Token{TokenType::Identifier, out, start};
}

Token Lexer::lex_number() {
  size_t start = pos_;
  auto digits = [&]() {
    while (pos_ < input_.size() &&
           (std::isdigit(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '_')) {
      ++pos_;
    }
  };
  if (input_[pos_] == '0' && pos_ + 1 < input_.size() &&
      (input_[pos_ + 1] == 'x' || input_[pos_ + 1] == 'X')) {
    pos_ += 2;
    while (pos_ < input_.size() && std::isxdigit(static_cast<unsigned char>(input_[pos_]))) {
      ++pos_;
    }
    return Token{TokenType::Number, input_.substr(start, pos_ - start), start};
  }
  digits();
  if (pos_ < input_.size() && input_[pos_] == '.') {
    ++pos_;
    digits();
  }
  if (pos_ < input_.size() && (input_[pos_] == 'e' || input_[pos_] == 'E')) {
    size_t save = pos_;
    ++pos_;
    if (pos_ < input_.size() && (input_[pos_] == '+' || input_[pos_] == '-')) ++pos_;
    if (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
      digits();
    } else {
      pos_ = save;
    }
  }
  if (pos_ < input_.size() && is_ident_start(input_[pos_])) {
    while (pos_ < input_.size() && is_ident_char(input_[pos_])) ++pos_;
    return Token{TokenType::Invalid, "Malformed numeric literal", start};
  }
  return Token{TokenType::Number, input_.substr(start, pos_ - start), start};
}

Token Lexer::lex_parameter() {
  size_t start = pos_;
  ++pos_;
  while (pos_ < input_.size() && is_ident_char(input_[pos_])) {
    ++pos_;
  }
  std::string text = input_.substr(start, pos_ - start);
  if (text.size() == 1 && text[0] != '?') {
    return Token{TokenType::Invalid, "Expected parameter name after '" + text + "'", start};
  }
  return Token{TokenType::Parameter, text, start};
}

void Lexer::skip_ws_and_comments() {
  while (pos_ < input_.size()) {
    char c = input_[pos_];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++pos_;
      continue;
    }
    if (c == '-' && pos_ + 1 < input_.size() && input_[pos_ + 1] == '-') {
      while (pos_ < input_.size() && input_[pos_] != '\n') ++pos_;
      continue;
    }
    if (c == '/' && pos_ + 1 < input_.size() && input_[pos_ + 1] == '*') {
      size_t close = input_.find("*/", pos_ + 2);
      if (close == std::string::npos) {
        pos_ = input_.size();
        comment_error_ = true;
        return;
      }
      pos_ = close + 2;
      continue;
    }
    break;
  }
}

bool Lexer::is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool Lexer::is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' ||
         static_cast<unsigned char>(c) >= 0x80;
}

}  // namespace sqlvet
