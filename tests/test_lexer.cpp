#include "test_harness.h"

#include <vector>

#include "parser/lexer.h"

namespace {

std::vector<sqlvet::Token> lex_all(const std::string& input, sqlvet::Dialect dialect) {
  sqlvet::Lexer lexer(input, dialect);
  std::vector<sqlvet::Token> tokens;
  while (true) {
    sqlvet::Token token = lexer.next();
    tokens.push_back(token);
    if (token.type == sqlvet::TokenType::End || token.type == sqlvet::TokenType::Invalid) break;
  }
  return tokens;
}

void test_keywords_case_insensitive() {
  auto tokens = lex_all("select Country from readings", sqlvet::Dialect::Sqlite);
  expect_eq(tokens.size(), 5, "keyword token count");
  if (tokens.size() == 5) {
    expect_true(tokens[0].type == sqlvet::TokenType::KeywordSelect, "lowercase select is a keyword");
    expect_eq(tokens[0].text, "select", "keyword keeps source text");
    expect_true(tokens[1].type == sqlvet::TokenType::Identifier, "country is an identifier");
    expect_true(tokens[2].type == sqlvet::TokenType::KeywordFrom, "from is a keyword");
    expect_eq(tokens[3].pos, 20, "identifier position");
  }
}

void test_parameters() {
  auto tokens = lex_all("? ?1 :name @v $2", sqlvet::Dialect::Sqlite);
  expect_eq(tokens.size(), 6, "parameter token count");
  const char* expected[] = {"?", "?1", ":name", "@v", "$2"};
  for (size_t i = 0; i < 5 && i < tokens.size(); ++i) {
    expect_true(tokens[i].type == sqlvet::TokenType::Parameter, "parameter type");
    expect_eq(tokens[i].text, expected[i], "parameter text");
  }
}

void test_lone_parameter_prefix_is_invalid() {
  auto tokens = lex_all("SELECT @", sqlvet::Dialect::Sqlite);
  expect_true(tokens.back().type == sqlvet::TokenType::Invalid, "lone @ is invalid");
  expect_eq(tokens.back().text, "Expected parameter name after '@'", "lone @ message");
}

void test_string_escapes_and_blob() {
  auto tokens = lex_all("'it''s' x'0A'", sqlvet::Dialect::Sqlite);
  expect_eq(tokens.size(), 3, "string and blob count");
  if (tokens.size() == 3) {
    expect_true(tokens[0].type == sqlvet::TokenType::String, "string type");
    expect_eq(tokens[0].text, "it's", "doubled quote folds");
    expect_true(tokens[1].type == sqlvet::TokenType::Blob, "blob type");
    expect_eq(tokens[1].text, "X'0A'", "blob text");
  }
}

void test_quoted_identifiers_by_dialect() {
  auto sqlite = lex_all("[my col] `b` \"c\"\"d\"", sqlvet::Dialect::Sqlite);
  expect_eq(sqlite.size(), 4, "sqlite quoted identifier count");
  if (sqlite.size() == 4) {
    expect_eq(sqlite[0].text, "my col", "bracket identifier");
    expect_eq(sqlite[1].text, "b", "backtick identifier");
    expect_eq(sqlite[2].text, "c\"d", "double quote escape");
  }
  auto postgres = lex_all("[a]", sqlvet::Dialect::Postgres);
  expect_true(postgres.back().type == sqlvet::TokenType::Invalid, "brackets are not identifiers in postgres");
  expect_eq(postgres.back().text, "Unexpected character '['", "bracket message");
}

void test_operators() {
  auto tokens = lex_all("a || b <> c != d :: e ->> f", sqlvet::Dialect::Postgres);
  expect_eq(tokens.size(), 12, "operator token count");
  if (tokens.size() == 12) {
    expect_true(tokens[1].type == sqlvet::TokenType::Concat, "concat");
    expect_true(tokens[3].type == sqlvet::TokenType::NotEqual, "<> is not-equal");
    expect_true(tokens[5].type == sqlvet::TokenType::NotEqual, "!= is not-equal");
    expect_true(tokens[7].type == sqlvet::TokenType::DoubleColon, "double colon");
    expect_true(tokens[9].type == sqlvet::TokenType::Arrow, "json arrow");
    expect_eq(tokens[9].text, "->>", "json arrow text");
  }
}

void test_numbers() {
  auto tokens = lex_all("42 3.5 .5 1e10 0x1F", sqlvet::Dialect::Sqlite);
  expect_eq(tokens.size(), 6, "number token count");
  for (size_t i = 0; i < 5 && i < tokens.size(); ++i) {
    expect_true(tokens[i].type == sqlvet::TokenType::Number, "numeric literal");
  }
  auto bad = lex_all("SELECT 12abc", sqlvet::Dialect::Sqlite);
  expect_eq(bad.back().text, "Malformed numeric literal", "number followed by letters");
}

void test_comments_are_skipped() {
  auto tokens = lex_all("-- header\nSELECT /* inline */ 1", sqlvet::Dialect::Sqlite);
  expect_eq(tokens.size(), 3, "comments produce no tokens");
  auto bad = lex_all("SELECT 1 /* open", sqlvet::Dialect::Sqlite);
  expect_eq(bad.back().text, "Unterminated block comment", "unterminated comment");
}

void test_unterminated_literals() {
  auto str = lex_all("SELECT 'abc", sqlvet::Dialect::Sqlite);
  expect_eq(str.back().text, "Unterminated string literal", "unterminated string");
  auto ident = lex_all("SELECT \"abc", sqlvet::Dialect::Sqlite);
  expect_eq(ident.back().text, "Unterminated quoted identifier", "unterminated identifier");
}

void test_ilike_only_in_postgres() {
  auto pg = lex_all("ILIKE", sqlvet::Dialect::Postgres);
  expect_true(pg[0].type == sqlvet::TokenType::KeywordIlike, "ilike keyword in postgres");
  auto lite = lex_all("ILIKE", sqlvet::Dialect::Sqlite);
  expect_true(lite[0].type == sqlvet::TokenType::Identifier, "ilike identifier in sqlite");
}

}  // namespace

void register_lexer_tests(std::vector<TestCase>& tests) {
  tests.push_back({"lexer_keywords_case_insensitive", test_keywords_case_insensitive});
  tests.push_back({"lexer_parameters", test_parameters});
  tests.push_back({"lexer_lone_parameter_prefix_is_invalid", test_lone_parameter_prefix_is_invalid});
  tests.push_back({"lexer_string_escapes_and_blob", test_string_escapes_and_blob});
  tests.push_back({"lexer_quoted_identifiers_by_dialect", test_quoted_identifiers_by_dialect});
  tests.push_back({"lexer_operators", test_operators});
  tests.push_back({"lexer_numbers", test_numbers});
  tests.push_back({"lexer_comments_are_skipped", test_comments_are_skipped});
  tests.push_back({"lexer_unterminated_literals", test_unterminated_literals});
  tests.push_back({"lexer_ilike_only_in_postgres", test_ilike_only_in_postgres});
}
