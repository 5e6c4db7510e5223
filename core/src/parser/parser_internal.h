#pragma once

#include <functional>
#include <optional>
#include <string>

#include "../query_parser.h"
#include "lexer.h"

namespace sqlvet {

/// Implements recursive-descent parsing of one SQL statement over the token stream.
/// MUST preserve token order and MUST set error_ on first failure.
/// Inputs are lexer tokens; outputs are ParseResult with no side effects.
class Parser {
 public:
  Parser(const std::string& input, Dialect dialect);
  ParseResult parse();

 private:
  // parser.cpp
  bool parse_statement(NodePtr& out);
  bool parse_command(NodePtr& out);

  // parser_query.cpp
  bool parse_query(NodePtr& out);
  bool parse_with(NodePtr& out);
  bool parse_cte(NodePtr& out);
  bool parse_compound(NodePtr& out);
  bool parse_compound_operand(NodePtr& out);
  bool parse_select_core(NodePtr& out);
  bool parse_values(NodePtr& out);
  bool parse_projections(Node& projections);
  bool parse_projection(Node& projections);
  bool parse_order_by(NodePtr& out);
  bool parse_limit_offset(Node& query);
  bool parse_window_clause(NodePtr& out);
  bool parse_window_spec(Node& window);

  // parser_source.cpp
  bool parse_from(NodePtr& out);
  bool parse_join_chain(Node& from);
  bool parse_table_ref(NodePtr& out);
  bool parse_relation_alias(Node& relation);
  bool parse_target_table(NodePtr& out);

  // parser_expr.cpp
  bool parse_expr(NodePtr& out);
  bool parse_or_expr(NodePtr& out);
  bool parse_and_expr(NodePtr& out);
  bool parse_not_expr(NodePtr& out);
  bool parse_cmp_expr(NodePtr& out);
  bool parse_rel_expr(NodePtr& out);
  bool parse_bit_expr(NodePtr& out);
  bool parse_add_expr(NodePtr& out);
  bool parse_mul_expr(NodePtr& out);
  bool parse_concat_expr(NodePtr& out);
  bool parse_unary_expr(NodePtr& out);
  bool parse_postfix_expr(NodePtr& out);
  bool parse_primary(NodePtr& out);
  bool parse_column_ref(NodePtr& out);
  bool parse_function_call(NodePtr& out);
  bool parse_case(NodePtr& out);
  bool parse_cast(NodePtr& out);
  bool parse_in_rhs(Node& in_node);
  bool parse_type_name(std::string& out, bool multi_word);
  bool parse_expr_list(Node& parent);

  // parser_statement.cpp
  bool parse_insert(NodePtr& out);
  bool parse_update(NodePtr& out);
  bool parse_delete(NodePtr& out);
  bool parse_create(NodePtr& out);
  bool parse_alter(NodePtr& out);
  bool parse_drop(NodePtr& out);
  bool parse_truncate(NodePtr& out);
  bool parse_rename(NodePtr& out);
  bool parse_returning(NodePtr& out);
  bool skip_trigger_body();

  // parser_util.cpp
  bool parse_name(std::string& out, const std::string& message);
  bool parse_qualified_name(std::string& qualifier, std::string& name, const std::string& message);
  bool parse_name_list(std::vector<std::string>& out);
  /// Skips tokens until stop_at matches at parenthesis depth 0, or ';' / End / an unmatched ).
  /// MUST leave current_ on the stopping token without consuming it.
  bool skip_clause(const std::function<bool(const Token&)>& stop_at);
  bool is_word(const char* word) const;
  bool match_word(const char* word);
  bool consume_word(const char* word, const std::string& message);
  bool is_query_start() const;
  bool is_dml_start() const;
  bool consume(TokenType type, const std::string& message);
  bool set_error(const std::string& message);
  ParseResult error_result();
  void advance();
  Token peek();
  void finish(Node& node) const;
  static void prepend_child(Node& parent, NodePtr child);

  /// Bounds recursion so hostile nesting fails as a syntax error instead of overflowing the stack.
  class DepthScope {
   public:
    explicit DepthScope(size_t& depth) : depth_(depth) { ++depth_; }
    ~DepthScope() { --depth_; }

   private:
    size_t& depth_;
  };
  static constexpr size_t kMaxDepth = 200;
  bool too_deep();

  Lexer lexer_;
  Dialect dialect_;
  Token current_{};
  Token peek_{};
  bool has_peek_ = false;
  size_t depth_ = 0;
  std::optional<ParseError> error_;
};

}  // namespace sqlvet
