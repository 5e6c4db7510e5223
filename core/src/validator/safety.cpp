#include "validator_internal.h"

#include "../util/string_util.h"

namespace sqlvet::validator_internal {

CheckResult check_safety(const ParseResult& parsed, const std::string& sql) {
  if (parsed.error.has_value()) {
    if (parsed.error->kind == ParseError::Kind::Empty) {
      return CheckResult{false, "Unsafe: Parse failed - empty result"};
    }
    return keyword_fallback(sql);
  }
  StatementKind kind = parsed.statement->kind;
  if (kind == StatementKind::Select) {
    return CheckResult{true, "Safe - SELECT only"};
  }
  if (kind == StatementKind::Other) {
    return CheckResult{false, "Unsafe: Non-SELECT statement"};
  }
  return CheckResult{false, std::string("Unsafe: ") + statement_kind_name(kind) + " operation detected"};
}

/// Keyword scan for input the parser rejected.
/// Matches substrings, so identifiers such as updated_at also trip it.
CheckResult keyword_fallback(const std::string& sql) {
  static const char* const kHarmful[] = {"DROP", "DELETE", "INSERT", "UPDATE", "CREATE", "ALTER"};
  std::string upper = util::to_upper(sql);
  for (const char* keyword : kHarmful) {
    if (upper.find(keyword) != std::string::npos) {
      return CheckResult{false, "Unsafe: Harmful keyword detected"};
    }
  }
  return CheckResult{true, "Safe - Keyword check passed"};
}

}  // namespace sqlvet::validator_internal
