#pragma once

#include <string>

#include "../query_parser.h"
#include "sqlvet/sqlvet.h"

namespace sqlvet::validator_internal {

/// Classifies a parsed statement as safe (SELECT only) or unsafe.
/// MUST fall back to keyword scanning when the statement could not be parsed.
/// Inputs are a parse result and its source text; outputs are CheckResult.
CheckResult check_safety(const ParseResult& parsed, const std::string& sql);
/// Scans raw text for harmful keywords, case-insensitively and by substring.
/// MUST only be used when structural classification is impossible.
CheckResult keyword_fallback(const std::string& sql);

/// Extracts CTE names, aliases, tables, and real column references from a tree.
/// MUST exclude alias and CTE-local names from real_columns at every nesting level.
ReferenceSets collect_references(const Node& root);
/// Cross-checks reference sets against a catalog; missing tables are reported first.
CheckResult check_references(const ReferenceSets& refs, const SchemaCatalog& catalog);
/// Semantic stage over a parse result; parse failures are hard failures.
CheckResult check_semantics(const ParseResult& parsed, const SchemaCatalog& catalog);

/// Runs a statement to completion inside a transaction that is always rolled back.
/// MUST NOT persist any change and MUST report store failures as "Runtime error: ...".
CheckResult check_execution(const std::string& sql, const ValidatorOptions& options);

/// Message used when a statement is interrupted by its deadline.
std::string timeout_message(int timeout_ms);

}  // namespace sqlvet::validator_internal
