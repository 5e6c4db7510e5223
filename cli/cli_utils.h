#pragma once

#include <string>

#include "config.h"
#include "sqlvet/sqlvet.h"

namespace sqlvet::cli {

/// Reads a file into memory for --query-file.
/// MUST throw on missing/unreadable files.
std::string read_file(const std::string& path);
/// Reads all stdin content when no query flag is given.
/// MUST block until EOF and MUST not interpret the stream contents.
std::string read_stdin();
/// Applies ANSI coloring to JSON for readability when enabled.
/// MUST NOT alter JSON semantics and MUST be disabled for non-TTY output.
/// Inputs are JSON text and a flag; outputs are colored text with no side effects.
std::string colorize_json(const std::string& input, bool enable);

/// Serializes a verdict as {"passed", "stage", "message", "stages"}.
/// stages lists {"stage", "ok", "reason"} for each stage that ran.
std::string build_verdict_json(const Verdict& verdict);
/// Serializes reference sets with each set as a sorted array of names.
std::string build_references_json(const ReferenceSets& refs);
/// Serializes the catalog as {"tables": {name: [{"name", "type"}]}}.
std::string build_schema_json(const SchemaCatalog& catalog);
/// Serializes a run result: verdict, column names, rows of text cells, truncation flag.
/// MUST keep cell order aligned with columns.
std::string build_rows_json(const QueryOutcome& outcome);
/// Serializes configured and discovered data sources.
std::string build_sources_json(const AppConfig& config);

/// Renders a verdict as one line: "PASS: ..." or "FAIL [Stage]: ...".
std::string format_verdict(const Verdict& verdict, bool color);
/// Renders reference sets as "name: a, b" lines in a fixed order.
std::string format_references(const ReferenceSets& refs);
/// Renders every table with its columns and declared types, one table per block.
std::string format_schema(const SchemaCatalog& catalog);
/// Renders data sources as "id  path" lines, marking the default and discovered ones.
std::string format_sources(const AppConfig& config);

}  // namespace sqlvet::cli
