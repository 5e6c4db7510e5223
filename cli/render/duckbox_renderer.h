#pragma once

#include <cstddef>
#include <string>

#include "sqlvet/sqlvet.h"

namespace sqlvet::render {

/// Controls table layout for --run output.
struct DuckboxOptions {
  /// Longest cell or header shown, in characters; 0 keeps cells whole.
  size_t max_cell_width = 40;
  /// Rows drawn; 0 draws every fetched row.
  size_t max_rows = 40;
  /// Bolds the header and dims NULL cells with ANSI escapes.
  bool color = false;
};

/// Renders a query outcome as a box-drawn table followed by a row-count and verdict line.
/// MUST right-align numeric cells, MUST mark SQL NULL cells, and MUST say when rows were cut.
/// A failing verdict renders as a single "No rows: <message>" line.
std::string render_duckbox(const QueryOutcome& outcome, const DuckboxOptions& options);

}  // namespace sqlvet::render
