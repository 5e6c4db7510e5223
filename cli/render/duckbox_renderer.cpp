#include "render/duckbox_renderer.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

#include "ui/color.h"

namespace sqlvet::render {

namespace {

using cli::kColor;

constexpr size_t kMinColumnWidth = 4;

struct Cell {
  std::string text;
  bool is_null = false;
  bool numeric = false;
};

/// Counts UTF-8 code points; continuation bytes add no width.
size_t visible_width(const std::string& value) {
  size_t width = 0;
  for (unsigned char c : value) {
    if ((c & 0xC0) != 0x80) ++width;
  }
  return width;
}

/// Cuts value to max_width code points, the last one being an ellipsis.
std::string clip(const std::string& value, size_t max_width) {
  if (max_width == 0 || visible_width(value) <= max_width) return value;
  std::string out;
  size_t kept = 0;
  for (char ch : value) {
    unsigned char c = static_cast<unsigned char>(ch);
    if ((c & 0xC0) != 0x80) {
      if (kept + 1 == max_width) break;
      ++kept;
    }
    out.push_back(ch);
  }
  return out + "…";
}

/// Accepts SQLite's integer and real renderings, including exponents.
bool looks_numeric(const std::string& value) {
  size_t i = 0;
  if (i < value.size() && (value[i] == '-' || value[i] == '+')) ++i;
  size_t digits = 0;
  bool dot = false;
  for (; i < value.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(value[i]);
    if (std::isdigit(c)) {
      ++digits;
    } else if (c == '.' && !dot) {
      dot = true;
    } else {
      break;
    }
  }
  if (digits == 0) return false;
  if (i < value.size() && (value[i] == 'e' || value[i] == 'E')) {
    ++i;
    if (i < value.size() && (value[i] == '-' || value[i] == '+')) ++i;
    size_t exponent = 0;
    while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]))) {
      ++i;
      ++exponent;
    }
    if (exponent == 0) return false;
  }
  return i == value.size();
}

Cell make_cell(const std::vector<std::string>& row, size_t index, size_t max_cell_width) {
  Cell cell;
  if (index >= row.size() || row[index] == "NULL") {
    cell.text = "NULL";
    cell.is_null = true;
    return cell;
  }
  std::string text = row[index];
  std::replace_if(text.begin(), text.end(), [](char c) { return c == '\n' || c == '\r' || c == '\t'; }, ' ');
  cell.numeric = looks_numeric(text);
  cell.text = clip(text, max_cell_width);
  return cell;
}

std::string pad(const std::string& text, size_t width, bool right_align) {
  size_t used = visible_width(text);
  if (used >= width) return text;
  std::string fill(width - used, ' ');
  return right_align ? fill + text : text + fill;
}

std::string rule(const std::vector<size_t>& widths, const char* left, const char* mid, const char* right) {
  std::string out = left;
  for (size_t i = 0; i < widths.size(); ++i) {
    for (size_t j = 0; j < widths[i] + 2; ++j) out += "─";
    out += (i + 1 < widths.size()) ? mid : right;
  }
  return out;
}

std::string row_summary(const QueryOutcome& outcome, size_t shown) {
  std::ostringstream oss;
  oss << shown << (shown == 1 ? " row" : " rows");
  if (shown < outcome.rows.size()) {
    oss << " shown of " << outcome.rows.size() << (outcome.truncated ? "+" : "");
  } else if (outcome.truncated) {
    oss << ", more available";
  }
  return oss.str();
}

}  // namespace

std::string render_duckbox(const QueryOutcome& outcome, const DuckboxOptions& options) {
  if (!outcome.verdict.passed && !outcome.verdict.message.empty()) {
    return "No rows: " + outcome.verdict.message;
  }
  const std::vector<std::string>& columns = outcome.columns;
  if (columns.empty()) return "(no columns)";
  size_t shown = outcome.rows.size();
  if (options.max_rows > 0) shown = std::min(shown, options.max_rows);
  size_t max_cell_width = options.max_cell_width;
  if (max_cell_width > 0) max_cell_width = std::max(max_cell_width, kMinColumnWidth);

  std::vector<std::string> headers;
  std::vector<size_t> widths;
  for (const auto& name : columns) {
    headers.push_back(clip(name, max_cell_width));
    widths.push_back(std::max(kMinColumnWidth, visible_width(headers.back())));
  }
  std::vector<std::vector<Cell>> body;
  for (size_t r = 0; r < shown; ++r) {
    std::vector<Cell> cells;
    for (size_t c = 0; c < columns.size(); ++c) {
      cells.push_back(make_cell(outcome.rows[r], c, max_cell_width));
      widths[c] = std::max(widths[c], visible_width(cells.back().text));
    }
    body.push_back(std::move(cells));
  }

  std::ostringstream oss;
  oss << rule(widths, "┌", "┬", "┐") << "\n│";
  for (size_t c = 0; c < headers.size(); ++c) {
    std::string text = pad(headers[c], widths[c], false);
    if (options.color) text = std::string(kColor.bold) + text + kColor.reset;
    oss << " " << text << " │";
  }
  oss << "\n" << rule(widths, "├", "┼", "┤") << "\n";
  for (const auto& cells : body) {
    oss << "│";
    for (size_t c = 0; c < cells.size(); ++c) {
      const Cell& cell = cells[c];
      std::string text = pad(cell.text, widths[c], cell.numeric);
      if (cell.is_null && options.color) text = std::string(kColor.dim) + text + kColor.reset;
      oss << " " << text << " │";
    }
    oss << "\n";
  }
  oss << rule(widths, "└", "┴", "┘") << "\n" << row_summary(outcome, shown);
  if (!outcome.verdict.message.empty()) {
    oss << " | " << outcome.verdict.message;
  }
  return oss.str();
}

}  // namespace sqlvet::render
