#pragma once

namespace sqlvet::cli {

/// Defines ANSI color codes for verdicts and diagnostics.
/// MUST remain valid ANSI sequences and MUST stay ASCII-only for terminal compatibility.
/// Inputs are the constant strings; side effects occur when printed to terminals.
struct Color {
  const char* reset = "\033[0m";
  const char* red = "\033[31m";
  const char* green = "\033[32m";
  const char* yellow = "\033[33m";
  const char* blue = "\033[34m";
  const char* magenta = "\033[35m";
  const char* cyan = "\033[36m";
  const char* dim = "\033[2m";
  const char* bold = "\033[1m";
};

/// Shared palette so every CLI surface styles verdicts the same way.
extern Color kColor;

}  // namespace sqlvet::cli
