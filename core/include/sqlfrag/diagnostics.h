#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sqlfrag/errors.h"

namespace sqlfrag {

/// Classifies diagnostic urgency for linting and error rendering.
/// MUST remain stable for text/JSON outputs and tests.
enum class DiagnosticSeverity {
  Error,
  Warning,
  Note,
};

/// Describes a source span in both byte offsets and line/column coordinates.
/// MUST use 1-based line/column values; byte offsets are 0-based.
struct DiagnosticSpan {
  size_t start_line = 1;
  size_t start_col = 1;
  size_t end_line = 1;
  size_t end_col = 1;
  size_t byte_start = 0;
  size_t byte_end = 0;
};

/// Structured template diagnostic.
/// MUST include a stable code and actionable help.
struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::Error;
  std::string code;
  std::string message;
  std::string help;
  DiagnosticSpan span;
  std::string snippet;
};

/// Parses a template without binding arguments and returns its syntax diagnostics.
/// MUST return an empty list for well-formed templates.
std::vector<Diagnostic> lint_template(const std::string& tmpl);
/// Maps an engine error raised while building or rendering `tmpl` to a diagnostic.
/// Syntax errors are anchored at the offending brace; other kinds at the best
/// matching marker, falling back to the start of the template.
Diagnostic diagnose_template_failure(const std::string& tmpl, const Error& error);

/// Renders diagnostics in a human-readable multi-block text format.
/// MUST be deterministic for stable golden tests.
std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics);
/// Renders diagnostics as a JSON array with a fixed key order.
std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics);
/// Returns true when at least one ERROR severity diagnostic exists.
bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics);

}  // namespace sqlfrag
