#include "sqlfrag/diagnostics.h"

#include <algorithm>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

#include "template/template_parser.h"

namespace sqlfrag {

namespace {

DiagnosticSpan span_from_bytes(const std::string& tmpl, size_t byte_start, size_t byte_end) {
  DiagnosticSpan span;
  const size_t size = tmpl.size();
  if (size == 0) return span;
  span.byte_start = std::min(byte_start, size - 1);
  span.byte_end = std::min(std::max(byte_end, span.byte_start + 1), size);

  size_t line = 1;
  size_t col = 1;
  for (size_t i = 0; i < span.byte_start; ++i) {
    if (tmpl[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  span.start_line = line;
  span.start_col = col;

  for (size_t i = span.byte_start; i < span.byte_end; ++i) {
    if (tmpl[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  span.end_line = line;
  span.end_col = col;
  return span;
}

size_t marker_end(const std::string& tmpl, size_t open) {
  size_t close = tmpl.find('}', open + 1);
  return close == std::string::npos ? open + 1 : close + 1;
}

std::string render_code_frame(const std::string& tmpl, const DiagnosticSpan& span) {
  if (tmpl.empty()) return "";
  size_t line_start = 0;
  size_t current_line = 1;
  while (current_line < span.start_line && line_start < tmpl.size()) {
    size_t nl = tmpl.find('\n', line_start);
    if (nl == std::string::npos) break;
    line_start = nl + 1;
    ++current_line;
  }
  size_t line_end = tmpl.find('\n', line_start);
  if (line_end == std::string::npos) line_end = tmpl.size();
  std::string line_text = tmpl.substr(line_start, line_end - line_start);
  if (!line_text.empty() && line_text.back() == '\r') line_text.pop_back();

  const size_t caret_start = span.start_col > 0 ? span.start_col - 1 : 0;
  if (caret_start > line_text.size()) return "";
  size_t caret_width = 1;
  if (span.start_line == span.end_line && span.end_col > span.start_col) {
    caret_width = span.end_col - span.start_col;
  }
  const size_t line_digits = std::to_string(span.start_line).size();

  std::ostringstream out;
  out << " --> line " << span.start_line << ", col " << span.start_col << "\n";
  out << std::string(line_digits, ' ') << " |\n";
  out << span.start_line << " | " << line_text << "\n";
  out << std::string(line_digits, ' ') << " | " << std::string(caret_start, ' ')
      << std::string(caret_width, '^');
  return out.str();
}

std::string severity_name(DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::Error:
      return "ERROR";
    case DiagnosticSeverity::Warning:
      return "WARNING";
    case DiagnosticSeverity::Note:
      return "NOTE";
  }
  return "ERROR";
}

nlohmann::ordered_json span_to_json(const DiagnosticSpan& span) {
  nlohmann::ordered_json out;
  out["start_line"] = span.start_line;
  out["start_col"] = span.start_col;
  out["end_line"] = span.end_line;
  out["end_col"] = span.end_col;
  out["byte_start"] = span.byte_start;
  out["byte_end"] = span.byte_end;
  return out;
}

std::optional<DiagnosticSpan> find_marker_span(const std::string& tmpl,
                                               TemplateItemType type,
                                               const std::string& name) {
  TemplateParseResult parsed = parse_template(tmpl);
  if (!parsed.parsed.has_value()) return std::nullopt;
  for (const auto& item : parsed.parsed->items) {
    if (item.type != type) continue;
    if (type == TemplateItemType::Named && item.text != name) continue;
    return span_from_bytes(tmpl, item.pos, marker_end(tmpl, item.pos));
  }
  return std::nullopt;
}

Diagnostic make_syntax_diagnostic(const std::string& tmpl, const TemplateParseError& error) {
  Diagnostic d;
  d.message = error.message;
  if (error.reason == TemplateParseError::Reason::InvalidName) {
    d.code = "SQF-SYN-0002";
    d.help = "Marker names must match [A-Za-z_][A-Za-z0-9_]*; use {} for positional values.";
    d.span = span_from_bytes(tmpl, error.position, marker_end(tmpl, error.position));
  } else {
    d.code = "SQF-SYN-0001";
    d.help = "Write {{ or }} for a literal brace, or close the marker.";
    d.span = span_from_bytes(tmpl, error.position, error.position + 1);
  }
  d.snippet = render_code_frame(tmpl, d.span);
  return d;
}

void set_code_help(Diagnostic& d, const Error& error) {
  switch (error.kind()) {
    case ErrorKind::Syntax:
      d.code = "SQF-SYN-0001";
      d.help = "Write {{ or }} for a literal brace, or close the marker.";
      return;
    case ErrorKind::Arity:
      d.code = "SQF-ARI-0001";
      d.help = "Pass exactly one positional argument per {} marker (or one value per unnest column).";
      return;
    case ErrorKind::UnfilledSlot:
      d.code = "SQF-SLT-0001";
      d.help = "Supply the named value when building the fragment, or fill() it before rendering.";
      return;
    case ErrorKind::Type:
      d.code = "SQF-TYP-0001";
      d.help = "Bind the value as a placeholder with value() instead of escaping it inline.";
      return;
    case ErrorKind::Composition:
      d.code = "SQF-TYP-0002";
      d.help = "Fill fragment-valued slots before prepare(), or use compile() instead.";
      return;
    case ErrorKind::Value:
      d.code = "SQF-VAL-0001";
      d.help = "Bind non-finite floats as placeholders; they have no SQL literal form.";
      return;
  }
}

}  // namespace

std::vector<Diagnostic> lint_template(const std::string& tmpl) {
  std::vector<Diagnostic> out;
  TemplateParseResult parsed = parse_template(tmpl);
  if (parsed.error.has_value()) {
    out.push_back(make_syntax_diagnostic(tmpl, *parsed.error));
  }
  return out;
}

Diagnostic diagnose_template_failure(const std::string& tmpl, const Error& error) {
  if (error.kind() == ErrorKind::Syntax) {
    TemplateParseResult parsed = parse_template(tmpl);
    if (parsed.error.has_value()) return make_syntax_diagnostic(tmpl, *parsed.error);
  }

  Diagnostic d;
  d.message = error.what();
  set_code_help(d, error);

  std::optional<DiagnosticSpan> span;
  if (const auto* syntax = dynamic_cast<const SyntaxError*>(&error)) {
    span = span_from_bytes(tmpl, syntax->position(), syntax->position() + 1);
  } else if (const auto* unfilled = dynamic_cast<const UnfilledSlotError*>(&error)) {
    span = find_marker_span(tmpl, TemplateItemType::Named, unfilled->slot_name());
  } else if (const auto* composition = dynamic_cast<const CompositionError*>(&error)) {
    span = find_marker_span(tmpl, TemplateItemType::Named, composition->slot_name());
  } else if (error.kind() == ErrorKind::Arity) {
    span = find_marker_span(tmpl, TemplateItemType::Positional, "");
  }
  d.span = span.has_value() ? *span : span_from_bytes(tmpl, 0, 1);
  d.snippet = render_code_frame(tmpl, d.span);
  return d;
}

std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    out << severity_name(d.severity) << "[" << d.code << "]: " << d.message << "\n";
    if (!d.snippet.empty()) out << d.snippet << "\n";
    out << "help: " << d.help << "\n";
    if (i + 1 < diagnostics.size()) out << "\n\n";
  }
  return out.str();
}

std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics) {
  nlohmann::ordered_json out = nlohmann::ordered_json::array();
  for (const auto& d : diagnostics) {
    nlohmann::ordered_json item;
    item["severity"] = severity_name(d.severity);
    item["code"] = d.code;
    item["message"] = d.message;
    item["help"] = d.help;
    item["span"] = span_to_json(d.span);
    item["snippet"] = d.snippet;
    out.push_back(std::move(item));
  }
  return out.dump();
}

bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics) {
  for (const auto& d : diagnostics) {
    if (d.severity == DiagnosticSeverity::Error) return true;
  }
  return false;
}

}  // namespace sqlfrag
