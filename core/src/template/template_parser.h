#pragma once

#include <optional>
#include <string>
#include <vector>

#include "template_tokens.h"

namespace sqlfrag {

struct TemplateParseError {
  enum class Reason { UnmatchedBrace, InvalidName } reason = Reason::UnmatchedBrace;
  std::string message;
  size_t position = 0;
};

struct ParsedTemplate {
  std::vector<TemplateItem> items;
  size_t positional_count = 0;
};

struct TemplateParseResult {
  std::optional<ParsedTemplate> parsed;
  std::optional<TemplateParseError> error;
};

/// Splits a template into literal runs and `{}` / `{name}` markers.
/// MUST stop at the first malformed brace and report its byte offset.
class TemplateParser {
 public:
  /// Constructs a parser over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  explicit TemplateParser(const std::string& input);
  TemplateParseResult parse();

 private:
  /// Parses the marker whose opening brace is at pos_; advances past the closing brace.
  bool parse_marker(ParsedTemplate& out);
  void flush_literal(ParsedTemplate& out);
  void set_error(TemplateParseError::Reason reason, const std::string& message, size_t position);

  const std::string& input_;
  size_t pos_ = 0;
  std::string literal_;
  size_t literal_start_ = 0;
  std::optional<TemplateParseError> error_;
};

/// Convenience wrapper over TemplateParser.
TemplateParseResult parse_template(const std::string& input);

}  // namespace sqlfrag
