#include "template_parser.h"

#include "util/string_util.h"

namespace sqlfrag {

TemplateParser::TemplateParser(const std::string& input) : input_(input) {}

TemplateParseResult TemplateParser::parse() {
  ParsedTemplate out;
  while (pos_ < input_.size() && !error_.has_value()) {
    char c = input_[pos_];
    if (c == '{') {
      if (pos_ + 1 < input_.size() && input_[pos_ + 1] == '{') {
        if (literal_.empty()) literal_start_ = pos_;
        literal_.push_back('{');
        pos_ += 2;
        continue;
      }
      flush_literal(out);
      if (!parse_marker(out)) break;
      continue;
    }
    if (c == '}') {
      if (pos_ + 1 < input_.size() && input_[pos_ + 1] == '}') {
        if (literal_.empty()) literal_start_ = pos_;
        literal_.push_back('}');
        pos_ += 2;
        continue;
      }
      set_error(TemplateParseError::Reason::UnmatchedBrace,
                "Single '}' encountered in template", pos_);
      break;
    }
    if (literal_.empty()) literal_start_ = pos_;
    literal_.push_back(c);
    ++pos_;
  }

  TemplateParseResult result;
  if (error_.has_value()) {
    result.error = error_;
    return result;
  }
  flush_literal(out);
  result.parsed = std::move(out);
  return result;
}

bool TemplateParser::parse_marker(ParsedTemplate& out) {
  const size_t open = pos_;
  const size_t close = input_.find('}', open + 1);
  if (close == std::string::npos) {
    set_error(TemplateParseError::Reason::UnmatchedBrace,
              "Single '{' encountered in template", open);
    return false;
  }
  std::string name = input_.substr(open + 1, close - open - 1);
  TemplateItem item;
  item.pos = open;
  if (name.empty()) {
    item.type = TemplateItemType::Positional;
    ++out.positional_count;
  } else if (util::is_identifier(name)) {
    item.type = TemplateItemType::Named;
    item.text = std::move(name);
  } else {
    set_error(TemplateParseError::Reason::InvalidName,
              "Invalid marker name '" + name + "'", open);
    return false;
  }
  out.items.push_back(std::move(item));
  pos_ = close + 1;
  return true;
}

void TemplateParser::flush_literal(ParsedTemplate& out) {
  if (literal_.empty()) return;
  TemplateItem item;
  item.type = TemplateItemType::Literal;
  item.text = std::move(literal_);
  item.pos = literal_start_;
  out.items.push_back(std::move(item));
  literal_.clear();
}

void TemplateParser::set_error(TemplateParseError::Reason reason,
                               const std::string& message,
                               size_t position) {
  if (error_.has_value()) return;
  TemplateParseError error;
  error.reason = reason;
  error.message = message;
  error.position = position;
  error_ = std::move(error);
}

TemplateParseResult parse_template(const std::string& input) {
  TemplateParser parser(input);
  return parser.parse();
}

}  // namespace sqlfrag
