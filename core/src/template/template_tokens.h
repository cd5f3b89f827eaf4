#pragma once

#include <cstddef>
#include <string>

namespace sqlfrag {

/// Enumerates the items a template splits into.
enum class TemplateItemType {
  Literal,
  Positional,
  Named,
};

/// One literal run or raw marker, with the byte offset where it starts.
/// For Literal, text is the unescaped run; for Named, text is the marker name.
struct TemplateItem {
  TemplateItemType type = TemplateItemType::Literal;
  std::string text;
  size_t pos = 0;
};

}  // namespace sqlfrag
