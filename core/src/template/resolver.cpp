#include "sqlfrag/fragment.h"

#include <string>

#include "fragment/fragment_builder.h"
#include "sqlfrag/errors.h"
#include "template_parser.h"

namespace sqlfrag {

Fragment sql(const std::string& tmpl, const std::vector<Arg>& positional, const NamedArgs& named) {
  TemplateParseResult parsed = parse_template(tmpl);
  if (!parsed.parsed.has_value()) {
    const auto& error = *parsed.error;
    throw SyntaxError(error.message, error.position);
  }
  const ParsedTemplate& shape = *parsed.parsed;
  if (shape.positional_count != positional.size()) {
    throw ArityError("Template expects " + std::to_string(shape.positional_count) +
                     " positional argument(s), got " + std::to_string(positional.size()));
  }

  FragmentBuilder out;
  SlotResolver named_resolver;
  size_t next_positional = 0;
  for (const auto& item : shape.items) {
    switch (item.type) {
      case TemplateItemType::Literal:
        out.append_literal(item.text);
        break;
      case TemplateItemType::Positional: {
        const size_t index = next_positional++;
        const Arg& arg = positional[index];
        if (arg.is_fragment()) {
          out.append_fragment(arg.fragment());
        } else {
          out.append_placeholder(make_binding(std::to_string(index), arg.value()));
        }
        break;
      }
      case TemplateItemType::Named: {
        auto it = named.find(item.text);
        if (it == named.end()) {
          out.append_slot(item.text);
        } else {
          named_resolver.resolve_into(out, item.text, it->second);
        }
        break;
      }
    }
  }
  return out.build();
}

}  // namespace sqlfrag
