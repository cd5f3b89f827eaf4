#include "sqlfrag/builders.h"

#include "fragment/fragment_builder.h"

namespace sqlfrag {

namespace {

std::string quote_identifier(const std::string& name) {
  std::string out;
  out.reserve(name.size() + 2);
  out.push_back('"');
  for (char c : name) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

Fragment join_wrapped(const std::vector<Fragment>& parts,
                      const std::string& op,
                      const std::string& empty_case) {
  if (parts.empty()) return literal(empty_case);
  FragmentBuilder out;
  out.append_literal("(");
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) out.append_literal(") " + op + " (");
    out.append_fragment(parts[i]);
  }
  out.append_literal(")");
  return out.build();
}

}  // namespace

Fragment literal(const std::string& text) {
  FragmentBuilder out;
  out.append_literal(text);
  return out.build();
}

Fragment value(Value v) {
  FragmentBuilder out;
  out.append_placeholder(make_binding("value", std::move(v)));
  return out.build();
}

Fragment slot(const std::string& name) {
  FragmentBuilder out;
  out.append_slot(name);
  return out.build();
}

Fragment identifier(const std::string& name, const std::optional<std::string>& prefix) {
  if (prefix.has_value() && !prefix->empty()) {
    return literal(quote_identifier(*prefix) + "." + quote_identifier(name));
  }
  return literal(quote_identifier(name));
}

Fragment list(const std::vector<Fragment>& parts) {
  return literal(", ").join(parts);
}

Fragment all(const std::vector<Fragment>& parts) {
  return join_wrapped(parts, "AND", "TRUE");
}

Fragment any(const std::vector<Fragment>& parts) {
  return join_wrapped(parts, "OR", "FALSE");
}

}  // namespace sqlfrag
