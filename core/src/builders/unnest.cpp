#include "sqlfrag/builders.h"

#include "fragment/fragment_builder.h"
#include "sqlfrag/errors.h"
#include "util/string_util.h"

namespace sqlfrag {

namespace {

bool is_json_type(const std::string& type_name) {
  const std::string upper = util::to_upper(type_name);
  return upper == "JSON" || upper == "JSONB";
}

// JSON columns travel as text arrays; NULL and text elements pass through untouched.
Value serialize_json_column(const std::vector<Value>& column) {
  std::vector<Value> out;
  out.reserve(column.size());
  for (const auto& item : column) {
    if (item.kind == Value::Kind::Null || item.kind == Value::Kind::Text) {
      out.push_back(item);
    } else {
      out.emplace_back(item.to_json().dump());
    }
  }
  return Value(std::move(out));
}

Fragment nest_for_type(std::vector<Value> column, const std::string& type_name) {
  FragmentBuilder out;
  if (is_json_type(type_name)) {
    out.append_placeholder(make_binding("data", serialize_json_column(column)));
    out.append_literal("::TEXT[]::" + type_name + "[]");
  } else {
    out.append_placeholder(make_binding("data", Value(std::move(column))));
    out.append_literal("::" + type_name + "[]");
  }
  return out.build();
}

}  // namespace

Fragment unnest(const std::vector<std::vector<Value>>& rows,
                const std::vector<std::string>& column_types) {
  const size_t width = column_types.size();
  std::vector<std::vector<Value>> columns(width);
  for (auto& column : columns) {
    column.reserve(rows.size());
  }
  for (size_t r = 0; r < rows.size(); ++r) {
    const auto& row = rows[r];
    if (row.size() != width) {
      throw ArityError("unnest row " + std::to_string(r) + " has " + std::to_string(row.size()) +
                       " value(s), expected " + std::to_string(width));
    }
    for (size_t c = 0; c < width; ++c) {
      columns[c].push_back(row[c]);
    }
  }

  std::vector<Fragment> nested;
  nested.reserve(width);
  for (size_t c = 0; c < width; ++c) {
    nested.push_back(nest_for_type(std::move(columns[c]), column_types[c]));
  }
  FragmentBuilder out;
  out.append_literal("UNNEST(");
  out.append_fragment(list(nested));
  out.append_literal(")");
  return out.build();
}

}  // namespace sqlfrag
