#include "sqlfrag/builders.h"

#include <cmath>

#include "sqlfrag/errors.h"

namespace sqlfrag {

namespace {

std::string quote_text(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('\'');
  for (char c : text) {
    if (c == '\'') out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string format_float(double v) {
  if (std::isnan(v)) {
    throw ValueError("Can't escape NaN float");
  }
  if (std::isinf(v)) {
    throw ValueError("Can't escape infinite float");
  }
  // Shortest round-trip form; integral values keep a trailing ".0".
  return nlohmann::json(v).dump();
}

}  // namespace

std::string escape(const Value& v) {
  switch (v.kind) {
    case Value::Kind::Null:
      return "NULL";
    case Value::Kind::Bool:
      return v.bool_value ? "TRUE" : "FALSE";
    case Value::Kind::Integer:
      return std::to_string(v.int_value);
    case Value::Kind::Float:
      return format_float(v.float_value);
    case Value::Kind::Text:
      return quote_text(v.text_value);
    case Value::Kind::Uuid:
      return quote_text(v.uuid_value.str()) + "::UUID";
    case Value::Kind::Array: {
      std::string out = "ARRAY[";
      for (size_t i = 0; i < v.items.size(); ++i) {
        if (i != 0) out += ", ";
        out += escape(v.items[i]);
      }
      out += "]";
      return out;
    }
    case Value::Kind::Json:
      break;
  }
  const std::string type_name = kind_name(v.kind);
  throw TypeError("Can't escape type " + type_name, type_name);
}

}  // namespace sqlfrag
