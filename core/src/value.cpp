#include "sqlfrag/value.h"

#include <cctype>

namespace sqlfrag {

namespace {

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
  return -1;
}

bool is_dash_position(size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

}  // namespace

std::optional<Uuid> Uuid::parse(std::string_view text) {
  const bool hyphenated = text.size() == 36;
  if (!hyphenated && text.size() != 32) return std::nullopt;
  Uuid out;
  size_t nibble = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (hyphenated && is_dash_position(i)) {
      if (text[i] != '-') return std::nullopt;
      continue;
    }
    int digit = hex_digit(text[i]);
    if (digit < 0) return std::nullopt;
    uint8_t& byte = out.bytes[nibble / 2];
    byte = static_cast<uint8_t>((nibble % 2 == 0) ? (digit << 4) : (byte | digit));
    ++nibble;
  }
  return out;
}

std::string Uuid::str() const {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[bytes[i] >> 4]);
    out.push_back(kHex[bytes[i] & 0x0f]);
  }
  return out;
}

Value::Value(bool v) : kind(Kind::Bool), bool_value(v) {}
Value::Value(int v) : kind(Kind::Integer), int_value(v) {}
Value::Value(long v) : kind(Kind::Integer), int_value(static_cast<int64_t>(v)) {}
Value::Value(long long v) : kind(Kind::Integer), int_value(static_cast<int64_t>(v)) {}
Value::Value(double v) : kind(Kind::Float), float_value(v) {}
Value::Value(const char* v) : kind(Kind::Text), text_value(v ? v : "") {}
Value::Value(std::string v) : kind(Kind::Text), text_value(std::move(v)) {}
Value::Value(Uuid v) : kind(Kind::Uuid), uuid_value(v) {}
Value::Value(std::vector<Value> v) : kind(Kind::Array), items(std::move(v)) {}

Value Value::json_document(nlohmann::json doc) {
  Value out;
  out.kind = Kind::Json;
  out.json_value = std::move(doc);
  return out;
}

nlohmann::json Value::to_json() const {
  switch (kind) {
    case Kind::Null:
      return nullptr;
    case Kind::Bool:
      return bool_value;
    case Kind::Integer:
      return int_value;
    case Kind::Float:
      return float_value;
    case Kind::Text:
      return text_value;
    case Kind::Uuid:
      return uuid_value.str();
    case Kind::Json:
      return json_value;
    case Kind::Array: {
      nlohmann::json out = nlohmann::json::array();
      for (const auto& item : items) {
        out.push_back(item.to_json());
      }
      return out;
    }
  }
  return nullptr;
}

bool operator==(const Value& a, const Value& b) {
  if (a.kind != b.kind) return false;
  switch (a.kind) {
    case Value::Kind::Null:
      return true;
    case Value::Kind::Bool:
      return a.bool_value == b.bool_value;
    case Value::Kind::Integer:
      return a.int_value == b.int_value;
    case Value::Kind::Float:
      return a.float_value == b.float_value;
    case Value::Kind::Text:
      return a.text_value == b.text_value;
    case Value::Kind::Uuid:
      return a.uuid_value == b.uuid_value;
    case Value::Kind::Json:
      return a.json_value == b.json_value;
    case Value::Kind::Array:
      return a.items == b.items;
  }
  return false;
}

bool operator!=(const Value& a, const Value& b) {
  return !(a == b);
}

const char* kind_name(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::Null:
      return "null";
    case Value::Kind::Bool:
      return "bool";
    case Value::Kind::Integer:
      return "integer";
    case Value::Kind::Float:
      return "float";
    case Value::Kind::Text:
      return "text";
    case Value::Kind::Uuid:
      return "uuid";
    case Value::Kind::Json:
      return "json";
    case Value::Kind::Array:
      return "array";
  }
  return "unknown";
}

}  // namespace sqlfrag
