#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace sqlfrag {

/// Holds a 128-bit UUID so it can be bound or escaped in canonical form.
/// MUST round-trip through str()/parse() without loss.
struct Uuid {
  std::array<uint8_t, 16> bytes{};

  /// Parses the 8-4-4-4-12 hex form or 32 bare hex digits, case-insensitively.
  /// Returns nullopt on any other shape.
  static std::optional<Uuid> parse(std::string_view text);
  /// Returns the lowercase 8-4-4-4-12 form.
  std::string str() const;

  bool operator==(const Uuid& other) const { return bytes == other.bytes; }
  bool operator!=(const Uuid& other) const { return !(*this == other); }
};

/// A dynamically typed bindable value handed to the driver alongside query text.
/// MUST keep exactly one payload field meaningful, selected by kind.
/// Inputs are host values; the engine never inspects payloads except in escape/unnest.
struct Value {
  enum class Kind { Null, Bool, Integer, Float, Text, Uuid, Json, Array } kind = Kind::Null;
  bool bool_value = false;
  int64_t int_value = 0;
  double float_value = 0.0;
  std::string text_value;
  Uuid uuid_value;
  nlohmann::json json_value;
  std::vector<Value> items;

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool v);
  Value(int v);
  Value(long v);
  Value(long long v);
  Value(double v);
  Value(const char* v);
  Value(std::string v);
  Value(Uuid v);
  Value(std::vector<Value> v);

  /// Wraps a JSON document; bound as-is and serialized for JSON array columns.
  static Value json_document(nlohmann::json doc);

  bool is_null() const { return kind == Kind::Null; }
  /// Converts to JSON (UUIDs become strings, arrays become JSON arrays).
  nlohmann::json to_json() const;
};

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

/// Returns the lowercase name used in type errors ("text", "integer", ...).
const char* kind_name(Value::Kind kind);

}  // namespace sqlfrag
