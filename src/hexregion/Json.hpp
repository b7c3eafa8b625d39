#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace hexregion {

// Small JSON document model for config files and tool output.
//
// Strict JSON (no comments, no trailing commas). Numbers are doubles. Object
// members keep their file order.
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull() { return JsonValue{}; }
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }

  // Object helpers; no-ops on non-objects.
  void set(const std::string& key, JsonValue v);
  void push(JsonValue v) { arrayValue.push_back(std::move(v)); }
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Body of a JSON string literal (no surrounding quotes).
std::string JsonEscape(const std::string& s);

// indent < 0 writes compact single-line JSON. Non-finite numbers become null.
std::string JsonStringify(const JsonValue& value, int indent = 2);

} // namespace hexregion
