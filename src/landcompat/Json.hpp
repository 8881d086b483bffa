#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace landcompat {

// Minimal JSON value + parser/writer for config files and the audit manifest.
//
// Notes:
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are doubles.
//  - Objects keep insertion order (written back in that order).
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

  static JsonValue MakeNull();
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

  // Object helper: append (or replace) a member. No-op unless this is an object.
  JsonValue& set(const std::string& key, JsonValue v);
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);
JsonValue* FindJsonMember(JsonValue& obj, const std::string& key);

// Errors are reported as "JSON parse error at line L, column C: ...".
bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Escape a string for use inside a JSON string literal (without the surrounding quotes).
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;
};

// Returns false on non-finite numbers or stream failures.
bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt = {});

} // namespace landcompat
