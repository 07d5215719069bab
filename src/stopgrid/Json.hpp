#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace stopgrid {

// JSON document used by config files, stop lists, reports and GeoJSON.
//
// Parsing is strict RFC 8259 (no comments or trailing commas) with a nesting
// limit. Numbers are doubles. Object members keep file order; a repeated key
// is kept and FindJsonMember returns its first occurrence.
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
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }

  // Object member / array element append; ignored for any other type.
  void add(std::string key, JsonValue v);
  void push(JsonValue v);
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);
JsonValue* FindJsonMember(JsonValue& obj, const std::string& key);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Errors are prefixed with the path. A leading UTF-8 BOM is skipped.
bool ReadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError);

// Body of a JSON string literal, quotes not included. Control characters
// become \u00XX.
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;

  // Emit members in key order instead of insertion order.
  bool sortKeys = false;
};

// Fails (nothing useful written) on NaN/Inf or a bad stream. Pretty output
// ends with a newline.
bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt = {});

// In-memory variant: NaN/Inf become null, no trailing newline. Empty on
// writer failure.
std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError,
                   const JsonWriteOptions& opt = {});

} // namespace stopgrid
