#pragma once

// evogate/jsonlite.hpp — Minimal JSON value model, strict parser and writer.
//
// Used for every JSON surface of the project: fixture payloads handed to the
// sandbox, the result.json written by the harness, generator output, config
// files and persisted EvolutionResult records.
//
// PARSER GUARANTEES:
//   - Strict: trailing data, duplicate keys, NaN/Infinity are errors.
//   - Integers without fraction/exponent are kept as int64 when they fit;
//     everything else numeric is a double.
//   - Objects are std::map, so serialization is key-sorted and deterministic.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace evogate::jsonlite {

struct Value;
using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(int i) : v(static_cast<std::int64_t>(i)) {}
  Value(long i) : v(static_cast<std::int64_t>(i)) {}
  Value(long long i) : v(static_cast<std::int64_t>(i)) {}
  Value(unsigned i) : v(static_cast<std::int64_t>(i)) {}
  Value(unsigned long i) : v(static_cast<std::int64_t>(i)) {}
  Value(unsigned long long i) : v(static_cast<std::int64_t>(i)) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key" | "json_not_object"
  std::string message;
};

// Parse any JSON value.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON document whose top level must be an object.
// Returns an empty object and sets *error on failure.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Compact serialization (no whitespace, sorted keys).
std::string to_json(const Value& v);
std::string to_json(const Object& o);

// Indented serialization for files read by humans or by the harness.
std::string to_json_pretty(const Value& v, int indent = 2);

std::string escape(const std::string& s);
std::string format_double(double d);

// Typed extractors. Missing key or wrong type yields the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);
const Value* find(const Object& obj, const std::string& key);

Array to_array(const std::vector<std::string>& items);

}  // namespace evogate::jsonlite
