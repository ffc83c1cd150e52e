#pragma once

// nexus/jsonlite.hpp: Minimal JSON value model, parser and serializer.
//
// DESIGN:
//   Value is a closed variant. Objects are std::map so serialization is
//   key-sorted and therefore canonical. Integers keep their exact value when
//   they fit in u64 (non-negative) or i64 (negative); anything wider falls back
//   to double. Callers that need arbitrary precision quote the literal first
//   (see nexus_data.hpp, large-integer preservation).
//
// INVARIANT:
//   parse(to_json(v)) == v for every Value that contains no non-finite double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nexus::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, std::int64_t, double, Object, Array> v;
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// Parse any JSON document.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a document whose root must be an object. Returns {} on error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

// Compact serialization, keys sorted.
std::string to_json(const Value& v);
std::string to_json(const Object& obj);
std::string escape(const std::string& s);
std::string format_double(double d);

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
const Value* find(const Object& obj, const std::string& key);
const Object* as_object(const Value& v);
const Array* as_array(const Value& v);
const std::string* as_string(const Value& v);
std::optional<std::uint64_t> as_u64(const Value& v);
bool is_null(const Value& v);

// Typed getters with defaults.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

}  // namespace nexus::jsonlite
