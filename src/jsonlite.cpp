#include "nexus/jsonlite.hpp"

// Architecture notes on jsonlite:
//
// DETERMINISM GUARANTEES:
//   - to_json() emits keys in sorted order (std::map iteration), so two equal
//     Values always serialize to the same bytes.
//   - format_double() emits the shortest decimal that round-trips through
//     strtod, always with a '.' or exponent so it re-parses as a double.
//
// DETERMINISM RISKS:
//   - strtod/snprintf honour LC_NUMERIC. The toolkit never calls setlocale, so
//     the C locale is in effect.

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace nexus::jsonlite {

namespace {

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;
  int depth{0};

  static constexpr int kMaxDepth = 128;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool read_hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else return false;
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { err = JsonError{"json_parse_error", "expected string"}; return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) {
        err = JsonError{"json_parse_error", "control character in string"};
        return {};
      }
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      switch (n) {
        case '"': o += '"'; break;
        case '\\': o += '\\'; break;
        case '/': o += '/'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'n': o += '\n'; break;
        case 'r': o += '\r'; break;
        case 't': o += '\t'; break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!read_hex4(cp)) { err = JsonError{"json_parse_error", "invalid \\u escape"}; return {}; }
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            std::uint32_t lo = 0;
            if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') {
              err = JsonError{"json_parse_error", "unpaired surrogate"};
              return {};
            }
            i += 2;
            if (!read_hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
              err = JsonError{"json_parse_error", "invalid low surrogate"};
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            err = JsonError{"json_parse_error", "unpaired surrogate"};
            return {};
          }
          append_utf8(o, cp);
          break;
        }
        default:
          err = JsonError{"json_parse_error", std::string("invalid escape \\") + n};
          return {};
      }
    }
    err = JsonError{"json_parse_error", "unterminated string"};
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;

    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      err = JsonError{"json_parse_error", "NaN/Infinity unsupported"};
      return false;
    }

    const bool negative = i < s.size() && s[i] == '-';
    if (negative) ++i;

    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
    if (s[i] == '0' && i + 1 < s.size() && std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
      err = JsonError{"json_parse_error", "leading zero"};
      return false;
    }
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool has_frac = false;
    if (i < s.size() && s[i] == '.') {
      has_frac = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid number format"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    bool has_exp = false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      has_exp = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid exponent"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num_str = s.substr(start, i - start);

    if (!has_frac && !has_exp) {
      errno = 0;
      char* end = nullptr;
      if (negative) {
        const long long x = std::strtoll(num_str.c_str(), &end, 10);
        if (errno == 0 && end && *end == '\0') {
          out_val = Value{static_cast<std::int64_t>(x)};
          return true;
        }
      } else {
        const unsigned long long x = std::strtoull(num_str.c_str(), &end, 10);
        if (errno == 0 && end && *end == '\0') {
          out_val = Value{static_cast<std::uint64_t>(x)};
          return true;
        }
      }
      // Out of 64-bit range: fall through to double.
    }

    errno = 0;
    char* end = nullptr;
    const double d = std::strtod(num_str.c_str(), &end);
    if (!end || *end != '\0' || errno == ERANGE) {
      err = JsonError{"json_parse_error", "number out of range: " + num_str};
      return false;
    }
    out_val = Value{d};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { err = JsonError{"json_parse_error", "unexpected eof"}; return {}; }
    if (depth > kMaxDepth) { err = JsonError{"json_parse_error", "nesting too deep"}; return {}; }
    if (s[i] == '{') return Value{parse_object()};
    if (s[i] == '[') return Value{parse_array()};
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) {
      return num_val;
    }
    if (!err) err = JsonError{"json_parse_error", "unexpected token at offset " + std::to_string(i)};
    return {};
  }

  Object parse_object() {
    Object out;
    ++depth;
    eat('{');
    ws();
    if (eat('}')) { --depth; return out; }
    while (!err) {
      ws();
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { err = JsonError{"json_parse_error", "expected :"}; break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    --depth;
    return out;
  }

  Array parse_array() {
    Array out;
    ++depth;
    eat('[');
    ws();
    if (eat(']')) { --depth; return out; }
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    --depth;
    return out;
  }
};

// Fast path for strings with no escape characters (the common case).
std::string escape_inner(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    } else {
      o += c;
    }
  }
  return o;
}

void write_value(std::ostringstream& oss, const Value& v);

void write_object(std::ostringstream& oss, const Object& obj) {
  oss << "{";
  bool first = true;
  for (const auto& [k, vv] : obj) {
    if (!first) oss << ",";
    first = false;
    oss << "\"" << escape_inner(k) << "\":";
    write_value(oss, vv);
  }
  oss << "}";
}

void write_value(std::ostringstream& oss, const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) { oss << "null"; return; }
  if (std::holds_alternative<bool>(v.v)) { oss << (std::get<bool>(v.v) ? "true" : "false"); return; }
  if (std::holds_alternative<std::string>(v.v)) { oss << "\"" << escape_inner(std::get<std::string>(v.v)) << "\""; return; }
  if (std::holds_alternative<std::uint64_t>(v.v)) { oss << std::get<std::uint64_t>(v.v); return; }
  if (std::holds_alternative<std::int64_t>(v.v)) { oss << std::get<std::int64_t>(v.v); return; }
  if (std::holds_alternative<double>(v.v)) { oss << format_double(std::get<double>(v.v)); return; }
  if (std::holds_alternative<Object>(v.v)) { write_object(oss, std::get<Object>(v.v)); return; }
  oss << "[";
  bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) {
    if (!first) oss << ",";
    first = false;
    write_value(oss, vv);
  }
  oss << "]";
}

Value parse_document(const std::string& text, std::optional<JsonError>& err) {
  Parser p{text};
  auto v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size()) p.err = JsonError{"json_parse_error", "trailing data"};
  err = p.err;
  return v;
}

}  // namespace

bool operator==(const Value& a, const Value& b) { return a.v == b.v; }

std::string format_double(double d) {
  char buf[64];
  int n = 0;
  for (int precision = 1; precision <= 17; ++precision) {
    n = std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
    if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
    if (std::strtod(buf, nullptr) == d) break;
  }
  std::string result(buf, static_cast<size_t>(n));
  if (result.find_first_of(".eEn") == std::string::npos) result += ".0";
  return result;
}

std::string escape(const std::string& s) { return escape_inner(s); }

std::string to_json(const Value& v) {
  std::ostringstream oss;
  write_value(oss, v);
  return oss.str();
}

std::string to_json(const Object& obj) {
  std::ostringstream oss;
  write_object(oss, obj);
  return oss.str();
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_document(text, err);
  if (error) *error = err;
  if (err) return {};
  return v;
}

std::optional<JsonError> validate_strict(const std::string& text) {
  std::optional<JsonError> err;
  (void)parse_document(text, err);
  return err;
}

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_document(text, err);
  if (error) *error = err;
  if (err) return {};
  return to_json(v);
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_document(text, err);
  if (!err && !std::holds_alternative<Object>(v.v)) {
    err = JsonError{"json_parse_error", "expected object at document root"};
  }
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(v.v);
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

const Object* as_object(const Value& v) { return std::get_if<Object>(&v.v); }
const Array* as_array(const Value& v) { return std::get_if<Array>(&v.v); }
const std::string* as_string(const Value& v) { return std::get_if<std::string>(&v.v); }
bool is_null(const Value& v) { return std::holds_alternative<std::nullptr_t>(v.v); }

std::optional<std::uint64_t> as_u64(const Value& v) {
  if (const auto* u = std::get_if<std::uint64_t>(&v.v)) return *u;
  return std::nullopt;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}
bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}
double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  if (std::holds_alternative<std::uint64_t>(it->second.v)) return static_cast<double>(std::get<std::uint64_t>(it->second.v));
  if (std::holds_alternative<std::int64_t>(it->second.v)) return static_cast<double>(std::get<std::int64_t>(it->second.v));
  return def;
}
std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) {
      out.push_back(std::get<std::string>(item.v));
    }
  }
  return out;
}
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return out;
  for (const auto& [k, v] : std::get<Object>(it->second.v)) {
    if (std::holds_alternative<std::string>(v.v)) {
      out[k] = std::get<std::string>(v.v);
    }
  }
  return out;
}

}  // namespace nexus::jsonlite
