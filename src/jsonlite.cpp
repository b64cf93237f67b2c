#include "evogate/jsonlite.hpp"

// Notes on jsonlite:
//
// DETERMINISM:
//   - Object is a std::map, so to_json() always emits keys in sorted order.
//   - format_double() uses "%.6f" with trailing-zero trimming; snprintf digit
//     output does not depend on the numeric locale for the C locale.
//
// LIMITS:
//   - Nesting depth is capped at kMaxDepth to keep hostile generator output or
//     candidate-written result files from exhausting the stack.
//   - \uXXXX escapes are decoded to UTF-8 for the BMP; surrogate pairs are
//     combined when both halves are present.

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace evogate::jsonlite {

namespace {

constexpr int kMaxDepth = 64;

void append_utf8(std::string& o, unsigned cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  int depth{0};
  std::optional<JsonError> err;

  void fail(const std::string& msg) {
    if (!err) err = JsonError{"json_parse_error", msg};
  }

  void ws() {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  }

  bool eat(char c) {
    ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }

  bool read_hex4(unsigned& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<unsigned>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<unsigned>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<unsigned>(c - 'A' + 10);
      else return false;
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) {
      fail("expected string");
      return {};
    }
    std::string o;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') return o;
      if (c != '\\') {
        o += c;
        continue;
      }
      if (i >= s.size()) break;
      const char n = s[i++];
      switch (n) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case '/': o += '/'; break;
        case '\\': o += '\\'; break;
        case '"': o += '"'; break;
        case 'u': {
          unsigned cp = 0;
          if (!read_hex4(cp)) {
            fail("invalid \\u escape");
            return {};
          }
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            const size_t save = i;
            i += 2;
            unsigned lo = 0;
            if (read_hex4(lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
              cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
            } else {
              i = save;
            }
          }
          append_utf8(o, cp);
          break;
        }
        default:
          fail("invalid escape");
          return {};
      }
    }
    fail("unterminated string");
    return {};
  }

  bool parse_number(Value& out) {
    ws();
    const size_t start = i;
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    bool is_float = false;
    if (i < s.size() && s[i] == '.') {
      is_float = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_float = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    const std::string num = s.substr(start, i - start);
    errno = 0;
    if (!is_float) {
      char* end = nullptr;
      const long long ll = std::strtoll(num.c_str(), &end, 10);
      if (errno == 0 && end && *end == '\0') {
        out = Value{ll};
        return true;
      }
      errno = 0;
    }
    char* end = nullptr;
    const double d = std::strtod(num.c_str(), &end);
    if (errno == ERANGE || !end || *end != '\0') {
      fail("number out of range");
      return false;
    }
    out = Value{d};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) {
      fail("unexpected eof");
      return {};
    }
    if (depth > kMaxDepth) {
      fail("nesting too deep");
      return {};
    }
    const char c = s[i];
    if (c == '{') return Value{parse_object()};
    if (c == '[') return Value{parse_array()};
    if (c == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) {
      i += 4;
      return Value{true};
    }
    if (s.compare(i, 5, "false") == 0) {
      i += 5;
      return Value{false};
    }
    if (s.compare(i, 4, "null") == 0) {
      i += 4;
      return Value{nullptr};
    }
    Value num;
    if (parse_number(num)) return num;
    fail("unexpected token");
    return {};
  }

  Object parse_object() {
    Object out;
    ++depth;
    eat('{');
    if (eat('}')) {
      --depth;
      return out;
    }
    while (!err) {
      std::string k = parse_string();
      if (err) break;
      if (out.find(k) != out.end()) {
        err = JsonError{"json_duplicate_key", "duplicate key: " + k};
        break;
      }
      if (!eat(':')) {
        fail("expected :");
        break;
      }
      Value v = parse_value();
      if (err) break;
      out.emplace(std::move(k), std::move(v));
      if (eat('}')) break;
      if (!eat(',')) {
        fail("expected ,");
        break;
      }
    }
    --depth;
    return out;
  }

  Array parse_array() {
    Array out;
    ++depth;
    eat('[');
    if (eat(']')) {
      --depth;
      return out;
    }
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) {
        fail("expected ,");
        break;
      }
    }
    --depth;
    return out;
  }
};

void write_value(std::string& out, const Value& v, int indent, int level);

void newline(std::string& out, int indent, int level) {
  if (indent <= 0) return;
  out += '\n';
  out.append(static_cast<size_t>(indent * level), ' ');
}

void write_value(std::string& out, const Value& v, int indent, int level) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) {
    out += "null";
  } else if (std::holds_alternative<bool>(v.v)) {
    out += std::get<bool>(v.v) ? "true" : "false";
  } else if (std::holds_alternative<std::int64_t>(v.v)) {
    out += std::to_string(std::get<std::int64_t>(v.v));
  } else if (std::holds_alternative<double>(v.v)) {
    out += format_double(std::get<double>(v.v));
  } else if (std::holds_alternative<std::string>(v.v)) {
    out += '"';
    out += escape(std::get<std::string>(v.v));
    out += '"';
  } else if (std::holds_alternative<Array>(v.v)) {
    const auto& a = std::get<Array>(v.v);
    out += '[';
    for (size_t k = 0; k < a.size(); ++k) {
      if (k) out += ',';
      newline(out, indent, level + 1);
      write_value(out, a[k], indent, level + 1);
    }
    if (!a.empty()) newline(out, indent, level);
    out += ']';
  } else {
    const auto& o = std::get<Object>(v.v);
    out += '{';
    bool first = true;
    for (const auto& [k, vv] : o) {
      if (!first) out += ',';
      first = false;
      newline(out, indent, level + 1);
      out += '"';
      out += escape(k);
      out += indent > 0 ? "\": " : "\":";
      write_value(out, vv, indent, level + 1);
    }
    if (!o.empty()) newline(out, indent, level);
    out += '}';
  }
}

}  // namespace

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size()) p.fail("trailing data");
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_value(text, &err);
  if (!err && !v.is_object()) err = JsonError{"json_not_object", "top-level value is not an object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string escape(const std::string& s) {
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
  for (unsigned char c : s) {
    switch (c) {
      case '"': o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          o += buf;
        } else {
          o += static_cast<char>(c);
        }
    }
  }
  return o;
}

std::string format_double(double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

std::string to_json(const Value& v) {
  std::string out;
  write_value(out, v, 0, 0);
  return out;
}

std::string to_json(const Object& o) {
  std::string out;
  write_value(out, Value{o}, 0, 0);
  return out;
}

std::string to_json_pretty(const Value& v, int indent) {
  std::string out;
  write_value(out, v, indent, 0);
  return out;
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<std::string>(v->v)) return def;
  return std::get<std::string>(v->v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<bool>(v->v)) return def;
  return std::get<bool>(v->v);
}

std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def) {
  const Value* v = find(obj, key);
  if (!v) return def;
  if (std::holds_alternative<std::int64_t>(v->v)) return std::get<std::int64_t>(v->v);
  if (std::holds_alternative<double>(v->v)) return static_cast<std::int64_t>(std::get<double>(v->v));
  return def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  const Value* v = find(obj, key);
  if (!v) return def;
  if (std::holds_alternative<double>(v->v)) return std::get<double>(v->v);
  if (std::holds_alternative<std::int64_t>(v->v)) return static_cast<double>(std::get<std::int64_t>(v->v));
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Array>(v->v)) return out;
  for (const auto& item : std::get<Array>(v->v)) {
    if (std::holds_alternative<std::string>(item.v)) out.push_back(std::get<std::string>(item.v));
  }
  return out;
}

Object get_object(const Object& obj, const std::string& key) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Object>(v->v)) return {};
  return std::get<Object>(v->v);
}

Array to_array(const std::vector<std::string>& items) {
  Array out;
  out.reserve(items.size());
  for (const auto& s : items) out.emplace_back(s);
  return out;
}

}  // namespace evogate::jsonlite
