#include "ramws/jsonlite.hpp"

#include <cstdio>
#include <limits>
#include <string_view>

namespace ramws::jsonlite {

namespace {

constexpr int kMaxDepth = 64;

class Reader {
 public:
  explicit Reader(const std::string& text) : s_(text) {}

  std::optional<JsonError> error;

  Value document() {
    Value v = value(0);
    skip_space();
    if (!error && pos_ != s_.size()) fail("json_parse_error", "trailing data");
    return v;
  }

 private:
  const std::string& s_;
  std::size_t pos_{0};

  void fail(const char* code, const std::string& what) {
    if (!error) error = JsonError{code, what + " at offset " + std::to_string(pos_)};
  }

  void skip_space() {
    while (pos_ < s_.size() && (s_[pos_] == ' ' || s_[pos_] == '\t' || s_[pos_] == '\n' || s_[pos_] == '\r')) {
      ++pos_;
    }
  }

  bool consume(char c) {
    skip_space();
    if (pos_ < s_.size() && s_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool keyword(const char* word) {
    const std::string_view w(word);
    if (s_.compare(pos_, w.size(), w) != 0) return false;
    pos_ += w.size();
    return true;
  }

  Value value(int depth) {
    if (depth > kMaxDepth) {
      fail("json_parse_error", "nesting too deep");
      return {};
    }
    skip_space();
    if (pos_ >= s_.size()) {
      fail("json_parse_error", "unexpected end of input");
      return {};
    }
    const char c = s_[pos_];
    if (c == '{') return object(depth);
    if (c == '[') return array(depth);
    if (c == '"') return string();
    if (c >= '0' && c <= '9') return number();
    if (keyword("true")) return Value{true};
    if (keyword("false")) return Value{false};
    if (keyword("null")) return Value{nullptr};
    fail("json_parse_error", c == '-' ? "negative numbers are not supported" : "unexpected character");
    return {};
  }

  Value number() {
    if (s_[pos_] == '0' && pos_ + 1 < s_.size() && s_[pos_ + 1] >= '0' && s_[pos_ + 1] <= '9') {
      fail("json_parse_error", "leading zero");
      return {};
    }
    std::uint64_t n = 0;
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') {
      const auto digit = static_cast<std::uint64_t>(s_[pos_] - '0');
      if (n > (kMax - digit) / 10) {
        fail("json_parse_error", "number out of range");
        return {};
      }
      n = n * 10 + digit;
      ++pos_;
    }
    if (pos_ < s_.size() && (s_[pos_] == '.' || s_[pos_] == 'e' || s_[pos_] == 'E')) {
      fail("json_parse_error", "only integers are supported");
      return {};
    }
    return Value{n};
  }

  bool hex4(unsigned& out) {
    if (pos_ + 4 > s_.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s_[pos_++];
      out <<= 4;
      if (h >= '0' && h <= '9') out |= static_cast<unsigned>(h - '0');
      else if (h >= 'a' && h <= 'f') out |= static_cast<unsigned>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') out |= static_cast<unsigned>(h - 'A' + 10);
      else return false;
    }
    return true;
  }

  static void put_utf8(std::string& out, unsigned cp) {
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

  std::string string() {
    std::string out;
    if (!consume('"')) {
      fail("json_parse_error", "expected string");
      return out;
    }
    while (pos_ < s_.size()) {
      const char c = s_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("json_parse_error", "control character in string");
        return out;
      }
      if (c != '\\') {
        out += c;
        continue;
      }
      if (pos_ >= s_.size()) break;
      const char e = s_[pos_++];
      switch (e) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
          unsigned cp = 0;
          if (!hex4(cp)) {
            fail("json_parse_error", "invalid \\u escape");
            return out;
          }
          if (cp >= 0xD800 && cp < 0xDC00) {
            unsigned low = 0;
            if (!keyword("\\u") || !hex4(low) || low < 0xDC00 || low >= 0xE000) {
              fail("json_parse_error", "unpaired surrogate");
              return out;
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          }
          put_utf8(out, cp);
          break;
        }
        default:
          fail("json_parse_error", "invalid escape");
          return out;
      }
    }
    fail("json_parse_error", "unterminated string");
    return out;
  }

  Value object(int depth) {
    Object out;
    consume('{');
    if (consume('}')) return Value{std::move(out)};
    while (!error) {
      std::string key = string();
      if (error) break;
      if (out.contains(key)) {
        fail("json_duplicate_key", "duplicate key '" + key + "'");
        break;
      }
      if (!consume(':')) {
        fail("json_parse_error", "expected ':'");
        break;
      }
      Value v = value(depth + 1);
      if (error) break;
      out.emplace(std::move(key), std::move(v));
      if (consume('}')) break;
      if (!consume(',')) fail("json_parse_error", "expected ',' or '}'");
    }
    return Value{std::move(out)};
  }

  Value array(int depth) {
    Array out;
    consume('[');
    if (consume(']')) return Value{std::move(out)};
    while (!error) {
      out.push_back(value(depth + 1));
      if (error) break;
      if (consume(']')) break;
      if (!consume(',')) fail("json_parse_error", "expected ',' or ']'");
    }
    return Value{std::move(out)};
  }
};

void write_string(std::string& out, const std::string& s) {
  out += '"';
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += '"';
}

void write_value(std::string& out, const Value& value);

void write_object(std::string& out, const Object& object) {
  out += '{';
  bool first = true;
  for (const auto& [key, v] : object) {
    if (!first) out += ',';
    first = false;
    write_string(out, key);
    out += ':';
    write_value(out, v);
  }
  out += '}';
}

void write_value(std::string& out, const Value& value) {
  if (const auto* b = std::get_if<bool>(&value.v)) {
    out += *b ? "true" : "false";
  } else if (const auto* n = std::get_if<std::uint64_t>(&value.v)) {
    out += std::to_string(*n);
  } else if (const auto* s = std::get_if<std::string>(&value.v)) {
    write_string(out, *s);
  } else if (const auto* o = std::get_if<Object>(&value.v)) {
    write_object(out, *o);
  } else if (const auto* a = std::get_if<Array>(&value.v)) {
    out += '[';
    for (std::size_t i = 0; i < a->size(); ++i) {
      if (i) out += ',';
      write_value(out, (*a)[i]);
    }
    out += ']';
  } else {
    out += "null";
  }
}

}  // namespace

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value v = reader.document();
  if (!reader.error && !std::holds_alternative<Object>(v.v)) {
    reader.error = JsonError{"json_parse_error", "top level is not an object"};
  }
  if (error) *error = reader.error;
  if (reader.error) return {};
  return std::get<Object>(std::move(v.v));
}

std::string to_json(const Value& value) {
  std::string out;
  write_value(out, value);
  return out;
}

std::string to_json(const Object& object) {
  std::string out;
  write_object(out, object);
  return out;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  const auto* s = std::get_if<std::string>(&it->second.v);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  const auto* b = std::get_if<bool>(&it->second.v);
  return b ? *b : def;
}

std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  const auto* n = std::get_if<std::uint64_t>(&it->second.v);
  return n ? *n : def;
}

const Object* get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<Object>(&it->second.v);
}

}  // namespace ramws::jsonlite
