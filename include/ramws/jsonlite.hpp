#pragma once

// ramws/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// Used for the workspace state file, `status --json`, event and audit lines.
// Objects are std::map, so serialization is key-sorted and byte-stable.
//
// SUBSET:
//   Every number ramws writes is a count, size, timestamp or raw mtime, so
//   numbers are unsigned 64-bit integers. Fractions, exponents and negative
//   numbers are rejected on read, as are duplicate keys and trailing data.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ramws::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, std::string, Object, Array> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

struct JsonError {
  std::string code;      // json_parse_error | json_duplicate_key
  std::string message;   // includes the byte offset
};

// Parses a document whose top level is an object. On failure returns an
// empty object and sets *error (if non-null).
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& value);
std::string to_json(const Object& object);

// Missing keys or mismatched types yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def = 0);
const Object* get_object(const Object& obj, const std::string& key);

}  // namespace ramws::jsonlite
