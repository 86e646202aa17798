#include "ramws/glob.hpp"

#include <optional>

namespace ramws::glob {

namespace {

// Matches one bracket expression at the front of `p` against `c`.
// Returns nullopt when the bracket is unterminated (then '[' is literal).
std::optional<bool> match_class(std::string_view p, char c, size_t& consumed) {
  size_t i = 1;
  bool negate = false;
  if (i < p.size() && (p[i] == '!' || p[i] == '^')) {
    negate = true;
    ++i;
  }
  bool matched = false;
  bool first = true;
  while (i < p.size()) {
    if (p[i] == ']' && !first) {
      consumed = i + 1;
      return matched != negate;
    }
    first = false;
    char lo = p[i];
    if (lo == '\\' && i + 1 < p.size()) lo = p[++i];
    if (i + 2 < p.size() && p[i + 1] == '-' && p[i + 2] != ']') {
      char hi = p[i + 2];
      if (lo <= c && c <= hi) matched = true;
      i += 3;
    } else {
      if (lo == c) matched = true;
      ++i;
    }
  }
  return std::nullopt;
}

bool wild_match(std::string_view p, std::string_view s) {
  while (!p.empty()) {
    char c = p[0];
    if (c == '*') {
      if (p.size() >= 2 && p[1] == '*') {
        size_t k = 2;
        while (k < p.size() && p[k] == '*') ++k;
        const std::string_view rest = p.substr(k);
        // "**/" also matches zero directories.
        if (!rest.empty() && rest[0] == '/' && wild_match(rest.substr(1), s)) return true;
        for (size_t i = 0; i <= s.size(); ++i) {
          if (wild_match(rest, s.substr(i))) return true;
        }
        return false;
      }
      const std::string_view rest = p.substr(1);
      for (size_t i = 0; i <= s.size(); ++i) {
        if (wild_match(rest, s.substr(i))) return true;
        if (i < s.size() && s[i] == '/') break;
      }
      return false;
    }
    if (s.empty()) return false;
    if (c == '?') {
      if (s[0] == '/') return false;
      p.remove_prefix(1);
      s.remove_prefix(1);
      continue;
    }
    if (c == '[') {
      size_t consumed = 0;
      auto m = match_class(p, s[0], consumed);
      if (m.has_value()) {
        if (!*m || s[0] == '/') return false;
        p.remove_prefix(consumed);
        s.remove_prefix(1);
        continue;
      }
    }
    if (c == '\\' && p.size() > 1) {
      p.remove_prefix(1);
      c = p[0];
    }
    if (c != s[0]) return false;
    p.remove_prefix(1);
    s.remove_prefix(1);
  }
  return s.empty();
}

}  // namespace

bool match(std::string_view pattern, std::string_view path, bool is_dir) {
  if (pattern.empty()) return false;
  std::string_view p = pattern;
  if (p.size() > 1 && p.back() == '/') {
    if (!is_dir) return false;
    p.remove_suffix(1);
  }
  if (p.front() == '/') {
    p.remove_prefix(1);
    return wild_match(p, path);
  }
  const bool has_slash = p.find('/') != std::string_view::npos;
  const bool has_double_star = p.find("**") != std::string_view::npos;
  if (!has_slash && !has_double_star) {
    const auto pos = path.rfind('/');
    return wild_match(p, pos == std::string_view::npos ? path : path.substr(pos + 1));
  }
  if (wild_match(p, path)) return true;
  for (size_t i = 0; i < path.size(); ++i) {
    if (path[i] == '/' && wild_match(p, path.substr(i + 1))) return true;
  }
  return false;
}

bool FilterSet::excluded(std::string_view path, bool is_dir) const {
  if (path.empty() || path == ".") return false;
  size_t pos = 0;
  while (true) {
    const size_t slash = path.find('/', pos);
    const bool last = slash == std::string_view::npos;
    const std::string_view prefix = last ? path : path.substr(0, slash);
    const bool prefix_is_dir = last ? is_dir : true;

    bool included = false;
    for (const auto& inc : includes) {
      if (match(inc, prefix, prefix_is_dir)) {
        included = true;
        break;
      }
    }
    if (!included) {
      for (const auto& exc : excludes) {
        if (match(exc, prefix, prefix_is_dir)) return true;
      }
    }
    if (last) return false;
    pos = slash + 1;
  }
}

std::string normalize_relative(std::string_view path, bool* escapes) {
  if (escapes) *escapes = false;
  if (!path.empty() && path.front() == '/' && escapes) *escapes = true;

  std::vector<std::string_view> parts;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t slash = path.find('/', pos);
    if (slash == std::string_view::npos) slash = path.size();
    const std::string_view part = path.substr(pos, slash - pos);
    if (part == "..") {
      if (parts.empty()) {
        if (escapes) *escapes = true;
      } else {
        parts.pop_back();
      }
    } else if (!part.empty() && part != ".") {
      parts.push_back(part);
    }
    pos = slash + 1;
  }
  if (parts.empty()) return ".";
  std::string out;
  for (const auto& part : parts) {
    if (!out.empty()) out += '/';
    out.append(part);
  }
  return out;
}

bool is_under(std::string_view path, std::string_view base) {
  if (base == ".") return true;
  if (path == base) return true;
  return path.size() > base.size() && path.substr(0, base.size()) == base &&
         path[base.size()] == '/';
}

std::string relative_to(std::string_view path, std::string_view base) {
  if (path == base) return {};
  if (base == ".") return std::string(path);
  return std::string(path.substr(base.size() + 1));
}

std::string join(std::string_view base, std::string_view tail) {
  if (tail.empty() || tail == ".") return std::string(base);
  if (base == "." || base.empty()) return std::string(tail);
  std::string out(base);
  out += '/';
  out.append(tail);
  return out;
}

}  // namespace ramws::glob
