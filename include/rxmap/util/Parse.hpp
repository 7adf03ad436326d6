#pragma once

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rxmap {

inline bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

inline std::string trim(std::string_view in) {
  std::size_t b = 0;
  std::size_t e = in.size();
  while (b < e && is_blank(in[b])) ++b;
  while (e > b && is_blank(in[e - 1])) --e;
  return std::string(in.substr(b, e - b));
}

// Drops everything from the first '#'.
inline std::string strip_comment(std::string_view s) { return std::string(s.substr(0, s.find('#'))); }

// First non-blank character is a letter (section headers in LAMMPS files).
inline bool starts_with_alpha(std::string_view s) {
  for (const char c : s) {
    if (is_blank(c)) continue;
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
  }
  return false;
}

inline void split_ws(std::string_view s, std::vector<std::string_view>& out) {
  out.clear();
  std::size_t i = 0;
  while (i < s.size()) {
    if (is_blank(s[i])) {
      ++i;
      continue;
    }
    std::size_t j = i;
    while (j < s.size() && !is_blank(s[j])) ++j;
    out.push_back(s.substr(i, j - i));
    i = j;
  }
}

// Whole-token parses; trailing characters fail.
template <typename IntT>
inline bool parse_int(std::string_view tok, IntT& value) {
  const char* end = tok.data() + tok.size();
  const auto res = std::from_chars(tok.data(), end, value);
  return res.ec == std::errc{} && res.ptr == end;
}

inline bool parse_double(std::string_view tok, double& value) {
  const char* end = tok.data() + tok.size();
  const auto res = std::from_chars(tok.data(), end, value);
  return res.ec == std::errc{} && res.ptr == end;
}

} // namespace rxmap
