#pragma once

#include <cctype>
#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace mfnam {

inline bool is_ws(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ',';
}

// Splits on blanks, tabs and commas (MODFLOW free format treats commas as blanks).
inline void split_ws(std::string_view s, std::vector<std::string_view>& out) {
  out.clear();
  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    while (i < n && is_ws(s[i])) ++i;
    if (i >= n) break;
    std::size_t j = i;
    if (s[i] == '\'' || s[i] == '"') {
      // quoted token (filenames with blanks)
      const char q = s[i];
      j = i + 1;
      while (j < n && s[j] != q) ++j;
      out.emplace_back(s.substr(i + 1, j - i - 1));
      i = (j < n) ? j + 1 : j;
      continue;
    }
    while (j < n && !is_ws(s[j])) ++j;
    out.emplace_back(s.substr(i, j - i));
    i = j;
  }
}

inline std::vector<std::string_view> split_ws(std::string_view s) {
  std::vector<std::string_view> out;
  split_ws(s, out);
  return out;
}

template <typename IntT>
inline bool parse_int(std::string_view tok, IntT& value) {
  if (!tok.empty() && tok.front() == '+') tok.remove_prefix(1);
  const char* b = tok.data();
  const char* e = tok.data() + tok.size();
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

// Accepts Fortran exponents (1.0D-3) in addition to what from_chars takes.
inline bool parse_double(std::string_view tok, double& value) {
  std::string s(tok);
  if (!s.empty() && s.front() == '+') s.erase(0, 1);
  for (auto& c : s) {
    if (c == 'd' || c == 'D') c = 'e';
  }
  const char* b = s.data();
  const char* e = s.data() + s.size();
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

inline std::string to_upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
  return out;
}

inline std::string to_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (::toupper(static_cast<unsigned char>(a[i])) != ::toupper(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

inline bool icontains(std::string_view haystack, std::string_view needle) {
  return to_upper(haystack).find(to_upper(needle)) != std::string::npos;
}

inline std::string_view trim(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) ++b;
  std::size_t e = s.size();
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n')) --e;
  return s.substr(b, e - b);
}

// Comment lines in MODFLOW input start with '#'.
// "a, b,,c" -> {"a", "b", "c"}
inline std::vector<std::string> split_list(std::string_view s, char sep = ',') {
  std::vector<std::string> out;
  std::size_t b = 0;
  while (b <= s.size()) {
    std::size_t e = s.find(sep, b);
    if (e == std::string_view::npos) e = s.size();
    const std::string_view item = trim(s.substr(b, e - b));
    if (!item.empty()) out.emplace_back(item);
    b = e + 1;
  }
  return out;
}

inline bool is_comment_or_blank(std::string_view line) {
  const auto t = trim(line);
  return t.empty() || t.front() == '#';
}

} // namespace mfnam
