#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "mfnam/core/Errors.hpp"
#include "mfnam/util/Parse.hpp"

namespace mfnam {

// Minimal INI parser for run configuration:
// - Sections: [section]
// - Key: key = value
// - Comments: lines starting with '#' or ';'
// - Values: raw strings; surrounding quotes (single/double) are stripped.
class IniConfig {
public:
  explicit IniConfig(const std::filesystem::path& file) : file_(file) {
    std::ifstream ifs(file_);
    if (!ifs) throw ConfigError(err_prefix_() + "failed to open config");
    parse_(ifs);
  }

  IniConfig(std::istream& is, const std::filesystem::path& source) : file_(source) {
    parse_(is);
  }

  const std::filesystem::path& file_path() const { return file_; }
  std::filesystem::path base_dir() const { return file_.parent_path(); }

  bool has_section(const std::string& section) const {
    return data_.find(section) != data_.end();
  }

  // Sorted.
  std::vector<std::string> section_names() const {
    std::vector<std::string> out;
    out.reserve(data_.size());
    for (const auto& kv : data_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
  }

  bool has_key(const std::string& section, const std::string& key) const {
    return get_raw_(section, key).has_value();
  }

  std::string get_string(const std::string& section, const std::string& key,
                         const std::optional<std::string>& def = std::nullopt) const {
    if (auto v = get_raw_(section, key)) return *v;
    if (def) return *def;
    throw ConfigError(err_prefix_() + "missing required key '" + key + "' in section [" + section + "]");
  }

  std::int64_t get_int64(const std::string& section, const std::string& key,
                         const std::optional<std::int64_t>& def = std::nullopt) const {
    std::string s = get_string(section, key, def ? std::optional<std::string>(std::to_string(*def)) : std::nullopt);
    try {
      std::size_t pos = 0;
      long long v = std::stoll(s, &pos);
      if (pos != s.size()) throw std::invalid_argument("trailing chars");
      return static_cast<std::int64_t>(v);
    } catch (const std::logic_error&) {
      throw ConfigError(err_prefix_() + "failed to parse integer for " + section + "." + key + " from value: '" + s + "'");
    }
  }

  bool get_bool(const std::string& section, const std::string& key,
                const std::optional<bool>& def = std::nullopt) const {
    const std::string s = to_lower(get_string(section, key, def ? std::optional<std::string>(*def ? "true" : "false") : std::nullopt));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw ConfigError(err_prefix_() + "failed to parse bool for " + section + "." + key + " from value: '" + s + "'");
  }

  // Comma-separated list, items trimmed, empty items dropped.
  std::vector<std::string> get_list(const std::string& section, const std::string& key,
                                    const std::optional<std::string>& def = std::nullopt) const {
    return split_list(get_string(section, key, def));
  }

  // Path value resolved against the config file's directory.
  std::optional<std::filesystem::path> get_path(const std::string& section, const std::string& key) const {
    auto v = get_raw_(section, key);
    if (!v || v->empty()) return std::nullopt;
    std::filesystem::path p(*v);
    if (p.is_absolute()) return p;
    return (base_dir() / p).lexically_normal();
  }

private:
  std::filesystem::path file_;
  std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;

  static std::string strip_quotes_(std::string s) {
    if (s.size() >= 2) {
      const char a = s.front();
      const char b = s.back();
      if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) return s.substr(1, s.size() - 2);
    }
    return s;
  }

  std::string err_prefix_() const {
    return std::string("IniConfig[") + file_.string() + "]: ";
  }

  std::optional<std::string> get_raw_(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    if (it == data_.end()) return std::nullopt;
    auto it2 = it->second.find(key);
    if (it2 == it->second.end()) return std::nullopt;
    return it2->second;
  }

  void parse_(std::istream& is) {
    std::string section;
    std::string line;
    std::size_t lineno = 0;

    while (std::getline(is, line)) {
      ++lineno;
      const std::string s(trim(line));
      if (s.empty() || s[0] == '#' || s[0] == ';') continue;

      if (s.front() == '[' && s.back() == ']') {
        section = std::string(trim(std::string_view(s).substr(1, s.size() - 2)));
        if (section.empty()) {
          throw ConfigError(err_prefix_() + "empty section header at line " + std::to_string(lineno));
        }
        (void)data_[section];
        continue;
      }

      const auto eq = s.find('=');
      if (eq == std::string::npos) {
        throw ConfigError(err_prefix_() + "expected key=value at line " + std::to_string(lineno) + ": " + s);
      }
      const std::string key(trim(std::string_view(s).substr(0, eq)));
      if (key.empty()) throw ConfigError(err_prefix_() + "empty key at line " + std::to_string(lineno));
      if (section.empty()) {
        throw ConfigError(err_prefix_() + "key outside any section at line " + std::to_string(lineno) + ": " + key);
      }
      data_[section][key] = strip_quotes_(std::string(trim(std::string_view(s).substr(eq + 1))));
    }
  }
};

} // namespace mfnam
